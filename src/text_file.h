// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "system_file_stream.h"

#include <cstddef>
#include <string>
#include <vector>

namespace scenario_r {

/// Size of the block inspected by is_text_file()
constexpr std::size_t kTextProbeSize = 8192;

/**
 * @brief Decide whether a file decodes as UTF-8 text
 *
 * Only the first kTextProbeSize bytes are inspected. A multi-byte sequence
 * cut by the end of a full probe block is accepted; any other invalid
 * sequence classifies the file as binary. Empty files are text.
 */
bool is_text_file(const std::string &path);

/// true when data[0, size) is valid UTF-8; a truncated final sequence is accepted if allow_truncated_tail
bool is_valid_utf8(const unsigned char *data, std::size_t size, bool allow_truncated_tail);

/**
 * @brief Line reader treating "\n", "\r\n" and "\r" as line separators
 *
 * Every returned line ends with a single "\n" when it was terminated in the
 * file; the last line of a file without a trailing separator is returned
 * without one.
 */
class TextLineReader {
public:
  explicit TextLineReader(const std::string &path);

  /// Read the next line into line; returns false at end of file
  bool next_line(std::string &line);

private:
  bool fill();

  SystemFileStream _stream;
  std::vector<char> _buffer;
  std::size_t _pos = 0;
  std::size_t _size = 0;
  bool _skip_lf = false;
};

} // namespace scenario_r
