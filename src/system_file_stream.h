// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include <cstddef>
#include <cstdio>
#include <string>

namespace scenario_r {

/**
 * @brief Read-only handle on a regular file
 *
 * Failures to open or read are raised as ScenarioFaultError (Io) carrying
 * the errno of the failing call.
 */
class SystemFileStream {
public:
  explicit SystemFileStream(std::string path);
  ~SystemFileStream();

  SystemFileStream(const SystemFileStream &) = delete;
  SystemFileStream &operator=(const SystemFileStream &) = delete;

  /// Read up to size bytes; returns 0 at end of file
  std::size_t read(void *buffer, std::size_t size);

  const std::string &path() const { return _path; }

private:
  void report_read_failure(int err);

  std::string _path;
  FILE *_handle;
  bool _at_end = false;
};

} // namespace scenario_r
