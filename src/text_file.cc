// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "text_file.h"

namespace scenario_r {

namespace {

// Expected length of the sequence introduced by lead, 0 if lead is invalid
std::size_t utf8_sequence_length(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 0;
}

// Bounds of the second byte; tighter than 0x80..0xBF for lead bytes that would
// otherwise allow overlong forms, surrogates or code points above U+10FFFF.
void second_byte_range(unsigned char lead, unsigned char &low, unsigned char &high) {
  low = 0x80;
  high = 0xBF;
  switch (lead) {
  case 0xE0:
    low = 0xA0;
    break;
  case 0xED:
    high = 0x9F;
    break;
  case 0xF0:
    low = 0x90;
    break;
  case 0xF4:
    high = 0x8F;
    break;
  default:
    break;
  }
}

} // namespace

bool is_valid_utf8(const unsigned char *data, std::size_t size, bool allow_truncated_tail) {
  std::size_t i = 0;
  while (i < size) {
    const unsigned char lead = data[i];
    const std::size_t length = utf8_sequence_length(lead);
    if (length == 0) {
      return false;
    }
    if (length == 1) {
      ++i;
      continue;
    }

    unsigned char low = 0;
    unsigned char high = 0;
    second_byte_range(lead, low, high);

    for (std::size_t k = 1; k < length; ++k) {
      if (i + k >= size) {
        return allow_truncated_tail;
      }
      const unsigned char c = data[i + k];
      if (k == 1 ? (c < low || c > high) : (c < 0x80 || c > 0xBF)) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

bool is_text_file(const std::string &path) {
  SystemFileStream stream(path);
  std::vector<unsigned char> probe(kTextProbeSize);

  std::size_t filled = 0;
  while (filled < probe.size()) {
    const std::size_t n = stream.read(probe.data() + filled, probe.size() - filled);
    if (n == 0) {
      break;
    }
    filled += n;
  }

  return is_valid_utf8(probe.data(), filled, filled == probe.size());
}

TextLineReader::TextLineReader(const std::string &path)
    : _stream(path)
    , _buffer(64 * 1024) {}

bool TextLineReader::fill() {
  _pos = 0;
  _size = _stream.read(_buffer.data(), _buffer.size());
  return _size > 0;
}

bool TextLineReader::next_line(std::string &line) {
  line.clear();
  while (true) {
    if (_pos == _size && !fill()) {
      return !line.empty();
    }

    const char c = _buffer[_pos++];
    if (_skip_lf) {
      _skip_lf = false;
      if (c == '\n') {
        continue;
      }
    }

    if (c == '\n') {
      line.push_back('\n');
      return true;
    }
    if (c == '\r') {
      // A following '\n' belongs to this separator
      line.push_back('\n');
      _skip_lf = true;
      return true;
    }
    line.push_back(c);
  }
}

} // namespace scenario_r
