// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "system_file_stream.h"
#include "scenario_r/scenario_fault_error.h"

#include <cerrno>
#include <utility>

namespace scenario_r {

SystemFileStream::SystemFileStream(std::string path)
    : _path(std::move(path))
    , _handle(nullptr) {
  errno = 0;
  FILE *handle = std::fopen(_path.c_str(), "rb");
  if (!handle) {
    const int err = errno;
    throw make_scenario_fault_error(FaultKind::Io, format_path_errno_error("Failed to open file", _path, err), _path, err);
  }
  _handle = handle;
}

SystemFileStream::~SystemFileStream() {
  if (_handle) {
    std::fclose(_handle);
  }
}

std::size_t SystemFileStream::read(void *buffer, std::size_t size) {
  if (size == 0 || _at_end) {
    return 0;
  }

  errno = 0;
  const std::size_t bytes_read = std::fread(buffer, 1, size, _handle);
  if (bytes_read > 0) {
    return bytes_read;
  }

  if (std::ferror(_handle)) {
    report_read_failure(errno);
  }
  _at_end = true;
  return 0;
}

void SystemFileStream::report_read_failure(int err) {
  throw make_scenario_fault_error(FaultKind::Io, format_path_errno_error("Failed to read file", _path, err), _path, err);
}

} // namespace scenario_r
