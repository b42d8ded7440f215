// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/temporary_directory.h"
#include "scenario_r/scenario_fault_error.h"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace scenario_r {

namespace {

std::filesystem::path base_directory(const std::filesystem::path &parent) {
  std::error_code ec;
  if (parent.empty()) {
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to locate temporary directory: " + ec.message(), {}, ec.value());
    }
    return base;
  }

  std::filesystem::path base = std::filesystem::absolute(parent, ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to resolve '" + parent.string() + "': " + ec.message(), parent.string(), ec.value());
  }
  return base.lexically_normal();
}

std::filesystem::path create_unique_directory(const std::string &prefix, const std::filesystem::path &parent) {
  const std::filesystem::path base = base_directory(parent);

  const std::string pattern = (base / (prefix + "-XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  errno = 0;
  if (::mkdtemp(buffer.data()) == nullptr) {
    const int err = errno;
    throw make_scenario_fault_error(FaultKind::Io, format_path_errno_error("Failed to create temporary directory", pattern, err), pattern, err);
  }
  return std::filesystem::path(buffer.data());
}

} // namespace

TemporaryDirectory::TemporaryDirectory(const std::string &prefix, const std::filesystem::path &parent)
    : _path(create_unique_directory(prefix, parent)) {}

TemporaryDirectory::~TemporaryDirectory() {
  if (_path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_path, ec);
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory &&other) noexcept
    : _path(std::exchange(other._path, {})) {}

TemporaryDirectory &TemporaryDirectory::operator=(TemporaryDirectory &&other) noexcept {
  if (this != &other) {
    if (!_path.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(_path, ec);
    }
    _path = std::exchange(other._path, {});
  }
  return *this;
}

void TemporaryDirectory::cleanup() {
  if (_path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_path, ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to remove temporary directory '" + _path.string() + "': " + ec.message(), _path.string(), ec.value());
  }
  _path.clear();
}

} // namespace scenario_r
