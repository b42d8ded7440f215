// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/isolated_working_directory.h"
#include "scenario_r/scenario_fault_error.h"

#include <system_error>

namespace scenario_r {

namespace fs = std::filesystem;

namespace {

fs::path current_directory() {
  std::error_code ec;
  fs::path current = fs::current_path(ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to query working directory: " + ec.message(), {}, ec.value());
  }
  return current;
}

} // namespace

IsolatedWorkingDirectory::IsolatedWorkingDirectory(const std::vector<ExternalConnection> &connections, const ScratchDirectoryOptions &scratch)
    : _directory(scratch.prefix, scratch.parent_directory ? fs::path(*scratch.parent_directory) : fs::path())
    , _original_working_dir(current_directory()) {
  std::error_code ec;
  fs::current_path(_directory.path(), ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to change to temporary directory '" + _directory.path().string() + "': " + ec.message(),
                                    _directory.path().string(), ec.value());
  }
  _active = true;

  try {
    for (const auto &connection : connections) {
      connect(connection);
    }
  } catch (...) {
    // leave no changed working directory behind a failed construction
    std::error_code restore_ec;
    fs::current_path(_original_working_dir, restore_ec);
    _active = false;
    throw;
  }
}

IsolatedWorkingDirectory::~IsolatedWorkingDirectory() {
  if (!_active) {
    return;
  }
  std::error_code ec;
  fs::current_path(_original_working_dir, ec);
  _active = false;
}

void IsolatedWorkingDirectory::release() {
  if (!_active) {
    return;
  }
  _active = false;

  std::error_code ec;
  fs::current_path(_original_working_dir, ec);
  _directory.cleanup();
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to restore working directory '" + _original_working_dir.string() + "': " + ec.message(),
                                    _original_working_dir.string(), ec.value());
  }
}

void IsolatedWorkingDirectory::connect(const ExternalConnection &connection) const {
  fs::path external(connection.external_path);
  if (external.is_relative()) {
    external = _original_working_dir / external;
  }

  std::error_code ec;
  if (!fs::exists(external, ec)) {
    throw make_scenario_fault_error(FaultKind::Io, "Could not connect " + external.string() + " to test, does not exist", external.string());
  }

  const fs::path internal = connection.internal_path ? fs::path(*connection.internal_path) : external.filename();

  switch (connection.strategy) {
  case ExternalConnection::Strategy::Custom:
    if (!connection.connector) {
      throw make_scenario_fault_error(FaultKind::Configuration, "Custom connection for " + external.string() + " has no connector", external.string());
    }
    connection.connector(external, internal);
    return;
  case ExternalConnection::Strategy::Symlink:
    if (fs::is_directory(external, ec)) {
      fs::create_directory_symlink(external, internal, ec);
    } else {
      fs::create_symlink(external, internal, ec);
    }
    break;
  case ExternalConnection::Strategy::Copy:
    fs::copy(external, internal, fs::copy_options::recursive, ec);
    break;
  }

  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to connect " + external.string() + " as " + internal.string() + ": " + ec.message(), external.string(),
                                    ec.value());
  }
}

} // namespace scenario_r
