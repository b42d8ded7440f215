// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/scenario_fault.h"
#include "scenario_r/scenario_fault_error.h"

#include <cstring>
#include <mutex>
#include <utility>

namespace scenario_r {

namespace {

std::mutex &callback_mutex() {
  static std::mutex mutex;
  return mutex;
}

FaultCallback &callback_slot() {
  static FaultCallback callback;
  return callback;
}

} // namespace

void register_fault_callback(FaultCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex());
  callback_slot() = std::move(callback);
}

void dispatch_fault(const ScenarioFault &fault) {
  FaultCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex());
    callback = callback_slot();
  }
  if (callback) {
    callback(fault);
  }
}

const char *fault_kind_name(FaultKind kind) {
  switch (kind) {
  case FaultKind::Configuration:
    return "configuration";
  case FaultKind::AmbiguousFixture:
    return "ambiguous-fixture";
  case FaultKind::MissingState:
    return "missing-state";
  case FaultKind::UnsupportedArchive:
    return "unsupported-archive";
  case FaultKind::ComparisonMismatch:
    return "mismatch";
  case FaultKind::Execution:
    return "execution";
  case FaultKind::Io:
    return "io";
  }
  return "unknown";
}

ScenarioFaultError::ScenarioFaultError(ScenarioFault fault)
    : std::runtime_error(fault.message)
    , _fault(std::move(fault)) {}

ScenarioFaultError make_scenario_fault_error(FaultKind kind, const std::string &message, const std::string &path, int errno_value) {
  ScenarioFault fault;
  fault.kind = kind;
  fault.message = message;
  fault.path = path;
  fault.errno_value = errno_value;
  return ScenarioFaultError(std::move(fault));
}

std::string format_errno_error(const std::string &prefix, int err) {
  if (err == 0) {
    return prefix;
  }
  return prefix + ": " + std::strerror(err);
}

std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err) {
  return format_errno_error(prefix + " '" + path + "'", err);
}

} // namespace scenario_r
