// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/scenario_fault.h"

#include <stdexcept>
#include <string>

namespace scenario_r {

/**
 * @brief Exception carrying a ScenarioFault
 */
class ScenarioFaultError : public std::runtime_error {
public:
  explicit ScenarioFaultError(ScenarioFault fault);

  const ScenarioFault &fault() const noexcept { return _fault; }
  FaultKind kind() const noexcept { return _fault.kind; }

private:
  ScenarioFault _fault;
};

ScenarioFaultError make_scenario_fault_error(FaultKind kind, const std::string &message, const std::string &path = {}, int errno_value = 0);

/// "prefix: strerror(err)" or just "prefix" when err is 0
std::string format_errno_error(const std::string &prefix, int err);

/// "prefix 'path': strerror(err)"
std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err);

} // namespace scenario_r
