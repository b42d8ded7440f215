// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include <functional>
#include <string>

namespace scenario_r {

/**
 * @brief Category of a reported fault
 *
 * Configuration faults abort a whole suite; every other kind is scoped to
 * the scenario (or comparison) that raised it.
 */
enum class FaultKind {
  Configuration,      ///< Missing or invalid fixtures root, unusable fixture entry
  AmbiguousFixture,   ///< More than one initial/final state candidate
  MissingState,       ///< Required initial/final state not found
  UnsupportedArchive, ///< Extension not in the recognized archive set
  ComparisonMismatch, ///< Structural or content inequality
  Execution,          ///< Scenario callback raised
  Io,                 ///< Filesystem or archive read/write failure
};

/**
 * @brief Description of a failure
 */
struct ScenarioFault {
  FaultKind kind = FaultKind::Io;
  std::string message; ///< Human readable message naming the offending item
  std::string path;    ///< Path the fault refers to (may be empty)
  int errno_value = 0; ///< errno captured at the failure site (0 if none)
};

using FaultCallback = std::function<void(const ScenarioFault &)>;

/**
 * @brief Register a process-wide fault callback
 *
 * Every fault reported by the library is dispatched to this callback.
 * Pass an empty callback to unregister.
 */
void register_fault_callback(FaultCallback callback);

/**
 * @brief Dispatch a fault to the registered callback (no-op when none)
 */
void dispatch_fault(const ScenarioFault &fault);

/// Short, stable name of a fault kind ("configuration", "mismatch", ...)
const char *fault_kind_name(FaultKind kind);

} // namespace scenario_r
