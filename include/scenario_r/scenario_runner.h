// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/scenario_fault.h"
#include "scenario_r/scenario_repository.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scenario_r {

/// Lifecycle of one scenario run
enum class ScenarioState {
  Discovered,
  StagingInitial,
  Executing,
  CheckingFinal,
  Passed,
  Failed,
};

const char *scenario_state_name(ScenarioState state);

struct ScenarioResult {
  std::string name;
  ScenarioState state = ScenarioState::Discovered;
  ScenarioState failed_during = ScenarioState::Discovered; ///< Meaningful when state == Failed
  std::optional<ScenarioFault> fault;                      ///< Set when state == Failed

  bool passed() const { return state == ScenarioState::Passed; }
};

/**
 * @brief Scenario logic supplied by the caller
 *
 * Invoked with the scenario name and the absolute fixture path while the
 * isolated working directory is current. Failure is signalled by throwing.
 */
using ScenarioCallback = std::function<void(const std::string &scenario_name, const std::string &scenario_fixture_path)>;

/**
 * @brief Runs one scenario: stage, execute, check
 *
 * The working directory is an IsolatedWorkingDirectory acquired for the run
 * and released before run() returns. Failures never escape run(); they are
 * reported in the returned ScenarioResult and dispatched to the fault
 * callback.
 */
class ScenarioRunner {
public:
  explicit ScenarioRunner(const ScenarioRepository &repository);

  ScenarioResult run(const Scenario &scenario, const ScenarioCallback &callback) const;

private:
  void stage_initial_state(const std::filesystem::path &fixture_directory, const std::filesystem::path &working_directory) const;
  void check_final_state(const std::filesystem::path &fixture_directory) const;

  const ScenarioRepository &_repository;
};

/**
 * @brief Repository and runner bundled for driving every scenario
 *
 * Usage:
 *   ScenarioOptions options;
 *   options.fixtures_root = "fixtures";
 *   ScenarioSuite suite(options);
 *   auto results = suite.run_all([](const std::string &name, const std::string &fixture) {
 *     run_tool_under_test(name);
 *   });
 */
class ScenarioSuite {
public:
  /// @throws ScenarioFaultError (Configuration) for an unusable fixtures root
  explicit ScenarioSuite(ScenarioOptions options);

  ScenarioSuite(const ScenarioSuite &) = delete;
  ScenarioSuite &operator=(const ScenarioSuite &) = delete;

  const std::vector<Scenario> &scenarios() const { return _repository.scenarios(); }
  const ScenarioRepository &repository() const { return _repository; }

  /// @throws ScenarioFaultError (Configuration) when no scenario has that name
  ScenarioResult run(const std::string &scenario_name, const ScenarioCallback &callback) const;

  /// Run every scenario in discovery order; a failure never stops the others
  std::vector<ScenarioResult> run_all(const ScenarioCallback &callback) const;

  static bool all_passed(const std::vector<ScenarioResult> &results);

private:
  ScenarioRepository _repository;
  ScenarioRunner _runner;
};

} // namespace scenario_r
