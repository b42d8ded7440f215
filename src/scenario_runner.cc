// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/scenario_runner.h"
#include "scenario_r/isolated_working_directory.h"
#include "scenario_r/path_comparator.h"
#include "scenario_r/scenario_fault_error.h"

#include <algorithm>
#include <system_error>
#include <utility>

namespace scenario_r {

namespace fs = std::filesystem;

namespace {

bool is_existing_directory(const fs::path &path) {
  std::error_code ec;
  return fs::is_directory(path, ec) && !ec;
}

// Expose a resolved state entry as a directory, extracting archives into holder
fs::path state_directory(const fs::path &state, const std::string &label, std::optional<ExtractedTree> &holder) {
  if (is_existing_directory(state)) {
    return state;
  }
  if (!is_archive(state)) {
    throw make_scenario_fault_error(FaultKind::Configuration, label + " " + state.string() + " is neither a directory nor an archive", state.string());
  }
  holder.emplace(extract_archive(state));
  return holder->path();
}

void copy_tree_contents(const fs::path &source, const fs::path &destination) {
  std::error_code ec;
  fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to copy " + source.string() + " into " + destination.string() + ": " + ec.message(), source.string(),
                                    ec.value());
  }
}

} // namespace

const char *scenario_state_name(ScenarioState state) {
  switch (state) {
  case ScenarioState::Discovered:
    return "discovered";
  case ScenarioState::StagingInitial:
    return "staging-initial";
  case ScenarioState::Executing:
    return "executing";
  case ScenarioState::CheckingFinal:
    return "checking-final";
  case ScenarioState::Passed:
    return "passed";
  case ScenarioState::Failed:
    return "failed";
  }
  return "unknown";
}

ScenarioRunner::ScenarioRunner(const ScenarioRepository &repository)
    : _repository(repository) {}

ScenarioResult ScenarioRunner::run(const Scenario &scenario, const ScenarioCallback &callback) const {
  ScenarioResult result;
  result.name = scenario.name;

  const auto fail = [&result](ScenarioFault fault) {
    result.failed_during = result.state;
    result.state = ScenarioState::Failed;
    dispatch_fault(fault);
    result.fault = std::move(fault);
  };

  try {
    result.state = ScenarioState::StagingInitial;
    const FixtureView fixture = _repository.open_fixture(scenario);
    IsolatedWorkingDirectory working_directory(_repository.options().external_connections, _repository.options().scratch_directory);
    stage_initial_state(fixture.directory(), working_directory.path());

    result.state = ScenarioState::Executing;
    if (!callback) {
      throw make_scenario_fault_error(FaultKind::Execution, "Please provide a function for running scenario " + scenario.name, scenario.fixture_path.string());
    }
    try {
      callback(scenario.name, scenario.fixture_path.string());
    } catch (const ScenarioFaultError &) {
      throw;
    } catch (const std::exception &ex) {
      throw make_scenario_fault_error(FaultKind::Execution, ex.what(), scenario.fixture_path.string());
    } catch (...) {
      throw make_scenario_fault_error(FaultKind::Execution, "Scenario callback for " + scenario.name + " threw a non-standard exception",
                                      scenario.fixture_path.string());
    }

    result.state = ScenarioState::CheckingFinal;
    check_final_state(fixture.directory());

    working_directory.release();
    result.state = ScenarioState::Passed;
  } catch (const ScenarioFaultError &error) {
    fail(error.fault());
  } catch (const std::exception &ex) {
    ScenarioFault fault;
    fault.kind = FaultKind::Io;
    fault.message = ex.what();
    fault.path = scenario.fixture_path.string();
    fail(std::move(fault));
  }

  return result;
}

void ScenarioRunner::stage_initial_state(const fs::path &fixture_directory, const fs::path &working_directory) const {
  const ScenarioOptions &options = _repository.options();
  const std::optional<fs::path> initial_state = _repository.resolve_initial_state(fixture_directory);
  if (!initial_state) {
    if (options.initial_state_missing_allowed) {
      return;
    }
    throw make_scenario_fault_error(FaultKind::MissingState, "Could not find initial state " + options.initial_state_name + " in " + fixture_directory.string(),
                                    fixture_directory.string());
  }

  std::optional<ExtractedTree> extracted;
  const fs::path source = state_directory(*initial_state, "Initial state", extracted);
  copy_tree_contents(source, working_directory);
}

void ScenarioRunner::check_final_state(const fs::path &fixture_directory) const {
  const ScenarioOptions &options = _repository.options();
  if (options.check_strategy == CheckStrategy::NoCheck) {
    return;
  }

  const std::optional<fs::path> final_state = _repository.resolve_final_state(fixture_directory);
  if (!final_state) {
    if (options.final_state_missing_allowed) {
      return;
    }
    throw make_scenario_fault_error(FaultKind::MissingState, "Could not find final state " + options.final_state_name + " in " + fixture_directory.string(),
                                    fixture_directory.string());
  }

  std::optional<ExtractedTree> extracted;
  const fs::path expected = state_directory(*final_state, "Final state", extracted);

  std::error_code ec;
  const fs::path actual = fs::current_path(ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to query working directory: " + ec.message(), {}, ec.value());
  }

  std::optional<ScenarioFault> mismatch;
  if (options.check_strategy == CheckStrategy::NamesOnly) {
    mismatch = compare_file_names(expected, actual, options.extra_final_items_allowed);
  } else {
    ComparisonOptions comparison;
    comparison.left_must_contain_right = !options.extra_final_items_allowed;
    comparison.right_must_contain_left = true;
    mismatch = PathComparator(comparison).compare(expected, actual);
  }

  if (mismatch) {
    if (extracted) {
      mismatch->message += " (final state extracted from " + final_state->string() + ")";
    }
    throw ScenarioFaultError(std::move(*mismatch));
  }
}

ScenarioSuite::ScenarioSuite(ScenarioOptions options)
    : _repository(std::move(options))
    , _runner(_repository) {}

ScenarioResult ScenarioSuite::run(const std::string &scenario_name, const ScenarioCallback &callback) const {
  const auto &all = _repository.scenarios();
  const auto it = std::find_if(all.begin(), all.end(), [&scenario_name](const Scenario &s) { return s.name == scenario_name; });
  if (it == all.end()) {
    throw make_scenario_fault_error(FaultKind::Configuration, "No scenario named " + scenario_name + " in " + _repository.fixtures_root().string(),
                                    _repository.fixtures_root().string());
  }
  return _runner.run(*it, callback);
}

std::vector<ScenarioResult> ScenarioSuite::run_all(const ScenarioCallback &callback) const {
  std::vector<ScenarioResult> results;
  results.reserve(_repository.scenarios().size());
  for (const auto &scenario : _repository.scenarios()) {
    results.push_back(_runner.run(scenario, callback));
  }
  return results;
}

bool ScenarioSuite::all_passed(const std::vector<ScenarioResult> &results) {
  return std::all_of(results.begin(), results.end(), [](const ScenarioResult &r) { return r.passed(); });
}

} // namespace scenario_r
