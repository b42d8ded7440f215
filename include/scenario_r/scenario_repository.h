// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/archive_adapter.h"
#include "scenario_r/isolated_working_directory.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenario_r {

/// How the final state of a scenario is verified
enum class CheckStrategy {
  NoCheck,      ///< Pass once the scenario callback returns
  NamesOnly,    ///< Compare the set of relative file paths
  FullContents, ///< Recursive content comparison
};

struct ScenarioOptions {
  std::optional<std::string> fixtures_root;           ///< Directory of scenario fixtures (required)
  CheckStrategy check_strategy = CheckStrategy::FullContents;
  bool initial_state_missing_allowed = true;          ///< Start from an empty directory when no initial state exists
  bool final_state_missing_allowed = false;           ///< Pass when no final state exists
  bool extra_final_items_allowed = false;             ///< Working directory may hold items the final state lacks
  std::string initial_state_name = "initial_state";   ///< Base name of the initial state entry
  std::string final_state_name = "final_state";       ///< Base name of the final state entry
  std::vector<ExternalConnection> external_connections; ///< Connected into every isolated directory
  ScratchDirectoryOptions scratch_directory;            ///< Placement of every isolated directory
};

/**
 * @brief One discovered scenario
 */
struct Scenario {
  std::string name;                   ///< Unique name derived from the fixture entry
  std::filesystem::path fixture_path; ///< Absolute path of the fixture directory or archive
};

/**
 * @brief A scenario fixture exposed as a plain directory
 *
 * Archive fixtures are extracted for the lifetime of the view.
 */
class FixtureView {
public:
  explicit FixtureView(const std::filesystem::path &fixture_path);

  FixtureView(FixtureView &&) noexcept = default;
  FixtureView &operator=(FixtureView &&) noexcept = default;

  const std::filesystem::path &directory() const { return _directory; }

private:
  std::optional<ExtractedTree> _extracted;
  std::filesystem::path _directory;
};

/**
 * @brief Enumerates scenarios from a fixtures directory
 *
 * Each immediate child of the fixtures root (directory or archive) is one
 * scenario. Names are the child names without archive extension; a name
 * already taken during the enumeration receives a "_1", "_2", ... suffix.
 * Children are visited in file-name order.
 *
 * Usage:
 *   ScenarioOptions options;
 *   options.fixtures_root = "test/fixtures";
 *   ScenarioRepository repository(options);
 *   for (const Scenario &scenario : repository.scenarios()) { ... }
 */
class ScenarioRepository {
public:
  /**
   * @throws ScenarioFaultError (Configuration) when the fixtures root is not
   *         configured or does not name an existing directory
   */
  explicit ScenarioRepository(ScenarioOptions options);

  const std::vector<Scenario> &scenarios() const { return _scenarios; }
  const ScenarioOptions &options() const { return _options; }
  const std::filesystem::path &fixtures_root() const { return _fixtures_root; }

  /**
   * @brief Expose a scenario fixture as a plain directory
   * @throws ScenarioFaultError (Configuration) when the fixture is neither a
   *         directory nor an archive
   */
  FixtureView open_fixture(const Scenario &scenario) const;

  std::optional<std::filesystem::path> resolve_initial_state(const std::filesystem::path &fixture_directory) const;
  std::optional<std::filesystem::path> resolve_final_state(const std::filesystem::path &fixture_directory) const;

private:
  std::vector<Scenario> discover() const;

  ScenarioOptions _options;
  std::filesystem::path _fixtures_root;
  std::vector<Scenario> _scenarios;
};

/**
 * @brief Find the single child of fixture_directory named marker
 *
 * Child names are compared after strip_archive_extension().
 *
 * @return The matching child, or std::nullopt when there is none
 * @throws ScenarioFaultError (AmbiguousFixture) when several children match
 */
std::optional<std::filesystem::path> resolve_state(const std::filesystem::path &fixture_directory, const std::string &marker);

/// Derive unique scenario names from fixture entry names, in order
std::vector<std::string> derive_scenario_names(const std::vector<std::string> &entry_names);

} // namespace scenario_r
