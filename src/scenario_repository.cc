// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/scenario_repository.h"
#include "scenario_r/scenario_fault_error.h"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace scenario_r {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> sorted_children(const fs::path &directory) {
  std::vector<fs::path> children;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    children.push_back(it->path());
  }
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to list '" + directory.string() + "': " + ec.message(), directory.string(), ec.value());
  }
  std::sort(children.begin(), children.end(), [](const fs::path &a, const fs::path &b) { return a.filename().string() < b.filename().string(); });
  return children;
}

fs::path validate_fixtures_root(const ScenarioOptions &options) {
  if (!options.fixtures_root) {
    throw make_scenario_fault_error(FaultKind::Configuration, "Please provide fixtures_root");
  }

  const fs::path root(*options.fixtures_root);
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw make_scenario_fault_error(FaultKind::Configuration, "Could not find fixtures_root " + root.string(), root.string());
  }
  if (!fs::is_directory(root, ec)) {
    throw make_scenario_fault_error(FaultKind::Configuration, "fixtures_root " + root.string() + " is not a directory", root.string());
  }

  fs::path absolute = fs::absolute(root, ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Configuration, "Failed to resolve fixtures_root " + root.string() + ": " + ec.message(), root.string(), ec.value());
  }
  return absolute.lexically_normal();
}

} // namespace

FixtureView::FixtureView(const fs::path &fixture_path) {
  std::error_code ec;
  if (fs::is_directory(fixture_path, ec)) {
    _directory = fixture_path;
    return;
  }
  if (!is_archive(fixture_path)) {
    throw make_scenario_fault_error(FaultKind::Configuration, "Fixture " + fixture_path.string() + " is neither a directory nor an archive", fixture_path.string());
  }
  _extracted.emplace(extract_archive(fixture_path));
  _directory = _extracted->path();
}

std::vector<std::string> derive_scenario_names(const std::vector<std::string> &entry_names) {
  std::vector<std::string> names;
  std::set<std::string> taken;
  names.reserve(entry_names.size());

  for (const auto &entry_name : entry_names) {
    const std::string base = strip_archive_extension(entry_name);
    std::string candidate = base;
    for (std::size_t suffix = 1; taken.count(candidate) != 0; ++suffix) {
      candidate = base + "_" + std::to_string(suffix);
    }
    taken.insert(candidate);
    names.push_back(std::move(candidate));
  }
  return names;
}

std::optional<fs::path> resolve_state(const fs::path &fixture_directory, const std::string &marker) {
  std::vector<fs::path> matches;
  for (const auto &child : sorted_children(fixture_directory)) {
    if (strip_archive_extension(child.filename().string()) == marker) {
      matches.push_back(child);
    }
  }

  if (matches.empty()) {
    return std::nullopt;
  }
  if (matches.size() > 1) {
    std::string found;
    for (const auto &match : matches) {
      found += (found.empty() ? "" : ", ") + match.filename().string();
    }
    throw make_scenario_fault_error(FaultKind::AmbiguousFixture, "Found multiple " + marker + " entries in " + fixture_directory.string() + ": " + found,
                                    fixture_directory.string());
  }
  return matches.front();
}

ScenarioRepository::ScenarioRepository(ScenarioOptions options)
    : _options(std::move(options))
    , _fixtures_root(validate_fixtures_root(_options))
    , _scenarios(discover()) {}

std::vector<Scenario> ScenarioRepository::discover() const {
  const std::vector<fs::path> children = sorted_children(_fixtures_root);

  std::vector<std::string> entry_names;
  entry_names.reserve(children.size());
  for (const auto &child : children) {
    entry_names.push_back(child.filename().string());
  }
  const std::vector<std::string> names = derive_scenario_names(entry_names);

  std::vector<Scenario> scenarios;
  scenarios.reserve(children.size());
  for (std::size_t i = 0; i < children.size(); ++i) {
    scenarios.push_back({ names[i], children[i] });
  }
  return scenarios;
}

FixtureView ScenarioRepository::open_fixture(const Scenario &scenario) const { return FixtureView(scenario.fixture_path); }

std::optional<fs::path> ScenarioRepository::resolve_initial_state(const fs::path &fixture_directory) const {
  return resolve_state(fixture_directory, _options.initial_state_name);
}

std::optional<fs::path> ScenarioRepository::resolve_final_state(const fs::path &fixture_directory) const {
  return resolve_state(fixture_directory, _options.final_state_name);
}

} // namespace scenario_r
