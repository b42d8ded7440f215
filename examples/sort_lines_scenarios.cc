// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/scenario_fault_error.h"
#include "scenario_r/scenario_runner.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <locale.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace scenario_r;

// Unit of work under test: writes "<name>.sorted" next to every "*.txt" in the
// current directory, holding the lines of the input in ascending order.
void sort_text_files() {
  for (const auto &entry : std::filesystem::directory_iterator(".")) {
    if (!entry.is_regular_file() || entry.path().extension() != ".txt") {
      continue;
    }

    std::ifstream in(entry.path());
    if (!in) {
      throw std::runtime_error("cannot read " + entry.path().string());
    }
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
      lines.push_back(line);
    }
    std::sort(lines.begin(), lines.end());

    std::filesystem::path output = entry.path();
    output.replace_extension(".sorted");
    std::ofstream out(output);
    for (const auto &line : lines) {
      out << line << "\n";
    }
  }
}

// List discovered scenarios without running them
void list_scenarios(const ScenarioOptions &options) {
  ScenarioRepository repository(options);
  std::cout << "=== Scenarios in: " << repository.fixtures_root().string() << " ===\n";
  for (const auto &scenario : repository.scenarios()) {
    std::cout << "  " << scenario.name << " <- " << scenario.fixture_path.filename().string() << "\n";
  }
}

int run_scenarios(const ScenarioOptions &options) {
  ScenarioSuite suite(options);
  const auto results = suite.run_all([](const std::string &name, const std::string &fixture) {
    (void)name;
    (void)fixture;
    sort_text_files();
  });

  for (const auto &result : results) {
    std::cout << (result.passed() ? "[PASS] " : "[FAIL] ") << result.name;
    if (result.fault) {
      std::cout << ": " << result.fault->message;
    }
    std::cout << "\n";
  }
  return ScenarioSuite::all_passed(results) ? 0 : 1;
}

int main(int argc, char *argv[]) {
  setlocale(LC_ALL, "");

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <fixtures_root> [--list]\n";
    std::cerr << "\nEach fixture holds initial_state/ with *.txt files and final_state/ with the\n";
    std::cerr << "expected *.txt and *.sorted files.\n";
    return 1;
  }

  ScenarioOptions options;
  options.fixtures_root = argv[1];

  try {
    if (argc >= 3 && std::string(argv[2]) == "--list") {
      list_scenarios(options);
      return 0;
    }
    return run_scenarios(options);
  } catch (const ScenarioFaultError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
