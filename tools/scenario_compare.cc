// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/path_comparator.h"
#include "scenario_r/scenario_fault_error.h"

#include <filesystem>
#include <iostream>
#include <string>

using namespace scenario_r;

namespace {

struct CompareConfig {
  std::filesystem::path left;
  std::filesystem::path right;
  ComparisonOptions options;
};

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << (argv0 ? argv0 : "scenario_compare") << " <left> <right> [--allow-extra-left] [--allow-extra-right]\n";
  std::cerr << "\n  --allow-extra-left   items only present in <left> are ignored\n";
  std::cerr << "  --allow-extra-right  items only present in <right> are ignored\n";
}

} // namespace

int main(int argc, char **argv) {
  CompareConfig cfg;
  std::size_t positional = 0;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--allow-extra-left") {
      cfg.options.right_must_contain_left = false;
      continue;
    }
    if (arg == "--allow-extra-right") {
      cfg.options.left_must_contain_right = false;
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: unknown arg: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
    if (positional == 0) {
      cfg.left = arg;
    } else if (positional == 1) {
      cfg.right = arg;
    } else {
      std::cerr << "Error: unexpected extra path: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
    ++positional;
  }

  if (positional != 2) {
    print_usage(argv[0]);
    return 2;
  }

  register_fault_callback([](const ScenarioFault &fault) { std::cerr << "[" << fault_kind_name(fault.kind) << "] " << fault.message << "\n"; });

  try {
    if (!PathComparator(cfg.options).equal(cfg.left, cfg.right)) {
      return 1;
    }
  } catch (const ScenarioFaultError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }

  std::cout << "equal\n";
  return 0;
}
