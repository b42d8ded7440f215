// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/scenario_fault_error.h"
#include "scenario_r/scenario_runner.h"

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace scenario_r;

namespace {

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << (argv0 ? argv0 : "scenario_run")
            << " <fixtures_root> [--check none|names|contents] [--require-initial] [--allow-missing-final]\n"
               "       [--allow-extra] [--initial-name N] [--final-name N] -- <command> [args...]\n";
  std::cerr << "\nThe command runs inside each scenario's isolated directory with the scenario name\n"
               "and the fixture path appended to its arguments.\n";
}

bool parse_strategy(std::string_view value, CheckStrategy &out) {
  if (value == "none") {
    out = CheckStrategy::NoCheck;
  } else if (value == "names") {
    out = CheckStrategy::NamesOnly;
  } else if (value == "contents") {
    out = CheckStrategy::FullContents;
  } else {
    return false;
  }
  return true;
}

// Run argv + {name, fixture} and throw unless it exits with status 0
void run_command(const std::vector<std::string> &command, const std::string &scenario_name, const std::string &fixture_path) {
  std::vector<std::string> args = command;
  args.push_back(scenario_name);
  args.push_back(fixture_path);

  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::cout.flush();
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error(format_errno_error("fork failed", errno));
  }
  if (pid == 0) {
    ::execvp(argv[0], argv.data());
    std::cerr << format_errno_error("exec " + args[0] + " failed", errno) << "\n";
    ::_exit(127);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(format_errno_error("waitpid failed", errno));
    }
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return;
  }
  if (WIFSIGNALED(status)) {
    throw std::runtime_error(args[0] + " terminated by signal " + std::to_string(WTERMSIG(status)));
  }
  throw std::runtime_error(args[0] + " exited with status " + std::to_string(WEXITSTATUS(status)));
}

} // namespace

int main(int argc, char **argv) {
  ScenarioOptions options;
  std::vector<std::string> command;

  if (argc < 2) {
    print_usage(argv[0]);
    return 2;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--") {
      for (++i; i < argc; ++i) {
        command.emplace_back(argv[i]);
      }
      break;
    }
    if (arg == "--check") {
      if (i + 1 >= argc || !parse_strategy(argv[++i], options.check_strategy)) {
        std::cerr << "Error: --check requires none, names or contents\n";
        return 2;
      }
      continue;
    }
    if (arg == "--require-initial") {
      options.initial_state_missing_allowed = false;
      continue;
    }
    if (arg == "--allow-missing-final") {
      options.final_state_missing_allowed = true;
      continue;
    }
    if (arg == "--allow-extra") {
      options.extra_final_items_allowed = true;
      continue;
    }
    if (arg == "--initial-name" || arg == "--final-name") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires N\n";
        return 2;
      }
      (arg == "--initial-name" ? options.initial_state_name : options.final_state_name) = argv[++i];
      continue;
    }
    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: unknown arg: " << arg << "\n";
      print_usage(argv[0]);
      return 2;
    }
    if (options.fixtures_root) {
      std::cerr << "Error: fixtures root given twice: " << arg << "\n";
      return 2;
    }
    options.fixtures_root = arg;
  }

  if (command.empty()) {
    std::cerr << "Error: no command given after --\n";
    print_usage(argv[0]);
    return 2;
  }

  register_fault_callback([](const ScenarioFault &fault) { std::cerr << "  [" << fault_kind_name(fault.kind) << "] " << fault.message << "\n"; });

  try {
    ScenarioSuite suite(options);

    std::size_t passed = 0;
    std::size_t failed = 0;
    for (const Scenario &scenario : suite.scenarios()) {
      const ScenarioResult result =
          suite.run(scenario.name, [&command](const std::string &name, const std::string &fixture) { run_command(command, name, fixture); });
      if (result.passed()) {
        ++passed;
        std::cout << "[PASS] " << result.name << "\n";
      } else {
        ++failed;
        std::cout << "[FAIL] " << result.name << " (" << scenario_state_name(result.failed_during) << ")\n";
      }
    }

    std::cout << "\nScenarios: " << passed + failed << ", passed: " << passed << ", failed: " << failed << "\n";
    return failed == 0 ? 0 : 1;
  } catch (const ScenarioFaultError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
