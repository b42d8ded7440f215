// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "fixture_utils.h"
#include "scenario_r/temporary_directory.h"

#include <cerrno>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace scenario_r;
using namespace scenario_r::test_helpers;

namespace fs = std::filesystem;

namespace {

bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << message << std::endl;
    return false;
  }
  return true;
}

// Run program with args, output discarded; returns its exit status or -1 when it did not exit normally
int run_program(const std::string &program, const std::vector<std::string> &args) {
  std::vector<std::string> all;
  all.push_back(program);
  all.insert(all.end(), args.begin(), args.end());

  std::vector<char *> argv;
  for (auto &arg : all) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::cout.flush();
  std::cerr.flush();
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error("fork failed");
  }
  if (pid == 0) {
    const int null_fd = ::open("/dev/null", O_WRONLY);
    if (null_fd >= 0) {
      ::dup2(null_fd, STDOUT_FILENO);
      ::dup2(null_fd, STDERR_FILENO);
    }
    ::execv(argv[0], argv.data());
    ::_exit(127);
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error("waitpid failed");
    }
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool test_compare_tool(const std::string &tool, const fs::path &work) {
  bool ok = true;
  const fs::path base = work / "compare";
  write_tree(base / "left", { { "a.txt", "a\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" } });
  write_tree(base / "same", { { "a.txt", "a\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" } });
  write_tree(base / "changed", { { "a.txt", "A\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" } });
  write_tree(base / "wider", { { "a.txt", "a\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" }, { "extra.txt", "e\n" } });
  build_archive(base / "left.tar.gz", { { "a.txt", "a\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" } }, ArchiveLayout::TarGzip);
  build_archive(base / "copy.tar.gz", { { "a.txt", "a\n" }, { "sub/", "" }, { "sub/b.txt", "b\n" } }, ArchiveLayout::TarGzip);
  write_file(base / "broken.tar.gz", "not an archive at all");

  const std::string left = (base / "left").string();
  ok = expect(run_program(tool, { left, (base / "same").string() }) == 0, "Equal trees should exit 0") && ok;
  ok = expect(run_program(tool, { (base / "left.tar.gz").string(), (base / "copy.tar.gz").string() }) == 0, "Equal archives should exit 0") && ok;
  ok = expect(run_program(tool, { left, (base / "changed").string() }) == 1, "Differing content should exit 1") && ok;
  ok = expect(run_program(tool, { left, (base / "wider").string() }) == 1, "Extra right item should exit 1 by default") && ok;
  ok = expect(run_program(tool, { left, (base / "wider").string(), "--allow-extra-right" }) == 0, "--allow-extra-right should accept extra right items") && ok;
  ok = expect(run_program(tool, { "--allow-extra-left", left, (base / "wider").string() }) == 1, "--allow-extra-left should not excuse extra right items") && ok;
  ok = expect(run_program(tool, { (base / "wider").string(), left, "--allow-extra-left" }) == 0, "--allow-extra-left should accept extra left items") && ok;

  ok = expect(run_program(tool, {}) == 2, "Missing arguments should exit 2") && ok;
  ok = expect(run_program(tool, { left }) == 2, "A single path should exit 2") && ok;
  ok = expect(run_program(tool, { left, left, left }) == 2, "A third path should exit 2") && ok;
  ok = expect(run_program(tool, { "--bogus", left, left }) == 2, "Unknown flag should exit 2") && ok;
  ok = expect(run_program(tool, { "--help" }) == 0, "--help should exit 0") && ok;
  ok = expect(run_program(tool, { left, (base / "no_such_dir").string() }) == 1, "Missing path should be a mismatch") && ok;
  ok = expect(run_program(tool, { (base / "broken.tar.gz").string(), (base / "left.tar.gz").string() }) == 2, "Unreadable archive should exit 2") && ok;
  return ok;
}

bool test_run_tool(const std::string &tool, const fs::path &work) {
  bool ok = true;
  const fs::path passing = work / "run_passing";
  write_tree(passing / "writes_out", { { "initial_state/", "" }, { "final_state/", "" }, { "final_state/out.txt", "x\n" } });

  const fs::path failing = work / "run_failing";
  write_tree(failing / "writes_out", { { "initial_state/", "" }, { "final_state/", "" }, { "final_state/out.txt", "x\n" } });
  write_tree(failing / "wants_other", { { "initial_state/", "" }, { "final_state/", "" }, { "final_state/other.txt", "x\n" } });

  const std::vector<std::string> command = { "--", "/bin/sh", "-c", "echo x > out.txt", "sh" };
  const auto with_command = [&command](std::vector<std::string> args) {
    args.insert(args.end(), command.begin(), command.end());
    return args;
  };

  ok = expect(run_program(tool, with_command({ passing.string() })) == 0, "Passing scenario should exit 0") && ok;
  ok = expect(run_program(tool, with_command({ failing.string() })) == 1, "A failing scenario should exit 1") && ok;
  ok = expect(run_program(tool, with_command({ failing.string(), "--check", "none" })) == 0, "--check none should skip the final state") && ok;
  ok = expect(run_program(tool, with_command({ failing.string(), "--check", "names", "--allow-extra" })) == 1, "Missing expected file should still fail with --allow-extra") &&
       ok;
  ok = expect(run_program(tool, with_command({ passing.string(), "--require-initial", "--initial-name", "absent" })) == 1,
              "Required initial state under another name should fail") &&
       ok;
  ok = expect(run_program(tool, { passing.string(), "--", "/bin/sh", "-c", "exit 3", "sh" }) == 1, "Failing command should fail its scenario") && ok;

  ok = expect(run_program(tool, {}) == 2, "Missing arguments should exit 2") && ok;
  ok = expect(run_program(tool, { passing.string(), "--" }) == 2, "No command after -- should exit 2") && ok;
  ok = expect(run_program(tool, { passing.string() }) == 2, "Missing -- should exit 2") && ok;
  ok = expect(run_program(tool, with_command({ passing.string(), "--check", "sometimes" })) == 2, "Unknown check strategy should exit 2") && ok;
  ok = expect(run_program(tool, with_command({ passing.string(), "--bogus" })) == 2, "Unknown flag should exit 2") && ok;
  ok = expect(run_program(tool, with_command({ (work / "no_such_root").string() })) == 2, "Missing fixtures root should exit 2") && ok;
  return ok;
}

} // namespace

int main(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "Usage: " << argv[0] << " <scenario_compare> <scenario_run>" << std::endl;
    return 1;
  }

  bool ok = true;

  try {
    const std::string compare_tool = fs::absolute(argv[1]).string();
    const std::string run_tool = fs::absolute(argv[2]).string();
    TemporaryDirectory work("scenario_r-test-tools");
    ok = test_compare_tool(compare_tool, work.path()) && ok;
    ok = test_run_tool(run_tool, work.path()) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    ok = false;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Tool tests passed" << std::endl;
  return 0;
}
