// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "fixture_utils.h"
#include "scenario_r/path_comparator.h"
#include "scenario_r/scenario_fault_error.h"
#include "scenario_r/temporary_directory.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

using namespace scenario_r;
using namespace scenario_r::test_helpers;

namespace {

bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << message << std::endl;
    return false;
  }
  return true;
}

bool test_kind_names() {
  bool ok = true;
  ok = expect(std::string(fault_kind_name(FaultKind::Configuration)) == "configuration", "configuration name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::AmbiguousFixture)) == "ambiguous-fixture", "ambiguous-fixture name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::MissingState)) == "missing-state", "missing-state name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::UnsupportedArchive)) == "unsupported-archive", "unsupported-archive name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::ComparisonMismatch)) == "mismatch", "mismatch name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::Execution)) == "execution", "execution name") && ok;
  ok = expect(std::string(fault_kind_name(FaultKind::Io)) == "io", "io name") && ok;
  return ok;
}

bool test_error_construction() {
  bool ok = true;
  const ScenarioFaultError error = make_scenario_fault_error(FaultKind::MissingState, "state gone", "/fixtures/a", ENOENT);
  ok = expect(std::string(error.what()) == "state gone", "what() should be the fault message") && ok;
  ok = expect(error.kind() == FaultKind::MissingState, "kind() should be the fault kind") && ok;
  ok = expect(error.fault().path == "/fixtures/a", "fault path should be kept") && ok;
  ok = expect(error.fault().errno_value == ENOENT, "errno should be kept") && ok;

  ScenarioFault fault;
  fault.kind = FaultKind::Io;
  fault.message = "direct";
  const ScenarioFaultError direct(fault);
  ok = expect(std::string(direct.what()) == "direct" && direct.kind() == FaultKind::Io, "Direct construction should keep the fault") && ok;
  return ok;
}

bool test_errno_formatting() {
  bool ok = true;
  ok = expect(format_errno_error("open failed", 0) == "open failed", "errno 0 should leave the prefix alone") && ok;
  ok = expect(format_errno_error("open failed", ENOENT) == std::string("open failed: ") + std::strerror(ENOENT), "errno text should be appended") && ok;
  ok = expect(format_path_errno_error("Failed to open", "/x/y", EACCES) == std::string("Failed to open '/x/y': ") + std::strerror(EACCES), "path should be quoted") &&
       ok;
  return ok;
}

bool test_callback_dispatch(const std::filesystem::path &work) {
  bool ok = true;
  write_file(work / "left.txt", "a\n");
  write_file(work / "right.txt", "b\n");

  // Without a callback a mismatch is only reported through the return value
  ok = expect(!paths_equal(work / "left.txt", work / "right.txt"), "different files should not be equal") && ok;

  {
    FaultCapture capture;
    dispatch_fault(ScenarioFault{ FaultKind::Execution, "direct", "", 0 });
    ok = expect(capture.faults.size() == 1 && capture.faults[0].message == "direct", "direct dispatch should reach the callback") && ok;

    ok = expect(!paths_equal(work / "left.txt", work / "right.txt"), "different files should not be equal") && ok;
    ok = expect(capture.faults.size() == 2, "mismatch should be dispatched to the callback") && ok;
    if (capture.faults.size() == 2) {
      ok = expect(capture.faults[1].kind == FaultKind::ComparisonMismatch, "dispatched kind should be mismatch") && ok;
      ok = expect(capture.faults[1].path == (work / "right.txt").string(), "dispatched fault should name the actual file") && ok;
    }
  }

  std::size_t late = 0;
  register_fault_callback([&late](const ScenarioFault &) { ++late; });
  register_fault_callback({});
  dispatch_fault(ScenarioFault{});
  ok = expect(late == 0, "unregistered callback should not be invoked") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;

  try {
    TemporaryDirectory work("scenario_r-test-fault");
    ok = test_kind_names() && ok;
    ok = test_error_construction() && ok;
    ok = test_errno_formatting() && ok;
    ok = test_callback_dispatch(work.path()) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    ok = false;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Scenario fault tests passed" << std::endl;
  return 0;
}
