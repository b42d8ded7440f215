// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "fixture_utils.h"
#include "scenario_r/archive_adapter.h"
#include "scenario_r/scenario_fault_error.h"
#include "scenario_r/temporary_directory.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

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

bool test_is_archive() {
  bool ok = true;
  const std::vector<std::string> archives = { "a.zip", "a.tar", "a.gz", "a.tgz", "a.bz2", "a.tbz2", "a.xz", "a.txz", "a.tar.gz", "dir/final_state.tar.xz" };
  for (const auto &name : archives) {
    ok = expect(is_archive(name), "Expected archive: " + name) && ok;
  }

  const std::vector<std::string> others = { "a", "a.txt", "a.zip.txt", "a.ZIP", "zip", ".zip", "a.7z", "a.rar" };
  for (const auto &name : others) {
    ok = expect(!is_archive(name), "Expected non-archive: " + name) && ok;
  }
  return ok;
}

bool test_strip_archive_extension() {
  bool ok = true;
  ok = expect(strip_archive_extension("final_state.tar.gz") == "final_state", "compound .tar.gz not stripped") && ok;
  ok = expect(strip_archive_extension("final_state.tar.bz2") == "final_state", "compound .tar.bz2 not stripped") && ok;
  ok = expect(strip_archive_extension("final_state.tar.xz") == "final_state", "compound .tar.xz not stripped") && ok;
  ok = expect(strip_archive_extension("initial_state.zip") == "initial_state", ".zip not stripped") && ok;
  ok = expect(strip_archive_extension("scenario.tgz") == "scenario", ".tgz not stripped") && ok;
  ok = expect(strip_archive_extension("initial_state") == "initial_state", "plain name changed") && ok;
  ok = expect(strip_archive_extension("initial_state.txt") == "initial_state.txt", "non-archive extension stripped") && ok;
  ok = expect(strip_archive_extension("a.b.zip") == "a.b", "only the archive extension should go") && ok;
  ok = expect(strip_archive_extension(".tar.gz") == ".tar", "hidden-name handling changed") && ok;
  return ok;
}

bool test_extract_formats(const std::filesystem::path &work) {
  bool ok = true;
  const FileMap files = { { "a.txt", "alpha\n" }, { "nested/", "" }, { "nested/b.bin", std::string("\x00\x01\x02", 3) } };

  const std::vector<std::pair<std::string, ArchiveLayout>> cases = {
    { "sample.zip", ArchiveLayout::Zip },        { "sample.tar", ArchiveLayout::Tar },       { "sample.tar.gz", ArchiveLayout::TarGzip },
    { "sample.tgz", ArchiveLayout::TarGzip },    { "sample.tar.bz2", ArchiveLayout::TarBzip2 }, { "sample.tbz2", ArchiveLayout::TarBzip2 },
    { "sample.tar.xz", ArchiveLayout::TarXz },   { "sample.txz", ArchiveLayout::TarXz },
  };

  for (const auto &[name, layout] : cases) {
    const auto archive_path = work / name;
    build_archive(archive_path, files, layout);

    std::filesystem::path extracted_root;
    try {
      ExtractedTree tree = extract_archive(archive_path);
      extracted_root = tree.path();
      ok = expect(std::filesystem::is_directory(extracted_root), "Extraction root missing for " + name) && ok;
      ok = expect(read_file(extracted_root / "a.txt") == "alpha\n", "a.txt content mismatch for " + name) && ok;
      ok = expect(read_file(extracted_root / "nested" / "b.bin") == std::string("\x00\x01\x02", 3), "nested/b.bin content mismatch for " + name) && ok;
    } catch (const std::exception &ex) {
      std::cerr << "Unexpected exception extracting " << name << ": " << ex.what() << std::endl;
      ok = false;
    }
    ok = expect(!extracted_root.empty() && !std::filesystem::exists(extracted_root), "Extraction directory not removed for " + name) && ok;
  }

  // The tar filter is detected from the data, not from the name
  const auto misnamed = work / "actually_gzip.tar";
  build_archive(misnamed, files, ArchiveLayout::TarGzip);
  try {
    ExtractedTree tree = extract_archive(misnamed);
    ok = expect(read_file(tree.path() / "a.txt") == "alpha\n", "gzip data behind .tar name not extracted") && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception for misnamed archive: " << ex.what() << std::endl;
    ok = false;
  }
  return ok;
}

bool test_extract_failures(const std::filesystem::path &work) {
  bool ok = true;
  PrivateTempRoot temp_root(work / "private_tmp");
  const std::size_t before = temp_root.entry_count();

  {
    write_file(work / "plain.txt", "not an archive");
    bool threw = false;
    try {
      (void)extract_archive(work / "plain.txt");
    } catch (const ScenarioFaultError &error) {
      threw = error.kind() == FaultKind::UnsupportedArchive;
      ok = expect(std::string(error.what()).find("Unsupported archive type") != std::string::npos, "Unsupported archive message missing") && ok;
    }
    ok = expect(threw, "Expected UnsupportedArchive for .txt") && ok;
  }

  {
    write_file(work / "corrupt.tar.gz", "this is not gzip data at all");
    bool threw = false;
    try {
      (void)extract_archive(work / "corrupt.tar.gz");
    } catch (const ScenarioFaultError &error) {
      threw = error.kind() == FaultKind::Io;
      ok = expect(error.fault().path == (work / "corrupt.tar.gz").string(), "Corrupt archive fault should name the archive") && ok;
    }
    ok = expect(threw, "Expected Io fault for corrupt archive") && ok;
  }

  {
    build_archive(work / "escape.tar", { { "../escaped.txt", "boom" } }, ArchiveLayout::Tar);
    bool threw = false;
    try {
      (void)extract_archive(work / "escape.tar");
    } catch (const ScenarioFaultError &error) {
      threw = error.kind() == FaultKind::Io;
    }
    ok = expect(threw, "Expected entry escaping the destination to be refused") && ok;
    ok = expect(!std::filesystem::exists(work / "private_tmp" / "escaped.txt"), "Escaping entry was written") && ok;
  }

  ok = expect(temp_root.entry_count() == before, "Failed extractions leaked temporary directories") && ok;
  return ok;
}

bool test_extracted_tree_move(const std::filesystem::path &work) {
  bool ok = true;
  build_archive(work / "move.zip", { { "x.txt", "x" } }, ArchiveLayout::Zip);

  std::filesystem::path root;
  {
    ExtractedTree first = extract_archive(work / "move.zip");
    root = first.path();
    ExtractedTree second = std::move(first);
    ok = expect(second.path() == root, "Moved tree should keep its directory") && ok;
    ok = expect(std::filesystem::exists(root / "x.txt"), "Moved tree content missing") && ok;
  }
  ok = expect(!std::filesystem::exists(root), "Moved tree not removed at scope exit") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;

  try {
    TemporaryDirectory work("scenario_r-test-archive");
    ok = test_is_archive() && ok;
    ok = test_strip_archive_extension() && ok;
    ok = test_extract_formats(work.path()) && ok;
    ok = test_extract_failures(work.path()) && ok;
    ok = test_extracted_tree_move(work.path()) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    ok = false;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Archive adapter tests passed" << std::endl;
  return 0;
}
