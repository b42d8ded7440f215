// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/path_comparator.h"
#include "file_digest.h"
#include "scenario_r/archive_adapter.h"
#include "scenario_r/scenario_fault_error.h"
#include "text_file.h"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace scenario_r {

namespace fs = std::filesystem;

namespace {

ScenarioFault make_mismatch(const std::string &message, const fs::path &path) {
  ScenarioFault fault;
  fault.kind = FaultKind::ComparisonMismatch;
  fault.message = message;
  fault.path = path.string();
  return fault;
}

std::string join_names(const std::vector<std::string> &names) {
  std::string joined;
  for (const auto &name : names) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += name;
  }
  return joined;
}

bool path_exists(const fs::path &path) {
  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to stat '" + path.string() + "': " + ec.message(), path.string(), ec.value());
  }
  return exists;
}

bool is_existing_directory(const fs::path &path) {
  std::error_code ec;
  const bool result = fs::is_directory(path, ec);
  return !ec && result;
}

std::set<std::string> child_names(const fs::path &directory) {
  std::set<std::string> names;
  std::error_code ec;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    names.insert(it->path().filename().string());
  }
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to list '" + directory.string() + "': " + ec.message(), directory.string(), ec.value());
  }
  return names;
}

std::vector<std::string> difference(const std::set<std::string> &from, const std::set<std::string> &without) {
  std::vector<std::string> result;
  std::set_difference(from.begin(), from.end(), without.begin(), without.end(), std::back_inserter(result));
  return result;
}

void replace_all(std::string &text, const std::string &from, const std::string &to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Report paths inside an extracted tree relative to the archive it came from
void rebase_fault(ScenarioFault &fault, const fs::path &extracted_root, const fs::path &archive_path) {
  const std::string root = extracted_root.string();
  const std::string archive = archive_path.string();
  replace_all(fault.message, root, archive);
  replace_all(fault.path, root, archive);
}

} // namespace

PathKind classify_path(const fs::path &path) {
  if (is_existing_directory(path)) {
    return PathKind::Directory;
  }
  if (is_archive(path)) {
    return PathKind::Archive;
  }
  if (is_text_file(path.string())) {
    return PathKind::Text;
  }
  return PathKind::Binary;
}

PathComparator::PathComparator(ComparisonOptions defaults)
    : _defaults(defaults) {}

std::optional<ScenarioFault> PathComparator::compare(const fs::path &left, const fs::path &right) const { return compare(left, right, _defaults); }

std::optional<ScenarioFault> PathComparator::compare(const fs::path &left, const fs::path &right, const ComparisonOptions &options) const {
  if (!path_exists(left)) {
    return make_mismatch(left.string() + " does not exist", left);
  }
  if (!path_exists(right)) {
    return make_mismatch(right.string() + " does not exist", right);
  }

  const PathKind kind = classify_path(left);
  if (kind != PathKind::Directory && is_existing_directory(right)) {
    return make_mismatch(right.string() + " is a directory, expected a file like " + left.string(), right);
  }

  switch (kind) {
  case PathKind::Directory:
    return compare_directories(left, right, options);
  case PathKind::Archive:
    return compare_archives(left, right, options);
  case PathKind::Text:
    return compare_text_files(left, right);
  case PathKind::Binary:
    return compare_file_hashes(left, right);
  }
  return std::nullopt;
}

bool PathComparator::equal(const fs::path &left, const fs::path &right) const { return equal(left, right, _defaults); }

bool PathComparator::equal(const fs::path &left, const fs::path &right, const ComparisonOptions &options) const {
  const std::optional<ScenarioFault> mismatch = compare(left, right, options);
  if (mismatch) {
    dispatch_fault(*mismatch);
    return false;
  }
  return true;
}

std::optional<ScenarioFault> PathComparator::compare_directories(const fs::path &left, const fs::path &right, const ComparisonOptions &options) const {
  if (!is_existing_directory(right)) {
    return make_mismatch(right.string() + " is not a directory", right);
  }

  const std::set<std::string> left_names = child_names(left);
  const std::set<std::string> right_names = child_names(right);

  if (options.right_must_contain_left) {
    const std::vector<std::string> missing = difference(left_names, right_names);
    if (!missing.empty()) {
      return make_mismatch(right.string() + " is missing items present in " + left.string() + ": " + join_names(missing), right / missing.front());
    }
  }
  if (options.left_must_contain_right) {
    const std::vector<std::string> missing = difference(right_names, left_names);
    if (!missing.empty()) {
      return make_mismatch(left.string() + " is missing items present in " + right.string() + ": " + join_names(missing), right / missing.front());
    }
  }

  for (const auto &name : left_names) {
    if (right_names.find(name) == right_names.end()) {
      continue;
    }
    // Children always use the configured default, never the caller's override
    if (auto mismatch = compare(left / name, right / name, _defaults)) {
      return mismatch;
    }
  }
  return std::nullopt;
}

std::optional<ScenarioFault> PathComparator::compare_archives(const fs::path &left, const fs::path &right, const ComparisonOptions &options) const {
  const ExtractedTree left_tree = extract_archive(left);
  const ExtractedTree right_tree = extract_archive(right);

  std::optional<ScenarioFault> mismatch = compare_directories(left_tree.path(), right_tree.path(), options);
  if (mismatch) {
    rebase_fault(*mismatch, left_tree.path(), left);
    rebase_fault(*mismatch, right_tree.path(), right);
  }
  return mismatch;
}

bool paths_equal(const fs::path &left, const fs::path &right, const ComparisonOptions &options) { return PathComparator(options).equal(left, right); }

void require_paths_equal(const fs::path &left, const fs::path &right, const ComparisonOptions &options) {
  if (auto mismatch = PathComparator(options).compare(left, right)) {
    throw ScenarioFaultError(std::move(*mismatch));
  }
}

std::optional<ScenarioFault> compare_text_files(const fs::path &left, const fs::path &right) {
  TextLineReader left_reader(left.string());
  TextLineReader right_reader(right.string());

  std::string left_line;
  std::string right_line;
  for (std::size_t line = 1;; ++line) {
    const bool has_left = left_reader.next_line(left_line);
    const bool has_right = right_reader.next_line(right_line);
    if (!has_left && !has_right) {
      return std::nullopt;
    }
    if (!has_right) {
      return make_mismatch(right.string() + " ends on line " + std::to_string(line) + ", expected to continue", right);
    }
    if (!has_left) {
      return make_mismatch(right.string() + " continues past line " + std::to_string(line - 1) + ", expected to end", right);
    }
    if (left_line != right_line) {
      return make_mismatch(right.string() + " does not match " + left.string() + " on line " + std::to_string(line), right);
    }
  }
}

std::optional<ScenarioFault> compare_file_hashes(const fs::path &left, const fs::path &right) {
  const std::string left_hash = sha256_file_hex(left.string());
  const std::string right_hash = sha256_file_hex(right.string());
  if (left_hash == right_hash) {
    return std::nullopt;
  }
  return make_mismatch("Hash of " + right.string() + " does not match " + left.string() + " (sha256 " + right_hash + " != " + left_hash + ")", right);
}

std::set<std::string> collect_file_names(const fs::path &root) {
  std::set<std::string> names;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      continue;
    }
    names.insert(it->path().lexically_relative(root).generic_string());
  }
  if (ec) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to walk '" + root.string() + "': " + ec.message(), root.string(), ec.value());
  }
  return names;
}

std::optional<ScenarioFault> compare_file_names(const fs::path &expected, const fs::path &actual, bool allow_extra_in_actual) {
  const std::set<std::string> expected_names = collect_file_names(expected);
  const std::set<std::string> actual_names = collect_file_names(actual);

  const std::vector<std::string> missing = difference(expected_names, actual_names);
  if (!missing.empty()) {
    return make_mismatch(actual.string() + " is missing files present in " + expected.string() + ": " + join_names(missing), actual / missing.front());
  }
  if (!allow_extra_in_actual) {
    const std::vector<std::string> unexpected = difference(actual_names, expected_names);
    if (!unexpected.empty()) {
      return make_mismatch(actual.string() + " contains files absent from " + expected.string() + ": " + join_names(unexpected), actual / unexpected.front());
    }
  }
  return std::nullopt;
}

bool file_names_equal(const fs::path &expected, const fs::path &actual, bool allow_extra_in_actual) {
  const std::optional<ScenarioFault> mismatch = compare_file_names(expected, actual, allow_extra_in_actual);
  if (mismatch) {
    dispatch_fault(*mismatch);
    return false;
  }
  return true;
}

} // namespace scenario_r
