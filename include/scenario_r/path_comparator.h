// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/scenario_fault.h"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace scenario_r {

/**
 * @brief Subset semantics of a directory comparison
 *
 * Left and right refer to the first and second argument of a comparison.
 * Both constraints are active by default, so the two sides must hold the
 * same names. Only names present on both sides are compared recursively.
 */
struct ComparisonOptions {
  bool left_must_contain_right = true; ///< Every item of right must exist in left
  bool right_must_contain_left = true; ///< Every item of left must exist in right
};

/// How a path takes part in a comparison, derived at every level
enum class PathKind {
  Directory,
  Archive,
  Text,
  Binary,
};

/**
 * @brief Classify an existing path
 *
 * Directories first, then recognized archive names, then files whose first
 * block decodes as UTF-8 text; everything else is binary.
 */
PathKind classify_path(const std::filesystem::path &path);

/**
 * @brief Recursive content comparison of directories, archives and files
 *
 * The comparator is configured with default options. An explicit options
 * argument applies to the top-level call (and to the extracted roots when
 * the top-level paths are archives); every nested directory is compared
 * with the configured default.
 *
 * Usage:
 *   PathComparator comparator;
 *   if (!comparator.equal("expected", "actual")) { ... }
 */
class PathComparator {
public:
  explicit PathComparator(ComparisonOptions defaults = {});

  const ComparisonOptions &defaults() const { return _defaults; }

  /**
   * @brief Compare two paths
   * @return First mismatch found, or std::nullopt when the paths are equivalent
   * @throws ScenarioFaultError for I/O failures and unsupported archives
   */
  std::optional<ScenarioFault> compare(const std::filesystem::path &left, const std::filesystem::path &right) const;
  std::optional<ScenarioFault> compare(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options) const;

  /**
   * @brief Boolean form of compare()
   *
   * A mismatch is dispatched to the registered fault callback before false
   * is returned.
   */
  bool equal(const std::filesystem::path &left, const std::filesystem::path &right) const;
  bool equal(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options) const;

private:
  std::optional<ScenarioFault> compare_directories(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options) const;
  std::optional<ScenarioFault> compare_archives(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options) const;

  ComparisonOptions _defaults;
};

bool paths_equal(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options = {});

/**
 * @brief Throwing form of paths_equal()
 * @throws ScenarioFaultError (ComparisonMismatch) naming the first difference
 */
void require_paths_equal(const std::filesystem::path &left, const std::filesystem::path &right, const ComparisonOptions &options = {});

/// Compare two text files line by line with normalized line separators
std::optional<ScenarioFault> compare_text_files(const std::filesystem::path &left, const std::filesystem::path &right);

/// Compare two files by SHA-256 of their full content
std::optional<ScenarioFault> compare_file_hashes(const std::filesystem::path &left, const std::filesystem::path &right);

/**
 * @brief Relative paths of every non-directory entry below root
 *
 * Paths use '/' separators. Empty directories contribute nothing.
 */
std::set<std::string> collect_file_names(const std::filesystem::path &root);

/**
 * @brief Compare the file-name sets of two trees without reading contents
 *
 * With allow_extra_in_actual the actual tree may hold files the expected
 * tree lacks; every expected file must always be present.
 *
 * @return First mismatch found, or std::nullopt
 */
std::optional<ScenarioFault> compare_file_names(const std::filesystem::path &expected, const std::filesystem::path &actual, bool allow_extra_in_actual = false);

/// Boolean form of compare_file_names(), dispatching the mismatch on failure
bool file_names_equal(const std::filesystem::path &expected, const std::filesystem::path &actual, bool allow_extra_in_actual = false);

} // namespace scenario_r
