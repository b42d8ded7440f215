// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/temporary_directory.h"

#include <filesystem>
#include <string>
#include <vector>

namespace scenario_r {

/// Recognized archive extensions, matched against the last suffix of a file name
const std::vector<std::string> &archive_extensions();

/**
 * @brief Check whether a path names a recognized archive
 *
 * Purely syntactic: the last extension of the file name is compared with
 * archive_extensions(). The file is never opened.
 */
bool is_archive(const std::filesystem::path &path);

/**
 * @brief Remove an archive extension from a file name
 *
 * Compound forms (".tar.gz", ".tar.bz2", ".tar.xz") are removed as a whole.
 * Names without an archive extension are returned unchanged.
 *   strip_archive_extension("final_state.tar.gz") == "final_state"
 *   strip_archive_extension("notes.txt") == "notes.txt"
 */
std::string strip_archive_extension(const std::string &filename);

/**
 * @brief Directory holding the extracted contents of one archive
 *
 * Owns a temporary directory that is removed when the tree is destroyed.
 * Move-only.
 */
class ExtractedTree {
public:
  explicit ExtractedTree(TemporaryDirectory directory);

  ExtractedTree(ExtractedTree &&) noexcept = default;
  ExtractedTree &operator=(ExtractedTree &&) noexcept = default;

  const std::filesystem::path &path() const { return _directory.path(); }

private:
  TemporaryDirectory _directory;
};

/**
 * @brief Extract an archive into a fresh temporary directory
 *
 * ".zip" archives are read as zip containers; every other recognized
 * extension is read as a tar container whose compression (none, gzip,
 * bzip2, xz) is detected from the archive's own signature.
 *
 * @throws ScenarioFaultError UnsupportedArchive for an unrecognized
 *         extension, Io when the archive cannot be read or contains entries
 *         escaping the destination. The temporary directory is removed on
 *         every failure path.
 */
ExtractedTree extract_archive(const std::filesystem::path &archive_path);

} // namespace scenario_r
