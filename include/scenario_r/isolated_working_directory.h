// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include "scenario_r/temporary_directory.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace scenario_r {

/**
 * @brief External item made available inside an isolated working directory
 *
 * Relative external paths are resolved against the working directory that
 * was current before isolation. The internal path is relative to the
 * isolated directory and defaults to the external item's file name.
 */
struct ExternalConnection {
  enum class Strategy {
    Symlink, ///< Create a symbolic link to the external item
    Copy,    ///< Copy the external file or directory tree
    Custom,  ///< Invoke connector(absolute_external, relative_internal)
  };

  using Connector = std::function<void(const std::filesystem::path &, const std::filesystem::path &)>;

  std::string external_path;
  std::optional<std::string> internal_path;
  Strategy strategy = Strategy::Symlink;
  Connector connector; ///< Used with Strategy::Custom only
};

/// Where the scratch directory of an IsolatedWorkingDirectory is created
struct ScratchDirectoryOptions {
  std::string prefix = "scenario_r-work";         ///< Name prefix; a unique suffix is appended
  std::optional<std::string> parent_directory;    ///< Existing directory to create it in (default: system temp directory)
};

/**
 * @brief Empty scratch directory made current for the lifetime of the object
 *
 * Construction creates a temporary directory and changes the process working
 * directory to it. release() (also run by the destructor) restores the
 * previous working directory and removes the scratch directory.
 *
 * @note Changes process-wide state; only one instance should be active at a
 *       time.
 */
class IsolatedWorkingDirectory {
public:
  explicit IsolatedWorkingDirectory(const std::vector<ExternalConnection> &connections = {}, const ScratchDirectoryOptions &scratch = {});
  ~IsolatedWorkingDirectory();

  IsolatedWorkingDirectory(const IsolatedWorkingDirectory &) = delete;
  IsolatedWorkingDirectory &operator=(const IsolatedWorkingDirectory &) = delete;

  const std::filesystem::path &path() const { return _directory.path(); }
  const std::filesystem::path &original_working_dir() const { return _original_working_dir; }

  /**
   * @brief Restore the previous working directory and remove the scratch directory
   * @throws ScenarioFaultError (Io) if the previous directory cannot be restored;
   *         the scratch directory is removed regardless
   */
  void release();

private:
  void connect(const ExternalConnection &connection) const;

  TemporaryDirectory _directory;
  std::filesystem::path _original_working_dir;
  bool _active = false;
};

} // namespace scenario_r
