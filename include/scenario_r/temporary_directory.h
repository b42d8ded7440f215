// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include <filesystem>
#include <string>

namespace scenario_r {

/**
 * @brief Uniquely named scratch directory removed on destruction
 *
 * The directory is created under parent, or under
 * std::filesystem::temp_directory_path() when parent is empty, with the given
 * name prefix. The stored path is absolute. Move-only; a moved-from instance
 * owns nothing.
 */
class TemporaryDirectory {
public:
  explicit TemporaryDirectory(const std::string &prefix = "scenario_r", const std::filesystem::path &parent = {});
  ~TemporaryDirectory();

  TemporaryDirectory(const TemporaryDirectory &) = delete;
  TemporaryDirectory &operator=(const TemporaryDirectory &) = delete;
  TemporaryDirectory(TemporaryDirectory &&other) noexcept;
  TemporaryDirectory &operator=(TemporaryDirectory &&other) noexcept;

  const std::filesystem::path &path() const { return _path; }

  /**
   * @brief Remove the directory now
   * @throws ScenarioFaultError (Io) if removal fails
   */
  void cleanup();

private:
  std::filesystem::path _path;
};

} // namespace scenario_r
