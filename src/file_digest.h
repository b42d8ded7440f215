// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include <string>

namespace scenario_r {

/**
 * @brief SHA-256 of a file's full content as lowercase hex
 * @throws ScenarioFaultError (Io) on read or digest failure
 */
std::string sha256_file_hex(const std::string &path);

} // namespace scenario_r
