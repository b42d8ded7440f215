// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <functional>
#include <memory>
#include <string>

namespace scenario_r {

struct archive_deleter {
  void operator()(struct archive *a) const;
};

using archive_ptr = std::unique_ptr<struct archive, archive_deleter>;

/// Container layouts understood by the extractor
enum class ArchiveContainer {
  Zip,
  Tar,
};

/**
 * @brief Create a read handle restricted to one container format
 *
 * All compression filters are enabled so that the filter is detected from
 * the data. The opener is invoked with the configured handle and must
 * return a libarchive status code.
 */
archive_ptr new_read_archive(ArchiveContainer container, const std::function<int(struct archive *)> &opener);

/// Create a disk writer refusing ".." components and writes through symlinks
archive_ptr new_disk_writer();

/// archive_error_string() or a placeholder when libarchive has no message
std::string archive_error_message(struct archive *a);

} // namespace scenario_r
