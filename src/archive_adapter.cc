// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "scenario_r/archive_adapter.h"
#include "archive_type.h"
#include "scenario_r/scenario_fault_error.h"

#include <algorithm>
#include <utility>

namespace scenario_r {

namespace {

constexpr std::size_t kReadBlockSize = 10240;

const std::vector<std::string> &compound_extensions() {
  static const std::vector<std::string> extensions = { ".tar.gz", ".tar.bz2", ".tar.xz" };
  return extensions;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ArchiveContainer container_for(const std::filesystem::path &archive_path) {
  if (!is_archive(archive_path)) {
    const std::string extension = archive_path.extension().string();
    throw make_scenario_fault_error(FaultKind::UnsupportedArchive,
                                    "Unsupported archive type '" + (extension.empty() ? std::string("(none)") : extension) + "' for " + archive_path.string(),
                                    archive_path.string());
  }
  return archive_path.extension() == ".zip" ? ArchiveContainer::Zip : ArchiveContainer::Tar;
}

// Entry names must stay inside the destination directory
bool is_safe_entry_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  const std::filesystem::path entry_path(name);
  if (entry_path.is_absolute() || entry_path.has_root_name() || entry_path.has_root_directory()) {
    return false;
  }
  for (const auto &component : entry_path) {
    if (component == "..") {
      return false;
    }
  }
  return true;
}

void copy_entry_data(struct archive *reader, struct archive *writer, const std::string &entry_name, const std::string &archive_name) {
  const void *block = nullptr;
  size_t size = 0;
  la_int64_t offset = 0;

  while (true) {
    const int r = archive_read_data_block(reader, &block, &size, &offset);
    if (r == ARCHIVE_EOF) {
      return;
    }
    if (r < ARCHIVE_WARN) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to read '" + entry_name + "' from " + archive_name + ": " + archive_error_message(reader), archive_name,
                                      archive_errno(reader));
    }
    if (archive_write_data_block(writer, block, size, offset) < ARCHIVE_WARN) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to write '" + entry_name + "' extracted from " + archive_name + ": " + archive_error_message(writer),
                                      archive_name, archive_errno(writer));
    }
  }
}

void extract_into(const std::filesystem::path &archive_path, ArchiveContainer container, const std::filesystem::path &destination) {
  const std::string archive_name = archive_path.string();
  archive_ptr reader;
  try {
    reader = new_read_archive(container, [&archive_name](struct archive *a) { return archive_read_open_filename(a, archive_name.c_str(), kReadBlockSize); });
  } catch (const ScenarioFaultError &error) {
    ScenarioFault fault = error.fault();
    fault.message += " (" + archive_name + ")";
    fault.path = archive_name;
    throw ScenarioFaultError(std::move(fault));
  }
  archive_ptr writer = new_disk_writer();

  while (true) {
    struct archive_entry *entry = nullptr;
    const int header_result = archive_read_next_header(reader.get(), &entry);
    if (header_result == ARCHIVE_EOF) {
      break;
    }
    if (header_result < ARCHIVE_WARN) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to read entry header from " + archive_name + ": " + archive_error_message(reader.get()), archive_name,
                                      archive_errno(reader.get()));
    }

    const char *raw_name = archive_entry_pathname(entry);
    const std::string entry_name = raw_name ? raw_name : "";
    if (!is_safe_entry_name(entry_name)) {
      throw make_scenario_fault_error(FaultKind::Io, "Refusing to extract entry '" + entry_name + "' outside of the destination from " + archive_name, archive_name);
    }
    archive_entry_set_pathname(entry, (destination / entry_name).string().c_str());

    const char *hardlink = archive_entry_hardlink(entry);
    if (hardlink && hardlink[0] != '\0') {
      const std::string link_name = hardlink;
      if (!is_safe_entry_name(link_name)) {
        throw make_scenario_fault_error(FaultKind::Io, "Refusing hard link '" + entry_name + "' -> '" + link_name + "' from " + archive_name, archive_name);
      }
      archive_entry_set_hardlink(entry, (destination / link_name).string().c_str());
    }

    if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to create '" + entry_name + "' extracted from " + archive_name + ": " + archive_error_message(writer.get()),
                                      archive_name, archive_errno(writer.get()));
    }

    if (archive_entry_filetype(entry) == AE_IFREG) {
      copy_entry_data(reader.get(), writer.get(), entry_name, archive_name);
    }

    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
      throw make_scenario_fault_error(FaultKind::Io, "Failed to finish '" + entry_name + "' extracted from " + archive_name + ": " + archive_error_message(writer.get()),
                                      archive_name, archive_errno(writer.get()));
    }
  }

  if (archive_write_close(writer.get()) != ARCHIVE_OK) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to complete extraction of " + archive_name + ": " + archive_error_message(writer.get()), archive_name);
  }
}

} // namespace

const std::vector<std::string> &archive_extensions() {
  static const std::vector<std::string> extensions = { ".zip", ".tar", ".gz", ".tgz", ".bz2", ".tbz2", ".xz", ".txz" };
  return extensions;
}

bool is_archive(const std::filesystem::path &path) {
  const std::string extension = path.filename().extension().string();
  if (extension.empty()) {
    return false;
  }
  const auto &known = archive_extensions();
  return std::find(known.begin(), known.end(), extension) != known.end();
}

std::string strip_archive_extension(const std::string &filename) {
  for (const auto &compound : compound_extensions()) {
    if (filename.size() > compound.size() && ends_with(filename, compound)) {
      return filename.substr(0, filename.size() - compound.size());
    }
  }

  const std::filesystem::path name(filename);
  if (!is_archive(name)) {
    return filename;
  }
  return name.stem().string();
}

ExtractedTree::ExtractedTree(TemporaryDirectory directory)
    : _directory(std::move(directory)) {}

ExtractedTree extract_archive(const std::filesystem::path &archive_path) {
  const ArchiveContainer container = container_for(archive_path);

  ExtractedTree tree(TemporaryDirectory("scenario_r-extract"));
  extract_into(archive_path, container, tree.path());
  return tree;
}

} // namespace scenario_r
