// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "archive_type.h"
#include "scenario_r/scenario_fault_error.h"

namespace scenario_r {

void archive_deleter::operator()(struct archive *a) const {
  if (!a) {
    return;
  }
  // archive_free() dispatches to the read or write variant
  archive_free(a);
}

std::string archive_error_message(struct archive *a) {
  const char *msg = a ? archive_error_string(a) : nullptr;
  return msg ? std::string(msg) : std::string("(no libarchive message)");
}

archive_ptr new_read_archive(ArchiveContainer container, const std::function<int(struct archive *)> &opener) {
  archive_ptr ar(archive_read_new());
  if (!ar) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to allocate libarchive reader");
  }

  archive_read_support_filter_all(ar.get());
  int r = ARCHIVE_OK;
  switch (container) {
  case ArchiveContainer::Zip:
    r = archive_read_support_format_zip(ar.get());
    break;
  case ArchiveContainer::Tar:
    r = archive_read_support_format_tar(ar.get());
    break;
  }
  if (r != ARCHIVE_OK) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to enable archive format: " + archive_error_message(ar.get()));
  }

  if (opener(ar.get()) != ARCHIVE_OK) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to open archive: " + archive_error_message(ar.get()), {}, archive_errno(ar.get()));
  }
  return ar;
}

archive_ptr new_disk_writer() {
  archive_ptr writer(archive_write_disk_new());
  if (!writer) {
    throw make_scenario_fault_error(FaultKind::Io, "Failed to allocate libarchive disk writer");
  }
  archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  archive_write_disk_set_standard_lookup(writer.get());
  return writer;
}

} // namespace scenario_r
