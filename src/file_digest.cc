// SPDX-License-Identifier: MIT
// Copyright (c) 2025 scenario_r Team

#include "file_digest.h"
#include "scenario_r/scenario_fault_error.h"
#include "system_file_stream.h"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace scenario_r {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }
};

using DigestContextPtr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

[[noreturn]] void throw_digest_failure(const std::string &what, const std::string &path) {
  throw make_scenario_fault_error(FaultKind::Io, what + " for '" + path + "'", path);
}

std::string to_hex(const unsigned char *data, unsigned int size) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < size; ++i) {
    oss << std::setw(2) << static_cast<unsigned int>(data[i]);
  }
  return oss.str();
}

} // namespace

std::string sha256_file_hex(const std::string &path) {
  DigestContextPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw_digest_failure("Failed to allocate digest context", path);
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw_digest_failure("Failed to initialise SHA-256", path);
  }

  SystemFileStream stream(path);
  std::vector<unsigned char> buffer(64 * 1024);
  while (true) {
    const std::size_t n = stream.read(buffer.data(), buffer.size());
    if (n == 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer.data(), n) != 1) {
      throw_digest_failure("Failed to update SHA-256", path);
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_size = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
    throw_digest_failure("Failed to finalise SHA-256", path);
  }
  return to_hex(digest, digest_size);
}

} // namespace scenario_r
