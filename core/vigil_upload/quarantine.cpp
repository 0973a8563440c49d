// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "quarantine.hpp"

#include <unistd.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <random>
#include <system_error>

#define VIGIL_LOG_COMPONENT "quarantine"
#include "integrity_log.hpp"

namespace vigil {
namespace upload {

using logging::kv;

namespace {

std::atomic<uint64_t> g_quarantine_sequence{0};

// Leaves room for the suffix within a 255-byte directory entry
constexpr size_t kMaxQuarantineStem = 200;

uint32_t random_suffix() {
  thread_local std::mt19937 rng(std::random_device{}());
  return static_cast<uint32_t>(rng());
}

}  // namespace

std::string make_quarantine_path(const std::string& quarantine_dir, const std::string& filename) {
  uint64_t sequence = g_quarantine_sequence.fetch_add(1);

  char suffix[64];
  snprintf(
    suffix, sizeof(suffix), "%ld-%llu-%08x", static_cast<long>(getpid()),
    static_cast<unsigned long long>(sequence), random_suffix()
  );

  std::string dir = quarantine_dir;
  if (!dir.empty() && dir.back() != '/') {
    dir += '/';
  }
  return dir + "." + filename.substr(0, kMaxQuarantineStem) + "." + suffix + ".part";
}

bool QuarantineGuard::discard() {
  std::error_code ec;
  filesystem_.remove(path_, ec);
  if (ec) {
    VIGIL_LOG_WARN(
      "Failed to remove quarantined file" << kv("path", path_) << kv("error", ec.message())
    );
    return false;
  }
  VIGIL_LOG_DEBUG("Quarantined file removed" << kv("path", path_));
  return true;
}

}  // namespace upload
}  // namespace vigil
