// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_UPLOAD_TYPES_HPP
#define VIGIL_UPLOAD_TYPES_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "integrity_types.hpp"
#include "upload_state_machine.hpp"

namespace vigil {
namespace upload {

/**
 * Configuration for the UploadHandler
 */
struct UploadConfig {
  // Promoted artifacts land here
  std::string destination_dir = "/var/lib/vigil/artifacts";

  // Uploads in progress; empty means <destination_dir>/.quarantine.
  // Must be on the same filesystem as destination_dir for atomic rename.
  std::string quarantine_dir;

  // Empty list accepts any (or no) content type
  std::vector<std::string> allowed_content_types;

  integrity::IntegrityConfig integrity;

  std::string effective_quarantine_dir() const {
    if (!quarantine_dir.empty()) {
      return quarantine_dir;
    }
    return destination_dir + "/.quarantine";
  }
};

/**
 * Metadata accompanying an incoming byte stream.
 *
 * declared_size comes from the transport (e.g. Content-Length); when absent
 * the upload is accepted at whatever length arrives.
 */
struct UploadRequest {
  std::string declared_filename;
  std::optional<uint64_t> declared_size;
  std::optional<uint32_t> expected_crc32;
  std::optional<std::string> content_type;
};

struct UploadIntegrity {
  std::string algorithm = "crc32";
  uint32_t crc32 = 0;
};

struct UploadResult {
  std::string path;
  UploadIntegrity integrity;
  double throughput_mbps = 0.0;
  uint64_t bytes = 0;
};

struct UploadOutcome {
  bool valid;
  UploadResult result;
  integrity::ValidationError error;
  UploadState final_state;

  explicit operator bool() const {
    return valid;
  }

  static UploadOutcome success(UploadResult result) {
    return {true, std::move(result), {}, UploadState::PROMOTED};
  }

  static UploadOutcome failure(integrity::ValidationError error) {
    return {false, {}, std::move(error), UploadState::REJECTED};
  }
};

/**
 * Handler statistics
 */
struct UploadStats {
  std::atomic<uint64_t> uploads_active{0};
  std::atomic<uint64_t> uploads_completed{0};
  std::atomic<uint64_t> uploads_rejected{0};
  std::atomic<uint64_t> bytes_received{0};
};

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_UPLOAD_TYPES_HPP
