// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_UPLOAD_HANDLER_HPP
#define VIGIL_UPLOAD_HANDLER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "filename_guard.hpp"
#include "integrity_interfaces.hpp"
#include "strategy_selector.hpp"
#include "streaming_validator.hpp"
#include "upload_state_machine.hpp"
#include "upload_types.hpp"

namespace vigil {
namespace upload {

/**
 * UploadHandler takes an untrusted byte stream to a validated, promoted
 * artifact, or to nothing at all.
 *
 * Pipeline per upload:
 *   1. FilenameGuard on the declared name (and the content-type allow-list)
 *   2. Stream into a unique quarantine file while checksumming the same
 *      chunks (one pass, no re-read), stopping as soon as the body runs
 *      past declared_size
 *   3. Compare received length to declared_size, CRC to expected_crc32
 *   4. Atomic rename into destination_dir
 *
 * Any failure or cancellation removes the quarantine file, so a rejected
 * upload never leaves a visible artifact. Uploads are independent: one
 * handler may serve many threads at once.
 */
class UploadHandler {
public:
  explicit UploadHandler(UploadConfig config);

  /**
   * Constructor with injected dependencies (for testing)
   */
  UploadHandler(
    UploadConfig config, std::shared_ptr<integrity::IFileSystem> filesystem,
    std::shared_ptr<integrity::IFileStreamFactory> stream_factory
  );

  // Non-copyable
  UploadHandler(const UploadHandler&) = delete;
  UploadHandler& operator=(const UploadHandler&) = delete;

  /**
   * Run one upload to completion.
   *
   * @param stream Incoming bytes; consumed, not closed
   * @param request Declared filename and optional size / CRC / content type
   * @param cancel Optional abort flag, polled between chunks
   * @param on_transition Optional observer of every state change
   */
  UploadOutcome handle_upload(
    integrity::IFileStream& stream, const UploadRequest& request,
    const integrity::CancellationToken* cancel = nullptr,
    UploadTransitionCallback on_transition = nullptr
  );

  /**
   * Upload a local file, e.g. from the CLI.
   */
  UploadOutcome handle_upload_file(
    const std::string& source_path, const UploadRequest& request,
    const integrity::CancellationToken* cancel = nullptr
  );

  /**
   * Re-validate a promoted artifact against the CRC recorded at upload time.
   */
  integrity::ValidationResult verify(const std::string& path, uint32_t expected_crc32) const;

  const UploadStats& stats() const {
    return stats_;
  }

  const UploadConfig& config() const {
    return config_;
  }

private:
  UploadOutcome reject(
    UploadStateMachine& state, integrity::ValidationError error, const std::string& stage
  );

  // Ensure quarantine and destination directories exist
  bool prepare_directories(std::string& error_msg);

  UploadConfig config_;
  std::shared_ptr<integrity::IFileSystem> filesystem_;
  std::shared_ptr<integrity::IFileStreamFactory> stream_factory_;
  integrity::StreamingValidator validator_;
  integrity::StrategySelector selector_;
  FilenameGuard guard_;
  UploadStats stats_;
  std::atomic<uint64_t> next_upload_id_{1};
};

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_UPLOAD_HANDLER_HPP
