// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_STREAMING_VALIDATOR_HPP
#define VIGIL_STREAMING_VALIDATOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "integrity_interfaces.hpp"
#include "integrity_types.hpp"

namespace vigil {
namespace integrity {

/**
 * Per-call knobs for StreamingValidator.
 */
struct ValidateOptions {
  // 0 selects IntegrityConfig::chunk_size_bytes
  uint64_t chunk_size_bytes = 0;

  // When set, a different final CRC fails with ChecksumMismatch
  std::optional<uint32_t> expected_crc32;

  // When set, a stream longer than this fails with SizeMismatch as soon as
  // the overflowing chunk is read; that chunk never reaches the tee
  std::optional<uint64_t> max_bytes;

  // Polled before every chunk read; not owned
  const CancellationToken* cancel = nullptr;

  // Receives every chunk, in order, right after it is checksummed; not owned.
  // Lets a caller persist a stream and checksum it in a single pass.
  IOutputStream* tee = nullptr;
};

/**
 * Exact CRC-32 validation over a byte source in fixed-size chunks.
 *
 * Memory use is one chunk buffer regardless of source size. Every call
 * owns a fresh ChecksumAccumulator; instances hold only configuration and
 * may be shared between threads.
 *
 * Failures are returned, never thrown:
 *   NotFound         - file does not exist
 *   InvalidArgument  - not a regular file, or chunk size 0 / above 64 MiB
 *   EmptyFile        - zero bytes (known up front, or observed at end-of-stream)
 *   ReadFailure      - open or mid-stream I/O error
 *   WriteFailure     - tee rejected a chunk
 *   Cancelled        - token fired between chunks
 *   ChecksumMismatch - expected_crc32 given and different
 *   SizeMismatch     - more than max_bytes read; actual_size is the count
 *                      read so far, not the full stream length
 */
class StreamingValidator {
public:
  explicit StreamingValidator(IntegrityConfig config = IntegrityConfig());

  /**
   * Constructor with injected dependencies (for testing)
   */
  StreamingValidator(
    IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
    std::shared_ptr<IFileStreamFactory> stream_factory
  );

  /**
   * Validate a file on disk with Strategy::FullStream.
   * The file handle is released before returning on every path.
   */
  ValidationResult validate_file(
    const std::string& path, const ValidateOptions& options = ValidateOptions()
  ) const;

  /**
   * Validate a sequential stream of unknown length with Strategy::FullStream.
   * `label` identifies the stream in reports and errors. The stream is
   * consumed but not closed; it belongs to the caller.
   */
  ValidationResult validate_stream(
    IFileStream& stream, const std::string& label,
    const ValidateOptions& options = ValidateOptions()
  ) const;

  /**
   * Validate a small file with one read into a buffer of its exact size
   * (Strategy::FullBufferRead). Files above kMaxChunkSizeBytes are refused
   * with InvalidArgument.
   */
  ValidationResult read_full_buffer(
    const std::string& path, const ValidateOptions& options = ValidateOptions()
  ) const;

  const IntegrityConfig& config() const {
    return config_;
  }

private:
  // Existence, type and size checks shared by the file entry points
  std::optional<ValidationError> check_file(const std::string& path, uint64_t& size) const;

  IntegrityConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::shared_ptr<IFileStreamFactory> stream_factory_;
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_STREAMING_VALIDATOR_HPP
