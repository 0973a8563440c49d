// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_INTEGRITY_TYPES_HPP
#define VIGIL_INTEGRITY_TYPES_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace vigil {
namespace integrity {

constexpr uint64_t kBytesPerMiB = 1024 * 1024;
constexpr uint64_t kDefaultChunkSizeBytes = kBytesPerMiB;
constexpr uint64_t kMaxChunkSizeBytes = 64 * kBytesPerMiB;
constexpr uint64_t kDefaultWindowBytes = 64 * 1024;
constexpr uint64_t kDefaultFullBufferThresholdBytes = 128 * 1024;

/**
 * Tunables shared by the validator, the fingerprint generator and the
 * strategy selector.
 */
struct IntegrityConfig {
  uint64_t chunk_size_bytes = kDefaultChunkSizeBytes;
  uint64_t head_window_bytes = kDefaultWindowBytes;
  uint64_t tail_window_bytes = kDefaultWindowBytes;
  // CacheCheck/Telemetry files at or below this size are read in one buffer
  uint64_t full_buffer_threshold_bytes = kDefaultFullBufferThresholdBytes;
};

/**
 * Validation algorithm applied to a source.
 */
enum class Strategy {
  FullStream,     // every byte, fixed-size chunks
  Fingerprint,    // head window + tail window + size, approximate
  FullBufferRead  // whole (small) file in one buffer, exact
};

/**
 * Why the caller is validating. Drives StrategySelector.
 */
enum class UseCase { Upload, CacheCheck, SecurityAudit, Telemetry };

enum class ErrorCode {
  NotFound,
  EmptyFile,
  ReadFailure,
  WriteFailure,
  FilenameRejected,
  SizeMismatch,
  ChecksumMismatch,
  Cancelled,
  InvalidArgument
};

std::string to_string(Strategy strategy);
std::string to_string(UseCase use_case);
std::string to_string(ErrorCode code);

/**
 * Parse "upload", "cache-check", "security-audit" or "telemetry".
 * Underscores are accepted in place of dashes.
 */
std::optional<UseCase> parse_use_case(const std::string& str);

/**
 * Failure of any engine operation.
 *
 * `source` always names the file path or stream label the operation was
 * working on; `cause` holds the underlying I/O reason when there is one.
 */
struct ValidationError {
  ErrorCode code = ErrorCode::ReadFailure;
  std::string source;
  std::string message;
  std::string cause;

  // SizeMismatch: declared vs. received bytes
  uint64_t expected_size = 0;
  uint64_t actual_size = 0;

  // ChecksumMismatch: declared vs. computed CRC
  uint32_t expected_crc = 0;
  uint32_t actual_crc = 0;

  // FilenameRejected: name of the matching rule
  std::string rule;

  /**
   * "<message>: <source> (<cause>)", omitting empty parts.
   */
  std::string describe() const;

  static ValidationError make(
    ErrorCode code, const std::string& source, const std::string& message,
    const std::string& cause = ""
  ) {
    ValidationError error;
    error.code = code;
    error.source = source;
    error.message = message;
    error.cause = cause;
    return error;
  }
};

/**
 * Outcome of a full-stream or full-buffer validation.
 */
struct ValidationReport {
  std::string file_path;
  uint32_t calculated_crc = 0;
  Strategy strategy = Strategy::FullStream;
  uint64_t bytes_processed = 0;
  double duration_ms = 0.0;
  double throughput_mbps = 0.0;  // finite and >= 0
  double memory_usage_mb = 0.0;  // buffer bound, not file size
};

/**
 * Approximate identity from head window, tail window and total size.
 * Suitable for cache keys and fast rejection only.
 */
struct FingerprintReport {
  std::string file_path;
  uint32_t crc32 = 0;
  Strategy strategy = Strategy::Fingerprint;
  double latency_ms = 0.0;
  uint64_t total_size = 0;
  uint64_t head_bytes = 0;
  uint64_t tail_bytes = 0;
  double memory_usage_mb = 0.0;
};

struct ValidationResult {
  bool valid;
  ValidationReport report;
  ValidationError error;

  explicit operator bool() const {
    return valid;
  }

  static ValidationResult success(ValidationReport report) {
    return {true, std::move(report), {}};
  }

  static ValidationResult failure(ValidationError error) {
    return {false, {}, std::move(error)};
  }
};

struct FingerprintResult {
  bool valid;
  FingerprintReport report;
  ValidationError error;

  explicit operator bool() const {
    return valid;
  }

  static FingerprintResult success(FingerprintReport report) {
    return {true, std::move(report), {}};
  }

  static FingerprintResult failure(ValidationError error) {
    return {false, {}, std::move(error)};
  }
};

/**
 * Throughput in MiB/s with the elapsed time floored at one microsecond.
 * Never NaN, never infinite, never negative.
 */
double compute_throughput_mbps(uint64_t bytes, double duration_ms);

/**
 * Caller-owned abort flag, polled between chunk reads.
 *
 * One token may be shared by the thread that runs an operation and the
 * thread that decides to abort it.
 */
class CancellationToken {
public:
  void cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_INTEGRITY_TYPES_HPP
