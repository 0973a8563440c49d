// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "integrity_types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace vigil {
namespace integrity {

namespace {

// One microsecond, in seconds
constexpr double kMinElapsedSeconds = 1e-6;

}  // namespace

std::string to_string(Strategy strategy) {
  switch (strategy) {
    case Strategy::FullStream:
      return "full-stream";
    case Strategy::Fingerprint:
      return "fingerprint";
    case Strategy::FullBufferRead:
      return "full-buffer-read";
  }
  return "unknown";
}

std::string to_string(UseCase use_case) {
  switch (use_case) {
    case UseCase::Upload:
      return "upload";
    case UseCase::CacheCheck:
      return "cache-check";
    case UseCase::SecurityAudit:
      return "security-audit";
    case UseCase::Telemetry:
      return "telemetry";
  }
  return "unknown";
}

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::EmptyFile:
      return "empty_file";
    case ErrorCode::ReadFailure:
      return "read_failure";
    case ErrorCode::WriteFailure:
      return "write_failure";
    case ErrorCode::FilenameRejected:
      return "filename_rejected";
    case ErrorCode::SizeMismatch:
      return "size_mismatch";
    case ErrorCode::ChecksumMismatch:
      return "checksum_mismatch";
    case ErrorCode::Cancelled:
      return "cancelled";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

std::optional<UseCase> parse_use_case(const std::string& str) {
  std::string lower = str;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });

  if (lower == "upload") return UseCase::Upload;
  if (lower == "cache-check" || lower == "cache") return UseCase::CacheCheck;
  if (lower == "security-audit" || lower == "audit") return UseCase::SecurityAudit;
  if (lower == "telemetry") return UseCase::Telemetry;
  return std::nullopt;
}

std::string ValidationError::describe() const {
  std::string out = message.empty() ? to_string(code) : message;
  if (!source.empty()) {
    out += ": " + source;
  }
  if (!cause.empty()) {
    out += " (" + cause + ")";
  }
  return out;
}

double compute_throughput_mbps(uint64_t bytes, double duration_ms) {
  double seconds = duration_ms / 1000.0;
  if (!std::isfinite(seconds) || seconds < kMinElapsedSeconds) {
    seconds = kMinElapsedSeconds;
  }

  double mbps = (static_cast<double>(bytes) / static_cast<double>(kBytesPerMiB)) / seconds;
  if (!std::isfinite(mbps) || mbps < 0.0) {
    return 0.0;
  }
  return mbps;
}

}  // namespace integrity
}  // namespace vigil
