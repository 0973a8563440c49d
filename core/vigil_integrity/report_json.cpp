// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "report_json.hpp"

#include <variant>

#include "checksum_accumulator.hpp"

namespace vigil {
namespace integrity {

void to_json(nlohmann::json& j, const ValidationReport& report) {
  j = nlohmann::json{
    {"file_path", report.file_path},
    {"crc32", report.calculated_crc},
    {"crc32_hex", crc_to_hex(report.calculated_crc)},
    {"strategy", to_string(report.strategy)},
    {"bytes_processed", report.bytes_processed},
    {"duration_ms", report.duration_ms},
    {"throughput_mbps", report.throughput_mbps},
    {"memory_usage_mb", report.memory_usage_mb},
  };
}

void to_json(nlohmann::json& j, const FingerprintReport& report) {
  j = nlohmann::json{
    {"file_path", report.file_path},
    {"crc32", report.crc32},
    {"crc32_hex", crc_to_hex(report.crc32)},
    {"strategy", to_string(report.strategy)},
    {"latency_ms", report.latency_ms},
    {"total_size", report.total_size},
    {"head_bytes", report.head_bytes},
    {"tail_bytes", report.tail_bytes},
    {"memory_usage_mb", report.memory_usage_mb},
  };
}

void to_json(nlohmann::json& j, const ValidationError& error) {
  j = nlohmann::json{
    {"code", to_string(error.code)},
    {"source", error.source},
    {"message", error.message},
  };
  if (!error.cause.empty()) {
    j["cause"] = error.cause;
  }

  switch (error.code) {
    case ErrorCode::SizeMismatch:
      j["expected_size"] = error.expected_size;
      j["actual_size"] = error.actual_size;
      break;
    case ErrorCode::ChecksumMismatch:
      j["expected_crc32"] = crc_to_hex(error.expected_crc);
      j["actual_crc32"] = crc_to_hex(error.actual_crc);
      break;
    case ErrorCode::FilenameRejected:
      j["rule"] = error.rule;
      break;
    default:
      break;
  }
}

void to_json(nlohmann::json& j, const StrategyResult& result) {
  j = nlohmann::json{{"valid", result.valid}, {"strategy", to_string(result.strategy)}};
  if (!result.valid) {
    j["error"] = result.error;
    return;
  }
  std::visit([&j](const auto& report) { j["report"] = report; }, result.report);
}

}  // namespace integrity
}  // namespace vigil
