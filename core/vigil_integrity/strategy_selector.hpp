// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_STRATEGY_SELECTOR_HPP
#define VIGIL_STRATEGY_SELECTOR_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

#include "fingerprint_generator.hpp"
#include "integrity_types.hpp"
#include "streaming_validator.hpp"

namespace vigil {
namespace integrity {

/**
 * Report produced by whichever strategy ran.
 * FullStream and FullBufferRead yield a ValidationReport, Fingerprint a
 * FingerprintReport.
 */
using StrategyReport = std::variant<ValidationReport, FingerprintReport>;

struct StrategyResult {
  bool valid;
  Strategy strategy;
  StrategyReport report;
  ValidationError error;

  explicit operator bool() const {
    return valid;
  }

  static StrategyResult success(Strategy strategy, StrategyReport report) {
    return {true, strategy, std::move(report), {}};
  }

  static StrategyResult failure(Strategy strategy, ValidationError error) {
    return {false, strategy, ValidationReport(), std::move(error)};
  }
};

/**
 * Maps (file size, use case) to a validation strategy and runs it.
 *
 * Upload and SecurityAudit always get FullStream, whatever the size.
 * CacheCheck and Telemetry get Fingerprint, or FullBufferRead when the
 * file is no larger than full_buffer_threshold_bytes.
 */
class StrategySelector {
public:
  explicit StrategySelector(IntegrityConfig config = IntegrityConfig());

  /**
   * Constructor with injected dependencies (for testing). The stat in run()
   * and every strategy go through the same filesystem and stream factory.
   */
  StrategySelector(
    IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
    std::shared_ptr<IFileStreamFactory> stream_factory
  );

  Strategy select(uint64_t file_size_bytes, UseCase use_case) const;

  /**
   * Peak buffer a strategy needs for a file of the given size, in MiB.
   */
  double memory_estimate_mb(uint64_t file_size_bytes, Strategy strategy) const;

  /**
   * Stat the file, select a strategy and execute it.
   */
  StrategyResult run(const std::string& path, UseCase use_case) const;

private:
  IntegrityConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;
  StreamingValidator validator_;
  FingerprintGenerator fingerprinter_;
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_STRATEGY_SELECTOR_HPP
