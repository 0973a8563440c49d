// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "strategy_selector.hpp"

#include <algorithm>
#include <utility>

#include "integrity_impl.hpp"

#define VIGIL_LOG_COMPONENT "strategy_selector"
#include "integrity_log.hpp"

namespace vigil {
namespace integrity {

using logging::kv;

StrategySelector::StrategySelector(IntegrityConfig config)
    : StrategySelector(
        config, std::make_shared<FileSystemImpl>(), std::make_shared<FileStreamFactoryImpl>()
      ) {}

StrategySelector::StrategySelector(
  IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
  std::shared_ptr<IFileStreamFactory> stream_factory
)
    : config_(config)
    , filesystem_(filesystem)
    , validator_(config, filesystem, stream_factory)
    , fingerprinter_(config, std::move(filesystem), std::move(stream_factory)) {}

Strategy StrategySelector::select(uint64_t file_size_bytes, UseCase use_case) const {
  switch (use_case) {
    case UseCase::Upload:
    case UseCase::SecurityAudit:
      // Correctness-critical: never approximate, never size-dependent
      return Strategy::FullStream;
    case UseCase::CacheCheck:
    case UseCase::Telemetry:
      if (file_size_bytes <= config_.full_buffer_threshold_bytes) {
        return Strategy::FullBufferRead;
      }
      return Strategy::Fingerprint;
  }
  return Strategy::FullStream;
}

double StrategySelector::memory_estimate_mb(uint64_t file_size_bytes, Strategy strategy) const {
  uint64_t bytes = 0;
  switch (strategy) {
    case Strategy::FullStream:
      bytes = config_.chunk_size_bytes;
      break;
    case Strategy::Fingerprint: {
      uint64_t head = std::min(config_.head_window_bytes, file_size_bytes);
      uint64_t tail = std::min(config_.tail_window_bytes, file_size_bytes - head);
      bytes = std::max<uint64_t>(1, std::min(std::max(head, tail), config_.chunk_size_bytes));
      break;
    }
    case Strategy::FullBufferRead:
      bytes = file_size_bytes;
      break;
  }
  return static_cast<double>(bytes) / static_cast<double>(kBytesPerMiB);
}

StrategyResult StrategySelector::run(const std::string& path, UseCase use_case) const {
  uint64_t size = 0;
  std::error_code ec;
  if (filesystem_->exists(path)) {
    size = filesystem_->file_size(path, ec);
  }

  // Size 0 (missing, unreadable or empty) still goes through the chosen
  // strategy so the caller gets its precise error
  Strategy strategy = select(ec ? 0 : size, use_case);
  VIGIL_LOG_DEBUG(
    "Strategy selected" << kv("path", path) << kv("use_case", to_string(use_case))
                        << kv("strategy", to_string(strategy)) << kv("size", size)
  );

  switch (strategy) {
    case Strategy::FullStream: {
      auto result = validator_.validate_file(path);
      if (!result) {
        return StrategyResult::failure(strategy, std::move(result.error));
      }
      return StrategyResult::success(strategy, std::move(result.report));
    }
    case Strategy::FullBufferRead: {
      auto result = validator_.read_full_buffer(path);
      if (!result) {
        return StrategyResult::failure(strategy, std::move(result.error));
      }
      return StrategyResult::success(strategy, std::move(result.report));
    }
    case Strategy::Fingerprint: {
      auto result = fingerprinter_.generate(path);
      if (!result) {
        return StrategyResult::failure(strategy, std::move(result.error));
      }
      return StrategyResult::success(strategy, std::move(result.report));
    }
  }

  return StrategyResult::failure(
    strategy, ValidationError::make(ErrorCode::InvalidArgument, path, "Unknown strategy")
  );
}

}  // namespace integrity
}  // namespace vigil
