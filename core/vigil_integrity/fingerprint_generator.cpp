// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "fingerprint_generator.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

#include "checksum_accumulator.hpp"
#include "integrity_impl.hpp"

#define VIGIL_LOG_COMPONENT "fingerprint_generator"
#include "integrity_log.hpp"

namespace vigil {
namespace integrity {

using logging::kv;

namespace {

using Clock = std::chrono::steady_clock;

ValidationError fingerprint_error(
  ErrorCode code, const std::string& source, const std::string& cause
) {
  return ValidationError::make(
    code, source, "Failed to generate fingerprint for " + source, cause
  );
}

// Feed `length` bytes from the stream's current position, `buffer.size()` at a time
bool feed_window(
  IFileStream& stream, uint64_t length, std::vector<char>& buffer,
  ChecksumAccumulator& accumulator
) {
  uint64_t remaining = length;
  while (remaining > 0) {
    auto want = static_cast<std::streamsize>(std::min<uint64_t>(remaining, buffer.size()));
    stream.read(buffer.data(), want);
    std::streamsize got = stream.gcount();
    if (stream.bad() || got != want) {
      return false;
    }
    accumulator.update(buffer.data(), static_cast<size_t>(got));
    remaining -= static_cast<uint64_t>(got);
  }
  return true;
}

}  // namespace

FingerprintGenerator::FingerprintGenerator(IntegrityConfig config)
    : FingerprintGenerator(
        config, std::make_shared<FileSystemImpl>(), std::make_shared<FileStreamFactoryImpl>()
      ) {}

FingerprintGenerator::FingerprintGenerator(
  IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
  std::shared_ptr<IFileStreamFactory> stream_factory
)
    : config_(config)
    , filesystem_(std::move(filesystem))
    , stream_factory_(std::move(stream_factory)) {}

FingerprintResult FingerprintGenerator::generate(const std::string& path) const {
  if (!filesystem_->exists(path)) {
    return FingerprintResult::failure(fingerprint_error(ErrorCode::NotFound, path, "file not found"));
  }

  if (!filesystem_->is_regular_file(path)) {
    return FingerprintResult::failure(
      fingerprint_error(ErrorCode::InvalidArgument, path, "not a regular file")
    );
  }

  std::error_code ec;
  uint64_t size = filesystem_->file_size(path, ec);
  if (ec) {
    return FingerprintResult::failure(fingerprint_error(ErrorCode::ReadFailure, path, ec.message()));
  }

  auto stream = stream_factory_->create_file_stream(path, std::ios::binary);
  if (!stream) {
    return FingerprintResult::failure(fingerprint_error(ErrorCode::ReadFailure, path, "open failed"));
  }

  return generate(*stream, size, path);
}

FingerprintResult FingerprintGenerator::generate(
  IFileStream& stream, uint64_t total_size, const std::string& label
) const {
  if (total_size == 0) {
    return FingerprintResult::failure(fingerprint_error(ErrorCode::EmptyFile, label, "file is empty"));
  }

  auto start = Clock::now();

  uint64_t head_len = std::min(config_.head_window_bytes, total_size);
  uint64_t tail_len = std::min(config_.tail_window_bytes, total_size - head_len);

  // Bounded by the chunk size no matter how large the windows are configured
  uint64_t buffer_size = std::max<uint64_t>(
    1, std::min(std::max(head_len, tail_len), config_.chunk_size_bytes)
  );
  std::vector<char> buffer(static_cast<size_t>(buffer_size));
  ChecksumAccumulator accumulator;

  stream.seekg(0, std::ios::beg);
  if (stream.fail() || !feed_window(stream, head_len, buffer, accumulator)) {
    return FingerprintResult::failure(
      fingerprint_error(ErrorCode::ReadFailure, label, "head window read failed")
    );
  }

  if (tail_len > 0) {
    stream.seekg(static_cast<std::streamoff>(total_size - tail_len), std::ios::beg);
    if (stream.fail() || !feed_window(stream, tail_len, buffer, accumulator)) {
      return FingerprintResult::failure(
        fingerprint_error(ErrorCode::ReadFailure, label, "tail window read failed")
      );
    }
  }

  std::array<unsigned char, 8> size_bytes;
  for (size_t i = 0; i < size_bytes.size(); ++i) {
    size_bytes[i] = static_cast<unsigned char>((total_size >> (8 * i)) & 0xFF);
  }
  accumulator.update(size_bytes.data(), size_bytes.size());

  FingerprintReport report;
  report.file_path = label;
  report.crc32 = accumulator.finalize();
  report.strategy = Strategy::Fingerprint;
  report.latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  report.total_size = total_size;
  report.head_bytes = head_len;
  report.tail_bytes = tail_len;
  report.memory_usage_mb = static_cast<double>(buffer_size) / static_cast<double>(kBytesPerMiB);

  VIGIL_LOG_DEBUG(
    "Fingerprint generated" << kv("source", label) << kv("crc32", crc_to_hex(report.crc32))
                            << kv("size", total_size) << kv("head", head_len)
                            << kv("tail", tail_len)
  );

  return FingerprintResult::success(std::move(report));
}

std::map<std::string, FingerprintResult> FingerprintGenerator::generate_batch(
  const std::vector<std::string>& paths, size_t max_concurrency
) const {
  std::vector<FingerprintResult> results(paths.size(), FingerprintResult::failure({}));
  std::atomic<size_t> next{0};

  auto worker = [&]() {
    while (true) {
      size_t index = next.fetch_add(1);
      if (index >= paths.size()) {
        return;
      }
      results[index] = generate(paths[index]);
    }
  };

  size_t thread_count = std::min(std::max<size_t>(1, max_concurrency), paths.size());
  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  for (size_t i = 0; i < thread_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& t : workers) {
    t.join();
  }

  std::map<std::string, FingerprintResult> by_path;
  size_t failed = 0;
  for (size_t i = 0; i < paths.size(); ++i) {
    if (!results[i]) {
      ++failed;
    }
    by_path[paths[i]] = std::move(results[i]);
  }

  VIGIL_LOG_DEBUG(
    "Batch fingerprint complete" << kv("files", paths.size()) << kv("failed", failed)
                                 << kv("threads", thread_count)
  );

  return by_path;
}

}  // namespace integrity
}  // namespace vigil
