// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "streaming_validator.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include "checksum_accumulator.hpp"
#include "integrity_impl.hpp"

#define VIGIL_LOG_COMPONENT "streaming_validator"
#include "integrity_log.hpp"

namespace vigil {
namespace integrity {

using logging::kv;

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

double buffer_mb(uint64_t bytes) {
  return static_cast<double>(bytes) / static_cast<double>(kBytesPerMiB);
}

std::optional<ValidationError> check_chunk_size(uint64_t chunk_size, const std::string& source) {
  if (chunk_size == 0) {
    return ValidationError::make(
      ErrorCode::InvalidArgument, source, "Chunk size must be greater than zero"
    );
  }
  if (chunk_size > kMaxChunkSizeBytes) {
    return ValidationError::make(
      ErrorCode::InvalidArgument, source,
      "Chunk size exceeds " + std::to_string(kMaxChunkSizeBytes) + " bytes"
    );
  }
  return std::nullopt;
}

std::optional<ValidationError> check_expected_crc(
  const ValidateOptions& options, uint32_t actual, const std::string& source
) {
  if (!options.expected_crc32 || *options.expected_crc32 == actual) {
    return std::nullopt;
  }
  auto error = ValidationError::make(
    ErrorCode::ChecksumMismatch, source,
    "Checksum mismatch: expected " + crc_to_hex(*options.expected_crc32) + ", calculated " +
      crc_to_hex(actual)
  );
  error.expected_crc = *options.expected_crc32;
  error.actual_crc = actual;
  return error;
}

}  // namespace

StreamingValidator::StreamingValidator(IntegrityConfig config)
    : StreamingValidator(
        config, std::make_shared<FileSystemImpl>(), std::make_shared<FileStreamFactoryImpl>()
      ) {}

StreamingValidator::StreamingValidator(
  IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
  std::shared_ptr<IFileStreamFactory> stream_factory
)
    : config_(config)
    , filesystem_(std::move(filesystem))
    , stream_factory_(std::move(stream_factory)) {}

std::optional<ValidationError> StreamingValidator::check_file(
  const std::string& path, uint64_t& size
) const {
  if (!filesystem_->exists(path)) {
    return ValidationError::make(ErrorCode::NotFound, path, "File not found");
  }

  if (!filesystem_->is_regular_file(path)) {
    return ValidationError::make(ErrorCode::InvalidArgument, path, "Not a regular file");
  }

  std::error_code ec;
  size = filesystem_->file_size(path, ec);
  if (ec) {
    return ValidationError::make(
      ErrorCode::ReadFailure, path, "Cannot determine file size", ec.message()
    );
  }

  if (size == 0) {
    return ValidationError::make(ErrorCode::EmptyFile, path, "File is empty");
  }

  return std::nullopt;
}

ValidationResult StreamingValidator::validate_file(
  const std::string& path, const ValidateOptions& options
) const {
  uint64_t chunk_size = options.chunk_size_bytes ? options.chunk_size_bytes : config_.chunk_size_bytes;
  if (auto error = check_chunk_size(chunk_size, path)) {
    return ValidationResult::failure(*error);
  }

  uint64_t size = 0;
  if (auto error = check_file(path, size)) {
    VIGIL_LOG_WARN("Validation refused" << kv("path", path) << kv("reason", error->message));
    return ValidationResult::failure(*error);
  }

  auto stream = stream_factory_->create_file_stream(path, std::ios::binary);
  if (!stream) {
    VIGIL_LOG_WARN("Cannot open file for validation" << kv("path", path));
    return ValidationResult::failure(
      ValidationError::make(ErrorCode::ReadFailure, path, "Cannot open file", "open failed")
    );
  }

  VIGIL_LOG_DEBUG(
    "Validating file" << kv("path", path) << kv("size", size) << kv("chunk_size", chunk_size)
  );

  // stream is released when it goes out of scope, on every path below
  return validate_stream(*stream, path, options);
}

ValidationResult StreamingValidator::validate_stream(
  IFileStream& stream, const std::string& label, const ValidateOptions& options
) const {
  uint64_t chunk_size = options.chunk_size_bytes ? options.chunk_size_bytes : config_.chunk_size_bytes;
  if (auto error = check_chunk_size(chunk_size, label)) {
    return ValidationResult::failure(*error);
  }

  // Allocated once at full size so memory_usage_mb is a constant bound
  std::vector<char> buffer(static_cast<size_t>(chunk_size));
  ChecksumAccumulator accumulator;
  auto start = Clock::now();

  while (true) {
    if (options.cancel && options.cancel->is_cancelled()) {
      VIGIL_LOG_WARN(
        "Validation cancelled" << kv("source", label) << kv("bytes", accumulator.bytes())
      );
      return ValidationResult::failure(
        ValidationError::make(ErrorCode::Cancelled, label, "Validation cancelled")
      );
    }

    stream.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
    std::streamsize got = stream.gcount();

    if (stream.bad()) {
      VIGIL_LOG_ERROR(
        "Read failed mid-stream" << kv("source", label) << kv("offset", accumulator.bytes())
      );
      return ValidationResult::failure(ValidationError::make(
        ErrorCode::ReadFailure, label, "Read failed",
        "I/O error at offset " + std::to_string(accumulator.bytes())
      ));
    }

    if (got > 0) {
      accumulator.update(buffer.data(), static_cast<size_t>(got));
      VIGIL_LOG_DEBUG_EVERY_N(
        256, "Chunk checksummed" << kv("source", label) << kv("bytes", accumulator.bytes())
      );

      if (options.max_bytes && accumulator.bytes() > *options.max_bytes) {
        VIGIL_LOG_WARN(
          "Stream exceeds size limit" << kv("source", label) << kv("limit", *options.max_bytes)
                                      << kv("bytes", accumulator.bytes())
        );
        auto error = ValidationError::make(
          ErrorCode::SizeMismatch, label,
          "Size mismatch: declared " + std::to_string(*options.max_bytes) + ", received at least " +
            std::to_string(accumulator.bytes())
        );
        error.expected_size = *options.max_bytes;
        error.actual_size = accumulator.bytes();
        return ValidationResult::failure(std::move(error));
      }

      if (options.tee && !options.tee->write(buffer.data(), got)) {
        VIGIL_LOG_ERROR("Write failed" << kv("source", label) << kv("bytes", accumulator.bytes()));
        return ValidationResult::failure(ValidationError::make(
          ErrorCode::WriteFailure, label, "Write failed",
          "sink rejected chunk ending at offset " + std::to_string(accumulator.bytes())
        ));
      }
    }

    if (stream.eof()) {
      break;
    }

    if (stream.fail() || got <= 0) {
      return ValidationResult::failure(ValidationError::make(
        ErrorCode::ReadFailure, label, "Read failed",
        "stream stopped before end-of-stream at offset " + std::to_string(accumulator.bytes())
      ));
    }
  }

  if (accumulator.bytes() == 0) {
    return ValidationResult::failure(
      ValidationError::make(ErrorCode::EmptyFile, label, "Stream is empty")
    );
  }

  ValidationReport report;
  report.file_path = label;
  report.calculated_crc = accumulator.finalize();
  report.strategy = Strategy::FullStream;
  report.bytes_processed = accumulator.bytes();
  report.duration_ms = elapsed_ms(start);
  report.throughput_mbps = compute_throughput_mbps(report.bytes_processed, report.duration_ms);
  report.memory_usage_mb = buffer_mb(chunk_size);

  if (auto error = check_expected_crc(options, report.calculated_crc, label)) {
    VIGIL_LOG_WARN("Checksum mismatch" << kv("source", label) << kv("detail", error->message));
    return ValidationResult::failure(*error);
  }

  VIGIL_LOG_DEBUG(
    "Validation complete" << kv("source", label) << kv("crc32", crc_to_hex(report.calculated_crc))
                          << kv("bytes", report.bytes_processed)
                          << kv("throughput_mbps", report.throughput_mbps)
  );

  return ValidationResult::success(std::move(report));
}

ValidationResult StreamingValidator::read_full_buffer(
  const std::string& path, const ValidateOptions& options
) const {
  uint64_t size = 0;
  if (auto error = check_file(path, size)) {
    return ValidationResult::failure(*error);
  }

  if (size > kMaxChunkSizeBytes) {
    return ValidationResult::failure(ValidationError::make(
      ErrorCode::InvalidArgument, path,
      "File too large for a single-buffer read (" + std::to_string(size) + " bytes)"
    ));
  }

  if (options.cancel && options.cancel->is_cancelled()) {
    return ValidationResult::failure(
      ValidationError::make(ErrorCode::Cancelled, path, "Validation cancelled")
    );
  }

  auto stream = stream_factory_->create_file_stream(path, std::ios::binary);
  if (!stream) {
    return ValidationResult::failure(
      ValidationError::make(ErrorCode::ReadFailure, path, "Cannot open file", "open failed")
    );
  }

  auto start = Clock::now();
  std::vector<char> buffer(static_cast<size_t>(size));
  stream->read(buffer.data(), static_cast<std::streamsize>(size));
  std::streamsize got = stream->gcount();

  if (stream->bad() || got != static_cast<std::streamsize>(size)) {
    return ValidationResult::failure(ValidationError::make(
      ErrorCode::ReadFailure, path, "Read failed",
      "short read: " + std::to_string(got < 0 ? 0 : got) + " of " + std::to_string(size) +
        " bytes"
    ));
  }

  ValidationReport report;
  report.file_path = path;
  report.calculated_crc = ChecksumAccumulator::compute(buffer.data(), buffer.size());
  report.strategy = Strategy::FullBufferRead;
  report.bytes_processed = size;
  report.duration_ms = elapsed_ms(start);
  report.throughput_mbps = compute_throughput_mbps(size, report.duration_ms);
  report.memory_usage_mb = buffer_mb(size);

  if (auto error = check_expected_crc(options, report.calculated_crc, path)) {
    return ValidationResult::failure(*error);
  }

  VIGIL_LOG_DEBUG(
    "Full-buffer validation complete" << kv("path", path)
                                      << kv("crc32", crc_to_hex(report.calculated_crc))
  );

  return ValidationResult::success(std::move(report));
}

}  // namespace integrity
}  // namespace vigil
