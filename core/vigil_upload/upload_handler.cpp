// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_handler.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "checksum_accumulator.hpp"
#include "integrity_impl.hpp"
#include "quarantine.hpp"

#define VIGIL_LOG_COMPONENT "upload_handler"
#include "integrity_log.hpp"

namespace vigil {
namespace upload {

using integrity::ErrorCode;
using integrity::ValidationError;
using logging::kv;

namespace {

// Keeps uploads_active accurate on every exit path
class ActiveUploadScope {
public:
  explicit ActiveUploadScope(std::atomic<uint64_t>& counter)
      : counter_(counter) {
    counter_.fetch_add(1);
  }
  ~ActiveUploadScope() { counter_.fetch_sub(1); }

  ActiveUploadScope(const ActiveUploadScope&) = delete;
  ActiveUploadScope& operator=(const ActiveUploadScope&) = delete;

private:
  std::atomic<uint64_t>& counter_;
};

// Transitions below follow the table in order; a refusal means a logic error
void advance(UploadStateMachine& state, UploadState to) {
  std::string error;
  if (!state.transition_to(to, error)) {
    VIGIL_LOG_ERROR("Unexpected state transition failure" << kv("error", error));
  }
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty() || dir.back() == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

}  // namespace

UploadHandler::UploadHandler(UploadConfig config)
    : UploadHandler(
        std::move(config), std::make_shared<integrity::FileSystemImpl>(),
        std::make_shared<integrity::FileStreamFactoryImpl>()
      ) {}

UploadHandler::UploadHandler(
  UploadConfig config, std::shared_ptr<integrity::IFileSystem> filesystem,
  std::shared_ptr<integrity::IFileStreamFactory> stream_factory
)
    : config_(std::move(config))
    , filesystem_(std::move(filesystem))
    , stream_factory_(std::move(stream_factory))
    , validator_(config_.integrity, filesystem_, stream_factory_)
    , selector_(config_.integrity, filesystem_, stream_factory_)
    , guard_() {}

bool UploadHandler::prepare_directories(std::string& error_msg) {
  for (const auto& dir : {config_.effective_quarantine_dir(), config_.destination_dir}) {
    std::error_code ec;
    filesystem_->create_directories(dir, ec);
    if (ec) {
      error_msg = "cannot create " + dir + ": " + ec.message();
      return false;
    }
  }
  return true;
}

UploadOutcome UploadHandler::reject(
  UploadStateMachine& state, ValidationError error, const std::string& stage
) {
  UploadState from = state.get_state();
  if (!state.reject()) {
    VIGIL_LOG_ERROR("Reject after terminal state" << kv("state", state_to_string(from)));
  }
  stats_.uploads_rejected.fetch_add(1);

  VIGIL_LOG_WARN(
    "Upload rejected" << kv("stage", stage) << kv("state", state_to_string(from))
                      << kv("code", integrity::to_string(error.code))
                      << kv("detail", error.describe())
  );
  return UploadOutcome::failure(std::move(error));
}

UploadOutcome UploadHandler::handle_upload(
  integrity::IFileStream& stream, const UploadRequest& request,
  const integrity::CancellationToken* cancel, UploadTransitionCallback on_transition
) {
  ActiveUploadScope active(stats_.uploads_active);
  const std::string& name = request.declared_filename;
  std::string operation_id = "upload-" + std::to_string(next_upload_id_.fetch_add(1));
  VIGIL_LOG_SCOPED_CONTEXT(operation_id, name);

  UploadStateMachine state;
  if (on_transition) {
    state.register_transition_callback(std::move(on_transition));
  }

  // RECEIVED -> FILENAME_VALIDATED
  FilenameCheck check = guard_.validate(name);
  if (!check) {
    return reject(state, check.error, "filename");
  }

  if (!config_.allowed_content_types.empty()) {
    const auto& allowed = config_.allowed_content_types;
    if (!request.content_type ||
        std::find(allowed.begin(), allowed.end(), *request.content_type) == allowed.end()) {
      return reject(
        state,
        ValidationError::make(
          ErrorCode::InvalidArgument, name, "Content type not allowed",
          request.content_type.value_or("none")
        ),
        "content_type"
      );
    }
  }

  advance(state, UploadState::FILENAME_VALIDATED);

  // FILENAME_VALIDATED -> QUARANTINED
  std::string dir_error;
  if (!prepare_directories(dir_error)) {
    return reject(
      state, ValidationError::make(ErrorCode::WriteFailure, name, "Cannot prepare storage", dir_error),
      "prepare"
    );
  }

  std::string temp_path = make_quarantine_path(config_.effective_quarantine_dir(), name);
  QuarantineGuard quarantine(*filesystem_, temp_path);

  auto out = stream_factory_->create_output_stream(temp_path, std::ios::binary);
  if (!out) {
    return reject(
      state,
      ValidationError::make(
        ErrorCode::WriteFailure, name, "Cannot create quarantine file", temp_path
      ),
      "quarantine"
    );
  }

  // Uploads map to FullStream at every size
  uint64_t expected_size = request.declared_size.value_or(0);
  integrity::Strategy strategy = selector_.select(expected_size, integrity::UseCase::Upload);
  VIGIL_LOG_DEBUG(
    "Upload strategy" << kv("strategy", integrity::to_string(strategy))
                      << kv("memory_estimate_mb", selector_.memory_estimate_mb(expected_size, strategy))
  );

  // An over-long body is cut off at the declared size instead of filling quarantine
  integrity::ValidateOptions options;
  options.cancel = cancel;
  options.tee = out.get();
  options.max_bytes = request.declared_size;
  auto validation = validator_.validate_stream(stream, name, options);
  if (!validation) {
    if (!out->close()) {
      VIGIL_LOG_DEBUG("Quarantine file close failed after rejection" << kv("path", temp_path));
    }
    return reject(state, validation.error, "quarantine");
  }

  if (!out->close()) {
    return reject(
      state,
      ValidationError::make(
        ErrorCode::WriteFailure, name, "Cannot finalize quarantine file", temp_path
      ),
      "quarantine"
    );
  }

  const auto& report = validation.report;
  stats_.bytes_received.fetch_add(report.bytes_processed);
  advance(state, UploadState::QUARANTINED);

  // QUARANTINED -> VALIDATED
  if (request.declared_size && *request.declared_size != report.bytes_processed) {
    auto error = ValidationError::make(
      ErrorCode::SizeMismatch, name,
      "Size mismatch: declared " + std::to_string(*request.declared_size) + ", received " +
        std::to_string(report.bytes_processed)
    );
    error.expected_size = *request.declared_size;
    error.actual_size = report.bytes_processed;
    return reject(state, std::move(error), "validate");
  }

  if (request.expected_crc32 && *request.expected_crc32 != report.calculated_crc) {
    auto error = ValidationError::make(
      ErrorCode::ChecksumMismatch, name,
      "Checksum mismatch: expected " + integrity::crc_to_hex(*request.expected_crc32) +
        ", calculated " + integrity::crc_to_hex(report.calculated_crc)
    );
    error.expected_crc = *request.expected_crc32;
    error.actual_crc = report.calculated_crc;
    return reject(state, std::move(error), "validate");
  }

  advance(state, UploadState::VALIDATED);

  // VALIDATED -> PROMOTED
  std::string final_path = join_path(config_.destination_dir, name);
  std::error_code ec;
  filesystem_->rename(temp_path, final_path, ec);
  if (ec) {
    return reject(
      state,
      ValidationError::make(ErrorCode::WriteFailure, name, "Promotion failed", ec.message()),
      "promote"
    );
  }
  quarantine.commit();
  advance(state, UploadState::PROMOTED);
  stats_.uploads_completed.fetch_add(1);

  UploadResult result;
  result.path = final_path;
  result.integrity.crc32 = report.calculated_crc;
  result.throughput_mbps = report.throughput_mbps;
  result.bytes = report.bytes_processed;

  VIGIL_LOG_INFO(
    "Upload promoted" << kv("path", final_path) << kv("crc32", integrity::crc_to_hex(result.integrity.crc32))
                      << kv("bytes", result.bytes) << kv("throughput_mbps", result.throughput_mbps)
  );

  return UploadOutcome::success(std::move(result));
}

UploadOutcome UploadHandler::handle_upload_file(
  const std::string& source_path, const UploadRequest& request,
  const integrity::CancellationToken* cancel
) {
  if (!filesystem_->exists(source_path)) {
    stats_.uploads_rejected.fetch_add(1);
    return UploadOutcome::failure(
      ValidationError::make(ErrorCode::NotFound, source_path, "Upload source not found")
    );
  }

  auto stream = stream_factory_->create_file_stream(source_path, std::ios::binary);
  if (!stream) {
    stats_.uploads_rejected.fetch_add(1);
    return UploadOutcome::failure(ValidationError::make(
      ErrorCode::ReadFailure, source_path, "Cannot open upload source", "open failed"
    ));
  }

  return handle_upload(*stream, request, cancel);
}

integrity::ValidationResult UploadHandler::verify(
  const std::string& path, uint32_t expected_crc32
) const {
  integrity::ValidateOptions options;
  options.expected_crc32 = expected_crc32;
  return validator_.validate_file(path, options);
}

}  // namespace upload
}  // namespace vigil
