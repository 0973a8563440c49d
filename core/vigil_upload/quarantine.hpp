// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_QUARANTINE_HPP
#define VIGIL_QUARANTINE_HPP

#include <string>
#include <utility>

#include "integrity_interfaces.hpp"

namespace vigil {
namespace upload {

/**
 * Collision-free temporary path for an upload in progress:
 *   <quarantine_dir>/.<filename>.<pid>-<sequence>-<random>.part
 *
 * The process id separates processes, the sequence number separates
 * concurrent uploads of one process, and the random suffix guards against
 * pid reuse after a crash left files behind.
 */
std::string make_quarantine_path(const std::string& quarantine_dir, const std::string& filename);

/**
 * QuarantineGuard deletes a quarantined file unless the upload commits.
 *
 * Usage:
 *   QuarantineGuard guard(filesystem, temp_path);
 *   ... write, validate ...
 *   filesystem.rename(temp_path, final_path, ec);
 *   if (ec) return failure;  // guard removes temp_path
 *   guard.commit();          // file now lives at final_path
 *
 * Cleanup is best-effort: a failed delete is logged at WARN and never
 * replaces the error that caused the rejection.
 */
class QuarantineGuard {
public:
  QuarantineGuard(integrity::IFileSystem& filesystem, std::string path)
      : filesystem_(filesystem)
      , path_(std::move(path))
      , committed_(false) {}

  ~QuarantineGuard() {
    if (!committed_) {
      discard();
    }
  }

  /**
   * Keep the file. After commit, the destructor does nothing.
   */
  void commit() {
    committed_ = true;
  }

  bool is_committed() const {
    return committed_;
  }

  const std::string& path() const {
    return path_;
  }

  /**
   * Remove the quarantined file now. Returns false if removal failed.
   */
  bool discard();

  // Non-copyable, non-movable
  QuarantineGuard(const QuarantineGuard&) = delete;
  QuarantineGuard& operator=(const QuarantineGuard&) = delete;
  QuarantineGuard(QuarantineGuard&&) = delete;
  QuarantineGuard& operator=(QuarantineGuard&&) = delete;

private:
  integrity::IFileSystem& filesystem_;
  std::string path_;
  bool committed_;
};

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_QUARANTINE_HPP
