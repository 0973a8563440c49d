// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_FINGERPRINT_GENERATOR_HPP
#define VIGIL_FINGERPRINT_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "integrity_interfaces.hpp"
#include "integrity_types.hpp"

namespace vigil {
namespace integrity {

constexpr size_t kDefaultBatchConcurrency = 10;

/**
 * Fast approximate file identity.
 *
 * CRC-32 over head window ++ tail window ++ 8-byte little-endian total size.
 * The middle of the file is never read, so a change there may go unnoticed;
 * a change to the first or last byte, or to the size, always alters the
 * result. Use for cache keys and fast rejection, never for correctness-
 * critical checks (use StreamingValidator for those).
 *
 * Windows never overlap: head = min(head_window, size),
 * tail = min(tail_window, size - head).
 */
class FingerprintGenerator {
public:
  explicit FingerprintGenerator(IntegrityConfig config = IntegrityConfig());

  /**
   * Constructor with injected dependencies (for testing)
   */
  FingerprintGenerator(
    IntegrityConfig config, std::shared_ptr<IFileSystem> filesystem,
    std::shared_ptr<IFileStreamFactory> stream_factory
  );

  /**
   * Fingerprint a file on disk. Empty files fail with EmptyFile.
   */
  FingerprintResult generate(const std::string& path) const;

  /**
   * Fingerprint a seekable stream whose total size is known.
   */
  FingerprintResult generate(IFileStream& stream, uint64_t total_size, const std::string& label)
    const;

  /**
   * Fingerprint many files on at most `max_concurrency` worker threads.
   * Every path gets an entry; one failure does not affect the others.
   */
  std::map<std::string, FingerprintResult> generate_batch(
    const std::vector<std::string>& paths, size_t max_concurrency = kDefaultBatchConcurrency
  ) const;

  const IntegrityConfig& config() const {
    return config_;
  }

private:
  IntegrityConfig config_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::shared_ptr<IFileStreamFactory> stream_factory_;
};

}  // namespace integrity
}  // namespace vigil

#endif  // VIGIL_FINGERPRINT_GENERATOR_HPP
