// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_FILENAME_GUARD_HPP
#define VIGIL_FILENAME_GUARD_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "integrity_types.hpp"

namespace vigil {
namespace upload {

/**
 * Filename rules, in evaluation order. The first match is the one reported.
 */
enum class FilenameRule {
  Empty,
  TooLong,             // more than max_length bytes
  NullByte,            // raw '\0'
  EncodedControl,      // %00-%1f or %7f, any hex case
  ControlCharacter,    // raw 0x01-0x1f or 0x7f
  PathTraversal,       // ".." segment, %2e%2e, %2e., .%2e
  PathSeparator,       // '/', '\', %2f, %5c
  ReservedDeviceName,  // CON, PRN, AUX, NUL, COM1-9, LPT1-9, CONIN$, CONOUT$
  ShellMetacharacter   // | ; ` $( && > <
};

std::string to_string(FilenameRule rule);

/**
 * Outcome of a filename check. On failure `rule` is the first rule that
 * matched and `matched_rules` lists every rule that matched, in order.
 */
struct FilenameCheck {
  bool valid;
  FilenameRule rule;
  std::vector<FilenameRule> matched_rules;
  integrity::ValidationError error;

  explicit operator bool() const {
    return valid;
  }

  static FilenameCheck success() {
    return {true, FilenameRule::Empty, {}, {}};
  }

  static FilenameCheck failure(
    std::vector<FilenameRule> matched, integrity::ValidationError error
  ) {
    FilenameRule first = matched.front();
    return {false, first, std::move(matched), std::move(error)};
  }
};

/**
 * Pure predicate over untrusted filenames. Runs before any filesystem access.
 *
 * The name is never handed to a shell; rejecting metacharacters protects
 * downstream consumers that might.
 */
class FilenameGuard {
public:
  static constexpr size_t kDefaultMaxLength = 255;

  explicit FilenameGuard(size_t max_length = kDefaultMaxLength)
      : max_length_(max_length) {}

  /**
   * Evaluate every rule against `filename`.
   */
  FilenameCheck validate(const std::string& filename) const;

private:
  size_t max_length_;
};

}  // namespace upload
}  // namespace vigil

#endif  // VIGIL_FILENAME_GUARD_HPP
