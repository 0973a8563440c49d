// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_INTEGRITY_LOG_HPP
#define VIGIL_INTEGRITY_LOG_HPP

// Logging infrastructure (optional - only if vigil_logging is linked).
// Define VIGIL_LOG_COMPONENT before including this header.

#ifdef VIGIL_HAS_LOGGING
#include <vigil_log_macros.hpp>
#else
#include <iostream>
#include <sstream>
#include <string>

namespace vigil {
namespace logging {

template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

}  // namespace logging
}  // namespace vigil

// Fallback to stderr when logging is not available
#define VIGIL_LOG_DEBUG(msg) \
  do {                       \
  } while (0)
#define VIGIL_LOG_DEBUG_EVERY_N(n, msg) \
  do {                                  \
  } while (0)
#define VIGIL_LOG_INFO(msg) std::cerr << "[INFO] " << msg << std::endl
#define VIGIL_LOG_WARN(msg) std::cerr << "[WARN] " << msg << std::endl
#define VIGIL_LOG_ERROR(msg) std::cerr << "[ERROR] " << msg << std::endl
#define VIGIL_LOG_SCOPED_CONTEXT(operation_id_val, source_val) \
  do {                                                         \
  } while (0)
#endif

#endif  // VIGIL_INTEGRITY_LOG_HPP
