// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_LOG_SEVERITY_HPP
#define VIGIL_LOG_SEVERITY_HPP

#include <boost/log/expressions.hpp>
#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace vigil {
namespace logging {

/**
 * Severity levels for vigil logging.
 * FATAL is reserved for conditions that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  static const char* strings[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
  if (static_cast<size_t>(level) < sizeof(strings) / sizeof(*strings))
    strm << strings[static_cast<size_t>(level)];
  else
    strm << static_cast<int>(level);
  return strm;
}

// Attribute names shared by the macros and the sinks
constexpr const char* kComponentAttr = "Component";
constexpr const char* kOperationIdAttr = "OperationID";
constexpr const char* kSourceAttr = "Source";

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace vigil

#endif  // VIGIL_LOG_SEVERITY_HPP
