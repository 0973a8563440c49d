// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_LOG_MACROS_HPP
#define VIGIL_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "vigil_log_severity.hpp"

namespace vigil {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in vigil_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Structured field helper.
 * Usage: VIGIL_LOG_INFO("upload promoted" << kv("bytes", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace vigil

// Define VIGIL_LOG_COMPONENT before including this header, one per translation unit:
//   #define VIGIL_LOG_COMPONENT "streaming_validator"
//   #include <vigil_log_macros.hpp>
#ifndef VIGIL_LOG_COMPONENT
#define VIGIL_LOG_COMPONENT "vigil"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define VIGIL_LOG_ENABLE_DEBUG 0
#else
#define VIGIL_LOG_ENABLE_DEBUG 1
#endif

// Every record carries its component as an attribute, not as message text
#define VIGIL_LOG_SEV_IMPL(level, msg)                                                       \
  BOOST_LOG_SEV(::vigil::logging::get_logger(), ::vigil::logging::severity_level::level)    \
    << ::boost::log::add_value(                                                             \
         ::vigil::logging::kComponentAttr, std::string(VIGIL_LOG_COMPONENT)                 \
       )                                                                                    \
    << msg

#define VIGIL_LOG_DEBUG(msg)            \
  do {                                  \
    if (VIGIL_LOG_ENABLE_DEBUG) {       \
      VIGIL_LOG_SEV_IMPL(debug, msg);   \
    }                                   \
  } while (0)

#define VIGIL_LOG_INFO(msg)        \
  do {                             \
    VIGIL_LOG_SEV_IMPL(info, msg); \
  } while (0)

#define VIGIL_LOG_WARN(msg)        \
  do {                             \
    VIGIL_LOG_SEV_IMPL(warn, msg); \
  } while (0)

#define VIGIL_LOG_ERROR(msg)        \
  do {                              \
    VIGIL_LOG_SEV_IMPL(error, msg); \
  } while (0)

#define VIGIL_LOG_FATAL(msg)        \
  do {                              \
    VIGIL_LOG_SEV_IMPL(fatal, msg); \
  } while (0)

// Attach the operation and its source to every record emitted in the enclosing scope.
// At most one per scope.
// Usage: VIGIL_LOG_SCOPED_CONTEXT("upload-42", "pkg-1.0.0.tgz");
#define VIGIL_LOG_SCOPED_CONTEXT(operation_id_val, source_val)                   \
  ::boost::log::scoped_attribute _vigil_log_operation_id_sentry =                  \
    ::boost::log::add_scoped_thread_attribute(                                     \
      ::vigil::logging::kOperationIdAttr,                                          \
      ::boost::log::attributes::constant<std::string>(operation_id_val)            \
    );                                                                             \
  ::boost::log::scoped_attribute _vigil_log_source_sentry =                        \
    ::boost::log::add_scoped_thread_attribute(                                     \
      ::vigil::logging::kSourceAttr,                                               \
      ::boost::log::attributes::constant<std::string>(source_val)                  \
    );                                                                             \
  (void)_vigil_log_operation_id_sentry;                                            \
  (void)_vigil_log_source_sentry

// Log every Nth pass through a call site, for per-chunk loops.
// Usage: VIGIL_LOG_DEBUG_EVERY_N(256, "chunk" << kv("offset", offset));
#define VIGIL_LOG_DEBUG_EVERY_N(n, msg)                 \
  do {                                                  \
    static std::atomic<uint64_t> _vigil_log_counter{0}; \
    if ((_vigil_log_counter++ % (n)) == 0) {            \
      VIGIL_LOG_DEBUG(msg);                             \
    }                                                   \
  } while (0)

#endif  // VIGIL_LOG_MACROS_HPP
