// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_LOG_RECORD_HPP
#define VIGIL_LOG_RECORD_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "vigil_log_severity.hpp"

namespace vigil {
namespace logging {

/**
 * The fields a sink renders, pulled out of a Boost.Log record once.
 */
struct LogRecordFields {
  std::string timestamp;  // ISO 8601, empty if the record has no TimeStamp
  std::optional<severity_level> severity;
  std::string component;
  std::string message;
  std::string thread_id;
  std::optional<std::string> operation_id;
  std::optional<std::string> source;
};

LogRecordFields extract_fields(const boost::log::record_view& rec);

/**
 * "[ts] [LEVEL] [component] message | operation_id=.. source=.."
 */
void write_text(
  const LogRecordFields& fields, boost::log::formatting_ostream& strm, bool use_colors = false
);

/**
 * One object per record: ts, level, component, msg, thread_id, and
 * operation_id / source when set. Invalid UTF-8 is replaced, never thrown.
 */
nlohmann::json record_to_json(const LogRecordFields& fields);

/**
 * ANSI color escape for a severity level ("" for unknown levels).
 */
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace vigil

#endif  // VIGIL_LOG_RECORD_HPP
