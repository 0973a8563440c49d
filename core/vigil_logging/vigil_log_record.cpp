// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vigil_log_record.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>

#include <sstream>

namespace vigil {
namespace logging {

namespace {

const char* const kResetColor = "\033[0m";

std::optional<std::string> extract_string(const boost::log::record_view& rec, const char* name) {
  auto value = boost::log::extract<std::string>(name, rec);
  if (!value) {
    return std::nullopt;
  }
  return *value;
}

}  // namespace

LogRecordFields extract_fields(const boost::log::record_view& rec) {
  LogRecordFields fields;

  if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
    fields.timestamp = boost::posix_time::to_iso_extended_string(*ts);
  }
  if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
    fields.severity = *sev;
  }
  if (auto tid =
        boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec)) {
    std::ostringstream oss;
    oss << *tid;
    fields.thread_id = oss.str();
  }
  if (auto msg = rec[boost::log::expressions::smessage]) {
    fields.message = *msg;
  }

  fields.component = extract_string(rec, kComponentAttr).value_or("vigil");
  fields.operation_id = extract_string(rec, kOperationIdAttr);
  fields.source = extract_string(rec, kSourceAttr);
  return fields;
}

void write_text(
  const LogRecordFields& fields, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[" << fields.timestamp << "] ";

  if (fields.severity) {
    if (use_colors) {
      strm << severity_color(*fields.severity) << "[" << *fields.severity << "]" << kResetColor
           << " ";
    } else {
      strm << "[" << *fields.severity << "] ";
    }
  }

  strm << "[" << fields.component << "] " << fields.message;

  if (fields.operation_id || fields.source) {
    strm << " |";
    if (fields.operation_id) strm << " operation_id=" << *fields.operation_id;
    if (fields.source) strm << " source=" << *fields.source;
  }
}

nlohmann::json record_to_json(const LogRecordFields& fields) {
  nlohmann::json j = {
    {"ts", fields.timestamp},
    {"component", fields.component},
    {"msg", fields.message},
    {"thread_id", fields.thread_id},
  };
  if (fields.severity) {
    std::ostringstream level;
    level << *fields.severity;
    j["level"] = level.str();
  }
  if (fields.operation_id) {
    j["operation_id"] = *fields.operation_id;
  }
  if (fields.source) {
    j["source"] = *fields.source;
  }
  return j;
}

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";  // Cyan
    case severity_level::info:
      return "\033[32m";  // Green
    case severity_level::warn:
      return "\033[33m";  // Yellow
    case severity_level::error:
      return "\033[31m";  // Red
    case severity_level::fatal:
      return "\033[35m";  // Magenta
    default:
      return "";
  }
}

}  // namespace logging
}  // namespace vigil
