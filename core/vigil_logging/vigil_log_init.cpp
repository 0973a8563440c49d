// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vigil_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>
#include <utility>

#include "vigil_log_macros.hpp"

namespace vigil {
namespace logging {

namespace {

struct SeverityName {
  const char* name;
  severity_level level;
};

// First entry per level is the canonical name
constexpr std::array<SeverityName, 6> kSeverityNames = {{
  {"debug", severity_level::debug},
  {"info", severity_level::info},
  {"warn", severity_level::warn},
  {"warning", severity_level::warn},
  {"error", severity_level::error},
  {"fatal", severity_level::fatal},
}};

// Sinks installed by init_logging, guarded by mutex
struct LoggingState {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console_sink;
  boost::shared_ptr<async_file_sink_t> file_sink;
  bool initialized = false;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

struct EnvOverride {
  const char* variable;
  std::function<void(LoggingConfig&, const std::string&)> apply;
};

void set_level(severity_level& target, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    target = *level;
  }
}

void set_flag(bool& target, const std::string& value) {
  if (auto flag = parse_bool(value)) {
    target = *flag;
  }
}

// Applied in order: the per-sink levels win over VIGIL_LOG_LEVEL
const std::array<EnvOverride, 7>& env_overrides() {
  static const std::array<EnvOverride, 7> overrides = {{
    {"VIGIL_LOG_LEVEL",
     [](LoggingConfig& c, const std::string& v) {
       set_level(c.console_level, v);
       set_level(c.file_level, v);
     }},
    {"VIGIL_LOG_CONSOLE_LEVEL",
     [](LoggingConfig& c, const std::string& v) { set_level(c.console_level, v); }},
    {"VIGIL_LOG_CONSOLE_ENABLED",
     [](LoggingConfig& c, const std::string& v) { set_flag(c.console_enabled, v); }},
    {"VIGIL_LOG_FILE_LEVEL",
     [](LoggingConfig& c, const std::string& v) { set_level(c.file_level, v); }},
    {"VIGIL_LOG_FILE_ENABLED",
     [](LoggingConfig& c, const std::string& v) { set_flag(c.file_enabled, v); }},
    {"VIGIL_LOG_FILE_DIR",
     [](LoggingConfig& c, const std::string& v) { c.file_config.directory = v; }},
    {"VIGIL_LOG_FORMAT",
     [](LoggingConfig& c, const std::string& v) {
       c.file_config.format_json = (to_lower(v) == "json");
     }},
  }};
  return overrides;
}

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);
  for (const auto& entry : kSeverityNames) {
    if (lower == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

std::string severity_to_string(severity_level level) {
  for (const auto& entry : kSeverityNames) {
    if (entry.level == level) {
      return entry.name;
    }
  }
  return std::to_string(static_cast<int>(level));
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& override_entry : env_overrides()) {
    const char* value = std::getenv(override_entry.variable);
    if (value && value[0] != '\0') {
      override_entry.apply(config, value);
    }
  }
}

void init_logging(const LoggingConfig& config) {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (s.initialized) {
    return;
  }

  auto core = boost::log::core::get();

  // TimeStamp, ThreadID, ...
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    s.console_sink = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(s.console_sink);
  }

  if (config.file_enabled) {
    s.file_sink = create_file_sink(config.file_config, config.file_level);
    core->add_sink(s.file_sink);
  }

  s.initialized = true;
}

void shutdown_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (!s.initialized) {
    return;
  }

  auto core = boost::log::core::get();

  // Stopping drains the async queues
  if (s.console_sink) {
    core->remove_sink(s.console_sink);
    s.console_sink->stop();
    s.console_sink->flush();
    s.console_sink.reset();
  }
  if (s.file_sink) {
    core->remove_sink(s.file_sink);
    s.file_sink->stop();
    s.file_sink->flush();
    s.file_sink.reset();
  }

  s.initialized = false;
}

void flush_logging() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);

  if (s.console_sink) {
    s.console_sink->flush();
  }
  if (s.file_sink) {
    s.file_sink->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig final_config = config;
  apply_env_overrides(final_config);

  shutdown_logging();
  init_logging(final_config);
}

bool is_logging_initialized() {
  LoggingState& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

}  // namespace logging
}  // namespace vigil
