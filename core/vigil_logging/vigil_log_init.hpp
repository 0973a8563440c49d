// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_LOG_INIT_HPP
#define VIGIL_LOG_INIT_HPP

#include <optional>
#include <string>

#include "vigil_console_sink.hpp"
#include "vigil_file_sink.hpp"
#include "vigil_log_severity.hpp"

namespace vigil {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (case-insensitive).
 *
 * @return The parsed level, or std::nullopt for anything else
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Lower-case name of a level, the inverse of parse_severity_level.
 */
std::string severity_to_string(severity_level level);

/**
 * Apply environment variable overrides to a LoggingConfig in place.
 * Unparseable values are ignored.
 *
 *   VIGIL_LOG_LEVEL           - both sinks
 *   VIGIL_LOG_CONSOLE_LEVEL   - console sink
 *   VIGIL_LOG_FILE_LEVEL      - file sink
 *   VIGIL_LOG_FILE_DIR        - log file directory
 *   VIGIL_LOG_FORMAT          - "json" or "text"
 *   VIGIL_LOG_FILE_ENABLED    - "true"/"false"
 *   VIGIL_LOG_CONSOLE_ENABLED - "true"/"false"
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the console and file sinks. Calls after the first are ignored
 * until shutdown_logging().
 */
void init_logging(const LoggingConfig& config);

/**
 * Stop the async sinks, drain their queues and detach them.
 */
void shutdown_logging();

void flush_logging();

/**
 * Shut down and re-initialize with `config` plus environment overrides.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace vigil

#endif  // VIGIL_LOG_INIT_HPP
