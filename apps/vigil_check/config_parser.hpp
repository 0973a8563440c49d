// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_CHECK_CONFIG_PARSER_HPP
#define VIGIL_CHECK_CONFIG_PARSER_HPP

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

#include "integrity_types.hpp"
#include "upload_types.hpp"
#include "vigil_log_init.hpp"

namespace vigil {
namespace check {

/**
 * Everything vigil_check needs to drive the engine.
 *
 * upload.integrity is a copy of integrity, kept in sync by the parser.
 */
struct EngineConfig {
  integrity::IntegrityConfig integrity;
  upload::UploadConfig upload;
  logging::LoggingConfig logging;
};

/**
 * YAML configuration parser
 *
 * Example:
 *   integrity:
 *     chunk_size_bytes: 1048576
 *     head_window_bytes: 65536
 *     tail_window_bytes: 65536
 *     full_buffer_threshold_bytes: 131072
 *   upload:
 *     destination_dir: /var/lib/vigil/artifacts
 *     quarantine_dir: /var/lib/vigil/artifacts/.quarantine
 *     allowed_content_types: [application/gzip]
 *   logging:
 *     console: {enabled: true, colors: true, level: info}
 *     file: {enabled: false, level: debug, directory: /var/log/vigil, format: json}
 *
 * Every key is optional; missing keys keep their defaults.
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from a YAML file
   * @return true on success, false on failure (see get_last_error())
   */
  bool load_from_file(const std::string& path, EngineConfig& config);

  /**
   * Load configuration from a YAML string
   */
  bool load_from_string(const std::string& yaml_content, EngineConfig& config);

  /**
   * Check ranges and required fields.
   * @param error_msg Receives the first problem found
   */
  static bool validate(const EngineConfig& config, std::string& error_msg);

  /**
   * Effective configuration as JSON, defaults included.
   */
  static nlohmann::json to_json(const EngineConfig& config);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_integrity(const YAML::Node& node, integrity::IntegrityConfig& integrity);
  bool parse_upload(const YAML::Node& node, upload::UploadConfig& upload);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace check
}  // namespace vigil

#endif  // VIGIL_CHECK_CONFIG_PARSER_HPP
