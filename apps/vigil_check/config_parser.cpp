// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>
#include <optional>
#include <sstream>

namespace vigil {
namespace check {

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, EngineConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str(), config);
}

bool ConfigParser::load_from_string(const std::string& yaml_content, EngineConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["integrity"] && !parse_integrity(node["integrity"], config.integrity)) {
      return false;
    }

    if (node["upload"] && !parse_upload(node["upload"], config.upload)) {
      return false;
    }

    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }

    config.upload.integrity = config.integrity;
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_integrity(const YAML::Node& node, integrity::IntegrityConfig& integrity) {
  if (node["chunk_size_bytes"]) {
    integrity.chunk_size_bytes = node["chunk_size_bytes"].as<uint64_t>();
  }
  if (node["head_window_bytes"]) {
    integrity.head_window_bytes = node["head_window_bytes"].as<uint64_t>();
  }
  if (node["tail_window_bytes"]) {
    integrity.tail_window_bytes = node["tail_window_bytes"].as<uint64_t>();
  }
  if (node["full_buffer_threshold_bytes"]) {
    integrity.full_buffer_threshold_bytes = node["full_buffer_threshold_bytes"].as<uint64_t>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, upload::UploadConfig& upload) {
  if (node["destination_dir"]) {
    upload.destination_dir = node["destination_dir"].as<std::string>();
  }
  if (node["quarantine_dir"]) {
    upload.quarantine_dir = node["quarantine_dir"].as<std::string>();
  }
  if (node["allowed_content_types"]) {
    if (!node["allowed_content_types"].IsSequence()) {
      last_error_ = "upload.allowed_content_types must be a list";
      return false;
    }
    upload.allowed_content_types.clear();
    for (const auto& item : node["allowed_content_types"]) {
      upload.allowed_content_types.push_back(item.as<std::string>());
    }
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  auto parse_level = [this](const YAML::Node& level_node, const std::string& key,
                            logging::severity_level& out) {
    std::string text = level_node.as<std::string>();
    std::optional<logging::severity_level> level = logging::parse_severity_level(text);
    if (!level) {
      last_error_ = "Invalid log level for " + key + ": " + text;
      return false;
    }
    out = *level;
    return true;
  };

  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"] &&
        !parse_level(console["level"], "logging.console.level", logging.console_level)) {
      return false;
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"] && !parse_level(file["level"], "logging.file.level", logging.file_level)) {
      return false;
    }
    if (file["directory"]) {
      logging.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_config.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.file_config.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
    if (file["max_files"]) {
      logging.file_config.max_files = file["max_files"].as<int>();
    }
    if (file["format"]) {
      std::string format = file["format"].as<std::string>();
      if (format != "json" && format != "text") {
        last_error_ = "logging.file.format must be 'json' or 'text'";
        return false;
      }
      logging.file_config.format_json = (format == "json");
    }
  }

  return true;
}

bool ConfigParser::validate(const EngineConfig& config, std::string& error_msg) {
  const auto& limits = config.integrity;
  if (limits.chunk_size_bytes == 0) {
    error_msg = "integrity.chunk_size_bytes must be > 0";
    return false;
  }
  if (limits.chunk_size_bytes > integrity::kMaxChunkSizeBytes) {
    error_msg = "integrity.chunk_size_bytes must be <= " +
                std::to_string(integrity::kMaxChunkSizeBytes);
    return false;
  }
  if (limits.full_buffer_threshold_bytes > integrity::kMaxChunkSizeBytes) {
    error_msg = "integrity.full_buffer_threshold_bytes must be <= " +
                std::to_string(integrity::kMaxChunkSizeBytes);
    return false;
  }

  if (config.upload.destination_dir.empty()) {
    error_msg = "upload.destination_dir is empty";
    return false;
  }
  if (config.upload.effective_quarantine_dir() == config.upload.destination_dir) {
    error_msg = "upload.quarantine_dir must differ from upload.destination_dir";
    return false;
  }

  if (config.logging.file_enabled && config.logging.file_config.directory.empty()) {
    error_msg = "logging.file.directory is empty";
    return false;
  }
  if (config.logging.file_config.max_files < 0) {
    error_msg = "logging.file.max_files must be >= 0";
    return false;
  }

  return true;
}

nlohmann::json ConfigParser::to_json(const EngineConfig& config) {
  const auto& file = config.logging.file_config;
  return nlohmann::json{
    {"integrity",
     {
       {"chunk_size_bytes", config.integrity.chunk_size_bytes},
       {"head_window_bytes", config.integrity.head_window_bytes},
       {"tail_window_bytes", config.integrity.tail_window_bytes},
       {"full_buffer_threshold_bytes", config.integrity.full_buffer_threshold_bytes},
     }},
    {"upload",
     {
       {"destination_dir", config.upload.destination_dir},
       {"quarantine_dir", config.upload.effective_quarantine_dir()},
       {"allowed_content_types", config.upload.allowed_content_types},
     }},
    {"logging",
     {
       {"console",
        {
          {"enabled", config.logging.console_enabled},
          {"colors", config.logging.console_colors},
          {"level", logging::severity_to_string(config.logging.console_level)},
        }},
       {"file",
        {
          {"enabled", config.logging.file_enabled},
          {"level", logging::severity_to_string(config.logging.file_level)},
          {"directory", file.directory},
          {"pattern", file.file_pattern},
          {"rotation_size_mb", file.rotation_size_mb},
          {"rotate_at_midnight", file.rotate_at_midnight},
          {"max_files", file.max_files},
          {"format", file.format_json ? "json" : "text"},
        }},
     }},
  };
}

}  // namespace check
}  // namespace vigil
