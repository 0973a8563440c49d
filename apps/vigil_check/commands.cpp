// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <cctype>
#include <cstdlib>
#include <map>

#include "fingerprint_generator.hpp"
#include "report_json.hpp"
#include "strategy_selector.hpp"
#include "streaming_validator.hpp"
#include "upload_handler.hpp"
#include "upload_json.hpp"

// Logging infrastructure
#define VIGIL_LOG_COMPONENT "vigil_check"
#include <vigil_log_init.hpp>
#include <vigil_log_macros.hpp>

namespace vigil {
namespace check {

using logging::kv;

namespace {

// Sinks live for one command
class LoggingSession {
public:
  LoggingSession(const logging::LoggingConfig& base, bool verbose) {
    logging::LoggingConfig config = base;
    logging::apply_env_overrides(config);
    if (verbose) {
      config.console_level = logging::severity_level::debug;
    }
    logging::init_logging(config);
  }

  ~LoggingSession() {
    logging::shutdown_logging();
  }

  LoggingSession(const LoggingSession&) = delete;
  LoggingSession& operator=(const LoggingSession&) = delete;
};

template <typename Result>
nlohmann::json result_to_json(const Result& result) {
  nlohmann::json j{{"valid", result.valid}};
  if (result.valid) {
    j["report"] = result.report;
  } else {
    j["error"] = result.error;
  }
  return j;
}

bool takes_value(const std::string& flag) {
  return flag == "--config" || flag == "-c" || flag == "--size" || flag == "--crc" ||
         flag == "--use-case" || flag == "--content-type" || flag == "--concurrency";
}

}  // namespace

std::optional<uint32_t> parse_crc32(const std::string& text) {
  std::string digits = text;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }
  if (digits.empty() || digits.size() > 8) {
    return std::nullopt;
  }
  for (char c : digits) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  return static_cast<uint32_t>(std::strtoul(digits.c_str(), nullptr, 16));
}

std::optional<uint64_t> parse_size(const std::string& text) {
  if (text.empty() || text.size() > 19) {
    return std::nullopt;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  return static_cast<uint64_t>(std::strtoull(text.c_str(), nullptr, 10));
}

Commands::Commands(std::ostream& out, std::ostream& err)
    : verbose_(false)
    , out_(out)
    , err_(err) {
  config_.upload.integrity = config_.integrity;
}

// Paths and declared names are arbitrary bytes; invalid UTF-8 is replaced
// with U+FFFD rather than failing a finished command
void Commands::emit(const nlohmann::json& document) {
  out_ << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

int Commands::validate(
  const std::string& path, std::optional<uint32_t> expected_crc32, const std::string& use_case
) {
  if (use_case.empty()) {
    integrity::StreamingValidator validator(config_.integrity);
    integrity::ValidateOptions options;
    options.expected_crc32 = expected_crc32;

    auto result = validator.validate_file(path, options);
    emit(result_to_json(result));
    return result ? kExitOk : kExitFailed;
  }

  if (expected_crc32) {
    err_ << "Error: --crc cannot be combined with --use-case" << std::endl;
    return kExitUsage;
  }

  auto parsed = integrity::parse_use_case(use_case);
  if (!parsed) {
    err_ << "Error: Unknown use case '" << use_case << "'" << std::endl;
    return kExitUsage;
  }

  integrity::StrategySelector selector(config_.integrity);
  auto result = selector.run(path, *parsed);
  emit(result);
  return result ? kExitOk : kExitFailed;
}

int Commands::fingerprint(const std::vector<std::string>& paths, size_t concurrency) {
  integrity::FingerprintGenerator generator(config_.integrity);
  auto results = generator.generate_batch(paths, concurrency);

  nlohmann::json document = nlohmann::json::object();
  size_t failed = 0;
  for (const auto& entry : results) {
    document[entry.first] = result_to_json(entry.second);
    if (!entry.second) {
      ++failed;
    }
  }
  emit(document);

  if (verbose_) {
    VIGIL_LOG_INFO(
      "Fingerprint batch finished" << kv("files", results.size()) << kv("failed", failed)
    );
  }
  return failed == 0 ? kExitOk : kExitFailed;
}

int Commands::upload(
  const std::string& source, const std::string& name, std::optional<uint64_t> declared_size,
  std::optional<uint32_t> expected_crc32, std::optional<std::string> content_type
) {
  upload::UploadConfig upload_config = config_.upload;
  upload_config.integrity = config_.integrity;
  upload::UploadHandler handler(std::move(upload_config));

  upload::UploadRequest request;
  request.declared_filename = name;
  request.declared_size = declared_size;
  request.expected_crc32 = expected_crc32;
  request.content_type = std::move(content_type);

  auto outcome = handler.handle_upload_file(source, request);
  emit(outcome);
  return outcome ? kExitOk : kExitFailed;
}

int Commands::select(uint64_t size, const std::string& use_case) {
  auto parsed = integrity::parse_use_case(use_case);
  if (!parsed) {
    err_ << "Error: Unknown use case '" << use_case << "'" << std::endl;
    return kExitUsage;
  }

  integrity::StrategySelector selector(config_.integrity);
  integrity::Strategy strategy = selector.select(size, *parsed);
  emit(nlohmann::json{
    {"size_bytes", size},
    {"use_case", integrity::to_string(*parsed)},
    {"strategy", integrity::to_string(strategy)},
    {"memory_estimate_mb", selector.memory_estimate_mb(size, strategy)},
  });
  return kExitOk;
}

int Commands::config() {
  emit(ConfigParser::to_json(config_));
  return kExitOk;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return kExitOk;
  }

  // Parse flags
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (takes_value(arg)) {
      if (i + 1 >= argc) {
        err_ << "Error: Missing value for " << arg << std::endl;
        return kExitUsage;
      }
      options[arg == "-c" ? "--config" : arg] = argv[++i];
    } else if (arg.size() > 1 && arg[0] == '-') {
      err_ << "Error: Unknown option '" << arg << "'" << std::endl;
      return kExitUsage;
    } else {
      positional.push_back(arg);
    }
  }

  auto option = [&options](const std::string& name) -> std::optional<std::string> {
    auto it = options.find(name);
    if (it == options.end()) {
      return std::nullopt;
    }
    return it->second;
  };

  if (auto path = option("--config")) {
    ConfigParser parser;
    EngineConfig loaded;
    if (!parser.load_from_file(*path, loaded)) {
      err_ << "Error: " << parser.get_last_error() << std::endl;
      return kExitUsage;
    }
    config_ = std::move(loaded);
  }

  std::string config_error;
  if (!ConfigParser::validate(config_, config_error)) {
    err_ << "Error: Invalid configuration: " << config_error << std::endl;
    return kExitUsage;
  }

  std::optional<uint32_t> crc;
  if (auto text = option("--crc")) {
    crc = parse_crc32(*text);
    if (!crc) {
      err_ << "Error: --crc expects 1-8 hex digits, got '" << *text << "'" << std::endl;
      return kExitUsage;
    }
  }

  std::optional<uint64_t> size;
  if (auto text = option("--size")) {
    size = parse_size(*text);
    if (!size) {
      err_ << "Error: --size expects a byte count, got '" << *text << "'" << std::endl;
      return kExitUsage;
    }
  }

  size_t concurrency = integrity::kDefaultBatchConcurrency;
  if (auto text = option("--concurrency")) {
    auto parsed = parse_size(*text);
    if (!parsed || *parsed == 0) {
      err_ << "Error: --concurrency expects a positive integer" << std::endl;
      return kExitUsage;
    }
    concurrency = static_cast<size_t>(*parsed);
  }

  LoggingSession logging_session(config_.logging, verbose_);
  VIGIL_LOG_DEBUG("Executing command" << kv("command", command) << kv("args", positional.size()));

  // Execute command
  if (command == "validate" && positional.size() == 1) {
    return validate(positional[0], crc, option("--use-case").value_or(""));
  } else if (command == "fingerprint" && !positional.empty()) {
    return fingerprint(positional, concurrency);
  } else if (command == "upload" && positional.size() == 2) {
    return upload(positional[0], positional[1], size, crc, option("--content-type"));
  } else if (command == "select" && positional.size() == 2) {
    auto file_size = parse_size(positional[0]);
    if (!file_size) {
      err_ << "Error: select expects a byte count, got '" << positional[0] << "'" << std::endl;
      return kExitUsage;
    }
    return select(*file_size, positional[1]);
  } else if (command == "config" && positional.empty()) {
    return config();
  } else if (command == "validate" || command == "fingerprint" || command == "upload" ||
             command == "select" || command == "config") {
    err_ << "Error: Wrong arguments for '" << command << "'" << std::endl;
    print_usage();
    return kExitUsage;
  } else {
    err_ << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return kExitUsage;
  }
}

void Commands::print_usage() {
  err_ << "vigil_check - streaming integrity validation\n"
       << "\n"
       << "Usage: vigil_check <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  validate <path> [--crc HEX]        Checksum every byte of a file\n"
       << "  validate <path> --use-case UC      Run the strategy selected for UC\n"
       << "  fingerprint <path>...              Head/tail/size fingerprint of each file\n"
       << "  upload <src> <name> [--size N] [--crc HEX] [--content-type T]\n"
       << "                                     Quarantine, validate and promote a file\n"
       << "  select <size> <use-case>           Show the strategy for a size and use case\n"
       << "  config                             Print the effective configuration\n"
       << "\n"
       << "Use cases: upload, cache-check, security-audit, telemetry\n"
       << "\n"
       << "Options:\n"
       << "  -c, --config <yaml>   Engine configuration file\n"
       << "  --concurrency N       Fingerprint worker threads (default "
       << integrity::kDefaultBatchConcurrency << ")\n"
       << "  -v, --verbose         Debug logging on the console\n"
       << std::endl;
}

}  // namespace check
}  // namespace vigil
