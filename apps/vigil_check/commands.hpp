// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_CHECK_COMMANDS_HPP
#define VIGIL_CHECK_COMMANDS_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config_parser.hpp"

namespace vigil {
namespace check {

/**
 * Exit codes of vigil_check
 */
constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;  // validation failed or source unusable
constexpr int kExitUsage = 2;   // bad command line or configuration

/**
 * Parse 1-8 hex digits, with or without a 0x prefix.
 */
std::optional<uint32_t> parse_crc32(const std::string& text);

/**
 * Parse a non-negative decimal byte count.
 */
std::optional<uint64_t> parse_size(const std::string& text);

/**
 * Command handler for the vigil_check CLI.
 *
 * Every command prints one JSON document to the output stream; diagnostics
 * go to the error stream and to the log.
 */
class Commands {
public:
  explicit Commands(std::ostream& out = std::cout, std::ostream& err = std::cerr);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  /**
   * Replace the engine configuration (normally loaded via --config)
   */
  void set_config(EngineConfig config) {
    config_ = std::move(config);
  }

  /**
   * Execute validate command.
   * Without a use case every byte is checked; with one, the selected
   * strategy runs.
   */
  int validate(
    const std::string& path, std::optional<uint32_t> expected_crc32,
    const std::string& use_case = ""
  );

  /**
   * Execute fingerprint command
   */
  int fingerprint(const std::vector<std::string>& paths, size_t concurrency);

  /**
   * Execute upload command
   */
  int upload(
    const std::string& source, const std::string& name, std::optional<uint64_t> declared_size,
    std::optional<uint32_t> expected_crc32, std::optional<std::string> content_type
  );

  /**
   * Execute select command
   */
  int select(uint64_t size, const std::string& use_case);

  /**
   * Execute config command
   */
  int config();

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

private:
  EngineConfig config_;
  bool verbose_;
  std::ostream& out_;
  std::ostream& err_;

  void print_usage();

  void emit(const nlohmann::json& document);
};

}  // namespace check
}  // namespace vigil

#endif  // VIGIL_CHECK_COMMANDS_HPP
