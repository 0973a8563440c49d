// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_log_init.cpp
 * @brief Unit tests for severity parsing, env overrides and logging lifecycle
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

#include "vigil_log_init.hpp"
#include "vigil_log_macros.hpp"
#include "vigil_log_severity.hpp"

using namespace vigil::logging;

namespace {

const char* const kEnvVars[] = {
  "VIGIL_LOG_LEVEL",
  "VIGIL_LOG_CONSOLE_LEVEL",
  "VIGIL_LOG_FILE_LEVEL",
  "VIGIL_LOG_FILE_DIR",
  "VIGIL_LOG_FORMAT",
  "VIGIL_LOG_FILE_ENABLED",
  "VIGIL_LOG_CONSOLE_ENABLED",
};

void clear_env() {
  for (const char* name : kEnvVars) {
    unsetenv(name);
  }
}

}  // namespace

// ============================================================================
// Severity Level Tests
// ============================================================================

TEST(SeverityLevelTest, ParseValidLevels) {
  EXPECT_EQ(parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("info"), severity_level::info);
  EXPECT_EQ(parse_severity_level("warn"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityLevelTest, ParseCaseInsensitive) {
  EXPECT_EQ(parse_severity_level("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity_level("WaRnInG"), severity_level::warn);
  EXPECT_EQ(parse_severity_level("Error"), severity_level::error);
}

TEST(SeverityLevelTest, ParseInvalidLevels) {
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("  info  ").has_value());
  EXPECT_FALSE(parse_severity_level("inf").has_value());
}

TEST(SeverityLevelTest, CanonicalNamesRoundTrip) {
  EXPECT_EQ(severity_to_string(severity_level::debug), "debug");
  EXPECT_EQ(severity_to_string(severity_level::warn), "warn");
  EXPECT_EQ(severity_to_string(severity_level::fatal), "fatal");
  for (auto level : {severity_level::debug, severity_level::info, severity_level::warn,
                     severity_level::error, severity_level::fatal}) {
    EXPECT_EQ(parse_severity_level(severity_to_string(level)), level);
  }
}

TEST(SeverityLevelTest, OutputStream) {
  std::ostringstream oss;
  oss << severity_level::warn;
  EXPECT_EQ(oss.str(), "WARN");

  oss.str("");
  oss << static_cast<severity_level>(42);
  EXPECT_EQ(oss.str(), "42");
}

// ============================================================================
// Env Override Tests
// ============================================================================

class LoggingConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    clear_env();
  }

  void TearDown() override {
    clear_env();
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
};

TEST_F(LoggingConfigTest, DefaultConfigValues) {
  LoggingConfig config;

  EXPECT_TRUE(config.console_enabled);
  EXPECT_TRUE(config.console_colors);
  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_FALSE(config.file_enabled);
  EXPECT_EQ(config.file_level, severity_level::debug);
  EXPECT_EQ(config.file_config.directory, "/var/log/vigil");
}

TEST_F(LoggingConfigTest, GlobalLevelAppliesToBothSinks) {
  LoggingConfig config;
  setenv("VIGIL_LOG_LEVEL", "error", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::error);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(LoggingConfigTest, SinkLevelOverridesGlobalLevel) {
  LoggingConfig config;
  setenv("VIGIL_LOG_LEVEL", "error", 1);
  setenv("VIGIL_LOG_CONSOLE_LEVEL", "debug", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::debug);
  EXPECT_EQ(config.file_level, severity_level::error);
}

TEST_F(LoggingConfigTest, InvalidLevelIsIgnored) {
  LoggingConfig config;
  setenv("VIGIL_LOG_LEVEL", "loud", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.console_level, severity_level::info);
  EXPECT_EQ(config.file_level, severity_level::debug);
}

TEST_F(LoggingConfigTest, FileDirectoryAndFormat) {
  LoggingConfig config;
  setenv("VIGIL_LOG_FILE_DIR", "/tmp/vigil_logs", 1);
  setenv("VIGIL_LOG_FORMAT", "TEXT", 1);

  apply_env_overrides(config);

  EXPECT_EQ(config.file_config.directory, "/tmp/vigil_logs");
  EXPECT_FALSE(config.file_config.format_json);
}

TEST_F(LoggingConfigTest, EnableFlags) {
  LoggingConfig config;
  setenv("VIGIL_LOG_FILE_ENABLED", "yes", 1);
  setenv("VIGIL_LOG_CONSOLE_ENABLED", "off", 1);

  apply_env_overrides(config);

  EXPECT_TRUE(config.file_enabled);
  EXPECT_FALSE(config.console_enabled);
}

TEST_F(LoggingConfigTest, UnparseableBooleanKeepsCurrentValue) {
  LoggingConfig config;
  config.console_enabled = true;
  setenv("VIGIL_LOG_CONSOLE_ENABLED", "maybe", 1);

  apply_env_overrides(config);

  EXPECT_TRUE(config.console_enabled);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(LoggingConfigTest, InitAndShutdown) {
  EXPECT_FALSE(is_logging_initialized());

  LoggingConfig config;
  config.console_colors = false;
  init_logging(config);
  EXPECT_TRUE(is_logging_initialized());

  // Second init is a no-op
  init_logging(config);
  EXPECT_TRUE(is_logging_initialized());

  VIGIL_LOG_INFO("lifecycle test" << kv("attempt", 1));
  flush_logging();

  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());

  // Shutdown twice is harmless
  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingConfigTest, ReconfigureAppliesEnvOverrides) {
  init_logging(LoggingConfig());
  ASSERT_TRUE(is_logging_initialized());

  setenv("VIGIL_LOG_CONSOLE_ENABLED", "false", 1);
  LoggingConfig config;
  reconfigure_logging(config);

  EXPECT_TRUE(is_logging_initialized());
}

TEST_F(LoggingConfigTest, MacrosCompileWithoutInit) {
  // Records with no sinks attached are discarded
  VIGIL_LOG_DEBUG("debug" << kv("n", 1));
  VIGIL_LOG_WARN("warn" << kv("path", std::string("/tmp/x")));
  VIGIL_LOG_ERROR("error" << kv("label", "stdin"));
  for (int i = 0; i < 10; ++i) {
    VIGIL_LOG_DEBUG_EVERY_N(4, "sampled" << kv("i", i));
  }
  SUCCEED();
}

TEST(KvTest, QuotesStrings) {
  EXPECT_EQ(kv("bytes", 10), " bytes=10");
  EXPECT_EQ(kv("path", std::string("a.tgz")), " path=\"a.tgz\"");
  EXPECT_EQ(kv("label", "stdin"), " label=\"stdin\"");
}
