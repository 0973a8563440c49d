// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_console_sink.cpp
 * @brief Unit tests for the console sink, captured through std::clog
 */

#include <boost/log/core.hpp>
#include <gtest/gtest.h>

#include <iostream>
#include <sstream>
#include <string>

#include "vigil_console_sink.hpp"
#include "vigil_log_init.hpp"
#include "vigil_log_macros.hpp"
#include "vigil_log_record.hpp"

using namespace vigil::logging;

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    saved_ = std::clog.rdbuf(captured_.rdbuf());
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    std::clog.rdbuf(saved_);
  }

  void start(severity_level level, bool colors) {
    LoggingConfig config;
    config.console_enabled = true;
    config.console_colors = colors;
    config.console_level = level;
    config.file_enabled = false;
    init_logging(config);
  }

  // Drains the async queue before reading
  std::string output() {
    shutdown_logging();
    return captured_.str();
  }

  std::ostringstream captured_;
  std::streambuf* saved_ = nullptr;
};

TEST_F(ConsoleSinkTest, CreateWithDefaultParams) {
  auto sink = create_console_sink();
  ASSERT_NE(sink, nullptr);
}

TEST_F(ConsoleSinkTest, WritesPlainTextLine) {
  start(severity_level::info, false);

  VIGIL_LOG_INFO("ready" << kv("chunks", 3));
  std::string logs = output();

  EXPECT_NE(logs.find("[INFO] [vigil] ready chunks=3"), std::string::npos);
  EXPECT_EQ(logs.find("\033["), std::string::npos);
}

TEST_F(ConsoleSinkTest, FiltersBelowConsoleLevel) {
  start(severity_level::warn, false);

  VIGIL_LOG_DEBUG("debug detail");
  VIGIL_LOG_INFO("info detail");
  VIGIL_LOG_ERROR("disk full");
  std::string logs = output();

  EXPECT_EQ(logs.find("debug detail"), std::string::npos);
  EXPECT_EQ(logs.find("info detail"), std::string::npos);
  EXPECT_NE(logs.find("[ERROR] [vigil] disk full"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ColorsWrapSeverityTag) {
  start(severity_level::debug, true);

  VIGIL_LOG_ERROR("colored");
  std::string logs = output();

  std::string tag = std::string(severity_color(severity_level::error)) + "[ERROR]";
  EXPECT_NE(logs.find(tag), std::string::npos);
  EXPECT_NE(logs.find("colored"), std::string::npos);
}

TEST_F(ConsoleSinkTest, ScopedContextAppended) {
  start(severity_level::info, false);

  {
    VIGIL_LOG_SCOPED_CONTEXT("upload-3", "pkg.tgz");
    VIGIL_LOG_WARN("rejected");
  }
  VIGIL_LOG_WARN("outside");
  std::string logs = output();

  EXPECT_NE(logs.find("rejected | operation_id=upload-3 source=pkg.tgz"), std::string::npos);
  size_t outside = logs.find("outside");
  ASSERT_NE(outside, std::string::npos);
  std::string outside_line = logs.substr(outside);
  EXPECT_EQ(outside_line.find("operation_id"), std::string::npos);
}
