// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef VIGIL_FILE_SINK_HPP
#define VIGIL_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "vigil_log_severity.hpp"

namespace vigil {
namespace logging {

/**
 * Async file sink. The queue is larger than the console sink's because
 * file I/O competes with upload writes on the same disk.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/vigil";
  std::string file_pattern = "vigil_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;  // 0 disables pruning
  bool format_json = true;  // one JSON object per line for log shippers
};

/**
 * Create a rotating file sink.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Create `directory` if needed. Returns it, or "/tmp" when it cannot be used.
 */
std::string resolve_log_directory(const std::string& directory);

}  // namespace logging
}  // namespace vigil

#endif  // VIGIL_FILE_SINK_HPP
