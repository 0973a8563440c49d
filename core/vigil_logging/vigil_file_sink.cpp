// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "vigil_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "vigil_log_record.hpp"

namespace vigil {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

void json_line_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << record_to_json(extract_fields(rec))
            .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void text_line_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  write_text(extract_fields(rec), strm, false);
}

}  // namespace

std::string resolve_log_directory(const std::string& directory) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(directory, ec);
  if (ec || !boost::filesystem::is_directory(directory, ec)) {
    // The logger itself is not usable yet
    std::cerr << "[vigil_logging] Warning: Could not create log directory '" << directory
              << "': " << ec.message() << ". Falling back to /tmp\n";
    return "/tmp";
  }
  return directory;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  std::string log_directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );

  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }

  // Old upload logs are pruned by count; 0 keeps everything
  if (config.max_files > 0) {
    backend->set_file_collector(sinks::file::make_collector(
      keywords::target = log_directory,
      keywords::max_files = static_cast<unsigned int>(config.max_files)
    ));
    backend->scan_for_files();
  }

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_line_formatter : &text_line_formatter);

  return sink;
}

}  // namespace logging
}  // namespace vigil
