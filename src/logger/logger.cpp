#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace gridfs::logging {

namespace {

namespace expr = boost::log::expressions;

// Shared line layout for every sink
auto line_format() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

} // namespace

const char* to_string(severity_level level) {
  switch (level) {
    case severity_level::trace:   return "TRACE";
    case severity_level::debug:   return "DEBUG";
    case severity_level::info:    return "INFO";
    case severity_level::warning: return "WARNING";
    case severity_level::error:   return "ERROR";
    case severity_level::fatal:   return "FATAL";
    default:                      return "UNKNOWN";
  }
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace")   return severity_level::trace;
  if (name == "debug")   return severity_level::debug;
  if (name == "info")    return severity_level::info;
  if (name == "warning") return severity_level::warning;
  if (name == "error")   return severity_level::error;
  if (name == "fatal")   return severity_level::fatal;
  throw std::invalid_argument("Unknown log level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    // Create and configure text file sink backend
    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

    // Convert to absolute path
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(line_format());

    // Add sink and attributes to the core
    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging to " << log_path.string()
                            << " at level " << gridfs::logging::to_string(min_level);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  boost::log::core::get()->remove_all_sinks();

  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
  auto sink = boost::make_shared<text_sink>(backend);
  sink->set_formatter(line_format());

  boost::log::core::get()->add_sink(sink);
  boost::log::add_common_attributes();
  set_log_level(min_level);
  boost::log::core::get()->set_logging_enabled(true);
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace gridfs::logging
