#ifndef GRIDFS_LOGGER_HPP
#define GRIDFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace gridfs::logging {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);
// Parses trace|debug|info|warning|error|fatal, throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

// Initialize logging to a text file, replacing any existing sinks
void init_logging(const std::string& log_file = "gridfs.log",
                  severity_level min_level = severity_level::info);
// Initialize logging to the console, replacing any existing sinks
void init_console_logging(severity_level min_level = severity_level::info);
// Adjust the global severity filter
void set_log_level(severity_level min_level);

} // namespace gridfs::logging

#endif // GRIDFS_LOGGER_HPP
