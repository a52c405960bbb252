#ifndef SAVESTORE_LOGGER_HPP
#define SAVESTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace savestore {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a text file sink. The file is truncated on start
// and flushed after every record
void init_logging(const std::string& log_file = "savestore.log",
                  severity_level min_level = boost::log::trivial::info);

// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = boost::log::trivial::debug);

// Drops records below min_level
void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// Parses "trace", "debug", "info", "warning", "error" or "fatal",
// throws config::ConfigError otherwise
severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace savestore

#endif // SAVESTORE_LOGGER_HPP
