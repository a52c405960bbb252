#include "logger/logger.hpp"
#include "config/config_error.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>

namespace savestore {
namespace logging {

namespace {

namespace blog = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

// "2024-01-31 12:00:00.000000 [info] Store: ..."
auto record_format() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << expr::attr<blog::trivial::severity_level>("Severity") << "] "
    << expr::smessage;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    blog::core::get()->remove_all_sinks();

    // Convert to absolute path so the log lands where the caller expects
    std::filesystem::path log_path = std::filesystem::absolute(log_file);

    blog::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::trunc,
      keywords::format = record_format(),
      keywords::auto_flush = true
    );

    blog::add_common_attributes();
    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  blog::core::get()->remove_all_sinks();

  blog::add_console_log(
    std::clog,
    keywords::format = record_format(),
    keywords::auto_flush = true
  );

  blog::add_common_attributes();
  set_log_level(min_level);
  enable_logging();
}

void set_log_level(severity_level min_level) {
  blog::core::get()->set_filter(blog::trivial::severity >= min_level);
}

void enable_logging() {
  blog::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  blog::core::get()->set_logging_enabled(false);
}

severity_level parse_severity(const std::string& name) {
  severity_level level;
  if (!blog::trivial::from_string(name.c_str(), name.size(), level)) {
    throw config::ConfigError("unknown log level: " + name);
  }
  return level;
}

} // namespace logging
} // namespace savestore
