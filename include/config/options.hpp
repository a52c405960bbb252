#ifndef SAVESTORE_CONFIG_OPTIONS_HPP
#define SAVESTORE_CONFIG_OPTIONS_HPP

#include <iosfwd>
#include <string>
#include <boost/log/trivial.hpp>
#include "config/platform.hpp"

namespace savestore {
namespace config {

struct ProgramOptions {
  std::string project_title;
  // Overrides the platform save directory when set
  std::string root_override;
  Platform platform{current_platform()};
  std::string log_file{"savestore.log"};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Parses flag/value pairs. On bad input prints the problem and usage to err
// and returns options with valid == false
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

// Root directory the options point at, either the override or the platform
// save directory of the project
std::string resolve_root(const ProgramOptions& options, const EnvLookup& env = EnvLookup());

} // namespace config
} // namespace savestore

#endif // SAVESTORE_CONFIG_OPTIONS_HPP
