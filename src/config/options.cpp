#include "config/options.hpp"
#include "config/config_error.hpp"
#include "logger/logger.hpp"
#include <ostream>
#include <unordered_set>

namespace savestore {
namespace config {

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " -t <title> [options]\n"
      << "Required arguments:\n"
      << "  -t, --title      Project title, names the save directory\n"
      << "Optional arguments:\n"
      << "  -r, --root       Use this directory instead of the platform save directory\n"
      << "  -p, --platform   linux, macos or windows (default: host platform)\n"
      << "  -l, --log-file   Log file (default: savestore.log)\n"
      << "  -v, --log-level  trace, debug, info, warning, error or fatal (default: info)\n"
      << "Example: " << program_name << " -t my-game -v debug\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  static const std::unordered_set<std::string> known_flags = {
    "-t", "--title",
    "-r", "--root",
    "-p", "--platform",
    "-l", "--log-file",
    "-v", "--log-level"
  };

  const std::string program_name = argc > 0 ? argv[0] : "savestore";
  ProgramOptions options;

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (known_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[i + 1]);

    try {
      if (flag == "-t" || flag == "--title") {
        options.project_title = value;
      } else if (flag == "-r" || flag == "--root") {
        options.root_override = value;
      } else if (flag == "-p" || flag == "--platform") {
        options.platform = platform_from_string(value);
      } else if (flag == "-l" || flag == "--log-file") {
        options.log_file = value;
      } else if (flag == "-v" || flag == "--log-level") {
        options.log_level = logging::parse_severity(value);
      }
    } catch (const ConfigError& e) {
      err << "Error: " << e.what() << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (options.project_title.empty()) {
    err << "Error: A project title is required\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

std::string resolve_root(const ProgramOptions& options, const EnvLookup& env) {
  if (!options.root_override.empty()) {
    return options.root_override;
  }
  return resolve_save_path(options.platform, options.project_title, env);
}

} // namespace config
} // namespace savestore
