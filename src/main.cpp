#include "cli/cli.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include <iostream>
#include <string>

bool run_shell(const savestore::config::ProgramOptions& options) {
  try {
    const std::string root = savestore::config::resolve_root(options);
    savestore::store::Store store(options.project_title, root);
    savestore::cli::CLI cli(store);

    std::cout << "Project '" << store.project_title() << "' saving to " << store.root_path() << "\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to open store: " << e.what();
    std::cerr << "Error: Failed to open store: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = savestore::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    savestore::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_shell(options) ? 0 : 1;
}
