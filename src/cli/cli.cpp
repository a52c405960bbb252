#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace savestore {
namespace cli {

namespace {

// Strips leading whitespace left over after extracting the path
std::string remainder(std::istringstream& iss) {
  std::string rest;
  std::getline(iss >> std::ws, rest);
  return rest;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
CLI::CLI(store::Store& store, std::istream& in, std::ostream& out)
  : running_(false)
  , store_(store)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;
  
  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "savestore> " << std::flush;
  
  while (running_ && std::getline(in_, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command, path;

    iss >> command;
    if (command.empty()) {
      // Blank line, just prompt again
    } else if (command == "pwd" || command == "ls" || command == "help") {
      process_command(command, "", "");
    } else if (iss >> path) {
      process_command(command, path, remainder(iss));
    } else {
      out_ << "Invalid input. Usage: <command> [path] [value]" << std::endl;
    }

    if (running_) {
      out_ << "savestore> " << std::flush;
    }
  }
  
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING 
//==============================================

void CLI::process_command(const std::string& command, const std::string& path, const std::string& argument) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with path: " << path;

  if (command == "read") {
    handle_read_command(path);
  }
  else if (command == "write") {
    handle_write_command(path, argument);
  }
  else if (command == "exists") {
    handle_exists_command(path);
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "pwd") {
    handle_pwd_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_read_command(const std::string& path) {
  try {
    const codec::Value value = store_.read(path);
    out_ << value.dump(2) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading " + path, e.what());
  }
}

void CLI::handle_write_command(const std::string& path, const std::string& json_text) {
  if (json_text.empty()) {
    out_ << "Usage: write <path> <json value>" << std::endl;
    return;
  }

  codec::Value value;
  try {
    value = codec::Value::parse(json_text);
  } catch (const std::exception& e) {
    log_and_display_error("Invalid JSON value", e.what());
    return;
  }

  try {
    store_.write(path, value);
    out_ << "Wrote " << path << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error writing " + path, e.what());
  }
}

void CLI::handle_exists_command(const std::string& path) {
  out_ << (store_.exists(path) ? "true" : "false") << std::endl;
}

void CLI::handle_list_command() {
  try {
    for (const auto& path : store_.list()) {
      out_ << path << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing store", e.what());
  }
}

void CLI::handle_pwd_command() {
  out_ << "Project: " << store_.project_title() << std::endl;
  out_ << "Save directory: " << store_.root_path() << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                Display this help message" << std::endl;
  out_ << "  pwd                 Print project title and save directory" << std::endl;
  out_ << "  ls                  List every stored path" << std::endl;
  out_ << "  exists <path>       Check whether <path> exists" << std::endl;
  out_ << "  read <path>         Print the value stored at <path>" << std::endl;
  out_ << "  write <path> <json> Store <json> at <path>" << std::endl;
  out_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace savestore
