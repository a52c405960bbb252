#pragma once

#include <iostream>
#include <string>
#include "store/store.hpp"

namespace savestore {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(store::Store& store, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();

private:
  // ---- PARAMETERS ----
  bool running_;
  store::Store& store_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::string& path, const std::string& argument);
  void handle_read_command(const std::string& path);
  void handle_write_command(const std::string& path, const std::string& json_text);
  void handle_exists_command(const std::string& path);
  void handle_list_command();
  void handle_pwd_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace savestore
