#ifndef SAVESTORE_TEST_UTILS_HPP
#define SAVESTORE_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include "logger/logger.hpp"

// Set logging severity level and send records to the console
inline void init_test_logging() {
  savestore::logging::init_console_logging(boost::log::trivial::debug);
}

// Unique scratch directory under the system temp directory, ends with '/'
inline std::string make_test_root(const std::string& prefix) {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / 
    (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  return dir.generic_string() + "/";
}

inline void write_raw_file(const std::string& path, const std::string& contents) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

inline std::string read_raw_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

#endif // SAVESTORE_TEST_UTILS_HPP
