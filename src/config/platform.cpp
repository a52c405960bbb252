#include "config/platform.hpp"
#include "config/config_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <filesystem>

namespace savestore {
namespace config {

namespace {

const char* system_env(const char* name) {
  return std::getenv(name);
}

// Returns the variable's value, or an empty string when unset or empty
std::string lookup(const EnvLookup& env, const char* name) {
  const char* value = env ? env(name) : system_env(name);
  return value ? std::string(value) : std::string();
}

std::string require(const EnvLookup& env, const char* name) {
  std::string value = lookup(env, name);
  if (value.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Environment variable " << name << " is not set";
    throw ConfigError(std::string(name) + " is not set, cannot locate the save directory");
  }
  return value;
}

std::string project_directory(const std::filesystem::path& base, const std::string& project_title) {
  std::string path = (base / project_title).generic_string();
  if (path.back() != '/') {
    path += '/';
  }
  return path;
}

} // namespace

Platform current_platform() {
#if defined(_WIN32)
  return Platform::Windows;
#elif defined(__APPLE__)
  return Platform::MacOS;
#else
  return Platform::Linux;
#endif
}

const char* to_string(Platform platform) {
  switch (platform) {
    case Platform::Linux:   return "linux";
    case Platform::MacOS:   return "macos";
    case Platform::Windows: return "windows";
    default:                return "unknown";
  }
}

Platform platform_from_string(const std::string& name) {
  if (name == "linux") {
    return Platform::Linux;
  } else if (name == "macos") {
    return Platform::MacOS;
  } else if (name == "windows") {
    return Platform::Windows;
  }
  throw ConfigError("unknown platform: " + name);
}

std::string resolve_save_path(Platform platform, const std::string& project_title, 
                              const EnvLookup& env) {
  if (project_title.empty()) {
    throw ConfigError("project title must not be empty");
  }

  // The title names a single directory inside the platform base
  if (project_title == "." || project_title == ".." 
      || project_title.find_first_of("/\\") != std::string::npos
      || std::filesystem::path(project_title).is_absolute()) {
    BOOST_LOG_TRIVIAL(error) << "Config: Rejected project title: " << project_title;
    throw ConfigError("project title must be a single directory name: " + project_title);
  }

  std::filesystem::path base;
  switch (platform) {
    case Platform::Linux: {
      const std::string data_home = lookup(env, "XDG_DATA_HOME");
      base = data_home.empty() 
        ? std::filesystem::path(require(env, "HOME")) / ".local" / "share" 
        : std::filesystem::path(data_home);
      break;
    }
    case Platform::MacOS:
      base = std::filesystem::path(require(env, "HOME")) / "Library" / "Application Support";
      break;
    case Platform::Windows:
      base = std::filesystem::path(require(env, "APPDATA"));
      break;
  }

  std::string save_path = project_directory(base, project_title);
  BOOST_LOG_TRIVIAL(info) << "Config: Save directory for '" << project_title << "' on " 
                          << to_string(platform) << ": " << save_path;
  return save_path;
}

} // namespace config
} // namespace savestore
