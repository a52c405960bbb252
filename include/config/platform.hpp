#ifndef SAVESTORE_CONFIG_PLATFORM_HPP
#define SAVESTORE_CONFIG_PLATFORM_HPP

#include <functional>
#include <string>

namespace savestore {
namespace config {

enum class Platform {
  Linux,
  MacOS,
  Windows
};

// Looks up an environment variable, returns nullptr when it is unset
using EnvLookup = std::function<const char*(const char*)>;

// Platform this binary was compiled for
Platform current_platform();

const char* to_string(Platform platform);
// Accepts "linux", "macos" and "windows", throws ConfigError otherwise
Platform platform_from_string(const std::string& name);

// Resolves the per-project save directory of a platform:
//   Linux:   $XDG_DATA_HOME/<title>/ or $HOME/.local/share/<title>/
//   macOS:   $HOME/Library/Application Support/<title>/
//   Windows: %APPDATA%/<title>/
// The result always ends with '/'. Throws ConfigError when the title is
// empty or the variables the platform needs are unset
std::string resolve_save_path(Platform platform, const std::string& project_title, 
                              const EnvLookup& env = EnvLookup());

} // namespace config
} // namespace savestore

#endif // SAVESTORE_CONFIG_PLATFORM_HPP
