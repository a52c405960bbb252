#ifndef SAVESTORE_CONFIG_ERROR_HPP
#define SAVESTORE_CONFIG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace savestore {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) 
    : std::runtime_error("Configuration error: " + message) {}
};

} // namespace config
} // namespace savestore

#endif // SAVESTORE_CONFIG_ERROR_HPP
