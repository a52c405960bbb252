#ifndef SAVESTORE_STORE_ERROR_HPP
#define SAVESTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace savestore {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) 
    : std::runtime_error(message) {}
};

// Read of a path that has no entry under the root
class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& absolute_path) 
    : StoreError(absolute_path + ": No such file or directory") {}
};

// Directory creation, open, read or write failed at the OS boundary
class IoError : public StoreError {
public:
  explicit IoError(const std::string& message) 
    : StoreError("I/O error: " + message) {}
};

class EncodeError : public StoreError {
public:
  explicit EncodeError(const std::string& message) 
    : StoreError("Encode error: " + message) {}
};

class DecodeError : public StoreError {
public:
  explicit DecodeError(const std::string& message) 
    : StoreError("Decode error: " + message) {}
};

} // namespace store
} // namespace savestore

#endif // SAVESTORE_STORE_ERROR_HPP
