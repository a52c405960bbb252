#ifndef SAVESTORE_STORE_DIRECTORY_MATERIALIZER_HPP
#define SAVESTORE_STORE_DIRECTORY_MATERIALIZER_HPP

#include <string>

namespace savestore {
namespace store {

// Creates the ancestor directories of a relative path beneath the root
class DirectoryMaterializer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // root must end with the path separator
  explicit DirectoryMaterializer(const std::string& root);


  // ---- MATERIALIZATION ----
  // Creates every missing directory of path in root-to-leaf order, one level
  // at a time. Existing directories are left alone. Throws IoError on the
  // first level that cannot be created or is occupied by a non-directory
  void ensure_directories(const std::string& path) const;

private:
  // ---- PARAMETERS ----
  std::string root_;


  // ---- MATERIALIZATION ----
  // Creates a single directory whose parent already exists
  void ensure_directory(const std::string& absolute_path) const;
};

} // namespace store
} // namespace savestore

#endif // SAVESTORE_STORE_DIRECTORY_MATERIALIZER_HPP
