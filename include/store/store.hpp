#pragma once

#include <string>
#include <vector>
#include "codec/value.hpp"
#include "store/directory_materializer.hpp"
#include "store/store_error.hpp"
#include "store/tree_enumerator.hpp"

namespace savestore {
namespace store {

class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens the store of a project rooted at root_path, creating the root
  // directory if it is missing
  Store(const std::string& project_title, const std::string& root_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores value under path, creating missing directories. Paths ending in
  // ".json" are written as JSON text, everything else as CBOR
  void write(const std::string& path, const codec::Value& value);
  // Loads the value stored under path, throws NotFoundError if there is none
  codec::Value read(const std::string& path) const;


  // ---- QUERY OPERATIONS ----
  // Checks if any entry (file or directory) exists under path, never throws
  bool exists(const std::string& path) const;
  // Returns every stored file path in breadth-first order
  std::vector<std::string> list() const;


  // ---- GETTERS ----
  const std::string& project_title() const { return project_title_; }
  // Absolute root directory, always ends with the path separator
  const std::string& root_path() const { return root_path_; }

private:
  // ---- PARAMETERS ----
  const std::string project_title_;
  const std::string root_path_;
  DirectoryMaterializer materializer_;
  TreeEnumerator enumerator_;


  // ---- FILE OPERATIONS ----
  // Resolves a relative path against the root
  std::string resolve_path(const std::string& path) const;
  // Writes bytes to a file, truncating it if present
  void write_file(const std::string& absolute_path, const std::string& bytes) const;
  // Reads the entire contents of a file
  std::string read_file(const std::string& absolute_path) const;
};

} // namespace store
} // namespace savestore
