#include "store/path_splitter.hpp"

namespace savestore {
namespace store {

PathComponents split_path(const std::string& path) {
  PathComponents components;

  std::string::size_type segment_start = 0;
  std::string::size_type separator = path.find(PATH_SEPARATOR);

  // Every segment followed by a separator is a directory
  while (separator != std::string::npos) {
    components.directories.push_back(path.substr(segment_start, separator - segment_start));
    segment_start = separator + 1;
    separator = path.find(PATH_SEPARATOR, segment_start);
  }

  components.leaf = path.substr(segment_start);
  return components;
}

std::string join_path(const PathComponents& components) {
  std::string path;
  for (const auto& directory : components.directories) {
    path += directory;
    path += PATH_SEPARATOR;
  }
  path += components.leaf;
  return path;
}

} // namespace store
} // namespace savestore
