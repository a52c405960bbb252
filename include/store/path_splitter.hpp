#ifndef SAVESTORE_STORE_PATH_SPLITTER_HPP
#define SAVESTORE_STORE_PATH_SPLITTER_HPP

#include <string>
#include <vector>

namespace savestore {
namespace store {

// Separator used by every relative path handed to the store
constexpr char PATH_SEPARATOR = '/';

struct PathComponents {
  // Directory segments in root-to-leaf order
  std::vector<std::string> directories;
  // Everything after the last separator, empty for a trailing separator
  std::string leaf;
};

// Splits a relative path on the separator. Never fails: empty segments are
// kept as empty directory names and a trailing separator yields an empty leaf
PathComponents split_path(const std::string& path);

// Rejoins split components, join_path(split_path(p)) == p
std::string join_path(const PathComponents& components);

} // namespace store
} // namespace savestore

#endif // SAVESTORE_STORE_PATH_SPLITTER_HPP
