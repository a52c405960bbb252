#ifndef SAVESTORE_STORE_TREE_ENUMERATOR_HPP
#define SAVESTORE_STORE_TREE_ENUMERATOR_HPP

#include <string>
#include <vector>

namespace savestore {
namespace store {

// Breadth-first walk over everything stored beneath a root
class TreeEnumerator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // root must end with the path separator
  explicit TreeEnumerator(const std::string& root);


  // ---- TRAVERSAL ----
  // Returns the root-relative path of every regular file, in breadth-first
  // discovery order. Symlinks and special files are skipped. An absent root
  // yields an empty list, any other unreadable directory throws IoError
  std::vector<std::string> enumerate() const;

private:
  // ---- PARAMETERS ----
  std::string root_;
};

} // namespace store
} // namespace savestore

#endif // SAVESTORE_STORE_TREE_ENUMERATOR_HPP
