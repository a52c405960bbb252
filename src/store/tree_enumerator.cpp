#include "store/tree_enumerator.hpp"
#include "store/path_splitter.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <deque>
#include <filesystem>
#include <system_error>
#include <utility>

namespace savestore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TreeEnumerator::TreeEnumerator(const std::string& root) : root_(root) {
}


//==============================================
// TRAVERSAL
//==============================================

std::vector<std::string> TreeEnumerator::enumerate() const {
  BOOST_LOG_TRIVIAL(debug) << "TreeEnumerator: Walking: " << root_;

  std::vector<std::string> file_paths;

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "TreeEnumerator: Root is absent, nothing to list";
    return file_paths;
  }

  // Pending directories relative to the root, "" is the root itself
  std::deque<std::string> pending{""};

  while (!pending.empty()) {
    const std::string directory_path = std::move(pending.front());
    pending.pop_front();

    std::filesystem::directory_iterator it(root_ + directory_path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TreeEnumerator: Failed to open directory " 
                               << root_ + directory_path << ": " << ec.message();
      throw IoError(root_ + directory_path + ": " + ec.message());
    }

    // directory_iterator never yields the "." and ".." entries
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
      const std::string name = it->path().filename().string();
      const std::string relative_path = directory_path + name;

      // Classify without following symlinks
      std::error_code status_ec;
      const auto status = it->symlink_status(status_ec);
      if (status_ec) {
        BOOST_LOG_TRIVIAL(debug) << "TreeEnumerator: No attributes for " << relative_path << ", skipping";
        continue;
      }

      if (std::filesystem::is_regular_file(status)) {
        file_paths.push_back(relative_path);
      } else if (std::filesystem::is_directory(status)) {
        pending.push_back(relative_path + PATH_SEPARATOR);
      } else {
        BOOST_LOG_TRIVIAL(debug) << "TreeEnumerator: Skipping non-regular entry: " << relative_path;
      }
    }

    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TreeEnumerator: Failed while reading directory " 
                               << root_ + directory_path << ": " << ec.message();
      throw IoError(root_ + directory_path + ": " + ec.message());
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "TreeEnumerator: Found " << file_paths.size() << " file(s)";
  return file_paths;
}

} // namespace store
} // namespace savestore
