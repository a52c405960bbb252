#include "store/directory_materializer.hpp"
#include "store/path_splitter.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <system_error>

namespace savestore {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DirectoryMaterializer::DirectoryMaterializer(const std::string& root) : root_(root) {
  BOOST_LOG_TRIVIAL(debug) << "DirectoryMaterializer: Rooted at: " << root_;
}


//==============================================
// MATERIALIZATION
//==============================================

void DirectoryMaterializer::ensure_directories(const std::string& path) const {
  const PathComponents components = split_path(path);
  BOOST_LOG_TRIVIAL(debug) << "DirectoryMaterializer: " << components.directories.size() 
                           << " directory level(s) required for: " << path;

  // Each level's parent was handled by the previous iteration
  std::string cumulative = root_;
  for (const auto& directory : components.directories) {
    cumulative += directory;
    cumulative += PATH_SEPARATOR;
    ensure_directory(cumulative);
  }
}

void DirectoryMaterializer::ensure_directory(const std::string& absolute_path) const {
  std::error_code ec;
  const auto status = std::filesystem::status(absolute_path, ec);

  if (std::filesystem::is_directory(status)) {
    return;
  }

  if (std::filesystem::exists(status)) {
    BOOST_LOG_TRIVIAL(error) << "DirectoryMaterializer: Path exists but is not a directory: " << absolute_path;
    throw IoError(absolute_path + ": Not a directory");
  }

  BOOST_LOG_TRIVIAL(debug) << "DirectoryMaterializer: Creating directory: " << absolute_path;
  std::filesystem::create_directory(absolute_path, ec);
  if (ec) {
    // Someone else may have created it between the check and the create
    std::error_code recheck;
    if (std::filesystem::is_directory(absolute_path, recheck)) {
      return;
    }
    BOOST_LOG_TRIVIAL(error) << "DirectoryMaterializer: Failed to create directory " 
                             << absolute_path << ": " << ec.message();
    throw IoError(absolute_path + ": " + ec.message());
  }
}

} // namespace store
} // namespace savestore
