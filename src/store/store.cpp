#include "store/store.hpp"
#include "codec/codec.hpp"
#include "codec/format.hpp"
#include "store/path_splitter.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace savestore {
namespace store {

namespace {

std::string with_trailing_separator(std::string path) {
  if (path.empty() || path.back() != PATH_SEPARATOR) {
    path += PATH_SEPARATOR;
  }
  return path;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Store::Store(const std::string& project_title, const std::string& root_path)
  : project_title_(project_title)
  , root_path_(with_trailing_separator(std::filesystem::path(root_path).generic_string()))
  , materializer_(root_path_)
  , enumerator_(root_path_) {
  if (root_path.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Empty root path for project '" << project_title_ << "'";
    throw IoError("root path must not be empty");
  }

  BOOST_LOG_TRIVIAL(info) << "Store: Initializing store for project '" << project_title_ 
                          << "' at: " << root_path_;

  std::error_code ec;
  if (!std::filesystem::is_directory(root_path_, ec)) {
    // parent_path() of "<root>/" is the root itself, without the separator
    std::filesystem::create_directories(std::filesystem::path(root_path_).parent_path(), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to create root directory " << root_path_ 
                               << ": " << ec.message();
      throw IoError(root_path_ + ": " + ec.message());
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Root directory created/verified at: " << root_path_;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void Store::write(const std::string& path, const codec::Value& value) {
  BOOST_LOG_TRIVIAL(info) << "Store: Writing path: " << path;

  materializer_.ensure_directories(path);

  // Encode before opening so a rejected value leaves the old file intact
  const codec::Codec& codec = codec::codec_for(codec::select_format(path));
  BOOST_LOG_TRIVIAL(debug) << "Store: Using " << codec::format_to_string(codec.format()) 
                           << " format for: " << path;
  const std::string bytes = codec.encode(value);

  write_file(resolve_path(path), bytes);
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully wrote " << bytes.size() << " bytes to: " << path;
}

codec::Value Store::read(const std::string& path) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Reading path: " << path;

  const std::string absolute_path = resolve_path(path);
  if (!exists(path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << absolute_path;
    throw NotFoundError(absolute_path);
  }

  const std::string bytes = read_file(absolute_path);

  const codec::Codec& codec = codec::codec_for(codec::select_format(path));
  BOOST_LOG_TRIVIAL(debug) << "Store: Using " << codec::format_to_string(codec.format()) 
                           << " format for: " << path;
  codec::Value value = codec.decode(bytes);

  BOOST_LOG_TRIVIAL(info) << "Store: Successfully read " << bytes.size() << " bytes from: " << path;
  return value;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool Store::exists(const std::string& path) const {
  const std::string absolute_path = resolve_path(path);

  // A failed attribute query counts as absent
  std::error_code ec;
  bool exists = std::filesystem::exists(absolute_path, ec) && !ec;

  BOOST_LOG_TRIVIAL(debug) << "Store: Path " << path << (exists ? " exists" : " not found") 
                           << " at: " << absolute_path;
  return exists;
}

std::vector<std::string> Store::list() const {
  BOOST_LOG_TRIVIAL(info) << "Store: Listing contents of: " << root_path_;
  std::vector<std::string> paths = enumerator_.enumerate();
  BOOST_LOG_TRIVIAL(info) << "Store: Listed " << paths.size() << " stored file(s)";
  return paths;
}


//==============================================
// FILE OPERATIONS
//==============================================

std::string Store::resolve_path(const std::string& path) const {
  return root_path_ + path;
}

void Store::write_file(const std::string& absolute_path, const std::string& bytes) const {
  std::ofstream file(absolute_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file for writing: " << absolute_path;
    throw IoError(absolute_path + ": Failed to open file for writing");
  }

  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write file: " << absolute_path;
    throw IoError(absolute_path + ": Failed to write file");
  }

  // Push the data out now, a read right after this must observe it
  file.flush();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to flush file: " << absolute_path;
    throw IoError(absolute_path + ": Failed to flush file");
  }

  file.close();
  if (file.fail()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to close file: " << absolute_path;
    throw IoError(absolute_path + ": Failed to close file");
  }
}

std::string Store::read_file(const std::string& absolute_path) const {
  std::error_code ec;
  if (std::filesystem::is_directory(absolute_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Path is a directory: " << absolute_path;
    throw IoError(absolute_path + ": Is a directory");
  }

  // Open file in binary mode so CBOR bytes come back untouched
  std::ifstream file(absolute_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file for reading: " << absolute_path;
    throw IoError(absolute_path + ": Failed to open file for reading");
  }

  std::string contents;
  char buffer[4096];

  // Read file in chunks until the end
  while (file.read(buffer, sizeof(buffer))) {
    contents.append(buffer, static_cast<std::size_t>(file.gcount()));
  }

  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    contents.append(buffer, static_cast<std::size_t>(file.gcount()));
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to read file: " << absolute_path;
    throw IoError(absolute_path + ": Failed to read file");
  }

  return contents;
}

} // namespace store
} // namespace savestore
