#include "codec/format.hpp"
#include "store/path_splitter.hpp"
#include <unordered_map>

namespace savestore {
namespace codec {

namespace {

// Extensions stored as human-readable text. Matching is case-sensitive
const std::unordered_map<std::string, Format>& structured_extensions() {
  static const std::unordered_map<std::string, Format> extensions = {
    {"json", Format::Structured}
  };
  return extensions;
}

} // namespace

const char* format_to_string(Format format) {
  switch (format) {
    case Format::Structured: return "structured";
    case Format::Opaque:     return "opaque";
    default:                 return "unknown";
  }
}

std::string leaf_extension(const std::string& path) {
  const std::string leaf = store::split_path(path).leaf;
  const auto dot = leaf.rfind('.');
  if (dot == std::string::npos) {
    return "";
  }
  return leaf.substr(dot + 1);
}

Format select_format(const std::string& path) {
  const auto& extensions = structured_extensions();
  auto it = extensions.find(leaf_extension(path));
  if (it != extensions.end()) {
    return it->second;
  }
  return Format::Opaque;
}

} // namespace codec
} // namespace savestore
