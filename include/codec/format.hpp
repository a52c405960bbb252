#ifndef SAVESTORE_CODEC_FORMAT_HPP
#define SAVESTORE_CODEC_FORMAT_HPP

#include <string>

namespace savestore {
namespace codec {

enum class Format {
  Structured,
  Opaque
};

const char* format_to_string(Format format);

// Suffix after the final '.' of the leaf, empty when the leaf has none
std::string leaf_extension(const std::string& path);

// Maps a path to the format its file is stored in. Registered structured
// extensions select Structured, everything else (no extension included)
// selects Opaque
Format select_format(const std::string& path);

} // namespace codec
} // namespace savestore

#endif // SAVESTORE_CODEC_FORMAT_HPP
