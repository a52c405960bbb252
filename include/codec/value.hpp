#ifndef SAVESTORE_CODEC_VALUE_HPP
#define SAVESTORE_CODEC_VALUE_HPP

#include <nlohmann/json.hpp>

namespace savestore {
namespace codec {

// Value tree stored under a path: null, booleans, numbers, strings, arrays,
// objects and binary blobs. Binary blobs and non-finite numbers only survive
// the opaque format
using Value = nlohmann::json;

} // namespace codec
} // namespace savestore

#endif // SAVESTORE_CODEC_VALUE_HPP
