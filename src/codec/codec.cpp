#include "codec/codec.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <cmath>
#include <cstdint>
#include <vector>

namespace savestore {
namespace codec {

namespace {

// RFC 6901 reference token: '~' becomes "~0" and '/' becomes "~1"
std::string escape_pointer_token(const std::string& key) {
  std::string token;
  token.reserve(key.size());
  for (char c : key) {
    if (c == '~') {
      token += "~0";
    } else if (c == '/') {
      token += "~1";
    } else {
      token += c;
    }
  }
  return token;
}

} // namespace

//==============================================
// STRUCTURED CODEC
//==============================================

std::string StructuredCodec::encode(const Value& value) const {
  check_representable(value, "");

  try {
    std::string text = value.dump(INDENT);
    BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded " << text.size() << " bytes of JSON text";
    return text;
  } catch (const nlohmann::json::type_error& e) {
    // dump() refuses strings that are not valid UTF-8
    BOOST_LOG_TRIVIAL(error) << "Codec: JSON encoding failed: " << e.what();
    throw store::EncodeError(e.what());
  }
}

Value StructuredCodec::decode(const std::string& bytes) const {
  try {
    Value value = Value::parse(bytes);
    BOOST_LOG_TRIVIAL(debug) << "Codec: Decoded " << bytes.size() << " bytes of JSON text";
    return value;
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: JSON decoding failed: " << e.what();
    throw store::DecodeError(e.what());
  }
}

void StructuredCodec::check_representable(const Value& value, const std::string& location) const {
  const std::string where = location.empty() ? "/" : location;

  if (value.is_binary()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Binary value at " << where << " has no JSON representation";
    throw store::EncodeError("binary value at " + where + " has no JSON representation");
  }

  if (value.is_number_float() && !std::isfinite(value.get<double>())) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Non-finite number at " << where << " has no JSON representation";
    throw store::EncodeError("non-finite number at " + where + " has no JSON representation");
  }

  if (value.is_array()) {
    for (std::size_t i = 0; i < value.size(); ++i) {
      check_representable(value[i], location + "/" + std::to_string(i));
    }
  } else if (value.is_object()) {
    for (auto it = value.begin(); it != value.end(); ++it) {
      check_representable(it.value(), location + "/" + escape_pointer_token(it.key()));
    }
  }
}


//==============================================
// OPAQUE CODEC
//==============================================

std::string OpaqueCodec::encode(const Value& value) const {
  try {
    std::vector<std::uint8_t> cbor = Value::to_cbor(value);
    BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded " << cbor.size() << " bytes of CBOR";
    return std::string(cbor.begin(), cbor.end());
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: CBOR encoding failed: " << e.what();
    throw store::EncodeError(e.what());
  }
}

Value OpaqueCodec::decode(const std::string& bytes) const {
  try {
    Value value = Value::from_cbor(bytes);
    BOOST_LOG_TRIVIAL(debug) << "Codec: Decoded " << bytes.size() << " bytes of CBOR";
    return value;
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Codec: CBOR decoding failed: " << e.what();
    throw store::DecodeError(e.what());
  }
}


//==============================================
// STRATEGY LOOKUP
//==============================================

const Codec& codec_for(Format format) {
  static const StructuredCodec structured;
  static const OpaqueCodec opaque;

  switch (format) {
    case Format::Structured: return structured;
    case Format::Opaque:     return opaque;
  }
  return opaque;
}

} // namespace codec
} // namespace savestore
