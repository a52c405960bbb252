#ifndef SAVESTORE_CODEC_CODEC_HPP
#define SAVESTORE_CODEC_CODEC_HPP

#include <string>
#include "codec/format.hpp"
#include "codec/value.hpp"

namespace savestore {
namespace codec {

// Strategy turning a value tree into the bytes of a file and back.
// Failures are reported as store::EncodeError / store::DecodeError
class Codec {
public:
  virtual ~Codec() = default;

  virtual Format format() const = 0;
  // Serializes a value into the raw file contents
  virtual std::string encode(const Value& value) const = 0;
  // Parses raw file contents back into a value
  virtual Value decode(const std::string& bytes) const = 0;
};

// JSON text. Rejects binary blobs, non-finite numbers and invalid UTF-8
class StructuredCodec : public Codec {
public:
  // Indentation used when dumping, keeps files readable by hand
  static constexpr int INDENT = 2;

  Format format() const override { return Format::Structured; }
  std::string encode(const Value& value) const override;
  Value decode(const std::string& bytes) const override;

private:
  // Walks the tree and throws on the first node JSON cannot represent
  void check_representable(const Value& value, const std::string& location) const;
};

// CBOR, able to carry every kind of value including binary blobs
class OpaqueCodec : public Codec {
public:
  Format format() const override { return Format::Opaque; }
  std::string encode(const Value& value) const override;
  Value decode(const std::string& bytes) const override;
};

// Returns the shared strategy for a format
const Codec& codec_for(Format format);

} // namespace codec
} // namespace savestore

#endif // SAVESTORE_CODEC_CODEC_HPP
