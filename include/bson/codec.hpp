#ifndef GRIDFS_BSON_CODEC_HPP
#define GRIDFS_BSON_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <vector>
#include "bson/value.hpp"

namespace gridfs {
namespace bson {

class CodecError : public BsonError {
public:
  explicit CodecError(const std::string& message) : BsonError("Codec error: " + message) {}
};

// Little-endian binary document encoding:
//   document := int32 total_size, element*, 0x00
//   element  := type byte, cstring key, payload
class Codec {
public:
  // Upper bound accepted when decoding a single document
  static constexpr std::size_t MAX_DOCUMENT_SIZE = 48 * 1024 * 1024;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  static std::vector<uint8_t> encode(const Document& document);
  // Writes one encoded document to an output stream, returns bytes written
  static std::size_t write(const Document& document, std::ostream& output);

  static Document decode(const uint8_t* data, std::size_t size);
  static Document decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
  }
  // Reads exactly one encoded document from an input stream
  static Document read(std::istream& input);

private:
  // ---- ENCODING ----
  static void encode_document(const Document& document, std::vector<uint8_t>& out);
  static void encode_array(const Array& array, std::vector<uint8_t>& out);
  static void encode_element(const std::string& key, const Value& value, std::vector<uint8_t>& out);
  static void append_cstring(const std::string& text, std::vector<uint8_t>& out);
  static void append_int32(int32_t value, std::vector<uint8_t>& out);
  static void append_int64(int64_t value, std::vector<uint8_t>& out);
  // Overwrites a previously reserved 4-byte size prefix
  static void patch_int32(std::size_t offset, int32_t value, std::vector<uint8_t>& out);


  // ---- DECODING ----
  class Reader;
  static Document decode_document(Reader& reader);
  static Array decode_array(Reader& reader);
  static Value decode_value(Type type, Reader& reader);
};

} // namespace bson
} // namespace gridfs

#endif // GRIDFS_BSON_CODEC_HPP
