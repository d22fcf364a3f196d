#include "bson/codec.hpp"
#include <cstring>
#include <limits>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace gridfs {
namespace bson {

//==============================================
// BOUNDS CHECKED READER
//==============================================

class Codec::Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  std::size_t position() const { return pos_; }
  std::size_t remaining() const { return size_ - pos_; }

  const uint8_t* take(std::size_t count) {
    if (count > remaining()) {
      BOOST_LOG_TRIVIAL(error) << "Codec: Truncated input, wanted " << count
                               << " bytes but " << remaining() << " remain";
      throw CodecError("truncated input");
    }
    const uint8_t* start = data_ + pos_;
    pos_ += count;
    return start;
  }

  uint8_t read_byte() { return *take(1); }

  int32_t read_int32() {
    return boost::endian::load_little_s32(take(sizeof(int32_t)));
  }

  int64_t read_int64() {
    return boost::endian::load_little_s64(take(sizeof(int64_t)));
  }

  double read_double() {
    uint64_t bits = boost::endian::load_little_u64(take(sizeof(uint64_t)));
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }

  std::string read_cstring() {
    const uint8_t* start = data_ + pos_;
    const void* nul = std::memchr(start, 0, remaining());
    if (!nul) {
      throw CodecError("unterminated key");
    }
    std::size_t length = static_cast<const uint8_t*>(nul) - start;
    take(length + 1);
    return std::string(reinterpret_cast<const char*>(start), length);
  }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};


//==============================================
// SERIALIZATION
//==============================================

std::vector<uint8_t> Codec::encode(const Document& document) {
  std::vector<uint8_t> out;
  encode_document(document, out);
  return out;
}

std::size_t Codec::write(const Document& document, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("invalid output stream");
  }
  auto bytes = encode(document);
  if (!output.write(reinterpret_cast<const char*>(bytes.data()), bytes.size())) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << bytes.size() << " bytes to output stream";
    throw CodecError("failed to write to output stream");
  }
  return bytes.size();
}

void Codec::encode_document(const Document& document, std::vector<uint8_t>& out) {
  std::size_t start = out.size();
  append_int32(0, out);
  for (const auto& element : document) {
    encode_element(element.key, element.value, out);
  }
  out.push_back(0);
  std::size_t length = out.size() - start;
  if (length > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
    throw CodecError("document too large to encode");
  }
  patch_int32(start, static_cast<int32_t>(length), out);
}

void Codec::encode_array(const Array& array, std::vector<uint8_t>& out) {
  std::size_t start = out.size();
  append_int32(0, out);
  for (std::size_t i = 0; i < array.size(); ++i) {
    encode_element(std::to_string(i), array[i], out);
  }
  out.push_back(0);
  patch_int32(start, static_cast<int32_t>(out.size() - start), out);
}

void Codec::encode_element(const std::string& key, const Value& value, std::vector<uint8_t>& out) {
  if (key.find('\0') != std::string::npos) {
    throw CodecError("key contains a NUL byte: " + key);
  }
  out.push_back(static_cast<uint8_t>(value.type()));
  append_cstring(key, out);

  switch (value.type()) {
    case Type::Null:
      break;
    case Type::Boolean:
      out.push_back(value.as<bool>() ? 1 : 0);
      break;
    case Type::Int32:
      append_int32(value.as<int32_t>(), out);
      break;
    case Type::Int64:
      append_int64(value.as<int64_t>(), out);
      break;
    case Type::DateTime:
      append_int64(value.as<DateTime>().millis, out);
      break;
    case Type::Double: {
      double d = value.as<double>();
      int64_t bits;
      std::memcpy(&bits, &d, sizeof(bits));
      append_int64(bits, out);
      break;
    }
    case Type::String: {
      const auto& text = value.as<std::string>();
      append_int32(static_cast<int32_t>(text.size() + 1), out);
      out.insert(out.end(), text.begin(), text.end());
      out.push_back(0);
      break;
    }
    case Type::Binary: {
      const auto& binary = value.as<Binary>();
      append_int32(static_cast<int32_t>(binary.data.size()), out);
      out.push_back(binary.subtype);
      out.insert(out.end(), binary.data.begin(), binary.data.end());
      break;
    }
    case Type::ObjectId: {
      const auto& bytes = value.as<ObjectId>().bytes();
      out.insert(out.end(), bytes.begin(), bytes.end());
      break;
    }
    case Type::Document:
      encode_document(value.as<Document>(), out);
      break;
    case Type::Array:
      encode_array(value.as<Array>(), out);
      break;
  }
}

void Codec::append_cstring(const std::string& text, std::vector<uint8_t>& out) {
  out.insert(out.end(), text.begin(), text.end());
  out.push_back(0);
}

void Codec::append_int32(int32_t value, std::vector<uint8_t>& out) {
  uint8_t buffer[sizeof(int32_t)];
  boost::endian::store_little_s32(buffer, value);
  out.insert(out.end(), buffer, buffer + sizeof(buffer));
}

void Codec::append_int64(int64_t value, std::vector<uint8_t>& out) {
  uint8_t buffer[sizeof(int64_t)];
  boost::endian::store_little_s64(buffer, value);
  out.insert(out.end(), buffer, buffer + sizeof(buffer));
}

void Codec::patch_int32(std::size_t offset, int32_t value, std::vector<uint8_t>& out) {
  boost::endian::store_little_s32(out.data() + offset, value);
}


//==============================================
// DESERIALIZATION
//==============================================

Document Codec::decode(const uint8_t* data, std::size_t size) {
  Reader reader(data, size);
  Document document = decode_document(reader);
  if (reader.remaining() != 0) {
    BOOST_LOG_TRIVIAL(error) << "Codec: " << reader.remaining() << " trailing bytes after document";
    throw CodecError("trailing bytes after document");
  }
  return document;
}

Document Codec::read(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("invalid input stream");
  }

  uint8_t prefix[sizeof(int32_t)];
  if (!input.read(reinterpret_cast<char*>(prefix), sizeof(prefix))) {
    throw CodecError("failed to read document length");
  }
  int32_t length = boost::endian::load_little_s32(prefix);
  if (length < 5 || static_cast<std::size_t>(length) > MAX_DOCUMENT_SIZE) {
    throw CodecError("invalid document length " + std::to_string(length));
  }

  std::vector<uint8_t> bytes(static_cast<std::size_t>(length));
  std::memcpy(bytes.data(), prefix, sizeof(prefix));
  if (!input.read(reinterpret_cast<char*>(bytes.data() + sizeof(prefix)), length - sizeof(prefix))) {
    throw CodecError("failed to read document body");
  }
  return decode(bytes);
}

Document Codec::decode_document(Reader& reader) {
  std::size_t start = reader.position();
  int32_t length = reader.read_int32();
  if (length < 5 || static_cast<std::size_t>(length) - sizeof(int32_t) > reader.remaining()) {
    throw CodecError("invalid document length " + std::to_string(length));
  }
  std::size_t end = start + static_cast<std::size_t>(length);

  Document document;
  while (reader.position() < end - 1) {
    auto type = static_cast<Type>(reader.read_byte());
    std::string key = reader.read_cstring();
    document.append(key, decode_value(type, reader));
  }

  if (reader.position() != end - 1 || reader.read_byte() != 0) {
    throw CodecError("document length does not match its contents");
  }
  return document;
}

Array Codec::decode_array(Reader& reader) {
  Document as_document = decode_document(reader);
  Array array;
  array.reserve(as_document.size());
  for (const auto& element : as_document) {
    array.push_back(element.value);
  }
  return array;
}

Value Codec::decode_value(Type type, Reader& reader) {
  switch (type) {
    case Type::Null:
      return Value();
    case Type::Boolean: {
      uint8_t flag = reader.read_byte();
      if (flag > 1) {
        throw CodecError("invalid boolean byte");
      }
      return Value(flag == 1);
    }
    case Type::Int32:
      return Value(reader.read_int32());
    case Type::Int64:
      return Value(reader.read_int64());
    case Type::DateTime:
      return Value(DateTime{reader.read_int64()});
    case Type::Double:
      return Value(reader.read_double());
    case Type::String: {
      int32_t length = reader.read_int32();
      if (length < 1) {
        throw CodecError("invalid string length");
      }
      const uint8_t* bytes = reader.take(static_cast<std::size_t>(length));
      if (bytes[length - 1] != 0) {
        throw CodecError("string is not NUL terminated");
      }
      return Value(std::string(reinterpret_cast<const char*>(bytes), length - 1));
    }
    case Type::Binary: {
      int32_t length = reader.read_int32();
      if (length < 0) {
        throw CodecError("invalid binary length");
      }
      uint8_t subtype = reader.read_byte();
      const uint8_t* bytes = reader.take(static_cast<std::size_t>(length));
      return Value(Binary(std::vector<uint8_t>(bytes, bytes + length), subtype));
    }
    case Type::ObjectId: {
      std::array<uint8_t, ObjectId::SIZE> bytes{};
      std::memcpy(bytes.data(), reader.take(bytes.size()), bytes.size());
      return Value(ObjectId(bytes));
    }
    case Type::Document:
      return Value(decode_document(reader));
    case Type::Array:
      return Value(decode_array(reader));
  }
  BOOST_LOG_TRIVIAL(error) << "Codec: Unsupported element type 0x" << std::hex
                           << static_cast<int>(type);
  throw CodecError("unsupported element type");
}

} // namespace bson
} // namespace gridfs
