#ifndef GRIDFS_BSON_VALUE_HPP
#define GRIDFS_BSON_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "bson/object_id.hpp"

namespace gridfs {
namespace bson {

class BsonError : public std::runtime_error {
public:
  explicit BsonError(const std::string& message) : std::runtime_error(message) {}
};

class TypeError : public BsonError {
public:
  explicit TypeError(const std::string& message) : BsonError("Type error: " + message) {}
};

class FieldError : public BsonError {
public:
  explicit FieldError(const std::string& message) : BsonError("Field error: " + message) {}
};

// Element type tags as they appear on the wire
enum class Type : uint8_t {
  Double = 0x01,
  String = 0x02,
  Document = 0x03,
  Array = 0x04,
  Binary = 0x05,
  ObjectId = 0x07,
  Boolean = 0x08,
  DateTime = 0x09,
  Null = 0x0A,
  Int32 = 0x10,
  Int64 = 0x12
};

const char* type_name(Type type);

struct Binary {
  uint8_t subtype = 0;
  std::vector<uint8_t> data;

  Binary() = default;
  explicit Binary(std::vector<uint8_t> bytes, uint8_t sub = 0) : subtype(sub), data(std::move(bytes)) {}
  Binary(const char* bytes, std::size_t length) : data(bytes, bytes + length) {}

  bool operator==(const Binary& other) const {
    return subtype == other.subtype && data == other.data;
  }
  bool operator!=(const Binary& other) const { return !(*this == other); }
};

// UTC datetime in milliseconds since the epoch
struct DateTime {
  int64_t millis = 0;

  static DateTime now();

  bool operator==(const DateTime& other) const { return millis == other.millis; }
  bool operator!=(const DateTime& other) const { return millis != other.millis; }
};

class Value;
struct Element;

class Document {
public:
  using const_iterator = std::vector<Element>::const_iterator;

  // ---- CONSTRUCTION ----
  Document();
  Document(std::initializer_list<Element> elements);


  // ---- MODIFIERS ----
  // Appends without checking for an existing key
  Document& append(const std::string& key, Value value);
  // Replaces the value of an existing key or appends it
  Document& set(const std::string& key, Value value);
  bool erase(const std::string& key);


  // ---- LOOKUP ----
  bool has(const std::string& key) const;
  // Returns nullptr when the key is absent
  const Value* find(const std::string& key) const;
  // Throws FieldError when the key is absent
  const Value& get(const std::string& key) const;

  const std::string& get_string(const std::string& key) const;
  const Document& get_document(const std::string& key) const;
  const Binary& get_binary(const std::string& key) const;
  // Accepts int32, int64 and integral doubles
  int64_t get_integer(const std::string& key) const;


  // ---- ITERATION ----
  std::size_t size() const;
  bool empty() const;
  const_iterator begin() const;
  const_iterator end() const;
  const std::vector<Element>& elements() const { return elements_; }

  bool operator==(const Document& other) const;
  bool operator!=(const Document& other) const { return !(*this == other); }

private:
  std::vector<Element> elements_;
};

using Array = std::vector<Value>;

class Value {
public:
  using Storage = std::variant<std::monostate, bool, int32_t, int64_t, double,
                               std::string, Binary, ObjectId, DateTime, Document, Array>;

  // ---- CONSTRUCTION ----
  Value();
  Value(std::nullptr_t);
  Value(bool value);
  Value(int32_t value);
  Value(int64_t value);
  Value(double value);
  Value(const char* value);
  Value(std::string value);
  Value(Binary value);
  Value(ObjectId value);
  Value(DateTime value);
  Value(Document value);
  Value(Array value);


  // ---- TYPE QUERIES ----
  Type type() const;
  bool is_null() const { return std::holds_alternative<std::monostate>(storage_); }
  bool is_number() const;

  template <typename T>
  bool is() const { return std::holds_alternative<T>(storage_); }

  // Throws TypeError when the held type differs
  template <typename T>
  const T& as() const {
    if (const T* held = std::get_if<T>(&storage_)) {
      return *held;
    }
    throw TypeError(std::string("expected a different type, value holds ") + type_name(type()));
  }

  // Numeric conversions across int32, int64 and double
  int64_t as_int64() const;
  double as_double() const;

  // Short human readable rendering used in logs and error messages
  std::string to_string() const;

  const Storage& storage() const { return storage_; }

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

private:
  Storage storage_;
};

struct Element {
  std::string key;
  Value value;

  bool operator==(const Element& other) const {
    return key == other.key && value == other.value;
  }
};

// Total order used when sorting query results: numbers compare by value,
// other types by a fixed type rank, then by content.
int compare(const Value& lhs, const Value& rhs);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace bson
} // namespace gridfs

#endif // GRIDFS_BSON_VALUE_HPP
