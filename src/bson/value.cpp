#include "bson/value.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace gridfs {
namespace bson {

const char* type_name(Type type) {
  switch (type) {
    case Type::Double:   return "double";
    case Type::String:   return "string";
    case Type::Document: return "document";
    case Type::Array:    return "array";
    case Type::Binary:   return "binary";
    case Type::ObjectId: return "objectId";
    case Type::Boolean:  return "bool";
    case Type::DateTime: return "date";
    case Type::Null:     return "null";
    case Type::Int32:    return "int";
    case Type::Int64:    return "long";
    default:             return "unknown";
  }
}

DateTime DateTime::now() {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return DateTime{static_cast<int64_t>(millis)};
}


//==============================================
// DOCUMENT
//==============================================

Document::Document() = default;

Document::Document(std::initializer_list<Element> elements) : elements_(elements) {}

Document& Document::append(const std::string& key, Value value) {
  elements_.push_back(Element{key, std::move(value)});
  return *this;
}

Document& Document::set(const std::string& key, Value value) {
  for (auto& element : elements_) {
    if (element.key == key) {
      element.value = std::move(value);
      return *this;
    }
  }
  return append(key, std::move(value));
}

bool Document::erase(const std::string& key) {
  auto it = std::find_if(elements_.begin(), elements_.end(),
                         [&key](const Element& e) { return e.key == key; });
  if (it == elements_.end()) {
    return false;
  }
  elements_.erase(it);
  return true;
}

bool Document::has(const std::string& key) const {
  return find(key) != nullptr;
}

const Value* Document::find(const std::string& key) const {
  for (const auto& element : elements_) {
    if (element.key == key) {
      return &element.value;
    }
  }
  return nullptr;
}

const Value& Document::get(const std::string& key) const {
  const Value* value = find(key);
  if (!value) {
    throw FieldError("missing field '" + key + "'");
  }
  return *value;
}

const std::string& Document::get_string(const std::string& key) const {
  const Value& value = get(key);
  if (!value.is<std::string>()) {
    throw TypeError("field '" + key + "' is " + type_name(value.type()) + ", expected string");
  }
  return value.as<std::string>();
}

const Document& Document::get_document(const std::string& key) const {
  const Value& value = get(key);
  if (!value.is<Document>()) {
    throw TypeError("field '" + key + "' is " + type_name(value.type()) + ", expected document");
  }
  return value.as<Document>();
}

const Binary& Document::get_binary(const std::string& key) const {
  const Value& value = get(key);
  if (!value.is<Binary>()) {
    throw TypeError("field '" + key + "' is " + type_name(value.type()) + ", expected binary");
  }
  return value.as<Binary>();
}

int64_t Document::get_integer(const std::string& key) const {
  const Value& value = get(key);
  if (!value.is_number()) {
    throw TypeError("field '" + key + "' is " + type_name(value.type()) + ", expected a number");
  }
  return value.as_int64();
}

std::size_t Document::size() const { return elements_.size(); }
bool Document::empty() const { return elements_.empty(); }
Document::const_iterator Document::begin() const { return elements_.begin(); }
Document::const_iterator Document::end() const { return elements_.end(); }

bool Document::operator==(const Document& other) const {
  return elements_ == other.elements_;
}


//==============================================
// VALUE
//==============================================

Value::Value() = default;
Value::Value(std::nullptr_t) {}
Value::Value(bool value) : storage_(std::in_place_type<bool>, value) {}
Value::Value(int32_t value) : storage_(std::in_place_type<int32_t>, value) {}
Value::Value(int64_t value) : storage_(std::in_place_type<int64_t>, value) {}
Value::Value(double value) : storage_(std::in_place_type<double>, value) {}
Value::Value(const char* value) : storage_(std::in_place_type<std::string>, value) {}
Value::Value(std::string value) : storage_(std::in_place_type<std::string>, std::move(value)) {}
Value::Value(Binary value) : storage_(std::in_place_type<Binary>, std::move(value)) {}
Value::Value(ObjectId value) : storage_(std::in_place_type<ObjectId>, value) {}
Value::Value(DateTime value) : storage_(std::in_place_type<DateTime>, value) {}
Value::Value(Document value) : storage_(std::in_place_type<Document>, std::move(value)) {}
Value::Value(Array value) : storage_(std::in_place_type<Array>, std::move(value)) {}

Type Value::type() const {
  switch (storage_.index()) {
    case 0:  return Type::Null;
    case 1:  return Type::Boolean;
    case 2:  return Type::Int32;
    case 3:  return Type::Int64;
    case 4:  return Type::Double;
    case 5:  return Type::String;
    case 6:  return Type::Binary;
    case 7:  return Type::ObjectId;
    case 8:  return Type::DateTime;
    case 9:  return Type::Document;
    default: return Type::Array;
  }
}

bool Value::is_number() const {
  return is<int32_t>() || is<int64_t>() || is<double>();
}

int64_t Value::as_int64() const {
  if (is<int32_t>()) return as<int32_t>();
  if (is<int64_t>()) return as<int64_t>();
  if (is<double>()) {
    double d = as<double>();
    if (std::trunc(d) != d) {
      throw TypeError("double value is not integral");
    }
    return static_cast<int64_t>(d);
  }
  throw TypeError(std::string("expected a number, value holds ") + type_name(type()));
}

double Value::as_double() const {
  if (is<int32_t>()) return as<int32_t>();
  if (is<int64_t>()) return static_cast<double>(as<int64_t>());
  if (is<double>()) return as<double>();
  throw TypeError(std::string("expected a number, value holds ") + type_name(type()));
}

std::string Value::to_string() const {
  std::ostringstream ss;
  switch (type()) {
    case Type::Null:     ss << "null"; break;
    case Type::Boolean:  ss << (as<bool>() ? "true" : "false"); break;
    case Type::Int32:    ss << as<int32_t>(); break;
    case Type::Int64:    ss << as<int64_t>(); break;
    case Type::Double:   ss << as<double>(); break;
    case Type::String:   ss << as<std::string>(); break;
    case Type::ObjectId: ss << as<ObjectId>().to_hex(); break;
    case Type::DateTime: ss << "Date(" << as<DateTime>().millis << ")"; break;
    case Type::Binary:   ss << "Binary(" << as<Binary>().data.size() << " bytes)"; break;
    case Type::Document: {
      ss << "{";
      bool first = true;
      for (const auto& element : as<Document>()) {
        ss << (first ? " " : ", ") << element.key << ": " << element.value.to_string();
        first = false;
      }
      ss << " }";
      break;
    }
    case Type::Array: {
      ss << "[";
      bool first = true;
      for (const auto& item : as<Array>()) {
        ss << (first ? " " : ", ") << item.to_string();
        first = false;
      }
      ss << " ]";
      break;
    }
  }
  return ss.str();
}

bool Value::operator==(const Value& other) const {
  return storage_ == other.storage_;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  return os << value.to_string();
}


//==============================================
// ORDERING
//==============================================

namespace {

int type_rank(Type type) {
  switch (type) {
    case Type::Null:     return 0;
    case Type::Int32:
    case Type::Int64:
    case Type::Double:   return 1;
    case Type::String:   return 2;
    case Type::Document: return 3;
    case Type::Array:    return 4;
    case Type::Binary:   return 5;
    case Type::ObjectId: return 6;
    case Type::Boolean:  return 7;
    case Type::DateTime: return 8;
    default:             return 9;
  }
}

template <typename T>
int three_way(const T& lhs, const T& rhs) {
  if (lhs < rhs) return -1;
  if (rhs < lhs) return 1;
  return 0;
}

} // namespace

int compare(const Value& lhs, const Value& rhs) {
  int lrank = type_rank(lhs.type());
  int rrank = type_rank(rhs.type());
  if (lrank != rrank) {
    return three_way(lrank, rrank);
  }

  switch (lhs.type()) {
    case Type::Null:
      return 0;
    case Type::Int32:
    case Type::Int64:
    case Type::Double:
      if (!lhs.is<double>() && !rhs.is<double>()) {
        return three_way(lhs.as_int64(), rhs.as_int64());
      }
      return three_way(lhs.as_double(), rhs.as_double());
    case Type::String:
      return three_way(lhs.as<std::string>(), rhs.as<std::string>());
    case Type::Binary:
      return three_way(lhs.as<Binary>().data, rhs.as<Binary>().data);
    case Type::ObjectId:
      return three_way(lhs.as<ObjectId>(), rhs.as<ObjectId>());
    case Type::Boolean:
      return three_way(lhs.as<bool>(), rhs.as<bool>());
    case Type::DateTime:
      return three_way(lhs.as<DateTime>().millis, rhs.as<DateTime>().millis);
    case Type::Document: {
      const auto& l = lhs.as<Document>().elements();
      const auto& r = rhs.as<Document>().elements();
      for (std::size_t i = 0; i < l.size() && i < r.size(); ++i) {
        if (int c = three_way(l[i].key, r[i].key)) return c;
        if (int c = compare(l[i].value, r[i].value)) return c;
      }
      return three_way(l.size(), r.size());
    }
    case Type::Array: {
      const auto& l = lhs.as<Array>();
      const auto& r = rhs.as<Array>();
      for (std::size_t i = 0; i < l.size() && i < r.size(); ++i) {
        if (int c = compare(l[i], r[i])) return c;
      }
      return three_way(l.size(), r.size());
    }
  }
  return 0;
}

} // namespace bson
} // namespace gridfs
