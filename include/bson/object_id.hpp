#ifndef GRIDFS_BSON_OBJECT_ID_HPP
#define GRIDFS_BSON_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace gridfs {
namespace bson {

// 12-byte document identifier: 4-byte big-endian seconds since the epoch,
// 5 random bytes fixed per process, 3-byte big-endian counter.
class ObjectId {
public:
  static constexpr std::size_t SIZE = 12;

  // ---- CONSTRUCTION ----
  ObjectId() = default;
  explicit ObjectId(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}
  // Generates a fresh id
  static ObjectId generate();
  // Parses a 24 character hex string, throws std::invalid_argument on bad input
  static ObjectId from_hex(const std::string& hex);
  static bool is_valid_hex(const std::string& hex);


  // ---- ACCESSORS ----
  std::string to_hex() const;
  uint32_t timestamp() const;
  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }


  // ---- COMPARISON ----
  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }

private:
  std::array<uint8_t, SIZE> bytes_{};
};

inline std::ostream& operator<<(std::ostream& os, const ObjectId& oid) {
  return os << oid.to_hex();
}

} // namespace bson
} // namespace gridfs

#endif // GRIDFS_BSON_OBJECT_ID_HPP
