#include "bson/object_id.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <boost/endian/conversion.hpp>

namespace gridfs {
namespace bson {

namespace {

// Random bytes chosen once per process
const std::array<uint8_t, 5>& process_unique() {
  static const std::array<uint8_t, 5> value = [] {
    std::array<uint8_t, 5> bytes{};
    crypto::random_bytes(bytes.data(), bytes.size());
    return bytes;
  }();
  return value;
}

std::atomic<uint32_t>& counter() {
  static std::atomic<uint32_t> value{[] {
    uint8_t seed[4];
    crypto::random_bytes(seed, sizeof(seed));
    return boost::endian::load_big_u32(seed) & 0x00FFFFFF;
  }()};
  return value;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

ObjectId ObjectId::generate() {
  std::array<uint8_t, SIZE> bytes{};

  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  boost::endian::store_big_u32(bytes.data(), static_cast<uint32_t>(seconds));

  const auto& unique = process_unique();
  std::copy(unique.begin(), unique.end(), bytes.begin() + 4);

  // Only the low 24 bits of the counter are used
  uint32_t count = counter().fetch_add(1) & 0x00FFFFFF;
  bytes[9] = static_cast<uint8_t>(count >> 16);
  bytes[10] = static_cast<uint8_t>(count >> 8);
  bytes[11] = static_cast<uint8_t>(count);

  return ObjectId(bytes);
}

bool ObjectId::is_valid_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    return false;
  }
  for (char c : hex) {
    if (hex_value(c) < 0) {
      return false;
    }
  }
  return true;
}

ObjectId ObjectId::from_hex(const std::string& hex) {
  if (!is_valid_hex(hex)) {
    throw std::invalid_argument("ObjectId: invalid hex string: " + hex);
  }
  std::array<uint8_t, SIZE> bytes{};
  for (std::size_t i = 0; i < SIZE; ++i) {
    bytes[i] = static_cast<uint8_t>((hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1]));
  }
  return ObjectId(bytes);
}

std::string ObjectId::to_hex() const {
  return crypto::Digest::to_hex(bytes_.data(), bytes_.size());
}

uint32_t ObjectId::timestamp() const {
  return boost::endian::load_big_u32(bytes_.data());
}

} // namespace bson
} // namespace gridfs
