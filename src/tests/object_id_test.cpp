#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <set>
#include "bson/object_id.hpp"

using namespace gridfs::bson;

TEST(ObjectIdTest, GeneratedIdsAreUnique) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(seen.insert(ObjectId::generate().to_hex()).second);
  }
}

TEST(ObjectIdTest, TimestampIsCurrent) {
  auto now = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  uint32_t timestamp = ObjectId::generate().timestamp();
  EXPECT_LE(std::abs(static_cast<long long>(timestamp) - now), 5);
}

TEST(ObjectIdTest, HexRoundTrip) {
  const std::string hex = "5f1d7a2b9c0e4d3f2a1b0c9d";
  ObjectId oid = ObjectId::from_hex(hex);
  EXPECT_EQ(oid.to_hex(), hex);
  EXPECT_EQ(oid.timestamp(), 0x5f1d7a2bu);
  EXPECT_EQ(ObjectId::from_hex("5F1D7A2B9C0E4D3F2A1B0C9D"), oid);
}

TEST(ObjectIdTest, RejectsInvalidHex) {
  EXPECT_FALSE(ObjectId::is_valid_hex("abc"));
  EXPECT_FALSE(ObjectId::is_valid_hex("zz1d7a2b9c0e4d3f2a1b0c9d"));
  EXPECT_TRUE(ObjectId::is_valid_hex("5f1d7a2b9c0e4d3f2a1b0c9d"));
  EXPECT_THROW(ObjectId::from_hex("not-an-object-id"), std::invalid_argument);
}

TEST(ObjectIdTest, OrdersByBytes) {
  ObjectId earlier = ObjectId::from_hex("000000010000000000000000");
  ObjectId later = ObjectId::from_hex("000000020000000000000000");
  EXPECT_LT(earlier, later);
  EXPECT_NE(earlier, later);
}
