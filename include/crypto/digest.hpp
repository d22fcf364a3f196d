#ifndef GRIDFS_CRYPTO_DIGEST_HPP
#define GRIDFS_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace gridfs::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

class Digest {
public:

  enum class Algorithm {
    MD5,
    SHA256
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(Algorithm algorithm = Algorithm::MD5);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;
  Digest(Digest&&) noexcept;
  Digest& operator=(Digest&&) noexcept;


  // ---- INCREMENTAL HASHING ----
  // Feeds bytes into the running digest
  void update(const void* data, std::size_t length);
  void update(const std::string& data) { update(data.data(), data.size()); }
  // Finalizes the digest and returns raw bytes. Only valid once.
  std::vector<uint8_t> finish();
  // Finalizes the digest and returns lower-case hex
  std::string hex_digest();


  // ---- ONE-SHOT HELPERS ----
  static std::string hex(Algorithm algorithm, const void* data, std::size_t length);
  static std::string hex(Algorithm algorithm, const std::string& data) {
    return hex(algorithm, data.data(), data.size());
  }
  static std::string to_hex(const uint8_t* data, std::size_t length);


  // ---- GETTERS ----
  Algorithm algorithm() const { return algorithm_; }
  bool finished() const { return finished_; }
  std::uint64_t bytes_hashed() const { return bytes_hashed_; }

private:
  // ---- PARAMETERS ----
  Algorithm algorithm_;
  std::unique_ptr<DigestContext> context_;
  bool finished_ = false;
  std::uint64_t bytes_hashed_ = 0;
};

// Fills the buffer with cryptographically strong random bytes
void random_bytes(uint8_t* buffer, std::size_t length);

} // namespace gridfs::crypto

#endif // GRIDFS_CRYPTO_DIGEST_HPP
