#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridfs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create new message digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  // Free message digest context
  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  // Access the underlying context
  EVP_MD_CTX* get() { return ctx; }
};

namespace {

const EVP_MD* select_md(Digest::Algorithm algorithm) {
  switch (algorithm) {
    case Digest::Algorithm::MD5:    return EVP_md5();
    case Digest::Algorithm::SHA256: return EVP_sha256();
  }
  throw DigestError("Unknown digest algorithm");
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(Algorithm algorithm)
  : algorithm_(algorithm)
  , context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), select_md(algorithm_), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
  BOOST_LOG_TRIVIAL(trace) << "Digest: Initialized "
                           << (algorithm_ == Algorithm::MD5 ? "MD5" : "SHA-256") << " context";
}

Digest::~Digest() = default;

Digest::Digest(Digest&&) noexcept = default;
Digest& Digest::operator=(Digest&&) noexcept = default;


//==============================================
// INCREMENTAL HASHING
//==============================================

void Digest::update(const void* data, std::size_t length) {
  if (finished_) {
    throw DigestError("Update after digest was finalized");
  }
  if (length == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, length)) {
    throw DigestError("Failed to update hash");
  }
  bytes_hashed_ += length;
}

std::vector<uint8_t> Digest::finish() {
  if (finished_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finished_ = true;

  BOOST_LOG_TRIVIAL(trace) << "Digest: Finalized digest over " << bytes_hashed_ << " bytes";
  return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string Digest::hex_digest() {
  auto raw = finish();
  return to_hex(raw.data(), raw.size());
}


//==============================================
// ONE-SHOT HELPERS
//==============================================

std::string Digest::hex(Algorithm algorithm, const void* data, std::size_t length) {
  Digest digest(algorithm);
  digest.update(data, length);
  return digest.hex_digest();
}

std::string Digest::to_hex(const uint8_t* data, std::size_t length) {
  std::stringstream ss;
  for (std::size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

void random_bytes(uint8_t* buffer, std::size_t length) {
  if (RAND_bytes(buffer, static_cast<int>(length)) != 1) {
    throw RandomError("Failed to generate random bytes");
  }
}

} // namespace gridfs::crypto
