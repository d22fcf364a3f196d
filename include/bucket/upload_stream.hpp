#ifndef GRIDFS_BUCKET_UPLOAD_STREAM_HPP
#define GRIDFS_BUCKET_UPLOAD_STREAM_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>
#include "bson/value.hpp"
#include "bucket/file_document.hpp"
#include "bucket/gridfs_error.hpp"
#include "config/config.hpp"
#include "crypto/digest.hpp"
#include "store/document_store.hpp"

namespace gridfs::bucket {

// Collection names a stream writes to or reads from
struct BucketCollections {
  std::string files;
  std::string chunks;
};

// Push-style writer that slices bytes into chunk documents and publishes the
// file document on close. One stream instance must be driven by one owner at
// a time; separate streams for distinct ids may run concurrently.
class UploadStream {
public:

  enum class State {
    Open,
    Closed,
    Aborted
  };

  // Approximate encoded size of a chunk document beyond its data bytes
  static constexpr std::size_t CHUNK_DOCUMENT_OVERHEAD = 64;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UploadStream(store::DocumentStore& store, BucketCollections collections, bson::Value id,
               std::string filename, int32_t chunk_size, config::FileExtras extras = {},
               std::size_t max_batch_bytes = config::DEFAULT_MAX_BATCH_BYTES);
  // Closes an open stream; errors are logged, never thrown
  ~UploadStream();

  UploadStream(const UploadStream&) = delete;
  UploadStream& operator=(const UploadStream&) = delete;


  // ---- WRITE OPERATIONS ----
  void write(const void* data, std::size_t size);
  // Writes length bytes of buffer starting at offset; length is clamped to the buffer
  void write(const std::string& buffer, int64_t length, int64_t offset = 0);

  // Writes each argument in order
  template <typename... Parts>
  void print(const Parts&... parts) {
    (write_part(parts), ...);
  }

  // Writes printf-style formatted text
  template <typename... Args>
  void printf(const char* format, Args... args) {
    int size = std::snprintf(nullptr, 0, format, args...);
    if (size < 0) {
      throw UsageError("invalid format string passed to printf");
    }
    std::vector<char> text(static_cast<std::size_t>(size) + 1);
    std::snprintf(text.data(), text.size(), format, args...);
    write(text.data(), static_cast<std::size_t>(size));
  }


  // ---- LIFECYCLE ----
  // Flushes remaining bytes and inserts the file document
  void close();
  // Deletes every chunk written for this id without publishing a file document
  void abort();


  // ---- GETTERS ----
  const bson::Value& id() const { return id_; }
  const std::string& filename() const { return filename_; }
  int32_t chunk_size() const { return chunk_size_; }
  int64_t length() const { return length_; }
  State state() const { return state_; }
  bool closed() const { return state_ != State::Open; }
  bool aborted() const { return state_ == State::Aborted; }
  // Buffered bytes that trigger a batch flush
  std::size_t flush_threshold() const { return flush_threshold_; }
  // File document published by a successful close
  const FileDocument& file() const;

private:
  // ---- PARAMETERS ----
  store::DocumentStore& store_;
  BucketCollections collections_;
  bson::Value id_;
  std::string filename_;
  int32_t chunk_size_;
  config::FileExtras extras_;
  std::size_t flush_threshold_;

  State state_ = State::Open;
  std::string buffer_;
  int64_t length_ = 0;
  int64_t next_chunk_n_ = 0;
  crypto::Digest md5_{crypto::Digest::Algorithm::MD5};
  FileDocument file_;
  // Digest is finalized once even if the file insert has to be retried
  std::string hex_digest_;
  bool digest_finished_ = false;


  // ---- WRITE SUPPORT ----
  void write_part(const std::string& text) { write(text.data(), text.size()); }
  void write_part(const char* text) { write(text, std::char_traits<char>::length(text)); }
  void write_part(char c) { write(&c, 1); }
  template <typename T>
  void write_part(const T& value) { write_part(std::to_string(value)); }

  // Persists full chunks; with all set, the short remainder is written too
  void flush_chunks(bool all);
  void ensure_writable(const char* operation) const;
};

} // namespace gridfs::bucket

#endif // GRIDFS_BUCKET_UPLOAD_STREAM_HPP
