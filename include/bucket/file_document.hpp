#ifndef GRIDFS_BUCKET_FILE_DOCUMENT_HPP
#define GRIDFS_BUCKET_FILE_DOCUMENT_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "bson/value.hpp"
#include "config/config.hpp"

namespace gridfs::bucket {

// Field names of the persisted files and chunks documents
namespace field {
constexpr const char* ID = "_id";
constexpr const char* LENGTH = "length";
constexpr const char* CHUNK_SIZE = "chunkSize";
constexpr const char* UPLOAD_DATE = "uploadDate";
constexpr const char* MD5 = "md5";
constexpr const char* FILENAME = "filename";
constexpr const char* CONTENT_TYPE = "contentType";
constexpr const char* METADATA = "metadata";
constexpr const char* ALIASES = "aliases";
constexpr const char* FILES_ID = "files_id";
constexpr const char* N = "n";
constexpr const char* DATA = "data";
} // namespace field

// Number of chunks a file of the given length is split into
int64_t chunk_count(int64_t length, int32_t chunk_size);
// Byte size chunk n must have; throws std::out_of_range past the last chunk
std::size_t expected_chunk_size(int64_t length, int32_t chunk_size, int64_t n);

// Metadata document that makes a stored file visible
struct FileDocument {
  bson::Value id;
  int64_t length = 0;
  int32_t chunk_size = 0;
  bson::DateTime upload_date;
  std::string md5;
  std::string filename;
  config::FileExtras extras;

  bson::Document to_document() const;
  // Throws GridFSError when a required field is missing or mistyped
  static FileDocument from_document(const bson::Document& document);

  int64_t chunk_count() const { return bucket::chunk_count(length, chunk_size); }
  std::size_t expected_chunk_size(int64_t n) const {
    return bucket::expected_chunk_size(length, chunk_size, n);
  }
};

struct ChunkDocument {
  bson::Value files_id;
  int64_t n = 0;
  std::vector<uint8_t> data;

  // Assigns a fresh ObjectId as the chunk's own _id
  bson::Document to_document() const;
  // Throws GridFSError when a required field is missing or mistyped
  static ChunkDocument from_document(const bson::Document& document);
};

// ---- CHUNK CODEC ----
// Chunk bytes travel as a generic binary field
bson::Binary encode_chunk(const uint8_t* data, std::size_t length);
std::vector<uint8_t> decode_chunk(const bson::Value& field);

} // namespace gridfs::bucket

#endif // GRIDFS_BUCKET_FILE_DOCUMENT_HPP
