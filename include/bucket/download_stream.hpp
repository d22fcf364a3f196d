#ifndef GRIDFS_BUCKET_DOWNLOAD_STREAM_HPP
#define GRIDFS_BUCKET_DOWNLOAD_STREAM_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "bucket/file_document.hpp"
#include "bucket/gridfs_error.hpp"
#include "store/document_store.hpp"

namespace gridfs::bucket {

// Pull-style reader over the chunks of one file. Every chunk is checked
// against the file document before its bytes become readable. Reads only move
// forward.
class DownloadStream {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens a cursor over the chunks of an existing file. A zero length file opens no cursor.
  DownloadStream(store::DocumentStore& store, const std::string& chunks_collection, FileDocument file);
  ~DownloadStream();

  DownloadStream(const DownloadStream&) = delete;
  DownloadStream& operator=(const DownloadStream&) = delete;


  // ---- READ OPERATIONS ----
  // Up to max_len bytes; fewer only at end of stream, empty once exhausted
  std::string read(std::size_t max_len);
  // Copies up to max_len bytes into dest and returns how many were copied
  std::size_t read_into(char* dest, std::size_t max_len);
  // Bytes through the first delimiter; the trailing partial line at end of
  // stream; empty once exhausted. An empty delimiter returns the rest of the file.
  std::string read_line(const std::string& delimiter = "\n");
  // Every remaining byte
  std::string read_all();
  // Next byte as unsigned char, or EOF
  int getc();
  // Next byte without consuming it, or EOF
  int peek();
  // True when the buffer is empty and no chunk remains
  bool eof();


  // ---- LIFECYCLE ----
  void close();


  // ---- GETTERS ----
  const FileDocument& file() const { return file_; }
  bool closed() const { return closed_; }
  // Bytes handed to the caller so far
  int64_t position() const { return consumed_; }

private:
  // ---- PARAMETERS ----
  store::DocumentStore& store_;
  std::string chunks_collection_;
  FileDocument file_;
  std::string file_id_;
  std::unique_ptr<store::Cursor> cursor_;

  std::string buffer_;
  std::size_t buffer_pos_ = 0;
  int64_t expected_n_ = 0;
  int64_t chunk_count_ = 0;
  int64_t consumed_ = 0;
  bool closed_ = false;


  // ---- CHUNK PROCESSING ----
  // Pulls, validates and buffers the next chunk; false once every chunk was read
  bool fetch_chunk();
  // Throws ChunkSequenceError or ChunkSizeError when the chunk does not fit the file
  void validate_chunk(const ChunkDocument& chunk) const;
  std::size_t buffered() const { return buffer_.size() - buffer_pos_; }
  // Hands n buffered bytes to the caller
  std::string take(std::size_t n);
  void ensure_open(const char* operation) const;
};

} // namespace gridfs::bucket

#endif // GRIDFS_BUCKET_DOWNLOAD_STREAM_HPP
