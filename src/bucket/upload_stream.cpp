#include "bucket/upload_stream.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace gridfs::bucket {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UploadStream::UploadStream(store::DocumentStore& store, BucketCollections collections, bson::Value id,
                           std::string filename, int32_t chunk_size, config::FileExtras extras,
                           std::size_t max_batch_bytes)
  : store_(store)
  , collections_(std::move(collections))
  , id_(std::move(id))
  , filename_(std::move(filename))
  , chunk_size_(chunk_size)
  , extras_(std::move(extras)) {

  if (chunk_size_ <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Upload stream: Invalid chunk size: " << chunk_size_;
    throw UsageError("chunk size must be positive, got " + std::to_string(chunk_size_));
  }
  if (id_.is_null()) {
    throw UsageError("upload stream needs a file id");
  }

  // Largest whole number of chunks whose documents fit in one batch
  std::size_t per_chunk = static_cast<std::size_t>(chunk_size_) + CHUNK_DOCUMENT_OVERHEAD;
  std::size_t chunks_per_batch = std::max<std::size_t>(1, max_batch_bytes / per_chunk);
  flush_threshold_ = chunks_per_batch * static_cast<std::size_t>(chunk_size_);

  BOOST_LOG_TRIVIAL(info) << "Upload stream: Opened stream for file " << id_.to_string()
                          << " (" << filename_ << ") with chunk size " << chunk_size_;
  BOOST_LOG_TRIVIAL(debug) << "Upload stream: Flushing every " << chunks_per_batch << " chunks ("
                           << flush_threshold_ << " bytes)";
}

UploadStream::~UploadStream() {
  if (state_ != State::Open) {
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload stream: Closing file " << id_.to_string() << " on destruction";
  try {
    close();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload stream: Close on destruction failed for file "
                             << id_.to_string() << ": " << e.what();
  }
}


//==============================================
// WRITE OPERATIONS
//==============================================

void UploadStream::write(const void* data, std::size_t size) {
  ensure_writable("write");
  if (size == 0) {
    return;
  }

  buffer_.append(static_cast<const char*>(data), size);
  length_ += static_cast<int64_t>(size);
  md5_.update(data, size);

  BOOST_LOG_TRIVIAL(trace) << "Upload stream: Buffered " << size << " bytes, "
                           << buffer_.size() << " pending, " << length_ << " total";

  if (buffer_.size() >= flush_threshold_) {
    flush_chunks(false);
  }
}

void UploadStream::write(const std::string& buffer, int64_t length, int64_t offset) {
  ensure_writable("write");
  if (length < 0) {
    throw UsageError("negative length passed to write");
  }
  if (offset < 0) {
    throw UsageError("negative offset passed to write");
  }
  if (static_cast<uint64_t>(offset) > buffer.size()) {
    throw UsageError("offset " + std::to_string(offset) + " is outside of a "
                     + std::to_string(buffer.size()) + " byte buffer");
  }

  std::size_t available = buffer.size() - static_cast<std::size_t>(offset);
  std::size_t count = std::min<std::size_t>(available, static_cast<uint64_t>(length));
  write(buffer.data() + offset, count);
}


//==============================================
// LIFECYCLE
//==============================================

void UploadStream::close() {
  if (state_ != State::Open) {
    BOOST_LOG_TRIVIAL(warning) << "Upload stream: close called on "
                               << (state_ == State::Closed ? "closed" : "aborted")
                               << " stream for file " << id_.to_string();
    return;
  }

  flush_chunks(true);

  if (!digest_finished_) {
    hex_digest_ = md5_.hex_digest();
    digest_finished_ = true;
  }

  FileDocument file;
  file.id = id_;
  file.length = length_;
  file.chunk_size = chunk_size_;
  file.upload_date = bson::DateTime::now();
  file.md5 = hex_digest_;
  file.filename = filename_;
  file.extras = extras_;

  try {
    store_.insert_one(collections_.files, file.to_document());
  } catch (const store::StoreError& e) {
    // Chunks already written stay in place; the caller decides on retry or abort
    BOOST_LOG_TRIVIAL(error) << "Upload stream: Failed to insert file document for "
                             << id_.to_string() << ", " << next_chunk_n_
                             << " chunks left in place: " << e.what();
    throw StorageError(StorageError::Phase::FileInsert, id_.to_string(), e.what());
  }

  file_ = std::move(file);
  state_ = State::Closed;
  BOOST_LOG_TRIVIAL(info) << "Upload stream: Closed file " << id_.to_string() << ": "
                          << length_ << " bytes in " << next_chunk_n_ << " chunks, md5 " << hex_digest_;
}

void UploadStream::abort() {
  if (state_ != State::Open) {
    BOOST_LOG_TRIVIAL(warning) << "Upload stream: abort called on "
                               << (state_ == State::Closed ? "closed" : "aborted")
                               << " stream for file " << id_.to_string();
    return;
  }

  std::size_t deleted = 0;
  try {
    deleted = store_.delete_many(collections_.chunks, bson::Document{{field::FILES_ID, id_}});
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload stream: Failed to delete chunks while aborting "
                             << id_.to_string() << ": " << e.what();
    throw StorageError(StorageError::Phase::Abort, id_.to_string(), e.what());
  }

  buffer_.clear();
  state_ = State::Aborted;
  BOOST_LOG_TRIVIAL(info) << "Upload stream: Aborted file " << id_.to_string()
                          << ", removed " << deleted << " chunks";
}

const FileDocument& UploadStream::file() const {
  if (state_ != State::Closed) {
    throw UsageError("file document is only available after a successful close");
  }
  return file_;
}


//==============================================
// WRITE SUPPORT
//==============================================

void UploadStream::flush_chunks(bool all) {
  const std::size_t chunk_size = static_cast<std::size_t>(chunk_size_);
  std::vector<bson::Document> chunks;
  std::size_t position = 0;

  while (buffer_.size() - position >= chunk_size || (all && position < buffer_.size())) {
    std::size_t take = std::min(chunk_size, buffer_.size() - position);
    const auto* start = reinterpret_cast<const uint8_t*>(buffer_.data() + position);

    ChunkDocument chunk;
    chunk.files_id = id_;
    chunk.n = next_chunk_n_ + static_cast<int64_t>(chunks.size());
    chunk.data.assign(start, start + take);
    chunks.push_back(chunk.to_document());

    position += take;
  }

  if (chunks.empty()) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Upload stream: Flushing chunks " << next_chunk_n_ << ".."
                           << next_chunk_n_ + static_cast<int64_t>(chunks.size()) - 1
                           << " for file " << id_.to_string();
  try {
    store_.insert_many(collections_.chunks, chunks);
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload stream: Chunk batch insert failed for file "
                             << id_.to_string() << ": " << e.what();
    throw StorageError(StorageError::Phase::ChunkFlush, id_.to_string(), e.what());
  }

  next_chunk_n_ += static_cast<int64_t>(chunks.size());
  buffer_.erase(0, position);
}

void UploadStream::ensure_writable(const char* operation) const {
  if (state_ != State::Open) {
    BOOST_LOG_TRIVIAL(error) << "Upload stream: " << operation << " on "
                             << (state_ == State::Closed ? "closed" : "aborted")
                             << " stream for file " << id_.to_string();
    throw UsageError(std::string(operation) + " on a "
                     + (state_ == State::Closed ? "closed" : "aborted") + " upload stream");
  }
}

} // namespace gridfs::bucket
