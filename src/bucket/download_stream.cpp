#include "bucket/download_stream.hpp"
#include <algorithm>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace gridfs::bucket {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DownloadStream::DownloadStream(store::DocumentStore& store, const std::string& chunks_collection,
                               FileDocument file)
  : store_(store)
  , chunks_collection_(chunks_collection)
  , file_(std::move(file))
  , file_id_(file_.id.to_string())
  , chunk_count_(file_.chunk_count()) {

  if (file_.length > 0) {
    try {
      cursor_ = store_.find(chunks_collection_, bson::Document{{field::FILES_ID, file_.id}}, field::N);
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Download stream: Failed to query chunks for file "
                               << file_id_ << ": " << e.what();
      throw StorageError(StorageError::Phase::ChunkQuery, file_id_, e.what());
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Download stream: Opened file " << file_id_ << " (" << file_.filename
                          << "): " << file_.length << " bytes in " << chunk_count_ << " chunks";
}

DownloadStream::~DownloadStream() {
  if (!closed_) {
    BOOST_LOG_TRIVIAL(debug) << "Download stream: Releasing file " << file_id_ << " on destruction";
  }
}


//==============================================
// READ OPERATIONS
//==============================================

std::string DownloadStream::read(std::size_t max_len) {
  ensure_open("read");
  std::string result;

  while (result.size() < max_len) {
    if (buffered() == 0 && !fetch_chunk()) {
      break;
    }
    result += take(std::min(buffered(), max_len - result.size()));
  }
  return result;
}

std::size_t DownloadStream::read_into(char* dest, std::size_t max_len) {
  ensure_open("read");
  std::size_t copied = 0;

  while (copied < max_len) {
    if (buffered() == 0 && !fetch_chunk()) {
      break;
    }
    std::size_t n = std::min(buffered(), max_len - copied);
    std::memcpy(dest + copied, buffer_.data() + buffer_pos_, n);
    buffer_pos_ += n;
    consumed_ += static_cast<int64_t>(n);
    copied += n;
  }
  return copied;
}

std::string DownloadStream::read_line(const std::string& delimiter) {
  ensure_open("read_line");
  if (delimiter.empty()) {
    return read_all();
  }

  // Offset from buffer_pos_ where the delimiter search resumes
  std::size_t scanned = 0;
  while (true) {
    std::size_t found = buffer_.find(delimiter, buffer_pos_ + scanned);
    if (found != std::string::npos) {
      return take(found + delimiter.size() - buffer_pos_);
    }

    // A delimiter may straddle the chunk boundary
    std::size_t overlap = delimiter.size() - 1;
    scanned = buffered() > overlap ? buffered() - overlap : 0;

    if (!fetch_chunk()) {
      return take(buffered());
    }
  }
}

std::string DownloadStream::read_all() {
  ensure_open("read_all");
  while (fetch_chunk()) {
  }
  BOOST_LOG_TRIVIAL(debug) << "Download stream: Slurping " << buffered() << " bytes of file " << file_id_;
  return take(buffered());
}

int DownloadStream::getc() {
  ensure_open("getc");
  if (buffered() == 0 && !fetch_chunk()) {
    return std::char_traits<char>::eof();
  }
  auto c = static_cast<unsigned char>(buffer_[buffer_pos_]);
  ++buffer_pos_;
  ++consumed_;
  return c;
}

int DownloadStream::peek() {
  ensure_open("peek");
  if (buffered() == 0 && !fetch_chunk()) {
    return std::char_traits<char>::eof();
  }
  return static_cast<unsigned char>(buffer_[buffer_pos_]);
}

bool DownloadStream::eof() {
  if (closed_) {
    return true;
  }
  return buffered() == 0 && expected_n_ >= chunk_count_;
}


//==============================================
// LIFECYCLE
//==============================================

void DownloadStream::close() {
  if (closed_) {
    BOOST_LOG_TRIVIAL(warning) << "Download stream: close called on closed stream for file " << file_id_;
    return;
  }
  cursor_.reset();
  buffer_.clear();
  buffer_.shrink_to_fit();
  buffer_pos_ = 0;
  closed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Download stream: Closed file " << file_id_ << " after "
                          << consumed_ << " bytes";
}


//==============================================
// CHUNK PROCESSING
//==============================================

bool DownloadStream::fetch_chunk() {
  if (expected_n_ >= chunk_count_) {
    return false;
  }

  bool available = false;
  bson::Document raw;
  try {
    available = cursor_ && cursor_->has_next();
    if (available) {
      raw = cursor_->next();
    }
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Failed to fetch chunk " << expected_n_
                             << " of file " << file_id_ << ": " << e.what();
    throw StorageError(StorageError::Phase::ChunkQuery, file_id_, e.what());
  }

  if (!available) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Chunk " << expected_n_ << " of file "
                             << file_id_ << " is missing";
    throw ChunkSequenceError("missing chunk " + std::to_string(expected_n_)
                             + " for file with id " + file_id_);
  }

  ChunkDocument chunk = ChunkDocument::from_document(raw);
  validate_chunk(chunk);

  // Drop consumed bytes before appending
  if (buffer_pos_ > 0) {
    buffer_.erase(0, buffer_pos_);
    buffer_pos_ = 0;
  }
  buffer_.append(chunk.data.begin(), chunk.data.end());
  ++expected_n_;

  BOOST_LOG_TRIVIAL(trace) << "Download stream: Buffered chunk " << chunk.n << " of file "
                           << file_id_ << " (" << chunk.data.size() << " bytes)";
  return true;
}

void DownloadStream::validate_chunk(const ChunkDocument& chunk) const {
  if (chunk.n != expected_n_) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Expected chunk " << expected_n_
                             << " but got chunk " << chunk.n << " for file " << file_id_;
    throw ChunkSequenceError("expected chunk " + std::to_string(expected_n_) + " but got chunk "
                             + std::to_string(chunk.n) + " for file with id " + file_id_);
  }

  std::size_t expected_size = file_.expected_chunk_size(chunk.n);
  if (chunk.data.size() != expected_size) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: Chunk " << chunk.n << " of file " << file_id_
                             << " has " << chunk.data.size() << " bytes, expected " << expected_size;
    throw ChunkSizeError(chunk.n, chunk.data.size(), expected_size, file_id_);
  }
}

std::string DownloadStream::take(std::size_t n) {
  std::string result = buffer_.substr(buffer_pos_, n);
  buffer_pos_ += n;
  consumed_ += static_cast<int64_t>(n);
  if (buffer_pos_ == buffer_.size()) {
    buffer_.clear();
    buffer_pos_ = 0;
  }
  return result;
}

void DownloadStream::ensure_open(const char* operation) const {
  if (closed_) {
    BOOST_LOG_TRIVIAL(error) << "Download stream: " << operation << " on closed stream for file " << file_id_;
    throw UsageError(std::string(operation) + " on a closed download stream");
  }
}

} // namespace gridfs::bucket
