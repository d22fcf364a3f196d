#include "bucket/bucket.hpp"
#include <boost/log/trivial.hpp>

namespace gridfs::bucket {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Bucket::Bucket(store::DocumentStore& store, config::BucketOptions options)
  : store_(store)
  , options_(std::move(options)) {
  try {
    config::validate(options_);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: Invalid options: " << e.what();
    throw UsageError(e.what());
  }

  collections_.files = options_.bucket_name + ".files";
  collections_.chunks = options_.bucket_name + ".chunks";
  ensure_indexes();
  BOOST_LOG_TRIVIAL(info) << "Bucket: Initialized bucket '" << options_.bucket_name
                          << "' with default chunk size " << options_.chunk_size_bytes;
}


//==============================================
// STREAM FACTORIES
//==============================================

std::unique_ptr<UploadStream> Bucket::open_upload_stream(const std::string& filename,
                                                         const config::UploadOptions& options) {
  return open_upload_stream_with_id(bson::ObjectId::generate(), filename, options);
}

std::unique_ptr<UploadStream> Bucket::open_upload_stream_with_id(const bson::Value& id,
                                                                 const std::string& filename,
                                                                 const config::UploadOptions& options) {
  if (id.is_null()) {
    throw UsageError("No id provided to open_upload_stream_with_id");
  }
  return std::make_unique<UploadStream>(store_, collections_, id, filename, resolve_chunk_size(options),
                                        options.extras, options_.max_batch_bytes);
}

std::unique_ptr<DownloadStream> Bucket::open_download_stream(const bson::Value& id) {
  if (id.is_null()) {
    throw UsageError("No id provided to open_download_stream");
  }

  auto file = find_file(id);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: No file found for id " << id.to_string();
    throw FileNotFoundError(id.to_string());
  }
  return std::make_unique<DownloadStream>(store_, collections_.chunks, std::move(*file));
}


//==============================================
// WHOLE FILE TRANSFERS
//==============================================

bson::Value Bucket::upload_from_stream(const std::string& filename, std::istream& source,
                                       const config::UploadOptions& options) {
  bson::Value id = bson::ObjectId::generate();
  upload_from_stream_with_id(id, filename, source, options);
  return id;
}

void Bucket::upload_from_stream_with_id(const bson::Value& id, const std::string& filename,
                                        std::istream& source, const config::UploadOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Uploading " << filename << " from stream as " << id.to_string();
  auto stream = open_upload_stream_with_id(id, filename, options);

  try {
    copy_into(*stream, source);
  } catch (const std::exception& e) {
    // Nothing was published yet, so reclaim the chunks instead of letting the destructor close
    BOOST_LOG_TRIVIAL(error) << "Bucket: Upload of " << filename << " failed, aborting: " << e.what();
    try {
      stream->abort();
    } catch (const GridFSError& abort_error) {
      BOOST_LOG_TRIVIAL(error) << "Bucket: Abort after failed upload also failed: " << abort_error.what();
    }
    throw;
  }

  stream->close();
}

void Bucket::download_to_stream(const bson::Value& id, std::ostream& destination) {
  auto stream = open_download_stream(id);
  std::size_t chunk_size = static_cast<std::size_t>(stream->file().chunk_size);

  while (true) {
    std::string data = stream->read(chunk_size);
    if (data.empty()) {
      break;
    }
    if (!destination.write(data.data(), static_cast<std::streamsize>(data.size()))) {
      BOOST_LOG_TRIVIAL(error) << "Bucket: Failed to write to destination stream";
      throw GridFSError("Bucket: Failed to write to destination stream");
    }
  }
  stream->close();
  BOOST_LOG_TRIVIAL(info) << "Bucket: Downloaded file " << id.to_string() << " ("
                          << stream->position() << " bytes)";
}


//==============================================
// FILE MANAGEMENT
//==============================================

void Bucket::delete_file(const bson::Value& id) {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Deleting file " << id.to_string();

  std::size_t files_deleted = 0;
  std::size_t chunks_deleted = 0;
  try {
    files_deleted = store_.delete_one(collections_.files, bson::Document{{field::ID, id}});
    // Orphaned chunks are removed even when the file document is gone
    chunks_deleted = store_.delete_many(collections_.chunks, bson::Document{{field::FILES_ID, id}});
  } catch (const store::StoreError& e) {
    throw StorageError(StorageError::Phase::Delete, id.to_string(), e.what());
  }

  if (files_deleted != 1) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: No file found for id " << id.to_string()
                             << " (removed " << chunks_deleted << " orphaned chunks)";
    throw FileNotFoundError(id.to_string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Bucket: Removed " << chunks_deleted << " chunks of file " << id.to_string();
}

std::vector<FileDocument> Bucket::find(const bson::Document& filter) {
  std::vector<FileDocument> files;
  try {
    auto cursor = store_.find(collections_.files, filter, field::UPLOAD_DATE);
    while (cursor->has_next()) {
      files.push_back(FileDocument::from_document(cursor->next()));
    }
  } catch (const store::StoreError& e) {
    throw StorageError(StorageError::Phase::FileQuery, bson::Value(filter).to_string(), e.what());
  }
  return files;
}

std::optional<FileDocument> Bucket::find_file(const bson::Value& id) {
  std::optional<bson::Document> document;
  try {
    document = store_.find_one(collections_.files, bson::Document{{field::ID, id}});
  } catch (const store::StoreError& e) {
    throw StorageError(StorageError::Phase::FileQuery, id.to_string(), e.what());
  }
  if (!document) {
    return std::nullopt;
  }
  return FileDocument::from_document(*document);
}

void Bucket::drop() {
  BOOST_LOG_TRIVIAL(info) << "Bucket: Dropping bucket '" << options_.bucket_name << "'";
  try {
    store_.drop(collections_.files);
    store_.drop(collections_.chunks);
  } catch (const store::StoreError& e) {
    throw StorageError(StorageError::Phase::Delete, options_.bucket_name, e.what());
  }
  ensure_indexes();
}


//==============================================
// UTILITY METHODS
//==============================================

// Chunk queries are keyed by files_id and read in n order
void Bucket::ensure_indexes() {
  try {
    store_.create_index(collections_.chunks, {field::FILES_ID, field::N});
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Bucket: Failed to index " << collections_.chunks << ": " << e.what();
    throw StorageError(StorageError::Phase::IndexSetup, options_.bucket_name, e.what());
  }
}

int32_t Bucket::resolve_chunk_size(const config::UploadOptions& options) const {
  int32_t chunk_size = options.chunk_size_bytes.value_or(options_.chunk_size_bytes);
  if (chunk_size <= 0) {
    throw UsageError("chunk size must be positive, got " + std::to_string(chunk_size));
  }
  return chunk_size;
}

void Bucket::copy_into(UploadStream& stream, std::istream& source) {
  if (!source.good()) {
    throw UsageError("invalid input stream provided for upload");
  }

  std::vector<char> buffer(static_cast<std::size_t>(stream.chunk_size()));
  while (source.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || source.gcount() > 0) {
    stream.write(buffer.data(), static_cast<std::size_t>(source.gcount()));
    if (source.eof()) {
      break;
    }
  }
  if (source.bad()) {
    throw GridFSError("Bucket: Failed to read from input stream");
  }
}

} // namespace gridfs::bucket
