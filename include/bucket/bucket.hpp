#ifndef GRIDFS_BUCKET_BUCKET_HPP
#define GRIDFS_BUCKET_BUCKET_HPP

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "bucket/download_stream.hpp"
#include "bucket/file_document.hpp"
#include "bucket/gridfs_error.hpp"
#include "bucket/upload_stream.hpp"
#include "config/config.hpp"
#include "store/document_store.hpp"

namespace gridfs::bucket {

// A files collection and a chunks collection sharing the bucket name as prefix
class Bucket {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Bucket(store::DocumentStore& store, config::BucketOptions options = {});


  // ---- STREAM FACTORIES ----
  std::unique_ptr<UploadStream> open_upload_stream(const std::string& filename,
                                                   const config::UploadOptions& options = {});
  std::unique_ptr<UploadStream> open_upload_stream_with_id(const bson::Value& id, const std::string& filename,
                                                           const config::UploadOptions& options = {});
  // Throws FileNotFoundError when no file document exists for id
  std::unique_ptr<DownloadStream> open_download_stream(const bson::Value& id);


  // ---- WHOLE FILE TRANSFERS ----
  // Copies the source into a new file and returns its id
  bson::Value upload_from_stream(const std::string& filename, std::istream& source,
                                 const config::UploadOptions& options = {});
  void upload_from_stream_with_id(const bson::Value& id, const std::string& filename, std::istream& source,
                                  const config::UploadOptions& options = {});
  void download_to_stream(const bson::Value& id, std::ostream& destination);


  // ---- FILE MANAGEMENT ----
  // Removes the file document and then its chunks
  void delete_file(const bson::Value& id);
  std::vector<FileDocument> find(const bson::Document& filter = {});
  std::optional<FileDocument> find_file(const bson::Value& id);
  // Drops both collections
  void drop();


  // ---- GETTERS ----
  const config::BucketOptions& options() const { return options_; }
  const std::string& files_collection() const { return collections_.files; }
  const std::string& chunks_collection() const { return collections_.chunks; }

private:
  // ---- PARAMETERS ----
  store::DocumentStore& store_;
  config::BucketOptions options_;
  BucketCollections collections_;

  void ensure_indexes();
  int32_t resolve_chunk_size(const config::UploadOptions& options) const;
  void copy_into(UploadStream& stream, std::istream& source);
};

} // namespace gridfs::bucket

#endif // GRIDFS_BUCKET_BUCKET_HPP
