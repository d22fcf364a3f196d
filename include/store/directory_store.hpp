#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "store/document_store.hpp"

namespace gridfs {
namespace store {

// Durable DocumentStore on the local filesystem. Every collection is a
// directory and every document one encoded file, addressed by the SHA-256
// of its encoded _id:
//   {base_path}/{collection}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}.bson
//
// An indexed collection gives each value of its first index field a directory
// of its own, addressed by the hash of that value. Documents inside it are
// named by the second index field, zero padded, or by their _id hash:
//   {base_path}/{collection}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}/{order}.bson
// Queries on the first field then touch only that directory, and the file
// names give the order of the second field without decoding.
class DirectoryStore : public DocumentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DirectoryStore(const std::string& base_path);


  // ---- WRITE OPERATIONS ----
  void insert_one(const std::string& collection, const bson::Document& document) override;
  void insert_many(const std::string& collection, const std::vector<bson::Document>& documents) override;
  std::size_t delete_one(const std::string& collection, const bson::Document& filter) override;
  std::size_t delete_many(const std::string& collection, const bson::Document& filter) override;
  void drop(const std::string& collection) override;
  // Removes every collection and resets the store
  void clear();


  // ---- INDEX OPERATIONS ----
  // Accepts one or two fields. The second must hold non-negative integers.
  // Throws StoreError when the collection already holds documents or a different index.
  void create_index(const std::string& collection, const std::vector<std::string>& fields) override;


  // ---- QUERY OPERATIONS ----
  // The cursor decodes one document per step unless sort_key is not covered by the layout
  std::unique_ptr<Cursor> find(const std::string& collection, const bson::Document& filter,
                               const std::string& sort_key = "") override;
  std::size_t count(const std::string& collection, const bson::Document& filter = {});
  std::vector<std::string> list_collections() const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  struct PartitionIndex {
    std::string partition_field;
    // Empty when documents inside a partition are named by their _id
    std::string order_field;

    bool operator==(const PartitionIndex& other) const {
      return partition_field == other.partition_field && order_field == other.order_field;
    }
  };

  // Document files a query has to look at
  struct Selection {
    std::vector<std::filesystem::path> paths;
    // Every path matches the filter by location alone
    bool exact = false;
    // Paths already ascend by the requested sort key
    bool ordered = false;
  };

  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  mutable std::mutex mutex_;
  mutable std::map<std::string, PartitionIndex> indexes_;


  // ---- STORAGE SUPPORT ----
  void insert_locked(const std::string& collection, const bson::Document& document);
  std::size_t delete_locked(const std::string& collection, const bson::Document& filter, bool only_one);
  Selection select_documents(const std::string& collection, const bson::Document& filter,
                             const std::string& sort_key) const;
  void write_document(const std::filesystem::path& path, const bson::Document& document) const;


  // ---- INDEX SUPPORT ----
  std::optional<PartitionIndex> index_for(const std::string& collection) const;
  void write_index_marker(const std::filesystem::path& root, const PartitionIndex& index) const;


  // ---- CAS STORAGE SUPPORT ----
  // Hex SHA-256 of the encoded value
  std::string hash_value(const bson::Value& value) const;
  std::filesystem::path get_path_for_hash(const std::filesystem::path& root, const std::string& hash) const;
  std::filesystem::path get_partition_path(const std::filesystem::path& root, const bson::Value& value) const;
  std::filesystem::path document_path(const std::filesystem::path& root, const bson::Document& document,
                                      const std::optional<PartitionIndex>& index) const;
  std::filesystem::path collection_path(const std::string& collection) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty directories between path and the collection root
  void prune_empty_parents(const std::filesystem::path& path, const std::filesystem::path& root) const;
};

} // namespace store
} // namespace gridfs
