#ifndef GRIDFS_STORE_DOCUMENT_STORE_HPP
#define GRIDFS_STORE_DOCUMENT_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "bson/value.hpp"

namespace gridfs {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Forward-only sequence of query results
class Cursor {
public:
  virtual ~Cursor() = default;

  virtual bool has_next() = 0;
  // Throws StoreError when exhausted
  virtual bson::Document next() = 0;
};

// Cursor over documents that were already materialized
class VectorCursor : public Cursor {
public:
  explicit VectorCursor(std::vector<bson::Document> documents)
    : documents_(std::move(documents)) {}

  bool has_next() override { return position_ < documents_.size(); }
  bson::Document next() override;

private:
  std::vector<bson::Document> documents_;
  std::size_t position_ = 0;
};

// Minimal collection store the bucket layer is written against.
// Filters are equality matches on top-level fields; an empty filter matches everything.
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  // ---- WRITE OPERATIONS ----
  virtual void insert_one(const std::string& collection, const bson::Document& document) = 0;
  virtual void insert_many(const std::string& collection, const std::vector<bson::Document>& documents) = 0;
  virtual std::size_t delete_one(const std::string& collection, const bson::Document& filter) = 0;
  virtual std::size_t delete_many(const std::string& collection, const bson::Document& filter) = 0;
  virtual void drop(const std::string& collection) = 0;
  // Declares the fields queries on a collection are keyed by, most significant first.
  // Stores without index support ignore the request.
  virtual void create_index(const std::string& /*collection*/, const std::vector<std::string>& /*fields*/) {}


  // ---- QUERY OPERATIONS ----
  // Results ascend by sort_key when it is non-empty
  virtual std::unique_ptr<Cursor> find(const std::string& collection, const bson::Document& filter,
                                       const std::string& sort_key = "") = 0;
  virtual std::optional<bson::Document> find_one(const std::string& collection, const bson::Document& filter);
};

// True when every field of the filter is present in the document with an equal value
bool matches(const bson::Document& document, const bson::Document& filter);

} // namespace store
} // namespace gridfs

#endif // GRIDFS_STORE_DOCUMENT_STORE_HPP
