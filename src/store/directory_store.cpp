#include "store/directory_store.hpp"
#include "bson/codec.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridfs {
namespace store {

namespace {
const char* const DOCUMENT_EXTENSION = ".bson";
const char* const PENDING_EXTENSION = ".pending";
const char* const INDEX_MARKER = ".index";

// Empty when the file was removed after it was listed
std::optional<bson::Document> read_document(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) && !ec) {
      BOOST_LOG_TRIVIAL(debug) << "Directory store: Document removed before read: " << path.string();
      return std::nullopt;
    }
    throw StoreError("Directory store: Failed to open file: " + path.string());
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  try {
    return bson::Codec::decode(bytes);
  } catch (const bson::BsonError& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Corrupt document at " << path.string() << ": " << e.what();
    throw StoreError("Directory store: Corrupt document at " + path.string() + ": " + e.what());
  }
}

// Zero padded so file names sort like the integers they hold
std::string order_name(const bson::Value& value, const std::string& field) {
  int64_t n = 0;
  try {
    n = value.as_int64();
  } catch (const bson::BsonError& e) {
    throw StoreError("Directory store: Indexed field '" + field + "' is not an integer: " + e.what());
  }
  if (n < 0) {
    throw StoreError("Directory store: Indexed field '" + field + "' is negative: " + std::to_string(n));
  }
  std::ostringstream name;
  name << std::setw(20) << std::setfill('0') << n;
  return name.str();
}

// Reads one document file per step, skipping files that no longer match
class DirectoryCursor : public Cursor {
public:
  DirectoryCursor(std::vector<std::filesystem::path> paths, bson::Document filter)
    : paths_(std::move(paths))
    , filter_(std::move(filter)) {}

  bool has_next() override {
    while (!pending_ && position_ < paths_.size()) {
      auto document = read_document(paths_[position_++]);
      if (document && matches(*document, filter_)) {
        pending_ = std::move(document);
      }
    }
    return pending_.has_value();
  }

  bson::Document next() override {
    if (!has_next()) {
      throw StoreError("Cursor: next() called on an exhausted cursor");
    }
    bson::Document document = std::move(*pending_);
    pending_.reset();
    return document;
  }

private:
  std::vector<std::filesystem::path> paths_;
  std::size_t position_ = 0;
  bson::Document filter_;
  std::optional<bson::Document> pending_;
};
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DirectoryStore::DirectoryStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Directory store: Initializing store with base path: " << base_path;
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to create base path: " << e.what();
    throw StoreError("Directory store: Failed to create base path: " + std::string(e.what()));
  }
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Store directory created/verified at: " << base_path;
}


//==============================================
// WRITE OPERATIONS
//==============================================

void DirectoryStore::insert_one(const std::string& collection, const bson::Document& document) {
  std::lock_guard<std::mutex> lock(mutex_);
  insert_locked(collection, document);
}

void DirectoryStore::insert_many(const std::string& collection,
                                 const std::vector<bson::Document>& documents) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Inserting " << documents.size()
                           << " documents into " << collection;
  for (const auto& document : documents) {
    insert_locked(collection, document);
  }
}

std::size_t DirectoryStore::delete_one(const std::string& collection, const bson::Document& filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  return delete_locked(collection, filter, true);
}

std::size_t DirectoryStore::delete_many(const std::string& collection, const bson::Document& filter) {
  std::lock_guard<std::mutex> lock(mutex_);
  return delete_locked(collection, filter, false);
}

void DirectoryStore::drop(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Directory store: Dropping collection: " << collection;
  try {
    std::filesystem::remove_all(collection_path(collection));
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to drop " << collection << ": " << e.what();
    throw StoreError("Directory store: Failed to drop collection: " + std::string(e.what()));
  }
  indexes_.erase(collection);
}

void DirectoryStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Directory store: Clearing entire store at: " << base_path_;
  try {
    std::filesystem::remove_all(base_path_);
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Directory store: Failed to clear store: " + std::string(e.what()));
  }
  indexes_.clear();
  BOOST_LOG_TRIVIAL(info) << "Directory store: Store cleared successfully";
}


//==============================================
// INDEX OPERATIONS
//==============================================

void DirectoryStore::create_index(const std::string& collection, const std::vector<std::string>& fields) {
  if (fields.empty() || fields.size() > 2) {
    throw StoreError("Directory store: An index takes one or two fields, got " + std::to_string(fields.size()));
  }
  for (const auto& field : fields) {
    if (field.empty()) {
      throw StoreError("Directory store: Index field names must not be empty");
    }
  }
  PartitionIndex requested{fields[0], fields.size() > 1 ? fields[1] : std::string()};

  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path root = collection_path(collection);

  if (auto existing = index_for(collection)) {
    if (*existing == requested) {
      BOOST_LOG_TRIVIAL(debug) << "Directory store: Index on " << collection << " already present";
      return;
    }
    BOOST_LOG_TRIVIAL(error) << "Directory store: Conflicting index requested on " << collection;
    throw StoreError("Directory store: Collection " + collection + " is already indexed on '"
                     + existing->partition_field + "'");
  }

  try {
    if (std::filesystem::exists(root)) {
      for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == DOCUMENT_EXTENSION) {
          throw StoreError("Directory store: Cannot index non-empty collection " + collection);
        }
      }
    }
    check_directory_exists(root);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Directory store: Failed to prepare index on " + collection + ": " + e.what());
  }

  write_index_marker(root, requested);
  indexes_[collection] = requested;
  BOOST_LOG_TRIVIAL(info) << "Directory store: Indexed " << collection << " on '" << requested.partition_field
                          << (requested.order_field.empty() ? "" : "', '" + requested.order_field) << "'";
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::unique_ptr<Cursor> DirectoryStore::find(const std::string& collection, const bson::Document& filter,
                                             const std::string& sort_key) {
  Selection selection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    BOOST_LOG_TRIVIAL(debug) << "Directory store: Querying " << collection << " with filter "
                             << bson::Value(filter).to_string()
                             << (sort_key.empty() ? "" : " sorted by " + sort_key);
    selection = select_documents(collection, filter, sort_key);
  }
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Query selected " << selection.paths.size() << " documents";

  if (selection.ordered) {
    return std::make_unique<DirectoryCursor>(std::move(selection.paths),
                                             selection.exact ? bson::Document() : filter);
  }

  // The layout does not give this order, so matches are sorted in memory
  std::vector<bson::Document> results;
  for (const auto& path : selection.paths) {
    auto document = read_document(path);
    if (document && matches(*document, filter)) {
      results.push_back(std::move(*document));
    }
  }

  // Documents without the key sort first, like a null value
  static const bson::Value missing;
  std::stable_sort(results.begin(), results.end(),
    [&sort_key](const bson::Document& lhs, const bson::Document& rhs) {
      const bson::Value* l = lhs.find(sort_key);
      const bson::Value* r = rhs.find(sort_key);
      return bson::compare(l ? *l : missing, r ? *r : missing) < 0;
    });
  return std::make_unique<VectorCursor>(std::move(results));
}

std::size_t DirectoryStore::count(const std::string& collection, const bson::Document& filter) {
  Selection selection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    selection = select_documents(collection, filter, "");
  }
  if (selection.exact) {
    return selection.paths.size();
  }

  DirectoryCursor cursor(std::move(selection.paths), filter);
  std::size_t matched = 0;
  while (cursor.has_next()) {
    cursor.next();
    ++matched;
  }
  return matched;
}

std::vector<std::string> DirectoryStore::list_collections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    if (entry.is_directory()) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}


//==============================================
// STORAGE SUPPORT
//==============================================

void DirectoryStore::insert_locked(const std::string& collection, const bson::Document& document) {
  bson::Document stored;
  if (!document.has("_id")) {
    // Assign an id up front so it is the first field
    stored.append("_id", bson::ObjectId::generate());
    for (const auto& element : document) {
      stored.append(element.key, element.value);
    }
  } else {
    stored = document;
  }

  std::filesystem::path root = collection_path(collection);
  auto index = index_for(collection);
  std::filesystem::path file_path = document_path(root, stored, index);
  BOOST_LOG_TRIVIAL(trace) << "Directory store: Calculated file path: " << file_path.string();

  if (std::filesystem::exists(file_path)) {
    std::string key = index ? stored.get(index->partition_field).to_string() + "/"
                              + (index->order_field.empty() ? stored.get("_id").to_string()
                                                            : stored.get(index->order_field).to_string())
                            : stored.get("_id").to_string();
    BOOST_LOG_TRIVIAL(error) << "Directory store: Duplicate key " << key << " in " << collection;
    throw StoreError("Directory store: Duplicate key " + key + " in " + collection);
  }

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("Directory store: Failed to create directory: " + std::string(e.what()));
  }
  // A dropped collection loses its marker while this store still knows the index
  if (index && !std::filesystem::exists(root / INDEX_MARKER)) {
    write_index_marker(root, *index);
  }
  write_document(file_path, stored);
}

std::size_t DirectoryStore::delete_locked(const std::string& collection, const bson::Document& filter,
                                          bool only_one) {
  std::filesystem::path root = collection_path(collection);
  Selection selection = select_documents(collection, filter, "");
  std::size_t deleted = 0;

  for (const auto& path : selection.paths) {
    if (!selection.exact) {
      auto document = read_document(path);
      if (!document || !matches(*document, filter)) {
        continue;
      }
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to remove " << path.string() << ": " << ec.message();
      throw StoreError("Directory store: Failed to remove document: " + path.string());
    }
    if (!removed) {
      continue;
    }
    prune_empty_parents(path.parent_path(), root);
    ++deleted;
    if (only_one) {
      break;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Directory store: Deleted " << deleted << " documents from " << collection;
  return deleted;
}

DirectoryStore::Selection DirectoryStore::select_documents(const std::string& collection,
                                                           const bson::Document& filter,
                                                           const std::string& sort_key) const {
  Selection selection;
  std::filesystem::path root = collection_path(collection);
  auto index = index_for(collection);
  const bson::Value* partition = index ? filter.find(index->partition_field) : nullptr;
  const bson::Value* id = index ? nullptr : filter.find("_id");

  try {
    if (!std::filesystem::exists(root)) {
      selection.exact = true;
      selection.ordered = true;
      return selection;
    }

    if (partition) {
      std::filesystem::path directory = get_partition_path(root, *partition);
      if (std::filesystem::is_directory(directory)) {
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
          if (entry.is_regular_file() && entry.path().extension() == DOCUMENT_EXTENSION) {
            selection.paths.push_back(entry.path());
          }
        }
      }
      std::sort(selection.paths.begin(), selection.paths.end());
      selection.exact = filter.size() == 1;
      selection.ordered = sort_key.empty() || sort_key == index->order_field;
    } else if (id) {
      std::filesystem::path path = get_path_for_hash(root, hash_value(*id));
      if (std::filesystem::exists(path)) {
        selection.paths.push_back(path);
      }
      selection.exact = filter.size() == 1;
      selection.ordered = true;
    } else {
      for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension() == DOCUMENT_EXTENSION) {
          selection.paths.push_back(entry.path());
        }
      }
      selection.exact = filter.empty();
      selection.ordered = sort_key.empty();
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to scan " << collection << ": " << e.what();
    throw StoreError("Directory store: Failed to scan collection: " + std::string(e.what()));
  }
  return selection;
}

void DirectoryStore::write_document(const std::filesystem::path& path, const bson::Document& document) const {
  // Write beside the target and rename so readers never see a partial file
  std::filesystem::path pending = path;
  pending += PENDING_EXTENSION;

  {
    std::ofstream file(pending, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Directory store: Failed to create file: " + pending.string());
    }
    try {
      bson::Codec::write(document, file);
    } catch (const bson::BsonError& e) {
      file.close();
      std::filesystem::remove(pending);
      throw StoreError("Directory store: Failed to encode document: " + std::string(e.what()));
    }
    file.flush();
    if (!file) {
      file.close();
      std::filesystem::remove(pending);
      throw StoreError("Directory store: Failed to write file: " + pending.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(pending, path, ec);
  if (ec) {
    std::filesystem::remove(pending);
    throw StoreError("Directory store: Failed to commit file " + path.string() + ": " + ec.message());
  }
}


//==============================================
// INDEX SUPPORT
//==============================================

std::optional<DirectoryStore::PartitionIndex> DirectoryStore::index_for(const std::string& collection) const {
  auto cached = indexes_.find(collection);
  if (cached != indexes_.end()) {
    return cached->second;
  }

  // Another store on the same directory may have created the index
  std::filesystem::path marker = collection_path(collection) / INDEX_MARKER;
  std::ifstream file(marker);
  if (!file) {
    return std::nullopt;
  }
  PartitionIndex index;
  std::getline(file, index.partition_field);
  std::getline(file, index.order_field);
  if (index.partition_field.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Corrupt index marker at " << marker.string();
    throw StoreError("Directory store: Corrupt index marker at " + marker.string());
  }
  indexes_[collection] = index;
  return index;
}

void DirectoryStore::write_index_marker(const std::filesystem::path& root, const PartitionIndex& index) const {
  std::filesystem::path marker = root / INDEX_MARKER;
  std::filesystem::path pending = marker;
  pending += PENDING_EXTENSION;

  {
    std::ofstream file(pending, std::ios::trunc);
    file << index.partition_field << '\n' << index.order_field << '\n';
    file.flush();
    if (!file) {
      throw StoreError("Directory store: Failed to write index marker: " + pending.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(pending, marker, ec);
  if (ec) {
    std::filesystem::remove(pending);
    throw StoreError("Directory store: Failed to commit index marker " + marker.string() + ": " + ec.message());
  }
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string DirectoryStore::hash_value(const bson::Value& value) const {
  auto encoded = bson::Codec::encode(bson::Document{{"_id", value}});
  return crypto::Digest::hex(crypto::Digest::Algorithm::SHA256, encoded.data(), encoded.size());
}

std::filesystem::path DirectoryStore::get_path_for_hash(const std::filesystem::path& root,
                                                        const std::string& hash) const {
  std::filesystem::path path = root;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6) + DOCUMENT_EXTENSION;
  return path;
}

std::filesystem::path DirectoryStore::get_partition_path(const std::filesystem::path& root,
                                                         const bson::Value& value) const {
  std::string hash = hash_value(value);
  std::filesystem::path path = root;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path DirectoryStore::document_path(const std::filesystem::path& root,
                                                    const bson::Document& document,
                                                    const std::optional<PartitionIndex>& index) const {
  const bson::Value& id = document.get("_id");
  if (!index) {
    return get_path_for_hash(root, hash_value(id));
  }

  const bson::Value* partition = document.find(index->partition_field);
  if (!partition) {
    throw StoreError("Directory store: Document lacks indexed field '" + index->partition_field + "'");
  }
  std::filesystem::path directory = get_partition_path(root, *partition);
  if (index->order_field.empty()) {
    return directory / (hash_value(id) + DOCUMENT_EXTENSION);
  }

  const bson::Value* order = document.find(index->order_field);
  if (!order) {
    throw StoreError("Directory store: Document lacks indexed field '" + index->order_field + "'");
  }
  return directory / (order_name(*order, index->order_field) + DOCUMENT_EXTENSION);
}

std::filesystem::path DirectoryStore::collection_path(const std::string& collection) const {
  if (collection.empty() || collection.find('/') != std::string::npos
      || collection.find('\\') != std::string::npos || collection.find('\0') != std::string::npos
      || collection == "." || collection == "..") {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Invalid collection name: " << collection;
    throw StoreError("Directory store: Invalid collection name: " + collection);
  }
  return base_path_ / collection;
}


//==============================================
// UTILITY METHODS
//==============================================

void DirectoryStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void DirectoryStore::prune_empty_parents(const std::filesystem::path& path,
                                         const std::filesystem::path& root) const {
  std::error_code ec;
  auto current = path;
  while (current != root && current.has_parent_path()) {
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

} // namespace store
} // namespace gridfs
