#include "store/document_store.hpp"

namespace gridfs {
namespace store {

bson::Document VectorCursor::next() {
  if (!has_next()) {
    throw StoreError("Cursor: next() called on an exhausted cursor");
  }
  return std::move(documents_[position_++]);
}

std::optional<bson::Document> DocumentStore::find_one(const std::string& collection,
                                                      const bson::Document& filter) {
  auto cursor = find(collection, filter);
  if (!cursor->has_next()) {
    return std::nullopt;
  }
  return cursor->next();
}

bool matches(const bson::Document& document, const bson::Document& filter) {
  for (const auto& condition : filter) {
    const bson::Value* value = document.find(condition.key);
    if (!value) {
      return false;
    }
    // Numbers of different widths still match by value
    if (value->is_number() && condition.value.is_number()) {
      if (bson::compare(*value, condition.value) != 0) {
        return false;
      }
    } else if (*value != condition.value) {
      return false;
    }
  }
  return true;
}

} // namespace store
} // namespace gridfs
