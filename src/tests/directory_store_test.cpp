#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <thread>
#include "store/directory_store.hpp"
#include "test_utils.hpp"

using namespace gridfs;
using namespace gridfs::store;

class DirectoryStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::unique_ptr<DirectoryStore> store;

  void SetUp() override {
    init_test_logging();
    dir = std::make_unique<TempDir>("directory_store_test");
    store = std::make_unique<DirectoryStore>(dir->string());
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    dir.reset();
  }

  // Drains a cursor into a vector
  static std::vector<bson::Document> collect(std::unique_ptr<Cursor> cursor) {
    std::vector<bson::Document> documents;
    while (cursor->has_next()) {
      documents.push_back(cursor->next());
    }
    return documents;
  }

  std::set<std::filesystem::path> document_files(const std::string& collection) const {
    std::set<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir->path() / collection)) {
      if (entry.is_regular_file() && entry.path().extension() == ".bson") {
        files.insert(entry.path());
      }
    }
    return files;
  }

  std::size_t count_files(const std::string& collection) const {
    std::size_t count = 0;
    auto root = dir->path() / collection;
    if (!std::filesystem::exists(root)) {
      return 0;
    }
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
      if (entry.is_regular_file()) {
        ++count;
      }
    }
    return count;
  }
};

TEST_F(DirectoryStoreTest, InsertAndFind) {
  bson::Document document{{"_id", "doc-1"}, {"size", int32_t{10}}};
  ASSERT_NO_THROW(store->insert_one("items", document));

  auto found = store->find_one("items", bson::Document{{"_id", "doc-1"}});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, document);
  EXPECT_FALSE(store->find_one("items", bson::Document{{"_id", "doc-2"}}).has_value());
}

TEST_F(DirectoryStoreTest, AssignsMissingId) {
  store->insert_one("items", bson::Document{{"name", "anonymous"}});

  auto found = store->find_one("items", bson::Document{{"name", "anonymous"}});
  ASSERT_TRUE(found.has_value());
  ASSERT_FALSE(found->empty());
  EXPECT_EQ(found->begin()->key, "_id");
  EXPECT_TRUE(found->get("_id").is<bson::ObjectId>());
}

TEST_F(DirectoryStoreTest, RejectsDuplicateId) {
  store->insert_one("items", bson::Document{{"_id", int32_t{1}}});
  EXPECT_THROW(store->insert_one("items", bson::Document{{"_id", int32_t{1}}}), StoreError);
  EXPECT_EQ(store->count("items"), 1u);
}

TEST_F(DirectoryStoreTest, ContentAddressedLayout) {
  store->insert_one("items", bson::Document{{"_id", "layout"}});
  ASSERT_EQ(count_files("items"), 1u);

  for (const auto& entry : std::filesystem::recursive_directory_iterator(dir->path() / "items")) {
    if (!entry.is_regular_file()) {
      continue;
    }
    auto relative = std::filesystem::relative(entry.path(), dir->path() / "items");
    std::vector<std::string> parts;
    for (const auto& part : relative) {
      parts.push_back(part.string());
    }
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0].size(), 2u);
    EXPECT_EQ(parts[1].size(), 2u);
    EXPECT_EQ(parts[2].size(), 2u);
    // 64 hex digits minus the three directory levels, plus the extension
    EXPECT_EQ(parts[3], parts[3].substr(0, 58) + ".bson");
  }
}

TEST_F(DirectoryStoreTest, FilterMatchesNumbersByValue) {
  store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{0}}});
  store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{1}}});
  store->insert_one("chunks", bson::Document{{"files_id", "g"}, {"n", int32_t{0}}});

  EXPECT_EQ(store->count("chunks", bson::Document{{"files_id", "f"}}), 2u);
  EXPECT_EQ(store->count("chunks", bson::Document{{"n", int64_t{1}}}), 1u);
  EXPECT_EQ(store->count("chunks"), 3u);
}

TEST_F(DirectoryStoreTest, FindSortsByKey) {
  for (int32_t n : {3, 0, 2, 1}) {
    store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", n}});
  }

  auto documents = collect(store->find("chunks", bson::Document{{"files_id", "f"}}, "n"));
  ASSERT_EQ(documents.size(), 4u);
  for (std::size_t i = 0; i < documents.size(); ++i) {
    EXPECT_EQ(documents[i].get_integer("n"), static_cast<int64_t>(i));
  }
}

TEST_F(DirectoryStoreTest, DeleteOneAndMany) {
  for (int32_t n = 0; n < 5; ++n) {
    store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", n}});
  }

  EXPECT_EQ(store->delete_one("chunks", bson::Document{{"n", int32_t{4}}}), 1u);
  EXPECT_EQ(store->delete_one("chunks", bson::Document{{"n", int32_t{4}}}), 0u);
  EXPECT_EQ(store->delete_many("chunks", bson::Document{{"files_id", "f"}}), 4u);
  EXPECT_EQ(store->count("chunks"), 0u);
  // Empty hash directories are pruned with the documents
  EXPECT_EQ(count_files("chunks"), 0u);
}

TEST_F(DirectoryStoreTest, DropAndListCollections) {
  store->insert_one("fs.files", bson::Document{{"_id", int32_t{1}}});
  store->insert_one("fs.chunks", bson::Document{{"_id", int32_t{1}}});

  EXPECT_EQ(store->list_collections(), (std::vector<std::string>{"fs.chunks", "fs.files"}));
  store->drop("fs.chunks");
  EXPECT_EQ(store->list_collections(), (std::vector<std::string>{"fs.files"}));
  EXPECT_NO_THROW(store->drop("never.created"));

  store->clear();
  EXPECT_TRUE(store->list_collections().empty());
}

TEST_F(DirectoryStoreTest, RejectsInvalidCollectionNames) {
  bson::Document document{{"_id", int32_t{1}}};
  EXPECT_THROW(store->insert_one("", document), StoreError);
  EXPECT_THROW(store->insert_one("../escape", document), StoreError);
  EXPECT_THROW(store->insert_one("..", document), StoreError);
}

TEST_F(DirectoryStoreTest, CorruptDocumentIsReported) {
  store->insert_one("items", bson::Document{{"_id", "victim"}});
  for (const auto& entry : std::filesystem::recursive_directory_iterator(dir->path() / "items")) {
    if (entry.is_regular_file()) {
      std::ofstream(entry.path(), std::ios::binary | std::ios::trunc) << "garbage";
    }
  }
  // The cursor reads documents as it advances
  auto cursor = store->find("items", {});
  EXPECT_THROW(cursor->has_next(), StoreError);
}

TEST_F(DirectoryStoreTest, CursorSkipsDocumentsRemovedAfterQuery) {
  for (int32_t i = 0; i < 4; ++i) {
    store->insert_one("items", bson::Document{{"_id", i}});
  }
  auto cursor = store->find("items", {});

  DirectoryStore other(dir->string());
  EXPECT_EQ(other.delete_one("items", bson::Document{{"_id", int32_t{2}}}), 1u);

  EXPECT_EQ(collect(std::move(cursor)).size(), 3u);
}

TEST_F(DirectoryStoreTest, IndexedCollectionLayout) {
  store->create_index("chunks", {"files_id", "n"});
  for (int32_t n : {2, 0, 1}) {
    store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", n}});
  }
  store->insert_one("chunks", bson::Document{{"files_id", "g"}, {"n", int32_t{0}}});

  std::set<std::string> names;
  std::set<std::filesystem::path> partitions;
  for (const auto& path : document_files("chunks")) {
    names.insert(path.filename().string());
    partitions.insert(path.parent_path());
  }
  EXPECT_EQ(partitions.size(), 2u);
  EXPECT_EQ(names, (std::set<std::string>{"00000000000000000000.bson", "00000000000000000001.bson",
                                          "00000000000000000002.bson"}));

  auto documents = collect(store->find("chunks", bson::Document{{"files_id", "f"}}, "n"));
  ASSERT_EQ(documents.size(), 3u);
  for (std::size_t i = 0; i < documents.size(); ++i) {
    EXPECT_EQ(documents[i].get_integer("n"), static_cast<int64_t>(i));
  }
  EXPECT_EQ(store->count("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{1}}}), 1u);
  EXPECT_EQ(store->count("chunks"), 4u);
}

TEST_F(DirectoryStoreTest, IndexedQueriesIgnoreOtherPartitions) {
  store->create_index("chunks", {"files_id", "n"});
  store->insert_one("chunks", bson::Document{{"files_id", "good"}, {"n", int32_t{0}}});
  std::set<std::filesystem::path> before = document_files("chunks");
  store->insert_one("chunks", bson::Document{{"files_id", "bad"}, {"n", int32_t{0}}});

  for (const auto& path : document_files("chunks")) {
    if (before.count(path) == 0) {
      std::ofstream(path, std::ios::binary | std::ios::trunc) << "garbage";
    }
  }

  EXPECT_EQ(collect(store->find("chunks", bson::Document{{"files_id", "good"}}, "n")).size(), 1u);
  auto bad = store->find("chunks", bson::Document{{"files_id", "bad"}}, "n");
  EXPECT_THROW(bad->has_next(), StoreError);
  // Removal by partition does not decode the documents
  EXPECT_EQ(store->delete_many("chunks", bson::Document{{"files_id", "bad"}}), 1u);
  EXPECT_EQ(store->count("chunks"), 1u);
}

TEST_F(DirectoryStoreTest, IndexRejectsDuplicateAndInvalidKeys) {
  store->create_index("chunks", {"files_id", "n"});
  store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{0}}});

  EXPECT_THROW(store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int64_t{0}}}), StoreError);
  EXPECT_THROW(store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{-1}}}), StoreError);
  EXPECT_THROW(store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", "one"}}), StoreError);
  EXPECT_THROW(store->insert_one("chunks", bson::Document{{"n", int32_t{3}}}), StoreError);
  EXPECT_EQ(store->count("chunks"), 1u);
}

TEST_F(DirectoryStoreTest, CreateIndexRules) {
  EXPECT_THROW(store->create_index("chunks", {}), StoreError);
  EXPECT_THROW(store->create_index("chunks", {"a", "b", "c"}), StoreError);

  store->create_index("chunks", {"files_id", "n"});
  EXPECT_NO_THROW(store->create_index("chunks", {"files_id", "n"}));
  EXPECT_THROW(store->create_index("chunks", {"owner"}), StoreError);

  store->insert_one("items", bson::Document{{"_id", int32_t{1}}});
  EXPECT_THROW(store->create_index("items", {"owner"}), StoreError);
}

TEST_F(DirectoryStoreTest, IndexSurvivesReopen) {
  store->create_index("chunks", {"files_id", "n"});
  store->insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{0}}});
  store.reset();

  DirectoryStore reopened(dir->string());
  EXPECT_THROW(reopened.insert_one("chunks", bson::Document{{"files_id", "f"}, {"n", int32_t{0}}}), StoreError);
  EXPECT_EQ(reopened.count("chunks", bson::Document{{"files_id", "f"}}), 1u);
}

TEST_F(DirectoryStoreTest, SurvivesReopen) {
  store->insert_one("items", bson::Document{{"_id", "persistent"}, {"value", 1.5}});
  store.reset();

  DirectoryStore reopened(dir->string());
  auto found = reopened.find_one("items", bson::Document{{"_id", "persistent"}});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->get("value").as<double>(), 1.5);
}

TEST_F(DirectoryStoreTest, ConcurrentInserts) {
  const int num_threads = 8;
  const int per_thread = 10;
  std::vector<std::thread> threads;

  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < per_thread; ++i) {
        store->insert_one("items", bson::Document{{"thread", int32_t{t}}, {"i", int32_t{i}}});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(store->count("items"), static_cast<std::size_t>(num_threads * per_thread));
}
