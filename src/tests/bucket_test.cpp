#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>
#include "bucket/bucket.hpp"
#include "crypto/digest.hpp"
#include "store/directory_store.hpp"
#include "test_utils.hpp"

using namespace gridfs;
using namespace gridfs::bucket;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class BucketTest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::unique_ptr<store::DirectoryStore> store;
  std::unique_ptr<Bucket> bucket;

  void SetUp() override {
    init_test_logging();
    dir = std::make_unique<TempDir>("bucket_test");
    store = std::make_unique<store::DirectoryStore>(dir->string());
    config::BucketOptions options;
    options.chunk_size_bytes = 8;
    bucket = std::make_unique<Bucket>(*store, options);
  }

  bson::Value put(const std::string& filename, const std::string& content) {
    std::istringstream source(content);
    return bucket->upload_from_stream(filename, source);
  }

  std::string get(const bson::Value& id) {
    std::ostringstream destination;
    bucket->download_to_stream(id, destination);
    return destination.str();
  }

  // Document files currently stored for the chunks collection
  std::set<std::filesystem::path> chunk_files() const {
    std::set<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir->path() / bucket->chunks_collection())) {
      if (entry.is_regular_file() && entry.path().extension() == ".bson") {
        files.insert(entry.path());
      }
    }
    return files;
  }
};

TEST_F(BucketTest, CollectionNames) {
  EXPECT_EQ(bucket->files_collection(), "fs.files");
  EXPECT_EQ(bucket->chunks_collection(), "fs.chunks");

  config::BucketOptions options;
  options.bucket_name = "photos";
  Bucket photos(*store, options);
  EXPECT_EQ(photos.files_collection(), "photos.files");
  EXPECT_EQ(photos.chunks_collection(), "photos.chunks");
}

TEST_F(BucketTest, RejectsInvalidOptions) {
  config::BucketOptions options;
  options.chunk_size_bytes = 0;
  EXPECT_THROW({ Bucket invalid(*store, options); }, UsageError);

  options = config::BucketOptions{};
  options.bucket_name.clear();
  EXPECT_THROW({ Bucket invalid(*store, options); }, UsageError);
}

TEST_F(BucketTest, UploadAndDownload) {
  const std::string content = "The quick brown fox jumps over the lazy dog";
  bson::Value id = put("fox.txt", content);

  EXPECT_TRUE(id.is<bson::ObjectId>());
  EXPECT_EQ(get(id), content);

  auto file = bucket->find_file(id);
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->filename, "fox.txt");
  EXPECT_EQ(file->length, static_cast<int64_t>(content.size()));
  EXPECT_EQ(file->chunk_size, 8);
  EXPECT_EQ(file->md5, crypto::Digest::hex(crypto::Digest::Algorithm::MD5, content));
  EXPECT_EQ(store->count(bucket->chunks_collection()), 6u);
}

TEST_F(BucketTest, UploadWithCustomIdAndOptions) {
  config::UploadOptions options;
  options.chunk_size_bytes = 3;
  options.extras.content_type = "text/plain";

  std::istringstream source("abcdefg");
  bucket->upload_from_stream_with_id("custom-id", "letters.txt", source, options);

  auto file = bucket->find_file("custom-id");
  ASSERT_TRUE(file.has_value());
  EXPECT_EQ(file->chunk_size, 3);
  EXPECT_EQ(file->chunk_count(), 3);
  EXPECT_EQ(file->extras.content_type, std::optional<std::string>("text/plain"));
  EXPECT_EQ(get("custom-id"), "abcdefg");
}

TEST_F(BucketTest, EmptyUpload) {
  bson::Value id = put("empty.bin", "");
  EXPECT_EQ(get(id), "");
  EXPECT_EQ(bucket->find_file(id)->length, 0);
  EXPECT_EQ(store->count(bucket->chunks_collection()), 0u);
}

TEST_F(BucketTest, StreamFactories) {
  auto upload = bucket->open_upload_stream("stream.txt");
  upload->write("hello world", 11);
  upload->close();
  bson::Value id = upload->id();

  auto download = bucket->open_download_stream(id);
  EXPECT_EQ(download->read(5), "hello");
  EXPECT_EQ(download->read_all(), " world");
  download->close();

  EXPECT_THROW(bucket->open_upload_stream_with_id(bson::Value(), "null.txt"), UsageError);
  config::UploadOptions bad;
  bad.chunk_size_bytes = -1;
  EXPECT_THROW(bucket->open_upload_stream("bad.txt", bad), UsageError);
}

TEST_F(BucketTest, OpenMissingFile) {
  EXPECT_THROW(bucket->open_download_stream(bson::ObjectId::generate()), FileNotFoundError);
  EXPECT_THROW(bucket->open_download_stream(bson::Value()), UsageError);

  std::ostringstream destination;
  EXPECT_THROW(bucket->download_to_stream("missing", destination), FileNotFoundError);
}

TEST_F(BucketTest, UnpublishedFileIsInvisible) {
  auto upload = bucket->open_upload_stream_with_id("pending", "pending.txt");
  upload->write("0123456789abcdef0123", 20);
  EXPECT_FALSE(bucket->find_file("pending").has_value());
  EXPECT_THROW(bucket->open_download_stream("pending"), FileNotFoundError);

  upload->abort();
  EXPECT_EQ(store->count(bucket->chunks_collection()), 0u);
}

TEST_F(BucketTest, DeleteFile) {
  bson::Value keep = put("keep.txt", "keep me around");
  bson::Value drop = put("drop.txt", "drop me please");

  bucket->delete_file(drop);
  EXPECT_FALSE(bucket->find_file(drop).has_value());
  EXPECT_EQ(store->count(bucket->chunks_collection(), bson::Document{{"files_id", drop}}), 0u);
  EXPECT_EQ(get(keep), "keep me around");

  EXPECT_THROW(bucket->delete_file(drop), FileNotFoundError);
}

TEST_F(BucketTest, DeleteRemovesOrphanedChunks) {
  // Flush chunks without publishing the file document
  config::BucketOptions options;
  options.chunk_size_bytes = 8;
  options.max_batch_bytes = 1;
  Bucket small_batches(*store, options);
  auto orphaned = small_batches.open_upload_stream_with_id("orphan", "orphan.txt");
  orphaned->write("0123456789abcdef", 16);

  bson::Document filter{{"files_id", "orphan"}};
  EXPECT_EQ(store->count(bucket->chunks_collection(), filter), 2u);
  EXPECT_THROW(bucket->delete_file("orphan"), FileNotFoundError);
  EXPECT_EQ(store->count(bucket->chunks_collection(), filter), 0u);
  orphaned->abort();
}

TEST_F(BucketTest, FindFiles) {
  put("a.txt", "a");
  put("b.txt", "bb");
  put("a.txt", "aaa");

  EXPECT_EQ(bucket->find().size(), 3u);
  auto named = bucket->find(bson::Document{{"filename", "a.txt"}});
  ASSERT_EQ(named.size(), 2u);
  for (const auto& file : named) {
    EXPECT_EQ(file.filename, "a.txt");
  }
  EXPECT_TRUE(bucket->find(bson::Document{{"filename", "none"}}).empty());
}

TEST_F(BucketTest, Drop) {
  put("a.txt", "some content here");
  put("b.txt", "other content here");

  bucket->drop();
  EXPECT_TRUE(bucket->find().empty());
  EXPECT_EQ(store->count(bucket->chunks_collection()), 0u);
  EXPECT_NO_THROW(bucket->drop());
}

TEST_F(BucketTest, FailedUploadIsAborted) {
  NiceMock<MockDocumentStore> mock;
  mock.delegate_to(*store);
  config::BucketOptions options;
  options.chunk_size_bytes = 4;
  options.max_batch_bytes = 1;
  Bucket failing(mock, options);

  EXPECT_CALL(mock, insert_many(failing.chunks_collection(), _))
    .WillOnce(::testing::DoDefault())
    .WillOnce(Throw(store::StoreError("disk full")));
  EXPECT_CALL(mock, delete_many(failing.chunks_collection(), _)).Times(1);

  std::istringstream source("0123456789");
  EXPECT_THROW(failing.upload_from_stream_with_id("doomed", "doomed.txt", source), StorageError);
  EXPECT_EQ(store->count(failing.chunks_collection()), 0u);
  EXPECT_FALSE(failing.find_file("doomed").has_value());
}

TEST_F(BucketTest, FileQueryFailure) {
  NiceMock<MockDocumentStore> mock;
  Bucket failing(mock);
  EXPECT_CALL(mock, find(failing.files_collection(), _, _)).WillRepeatedly(Throw(store::StoreError("offline")));

  try {
    failing.open_download_stream("anything");
    FAIL() << "open_download_stream should have thrown";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.phase(), StorageError::Phase::FileQuery);
  }
  EXPECT_THROW(failing.find(), StorageError);
}

TEST_F(BucketTest, CorruptChunkOnlyAffectsItsOwnFile) {
  config::BucketOptions options;
  options.chunk_size_bytes = 4;
  Bucket small(*store, options);

  std::istringstream first("abcdefghij");
  bson::Value healthy = small.upload_from_stream("healthy.txt", first);
  std::set<std::filesystem::path> before = chunk_files();

  std::istringstream second("zzzzzzzz");
  bson::Value damaged = small.upload_from_stream("damaged.txt", second);
  std::set<std::filesystem::path> after = chunk_files();
  ASSERT_EQ(after.size(), before.size() + 2);

  for (const auto& path : after) {
    if (before.count(path) == 0) {
      std::filesystem::resize_file(path, 3);
      break;
    }
  }

  auto stream = small.open_download_stream(healthy);
  EXPECT_EQ(stream->read_all(), "abcdefghij");

  try {
    small.open_download_stream(damaged)->read_all();
    FAIL() << "read_all should have thrown";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.phase(), StorageError::Phase::ChunkQuery);
  }

  // Deleting the damaged file does not decode its chunks
  EXPECT_NO_THROW(small.delete_file(damaged));
  EXPECT_EQ(store->count(small.chunks_collection(), bson::Document{{"files_id", damaged}}), 0u);
  EXPECT_EQ(store->count(small.chunks_collection(), bson::Document{{"files_id", healthy}}), 3u);
}

TEST_F(BucketTest, ChunksArePartitionedByFile) {
  bson::Value first = put("first.txt", "0123456789abcdef0123");
  bson::Value second = put("second.txt", "xyz");

  // Chunks of one file share a directory named after its files_id
  std::set<std::filesystem::path> directories;
  for (const auto& path : chunk_files()) {
    directories.insert(path.parent_path());
  }
  EXPECT_EQ(directories.size(), 2u);

  NiceMock<MockDocumentStore> mock;
  mock.delegate_to(*store);
  EXPECT_CALL(mock, create_index(bucket->chunks_collection(),
                                 std::vector<std::string>{"files_id", "n"})).Times(1);
  Bucket reopened(mock);
  EXPECT_EQ(reopened.open_download_stream(first)->read_all(), "0123456789abcdef0123");
  EXPECT_EQ(reopened.open_download_stream(second)->read_all(), "xyz");
}

TEST_F(BucketTest, DropKeepsChunkIndex) {
  put("before.txt", "content before drop");
  bucket->drop();

  bson::Value id = put("after.txt", "content after drop");
  EXPECT_EQ(get(id), "content after drop");
  EXPECT_TRUE(std::filesystem::exists(dir->path() / bucket->chunks_collection() / ".index"));
}

TEST_F(BucketTest, IndexSetupFailure) {
  NiceMock<MockDocumentStore> mock;
  EXPECT_CALL(mock, create_index(_, _)).WillOnce(Throw(store::StoreError("read-only")));

  try {
    Bucket failing(mock);
    FAIL() << "constructor should have thrown";
  } catch (const StorageError& e) {
    EXPECT_EQ(e.phase(), StorageError::Phase::IndexSetup);
  }
}
