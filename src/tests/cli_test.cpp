#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <fstream>
#include <memory>
#include <sstream>
#include "cli/cli.hpp"
#include "store/directory_store.hpp"
#include "test_utils.hpp"

using namespace gridfs;
using ::testing::HasSubstr;

class CLITest : public ::testing::Test {
protected:
  std::unique_ptr<TempDir> dir;
  std::unique_ptr<store::DirectoryStore> store;
  std::unique_ptr<bucket::Bucket> bucket;
  std::istringstream input;
  std::ostringstream output;
  std::unique_ptr<cli::CLI> shell;

  void SetUp() override {
    init_test_logging();
    dir = std::make_unique<TempDir>("cli_test");
    store = std::make_unique<store::DirectoryStore>((dir->path() / "store").string());
    config::BucketOptions options;
    options.chunk_size_bytes = 4;
    bucket = std::make_unique<bucket::Bucket>(*store, options);
    shell = std::make_unique<cli::CLI>(*bucket, input, output);
  }

  std::string local_file(const std::string& name, const std::string& content) {
    auto path = dir->path() / name;
    std::ofstream(path, std::ios::binary) << content;
    return path.string();
  }

  // Runs one command and returns what it printed
  std::string run(const std::string& line) {
    output.str("");
    EXPECT_TRUE(shell->execute(line));
    return output.str();
  }
};

TEST_F(CLITest, PutListCatAndRemove) {
  std::string path = local_file("notes.txt", "one\ntwo\nthree\n");
  EXPECT_THAT(run("put " + path + " renamed.txt"), HasSubstr("Stored renamed.txt as "));

  auto files = bucket->find();
  ASSERT_EQ(files.size(), 1u);
  std::string id = files[0].id.to_string();

  EXPECT_THAT(run("ls"), HasSubstr("renamed.txt"));
  EXPECT_EQ(run("cat " + id), "one\ntwo\nthree\n\n");
  EXPECT_EQ(run("head " + id + " 2"), "one\ntwo\n");

  EXPECT_THAT(run("rm " + id), HasSubstr("File deleted successfully"));
  EXPECT_THAT(run("ls"), HasSubstr("No files"));
  EXPECT_THAT(run("rm " + id), HasSubstr("Error deleting file"));
}

TEST_F(CLITest, PutUsesLocalFilename) {
  std::string path = local_file("report.csv", "a,b\n1,2\n");
  run("put " + path);
  auto files = bucket->find();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].filename, "report.csv");
}

TEST_F(CLITest, GetWritesLocalFile) {
  std::istringstream source("downloaded content");
  bucket->upload_from_stream_with_id("named-id", "remote.txt", source);

  std::string target = (dir->path() / "copy.txt").string();
  EXPECT_THAT(run("get named-id " + target), HasSubstr("Saved"));

  std::ifstream file(target, std::ios::binary);
  std::stringstream content;
  content << file.rdbuf();
  EXPECT_EQ(content.str(), "downloaded content");
}

TEST_F(CLITest, ReportsErrors) {
  EXPECT_THAT(run("cat 5f1d7a2b9c0e4d3f2a1b0c9d"), HasSubstr("Error reading file"));
  EXPECT_THAT(run("put /nonexistent/file.txt"), HasSubstr("Error opening file"));
  EXPECT_THAT(run("head some-id lots"), HasSubstr("Invalid line count"));
  EXPECT_THAT(run("frobnicate"), HasSubstr("Unknown command"));
  EXPECT_THAT(run("cat"), HasSubstr("Unknown command"));
}

TEST_F(CLITest, DropAndHelp) {
  run("put " + local_file("a.txt", "aaaa"));
  EXPECT_THAT(run("drop"), HasSubstr("dropped"));
  EXPECT_TRUE(bucket->find().empty());
  EXPECT_THAT(run("help"), HasSubstr("put <local> [name]"));
}

TEST_F(CLITest, RunLoopStopsOnQuit) {
  input.str("help\nquit\nls\n");
  shell->run();
  EXPECT_THAT(output.str(), HasSubstr("Available commands"));
  EXPECT_THAT(output.str(), ::testing::Not(HasSubstr("No files")));
  EXPECT_FALSE(shell->execute("quit"));
}

TEST(ParseFileIdTest, ObjectIdOrString) {
  EXPECT_TRUE(cli::CLI::parse_file_id("5f1d7a2b9c0e4d3f2a1b0c9d").is<bson::ObjectId>());
  EXPECT_EQ(cli::CLI::parse_file_id("plain-name"), bson::Value("plain-name"));
}
