#ifndef GRIDFS_CONFIG_HPP
#define GRIDFS_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "bson/value.hpp"

namespace gridfs {
namespace config {

// Default bytes per chunk (255 KiB)
constexpr int32_t DEFAULT_CHUNK_SIZE = 255 * 1024;
// Default budget for one chunk batch insert (16 MiB)
constexpr std::size_t DEFAULT_MAX_BATCH_BYTES = 16 * 1024 * 1024;

struct BucketOptions {
  std::string bucket_name = "fs";
  int32_t chunk_size_bytes = DEFAULT_CHUNK_SIZE;
  std::size_t max_batch_bytes = DEFAULT_MAX_BATCH_BYTES;
};

// Legacy and side-channel file document fields. Absent slots are not written.
struct FileExtras {
  std::optional<std::string> content_type;
  std::optional<bson::Document> metadata;
  std::optional<std::vector<std::string>> aliases;

  bool operator==(const FileExtras& other) const {
    return content_type == other.content_type && metadata == other.metadata
        && aliases == other.aliases;
  }
};

struct UploadOptions {
  // Falls back to BucketOptions::chunk_size_bytes when unset
  std::optional<int32_t> chunk_size_bytes;
  FileExtras extras;
};

// Throws std::invalid_argument describing the first invalid field
void validate(const BucketOptions& options);


// ---- SHELL CONFIGURATION ----
struct ShellConfig {
  std::string store_path = "gridfs_store";
  BucketOptions bucket;
  std::string log_file = "gridfs_shell.log";
  std::string log_level = "info";
  bool valid{false};
};

void print_usage(const std::string& program_name);
// Parses command line flags; on error prints usage and returns an invalid config
ShellConfig parse_command_line(int argc, const char* const argv[]);

} // namespace config
} // namespace gridfs

#endif // GRIDFS_CONFIG_HPP
