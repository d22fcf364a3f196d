#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace gridfs {
namespace config {

void validate(const BucketOptions& options) {
  if (options.bucket_name.empty()) {
    throw std::invalid_argument("bucket name must not be empty");
  }
  if (options.chunk_size_bytes <= 0) {
    throw std::invalid_argument("chunk size must be positive, got "
                                + std::to_string(options.chunk_size_bytes));
  }
  if (options.max_batch_bytes == 0) {
    throw std::invalid_argument("max batch size must be positive");
  }
}

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-d <dir>] [-b <bucket>] [-c <bytes>] [-l <file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -d, --dir         Store directory (default: gridfs_store)\n"
        << "  -b, --bucket      Bucket name (default: fs)\n"
        << "  -c, --chunk-size  Bytes per chunk (default: " << DEFAULT_CHUNK_SIZE << ")\n"
        << "  -l, --log-file    Log file (default: gridfs_shell.log)\n"
        << "  -v, --log-level   trace|debug|info|warning|error (default: info)\n"
        << "Example: " << program_name << " -d ./data -b photos -c 1048576\n";
}

ShellConfig parse_command_line(int argc, const char* const argv[]) {
  const std::unordered_map<std::string, std::string> flag_map = {
    {"-d", "dir"}, {"--dir", "dir"},
    {"-b", "bucket"}, {"--bucket", "bucket"},
    {"-c", "chunk"}, {"--chunk-size", "chunk"},
    {"-l", "log"}, {"--log-file", "log"},
    {"-v", "level"}, {"--log-level", "level"}
  };

  ShellConfig config;
  const std::string program_name = argc > 0 ? argv[0] : "gridfs_shell";

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(program_name);
    return config;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name);
      return config;
    }

    const std::string& name = it->second;
    if (name == "dir") {
      config.store_path = value;
    } else if (name == "bucket") {
      config.bucket.bucket_name = value;
    } else if (name == "log") {
      config.log_file = value;
    } else if (name == "level") {
      try {
        logging::parse_severity(value);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(program_name);
        return config;
      }
      config.log_level = value;
    } else if (name == "chunk") {
      try {
        std::size_t consumed = 0;
        long parsed = std::stol(value, &consumed);
        if (consumed != value.size() || parsed <= 0 || parsed > INT32_MAX) {
          throw std::out_of_range(value);
        }
        config.bucket.chunk_size_bytes = static_cast<int32_t>(parsed);
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid chunk size: " << value << '\n';
        print_usage(program_name);
        return config;
      }
    }
  }

  try {
    validate(config.bucket);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(program_name);
    return config;
  }

  config.valid = true;
  return config;
}

} // namespace config
} // namespace gridfs
