#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/directory_store.hpp"
#include <iostream>
#include <string>

bool run_shell(const gridfs::config::ShellConfig& config) {
  try {
    gridfs::logging::init_logging(config.log_file, gridfs::logging::parse_severity(config.log_level));

    gridfs::store::DirectoryStore store(config.store_path);
    gridfs::bucket::Bucket bucket(store, config.bucket);
    gridfs::cli::CLI cli(bucket);

    std::cout << "GridFS shell on " << store.base_path().string() << " (bucket "
              << bucket.options().bucket_name << "). Type 'help' for commands.\n";
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto config = gridfs::config::parse_command_line(argc, argv); !config.valid) {
    return 1;
  } else if (!run_shell(config)) {
    return 1;
  }
  return 0;
}
