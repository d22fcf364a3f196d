#include "cli/cli.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace gridfs {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(bucket::Bucket& bucket, std::istream& in, std::ostream& out)
  : running_(false)
  , bucket_(bucket)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for bucket " << bucket_.options().bucket_name;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "GridFS_Shell> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "GridFS_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit" || command == "exit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put" && (args.size() == 1 || args.size() == 2)) {
    handle_put_command(args);
  }
  else if (command == "get" && args.size() == 2) {
    handle_get_command(args);
  }
  else if (command == "cat" && args.size() == 1) {
    handle_cat_command(args);
  }
  else if (command == "head" && (args.size() == 1 || args.size() == 2)) {
    handle_head_command(args);
  }
  else if (command == "ls" && args.empty()) {
    handle_list_command();
  }
  else if (command == "rm" && args.size() == 1) {
    handle_delete_command(args);
  }
  else if (command == "drop" && args.empty()) {
    handle_drop_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
  }
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  const std::string& local_path = args[0];
  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << local_path << std::endl;
    return;
  }

  std::string name = args.size() == 2 ? args[1] : std::filesystem::path(local_path).filename().string();
  try {
    bson::Value id = bucket_.upload_from_stream(name, file);
    out_ << "Stored " << name << " as " << id.to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  std::ofstream file(args[1], std::ios::binary | std::ios::trunc);
  if (!file) {
    out_ << "Error opening file: " << args[1] << std::endl;
    return;
  }

  try {
    bucket_.download_to_stream(parse_file_id(args[0]), file);
    out_ << "Saved " << args[0] << " to " << args[1] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_cat_command(const std::vector<std::string>& args) {
  try {
    bucket_.download_to_stream(parse_file_id(args[0]), out_);
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_head_command(const std::vector<std::string>& args) {
  std::size_t lines = 10;
  if (args.size() == 2) {
    try {
      lines = static_cast<std::size_t>(std::stoul(args[1]));
    } catch (const std::exception&) {
      out_ << "Invalid line count: " << args[1] << std::endl;
      return;
    }
  }

  try {
    auto stream = bucket_.open_download_stream(parse_file_id(args[0]));
    for (std::size_t i = 0; i < lines; ++i) {
      std::string line = stream->read_line();
      if (line.empty()) {
        break;
      }
      out_ << line;
      if (line.back() != '\n') {
        out_ << std::endl;
      }
    }
    stream->close();
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    auto files = bucket_.find();
    if (files.empty()) {
      out_ << "No files in bucket " << bucket_.options().bucket_name << std::endl;
      return;
    }
    for (const auto& file : files) {
      out_ << std::left << std::setw(26) << file.id.to_string()
           << std::right << std::setw(12) << file.length << "  "
           << file.md5 << "  " << file.filename << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing files", e.what());
  }
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  try {
    bucket_.delete_file(parse_file_id(args[0]));
    out_ << "File deleted successfully" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting file", e.what());
  }
}

void CLI::handle_drop_command() {
  try {
    bucket_.drop();
    out_ << "Bucket " << bucket_.options().bucket_name << " dropped" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error dropping bucket", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                 Display this help message" << std::endl;
  out_ << "  put <local> [name]   Upload local file, optionally under another name" << std::endl;
  out_ << "  get <id> <local>     Download file <id> to local path" << std::endl;
  out_ << "  cat <id>             Print contents of file <id>" << std::endl;
  out_ << "  head <id> [lines]    Print the first lines of file <id> (default 10)" << std::endl;
  out_ << "  ls                   List files in the bucket" << std::endl;
  out_ << "  rm <id>              Delete file <id> and its chunks" << std::endl;
  out_ << "  drop                 Delete every file in the bucket" << std::endl;
  out_ << "  quit                 Exit the GridFS shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}


//==============================================
// UTILITY METHODS
//==============================================

bson::Value CLI::parse_file_id(const std::string& text) {
  if (bson::ObjectId::is_valid_hex(text)) {
    return bson::ObjectId::from_hex(text);
  }
  return text;
}

} // namespace cli
} // namespace gridfs
