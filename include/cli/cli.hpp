#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "bucket/bucket.hpp"

namespace gridfs {
namespace cli {

// Interactive line shell over a single bucket
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(bucket::Bucket& bucket, std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();
    // Runs one command line; returns false once the shell should stop
    bool execute(const std::string& line);


    // ---- UTILITY METHODS ----
    // 24 hex digits name an ObjectId, anything else a string id
    static bson::Value parse_file_id(const std::string& text);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    bucket::Bucket& bucket_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_put_command(const std::vector<std::string>& args);
    void handle_get_command(const std::vector<std::string>& args);
    void handle_cat_command(const std::vector<std::string>& args);
    void handle_head_command(const std::vector<std::string>& args);
    void handle_list_command();
    void handle_delete_command(const std::vector<std::string>& args);
    void handle_drop_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace gridfs
