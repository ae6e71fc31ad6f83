#pragma once

#include <iostream>
#include <string>
#include "client/client.hpp"

namespace fileclient {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::Client& client, const std::string& env,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    void run();

    const std::string& get_env() const { return env_; }

private:
    // ---- PARAMETERS ----
    bool running_;
    std::string env_;
    // System components
    client::Client& client_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& first, const std::string& second);
    void handle_get_file_command(const std::string& path, const std::string& dest);
    void handle_get_dir_command(const std::string& path, const std::string& dest);
    void handle_get_url_command(const std::string& url, const std::string& dest);
    void handle_hash_command(const std::string& path);
    void handle_get_state_command(const std::string& sls);
    void handle_help_command();
    void print_path(const std::string& path, const std::string& missing_message);
    void print_listing(const client::Listing& listing);
    void print_paths(const std::vector<std::string>& paths);
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fileclient
