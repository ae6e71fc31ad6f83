#ifndef FILECLIENT_CONFIG_CONFIG_HPP
#define FILECLIENT_CONFIG_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "network/load.hpp"

namespace fileclient {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// Options shared by every component. Built once and handed out by value or
// const reference, nothing writes to it afterwards.
struct Config {
    std::filesystem::path cachedir = "/var/cache/fileclient";
    // "remote" or "local", anything else is treated as remote
    std::string file_client = "remote";
    // environment -> ordered roots, earlier roots win
    std::map<std::string, std::vector<std::string>> file_roots = {{"base", {"/srv/salt"}}};
    std::string hash_type = "md5";
    std::string external_nodes;
    std::string id;
    std::string master = "salt";
    uint16_t master_port = 4506;
    std::filesystem::path key_file;
    int request_tries = 3;
    int request_timeout = 60;
    std::string log_file;
    std::string log_level = "warning";

    bool is_local() const { return file_client == "local"; }
};

// Reads a YAML mapping, keys left out keep their defaults. Throws ConfigError.
Config load_config(const std::filesystem::path& path);
Config parse_config(const std::string& yaml);

// Wire form of the options, answered by master_opts in local mode
network::Load to_load(const Config& config);

} // namespace config
} // namespace fileclient

#endif // FILECLIENT_CONFIG_CONFIG_HPP
