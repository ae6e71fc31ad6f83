#ifndef FILECLIENT_CLIENT_LOCAL_BACKEND_HPP
#define FILECLIENT_CLIENT_LOCAL_BACKEND_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "file_backend.hpp"
#include "config/config.hpp"

namespace fileclient {
namespace client {

// Serves files straight out of the configured file_roots, no master involved.
// Roots are searched in declaration order; listings concatenate the roots
// without removing duplicates.
class LocalBackend : public FileBackend {
public:

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit LocalBackend(const config::Config& config);
    ~LocalBackend() override = default;


    // ---- FETCHING ----
    // Returns the path inside the root, nothing is copied. dest, makedirs
    // and gzip are ignored.
    FetchResult get_file(const std::string& path, const std::string& dest, bool makedirs,
                         const std::string& env, int gzip) override;
    // First root holding path as a regular file
    std::optional<std::filesystem::path> find_file(const std::string& path, const std::string& env) const;


    // ---- LISTINGS ----
    Listing file_list(const std::string& env) override;
    Listing dir_list(const std::string& env) override;
    Listing file_list_emptydirs(const std::string& env) override;
    Listing list_env(const std::string& env) override;


    // ---- METADATA ----
    std::optional<crypto::DigestRecord> hash_file(const std::string& path, const std::string& env) override;
    std::optional<network::Load> master_opts() override;
    // Runs the external_nodes command with the minion id and reads its YAML
    std::optional<network::StringListMap> ext_nodes() override;

    // Parses external nodes output, empty map for shapes it does not know
    static network::StringListMap parse_ext_nodes(const std::string& yaml);

private:
    // Relative paths found under one root
    struct RootWalk {
        std::vector<std::string> files;
        std::vector<std::string> dirs;
        std::vector<std::string> empty_dirs;
    };

    // ---- PARAMETERS ----
    config::Config config_;


    // ---- UTILITY METHODS ----
    const std::vector<std::string>* roots_for(const std::string& env) const;
    std::vector<RootWalk> walk_roots(const std::string& env) const;
    static RootWalk walk_root(const std::filesystem::path& root);
};

} // namespace client
} // namespace fileclient

#endif // FILECLIENT_CLIENT_LOCAL_BACKEND_HPP
