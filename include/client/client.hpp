#ifndef FILECLIENT_CLIENT_CLIENT_HPP
#define FILECLIENT_CLIENT_CLIENT_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "file_backend.hpp"
#include "url_fetcher.hpp"
#include "config/config.hpp"
#include "paths/path_resolver.hpp"
#include "store/cache_store.hpp"
#include "templates/template_registry.hpp"

namespace fileclient {
namespace client {

// A cached state file and the salt:// path it came from
struct StateFile {
    std::string source;
    std::string dest;
};

// Entry point for callers. Operations shared by both backends live here,
// the rest is forwarded to the backend. Soft failures come back as empty
// values; PathSchemeError, ForeignFetchError and I/O errors are thrown.
class Client {
public:

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Client(const config::Config& config, std::unique_ptr<FileBackend> backend);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;


    // ---- FETCHING ----
    FetchResult get_file(const std::string& path, const std::string& dest = "", bool makedirs = false,
                         const std::string& env = paths::DEFAULT_ENV, int gzip = 0);
    // Fetches into the cache, empty when the file could not be had
    std::string cache_file(const std::string& path, const std::string& env = paths::DEFAULT_ENV);
    std::vector<std::string> cache_files(const std::vector<std::string>& paths,
                                         const std::string& env = paths::DEFAULT_ENV);
    // Comma separated list of paths
    std::vector<std::string> cache_files(const std::string& paths, const std::string& env = paths::DEFAULT_ENV);
    // Caches every file the environment lists
    std::vector<std::string> cache_master(const std::string& env = paths::DEFAULT_ENV);
    // Caches the files below a salt:// directory. With include_empty the
    // empty directories below it are created in the cache as well.
    std::vector<std::string> cache_dir(const std::string& path, const std::string& env = paths::DEFAULT_ENV,
                                       bool include_empty = false);
    // Copies a local file into <cachedir>/localfiles
    std::string cache_local_file(const std::string& path);
    // Copies a salt:// directory below dest, keeping its last segment.
    // Returns the created files and directories, sorted.
    std::vector<std::string> get_dir(const std::string& path, const std::string& dest,
                                     const std::string& env = paths::DEFAULT_ENV, int gzip = 0);
    // salt:// goes through get_file, anything else through libcurl
    std::string get_url(const std::string& url, const std::string& dest, bool makedirs = false,
                        const std::string& env = paths::DEFAULT_ENV);
    // Caches url, renders it with the named engine and moves the result to dest
    std::string get_template(const std::string& url, const std::string& dest,
                             const std::string& template_name = "jinja", bool makedirs = false,
                             const std::string& env = paths::DEFAULT_ENV,
                             templates::TemplateParams params = {});


    // ---- STATES ----
    // "a.b" is looked up as salt://a/b.sls, then salt://a/b/init.sls
    std::optional<StateFile> get_state(const std::string& sls, const std::string& env = paths::DEFAULT_ENV);
    std::vector<std::string> list_states(const std::string& env = paths::DEFAULT_ENV);


    // ---- LISTINGS ----
    Listing file_list(const std::string& env = paths::DEFAULT_ENV);
    Listing dir_list(const std::string& env = paths::DEFAULT_ENV);
    Listing file_list_emptydirs(const std::string& env = paths::DEFAULT_ENV);
    Listing list_env(const std::string& env = paths::DEFAULT_ENV);
    // Absolute paths in the files and localfiles caches
    std::vector<std::string> file_local_list(const std::string& env = paths::DEFAULT_ENV);
    std::string is_cached(const std::string& path, const std::string& env = paths::DEFAULT_ENV);


    // ---- METADATA ----
    std::optional<crypto::DigestRecord> hash_file(const std::string& path, const std::string& env = paths::DEFAULT_ENV);
    std::optional<network::Load> master_opts();
    std::optional<network::StringListMap> ext_nodes();


    // ---- GETTERS ----
    templates::TemplateRegistry& get_templates() { return templates_; }
    const store::CacheStore& get_store() const { return store_; }
    const config::Config& get_config() const { return config_; }

private:
    // ---- PARAMETERS ----
    config::Config config_;
    store::CacheStore store_;
    UrlFetcher url_fetcher_;
    templates::TemplateRegistry templates_;
    std::unique_ptr<FileBackend> backend_;


    // ---- UTILITY METHODS ----
    // <cachedir>/extrn_files/<env>/<host>/<path>, nothing is created
    std::filesystem::path external_path(const std::string& env, const paths::Url& url) const;
};

// Builds a client with the backend selected by file_client. The remote
// backend reads its session key from key_file.
std::unique_ptr<Client> make_client(const config::Config& config);

} // namespace client
} // namespace fileclient

#endif // FILECLIENT_CLIENT_CLIENT_HPP
