#ifndef FILECLIENT_CLIENT_REMOTE_BACKEND_HPP
#define FILECLIENT_CLIENT_REMOTE_BACKEND_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include "file_backend.hpp"
#include "config/config.hpp"
#include "network/master_channel.hpp"
#include "store/cache_store.hpp"

namespace fileclient {
namespace client {

// Destination file of one remote fetch. The handle is closed when the
// session goes away, whichever way the fetch ends.
class FetchSession {
public:
    FetchSession() = default;
    ~FetchSession();

    FetchSession(const FetchSession&) = delete;
    FetchSession& operator=(const FetchSession&) = delete;

    // Opens dest truncated, throws store::StoreError when it cannot be created
    void open(const std::filesystem::path& dest);
    void write(const std::string& data);
    void flush();
    void close();
    // Truncates the file and starts over from offset zero
    void restart();

    bool is_open() const { return output_.is_open(); }
    // Bytes written so far, sent to the master as the next loc
    uint64_t offset() const { return offset_; }
    const std::filesystem::path& dest() const { return dest_; }

    int attempts() const { return attempts_; }
    void count_attempt() { ++attempts_; }

private:
    std::filesystem::path dest_;
    std::ofstream output_;
    uint64_t offset_ = 0;
    int attempts_ = 0;
};

// Fetches and lists through the master
class RemoteBackend : public FileBackend {
public:
    // Downloads verified per fetch before an unverified file is accepted
    static constexpr int MAX_VERIFY_ATTEMPTS = 3;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    RemoteBackend(const config::Config& config, std::unique_ptr<network::MasterChannel> master);
    ~RemoteBackend() override = default;


    // ---- FETCHING ----
    // Streams the file chunk by chunk. Without dest the master's dest picks
    // the place under <cachedir>/files/<env>.
    FetchResult get_file(const std::string& path, const std::string& dest, bool makedirs,
                         const std::string& env, int gzip) override;


    // ---- LISTINGS ----
    Listing file_list(const std::string& env) override;
    Listing dir_list(const std::string& env) override;
    Listing file_list_emptydirs(const std::string& env) override;
    Listing list_env(const std::string& env) override;


    // ---- METADATA ----
    std::optional<crypto::DigestRecord> hash_file(const std::string& path, const std::string& env) override;
    std::optional<network::Load> master_opts() override;
    std::optional<network::StringListMap> ext_nodes() override;

private:
    // ---- PARAMETERS ----
    config::Config config_;
    std::unique_ptr<network::MasterChannel> master_;
    store::CacheStore store_;


    // ---- UTILITY METHODS ----
    // One _file_list style request, disengaged on timeout
    Listing list_command(const std::string& command, const std::string& env);
    // Opens the session on a cache path, clearing a directory cached there before
    void open_cache_destination(FetchSession& session, const std::string& env, const std::string& relative);
};

} // namespace client
} // namespace fileclient

#endif // FILECLIENT_CLIENT_REMOTE_BACKEND_HPP
