#ifndef FILECLIENT_CLIENT_FILE_BACKEND_HPP
#define FILECLIENT_CLIENT_FILE_BACKEND_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "crypto/digest.hpp"
#include "network/load.hpp"

namespace fileclient {
namespace client {

enum class FetchStatus {
    OK,
    NOT_FOUND,
    DESTINATION_UNAVAILABLE,   // parent of an explicit dest is missing, makedirs not set
    TIMEOUT                    // master unreachable, partial writes stay on disk
};

inline const char* fetch_status_to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK: return "OK";
        case FetchStatus::NOT_FOUND: return "Not found";
        case FetchStatus::DESTINATION_UNAVAILABLE: return "Destination unavailable";
        case FetchStatus::TIMEOUT: return "Timeout";
        default: return "Undefined status";
    }
}

struct FetchResult {
    FetchStatus status = FetchStatus::NOT_FOUND;
    std::filesystem::path path;

    bool ok() const { return status == FetchStatus::OK; }

    static FetchResult success(const std::filesystem::path& path) { return {FetchStatus::OK, path}; }
    static FetchResult failure(FetchStatus status) { return {status, {}}; }
};

// Root-relative POSIX paths. Disengaged when the master could not be
// reached, which is not the same as an empty listing.
using Listing = std::optional<std::vector<std::string>>;

// Operations that differ between serving from local roots and asking the
// master. Everything else is built on top of these by Client.
class FileBackend {
public:
    virtual ~FileBackend() = default;

    // ---- FETCHING ----
    // gzip is a compression level, 0 turns compression off
    virtual FetchResult get_file(const std::string& path, const std::string& dest, bool makedirs,
                                 const std::string& env, int gzip) = 0;


    // ---- LISTINGS ----
    virtual Listing file_list(const std::string& env) = 0;
    virtual Listing dir_list(const std::string& env) = 0;
    // Directories holding neither files nor subdirectories
    virtual Listing file_list_emptydirs(const std::string& env) = 0;
    virtual Listing list_env(const std::string& env) = 0;


    // ---- METADATA ----
    // A path without salt:// is hashed as a local file with md5 and throws
    // errors::FileNotFoundError when missing. A salt:// path that does not
    // resolve gives nothing.
    virtual std::optional<crypto::DigestRecord> hash_file(const std::string& path, const std::string& env) = 0;
    virtual std::optional<network::Load> master_opts() = 0;
    // environment -> classes of this minion
    virtual std::optional<network::StringListMap> ext_nodes() = 0;
};

} // namespace client
} // namespace fileclient

#endif // FILECLIENT_CLIENT_FILE_BACKEND_HPP
