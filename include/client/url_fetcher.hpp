#ifndef FILECLIENT_CLIENT_URL_FETCHER_HPP
#define FILECLIENT_CLIENT_URL_FETCHER_HPP

#include <filesystem>
#include <string>
#include "paths/path_resolver.hpp"

namespace fileclient {
namespace client {

// Retrieves foreign (non salt://) URLs with libcurl: http, https, ftp, file.
class UrlFetcher {
public:
    // Seconds allowed to establish a connection
    static constexpr long CONNECT_TIMEOUT = 60;

    UrlFetcher();

    // Streams the body of url to dest. Credentials embedded in the URL are
    // removed from the request URL and sent as basic auth instead. Throws
    // errors::ForeignFetchError, no partial file is left behind.
    void fetch(const paths::Url& url, const std::filesystem::path& dest) const;
};

} // namespace client
} // namespace fileclient

#endif // FILECLIENT_CLIENT_URL_FETCHER_HPP
