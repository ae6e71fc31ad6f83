#ifndef FILECLIENT_NETWORK_REQUEST_CHANNEL_HPP
#define FILECLIENT_NETWORK_REQUEST_CHANNEL_HPP

#include <string>
#include "network_error.hpp"

namespace fileclient {
namespace network {

// Blocking request/reply primitive towards the master
class RequestChannel {
public:
    virtual ~RequestChannel() = default;

    // Sends one request and waits for its reply. Each of the tries is bounded
    // by timeout_seconds; throws TransportTimeoutError once all of them failed.
    virtual std::string send(const std::string& kind, const std::string& payload,
                             int tries, int timeout_seconds) = 0;
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_REQUEST_CHANNEL_HPP
