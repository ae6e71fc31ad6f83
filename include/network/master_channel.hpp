#ifndef FILECLIENT_NETWORK_MASTER_CHANNEL_HPP
#define FILECLIENT_NETWORK_MASTER_CHANNEL_HPP

#include <memory>
#include <string>
#include "codec.hpp"
#include "load.hpp"
#include "request_channel.hpp"
#include "crypto/crypticle.hpp"

namespace fileclient {
namespace network {

// Authenticated request/reply with the master: every load is serialized,
// encrypted, sent as an "aes" request, and the reply is decrypted and
// deserialized the same way.
class MasterChannel {
public:
    static constexpr const char* REQUEST_KIND = "aes";
    static constexpr int DEFAULT_TRIES = 3;
    static constexpr int DEFAULT_TIMEOUT = 60;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    MasterChannel(std::unique_ptr<RequestChannel> channel,
                  std::unique_ptr<crypto::Crypticle> crypticle,
                  int tries = DEFAULT_TRIES,
                  int timeout_seconds = DEFAULT_TIMEOUT);

    MasterChannel(const MasterChannel&) = delete;
    MasterChannel& operator=(const MasterChannel&) = delete;


    // ---- REQUEST OPERATIONS ----
    // Throws TransportTimeoutError when the master cannot be reached
    Load query(const Load& request);

    int get_tries() const { return tries_; }
    int get_timeout() const { return timeout_seconds_; }

private:
    // ---- PARAMETERS ----
    std::unique_ptr<RequestChannel> channel_;
    std::unique_ptr<crypto::Crypticle> crypticle_;
    Codec codec_;
    int tries_;
    int timeout_seconds_;
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_MASTER_CHANNEL_HPP
