#ifndef FILECLIENT_NETWORK_TCP_REQUEST_CHANNEL_HPP
#define FILECLIENT_NETWORK_TCP_REQUEST_CHANNEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "request_channel.hpp"

namespace fileclient {
namespace network {

// RequestChannel over plain TCP, one connection per try.
//   request: u64 size || u8 kind_len || kind || payload
//   reply:   u64 size || payload
// Sizes are big endian and count the bytes that follow them.
class TcpRequestChannel : public RequestChannel {
public:
    // Replies larger than this are treated as a broken peer
    static constexpr uint64_t MAX_REPLY_SIZE = 1ULL << 32;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TcpRequestChannel(const std::string& host, uint16_t port);
    ~TcpRequestChannel() override = default;

    TcpRequestChannel(const TcpRequestChannel&) = delete;
    TcpRequestChannel& operator=(const TcpRequestChannel&) = delete;


    // ---- REQUEST OPERATIONS ----
    std::string send(const std::string& kind, const std::string& payload,
                     int tries, int timeout_seconds) override;

    // Builds the request frame, throws std::invalid_argument for kinds over 255 bytes
    static std::string build_frame(const std::string& kind, const std::string& payload);


    // ---- GETTERS ----
    const std::string& get_host() const { return host_; }
    uint16_t get_port() const { return port_; }

private:
    // ---- PARAMETERS ----
    std::string host_;
    uint16_t port_;


    // ---- REQUEST OPERATIONS ----
    // One connect/write/read cycle, empty when it failed or timed out
    std::optional<std::string> exchange(const std::string& frame, int timeout_seconds,
                                        NetworkError& error) const;
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_TCP_REQUEST_CHANNEL_HPP
