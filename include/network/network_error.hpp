#ifndef FILECLIENT_NETWORK_ERROR_HPP
#define FILECLIENT_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fileclient {
namespace network {

enum class NetworkError {
    SUCCESS = 0,
    CONNECTION_FAILED,
    CONNECTION_LOST,
    TIMEOUT,
    MALFORMED_REPLY,
    UNKNOWN_ERROR
};

inline const char* network_error_to_string(NetworkError error) {
    switch (error) {
        case NetworkError::SUCCESS: return "Success";
        case NetworkError::CONNECTION_FAILED: return "Connection failed";
        case NetworkError::CONNECTION_LOST: return "Connection lost";
        case NetworkError::TIMEOUT: return "Timeout";
        case NetworkError::MALFORMED_REPLY: return "Malformed reply";
        case NetworkError::UNKNOWN_ERROR: return "Unknown error";
        default: return "Undefined error";
    }
}

// Every try of a request failed or ran out of time
class TransportTimeoutError : public std::runtime_error {
public:
    TransportTimeoutError(const std::string& message, NetworkError last_error = NetworkError::TIMEOUT)
        : std::runtime_error(message), last_error_(last_error) {}

    NetworkError last_error() const { return last_error_; }

private:
    NetworkError last_error_;
};

} // namespace network
} // namespace fileclient

#endif // FILECLIENT_NETWORK_ERROR_HPP
