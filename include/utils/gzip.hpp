#pragma once

#include <string>
#include <stdexcept>

namespace fileclient {
namespace utils {

// gzip framed (RFC 1952) compression of whole chunks, as the master sends
// them when a fetch asks for compression
std::string gzip_compress(const std::string& data, int level = 6);
std::string gzip_uncompress(const std::string& data);

class GzipError : public std::runtime_error {
public:
  explicit GzipError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace utils
} // namespace fileclient
