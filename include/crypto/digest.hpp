#ifndef FILECLIENT_CRYPTO_DIGEST_HPP
#define FILECLIENT_CRYPTO_DIGEST_HPP

#include <filesystem>
#include <istream>
#include <string>
#include "crypto_error.hpp"

namespace fileclient::crypto {

// Algorithm used for ad hoc local files outside any root
constexpr const char* DEFAULT_HASH_TYPE = "md5";

struct DigestRecord {
  std::string hash_type;
  std::string hsum;

  bool operator==(const DigestRecord& other) const {
    return hash_type == other.hash_type && hsum == other.hsum;
  }
};

// Hex digest of the whole stream. hash_type is an OpenSSL digest name
// ("md5", "sha1", "sha256", ...), throws UnsupportedDigestError otherwise.
std::string hex_digest(std::istream& input, const std::string& hash_type);
std::string hex_digest_of(const std::string& data, const std::string& hash_type);

// Digest of a file, throws errors::FileNotFoundError if it is not a regular file
DigestRecord digest_file(const std::filesystem::path& path, const std::string& hash_type);

bool verify_file(const std::filesystem::path& path, const DigestRecord& expected);

} // namespace fileclient::crypto

#endif // FILECLIENT_CRYPTO_DIGEST_HPP
