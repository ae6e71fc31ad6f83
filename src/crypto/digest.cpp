#include "crypto/digest.hpp"
#include "errors/minion_error.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fileclient::crypto {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

std::string hex_digest(std::istream& input, const std::string& hash_type) {
  const EVP_MD* md = EVP_get_digestbyname(hash_type.c_str());
  if (!md) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Unknown hash type: " << hash_type;
    throw UnsupportedDigestError(hash_type);
  }

  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw CryptoError("Digest: Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
    throw CryptoError("Digest: Failed to initialize hash context");
  }

  std::array<char, 8192> buffer;
  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    if (!EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(input.gcount()))) {
      throw CryptoError("Digest: Failed to update hash");
    }
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw CryptoError("Digest: Failed to finalize hash");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string hex_digest_of(const std::string& data, const std::string& hash_type) {
  std::istringstream input(data);
  return hex_digest(input, hash_type);
}

DigestRecord digest_file(const std::filesystem::path& path, const std::string& hash_type) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "Digest: Specified file " << path.string()
                               << " is not present to generate hash";
    throw errors::FileNotFoundError("Specified file " + path.string() + " is not present to generate hash");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw errors::FileNotFoundError("Failed to open " + path.string());
  }

  DigestRecord record{hash_type, hex_digest(file, hash_type)};
  BOOST_LOG_TRIVIAL(debug) << "Digest: " << hash_type << " of " << path.string() << ": " << record.hsum;
  return record;
}

bool verify_file(const std::filesystem::path& path, const DigestRecord& expected) {
  return digest_file(path, expected.hash_type).hsum == expected.hsum;
}

} // namespace fileclient::crypto
