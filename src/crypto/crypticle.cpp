#include "crypto/crypticle.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fileclient::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Crypticle: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Crypticle::Crypticle(const std::vector<uint8_t>& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypticle: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key size");
  }

  aes_key_.assign(key.begin(), key.begin() + AES_KEY_SIZE);
  hmac_key_.assign(key.begin() + AES_KEY_SIZE, key.end());
  context_ = std::make_unique<CipherContext>();
  BOOST_LOG_TRIVIAL(debug) << "Crypticle: Session keys initialized";
}

Crypticle::~Crypticle() = default;

std::vector<uint8_t> Crypticle::load_key(const std::filesystem::path& key_file) {
  std::ifstream file(key_file);
  if (!file) {
    throw InitializationError("Failed to open key file: " + key_file.string());
  }

  std::string encoded((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  encoded.erase(std::remove_if(encoded.begin(), encoded.end(),
                               [](unsigned char c) { return std::isspace(c); }),
                encoded.end());
  if (encoded.empty() || encoded.size() % 4 != 0) {
    throw InitializationError("Malformed key file: " + key_file.string());
  }

  std::vector<uint8_t> decoded(encoded.size() / 4 * 3);
  const int length = EVP_DecodeBlock(decoded.data(),
                                     reinterpret_cast<const unsigned char*>(encoded.data()),
                                     static_cast<int>(encoded.size()));
  if (length < 0) {
    throw InitializationError("Malformed key file: " + key_file.string());
  }

  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  const auto padding = static_cast<size_t>(std::count(encoded.end() - 2, encoded.end(), '='));
  decoded.resize(static_cast<size_t>(length) - padding);
  return decoded;
}

std::vector<uint8_t> Crypticle::generate_key() {
  std::vector<uint8_t> key(KEY_SIZE);
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw InitializationError("Failed to generate session key");
  }
  return key;
}

std::string Crypticle::encode_key(const std::vector<uint8_t>& key) {
  std::string encoded(4 * ((key.size() + 2) / 3) + 1, '\0');
  const int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                     key.data(), static_cast<int>(key.size()));
  encoded.resize(static_cast<size_t>(length));
  return encoded;
}


//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::string Crypticle::encrypt(const std::string& payload) {
  const auto iv = generate_iv();
  initialize_cipher(iv.data(), true);

  std::stringstream input(payload);
  std::stringstream output;
  output.write(reinterpret_cast<const char*>(iv.data()), iv.size());
  process_stream(input, output, true);

  std::string message = output.str();
  message += sign(message);

  BOOST_LOG_TRIVIAL(trace) << "Crypticle: Encrypted " << payload.size() << " bytes into " << message.size();
  return message;
}

std::string Crypticle::decrypt(const std::string& message) {
  if (message.size() < IV_SIZE + BLOCK_SIZE + MAC_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypticle: Message too short: " << message.size() << " bytes";
    throw DecryptionError("Crypticle: Message too short");
  }

  const std::string signed_part = message.substr(0, message.size() - MAC_SIZE);
  const std::string mac = message.substr(message.size() - MAC_SIZE);
  const std::string expected = sign(signed_part);
  if (CRYPTO_memcmp(mac.data(), expected.data(), MAC_SIZE) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Crypticle: Message signature mismatch";
    throw AuthenticationError("Crypticle: Message signature mismatch");
  }

  initialize_cipher(reinterpret_cast<const uint8_t*>(signed_part.data()), false);

  std::stringstream input(signed_part.substr(IV_SIZE));
  std::stringstream output;
  process_stream(input, output, false);
  return output.str();
}


//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

void Crypticle::initialize_cipher(const uint8_t* iv, bool encrypting) {
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = EVP_aes_256_cbc();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, aes_key_.data(), iv)) {
      throw EncryptionError("Crypticle: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, aes_key_.data(), iv)) {
      throw DecryptionError("Crypticle: Failed to initialize decryption context");
    }
  }
}

void Crypticle::process_stream(std::istream& input, std::ostream& output, bool encrypting) {
  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;

  while (input.read(reinterpret_cast<char*>(inbuf.data()), inbuf.size()) || input.gcount() > 0) {
    const auto bytes_read = static_cast<int>(input.gcount());
    int outlen = 0;

    if (encrypting) {
      if (!EVP_EncryptUpdate(context_->get(), outbuf.data(), &outlen, inbuf.data(), bytes_read)) {
        throw EncryptionError("Crypticle: Failed to encrypt data block");
      }
    } else {
      if (!EVP_DecryptUpdate(context_->get(), outbuf.data(), &outlen, inbuf.data(), bytes_read)) {
        throw DecryptionError("Crypticle: Failed to decrypt data block");
      }
    }
    output.write(reinterpret_cast<const char*>(outbuf.data()), outlen);
  }

  process_final_block(output, encrypting);

  if (!output.good()) {
    throw std::runtime_error("Crypticle: Failed to write to output stream");
  }
}

void Crypticle::process_final_block(std::ostream& output, bool encrypting) {
  std::array<uint8_t, EVP_MAX_BLOCK_LENGTH> outbuf;
  int outlen = 0;

  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf.data(), &outlen)) {
      throw EncryptionError("Crypticle: Failed to finalize encryption");
    }
  } else {
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf.data(), &outlen)) {
      throw DecryptionError("Crypticle: Failed to finalize decryption");
    }
  }
  output.write(reinterpret_cast<const char*>(outbuf.data()), outlen);
}

std::array<uint8_t, Crypticle::IV_SIZE> Crypticle::generate_iv() const {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw EncryptionError("Crypticle: Failed to generate random IV");
  }
  return iv;
}

std::string Crypticle::sign(const std::string& data) const {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int mac_len = 0;

  if (!HMAC(EVP_sha256(), hmac_key_.data(), static_cast<int>(hmac_key_.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &mac_len)) {
    throw CryptoError("Crypticle: Failed to compute message signature");
  }
  return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

} // namespace fileclient::crypto
