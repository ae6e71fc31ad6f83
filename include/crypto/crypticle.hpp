#ifndef FILECLIENT_CRYPTO_CRYPTICLE_HPP
#define FILECLIENT_CRYPTO_CRYPTICLE_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include <memory>
#include <array>
#include <filesystem>
#include "crypto_error.hpp"

namespace fileclient::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Symmetric session cipher protecting every request and reply exchanged
// with the master. Wire form: IV || AES-256-CBC(payload) || HMAC-SHA256(IV || ciphertext)
class Crypticle {
public:
  static constexpr size_t AES_KEY_SIZE = 32;   // 256 bits for AES-256
  static constexpr size_t HMAC_KEY_SIZE = 32;
  static constexpr size_t KEY_SIZE = AES_KEY_SIZE + HMAC_KEY_SIZE;
  static constexpr size_t IV_SIZE = 16;        // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;     // AES block size
  static constexpr size_t MAC_SIZE = 32;       // SHA-256 output

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Crypticle(const std::vector<uint8_t>& key);
  ~Crypticle();

  Crypticle(const Crypticle&) = delete;
  Crypticle& operator=(const Crypticle&) = delete;

  // Reads base64 key material from a file
  static std::vector<uint8_t> load_key(const std::filesystem::path& key_file);
  static std::vector<uint8_t> generate_key();
  // Base64 form written to key files
  static std::string encode_key(const std::vector<uint8_t>& key);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::string encrypt(const std::string& payload);
  std::string decrypt(const std::string& message);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> aes_key_;
  std::vector<uint8_t> hmac_key_;
  std::unique_ptr<CipherContext> context_;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- STREAM PROCESSING - ENCRYPTION/DECRYPTION ----
  // Initializes cipher context for one message
  void initialize_cipher(const uint8_t* iv, bool encrypting);
  // Runs the input through the cipher in BUFFER_SIZE chunks
  void process_stream(std::istream& input, std::ostream& output, bool encrypting);
  // Handles the final block with padding
  void process_final_block(std::ostream& output, bool encrypting);

  std::array<uint8_t, IV_SIZE> generate_iv() const;
  std::string sign(const std::string& data) const;
};

} // namespace fileclient::crypto

#endif // FILECLIENT_CRYPTO_CRYPTICLE_HPP
