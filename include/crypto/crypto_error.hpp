#ifndef FILECLIENT_CRYPTO_ERROR_HPP
#define FILECLIENT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fileclient::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message) 
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message) 
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message) 
        : CryptoError("Decryption error: " + message) {}
};

// Message signature did not verify, payload is not trusted
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message) 
        : CryptoError("Authentication error: " + message) {}
};

// Digest name OpenSSL does not know
class UnsupportedDigestError : public CryptoError {
public:
    explicit UnsupportedDigestError(const std::string& name) 
        : CryptoError("Unsupported hash type: " + name) {}
};

} // namespace fileclient::crypto

#endif // FILECLIENT_CRYPTO_ERROR_HPP
