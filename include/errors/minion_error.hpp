#ifndef FILECLIENT_MINION_ERROR_HPP
#define FILECLIENT_MINION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace fileclient::errors {

class MinionError : public std::runtime_error {
public:
    explicit MinionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Virtual path without the salt:// scheme
class PathSchemeError : public MinionError {
public:
    explicit PathSchemeError(const std::string& path)
        : MinionError("Unsupported path: " + path) {}
};

class FileNotFoundError : public MinionError {
public:
    explicit FileNotFoundError(const std::string& message)
        : MinionError(message) {}
};

// Any failure retrieving a non salt:// URL
class ForeignFetchError : public MinionError {
public:
    explicit ForeignFetchError(const std::string& message)
        : MinionError(message) {}
};

} // namespace fileclient::errors

#endif // FILECLIENT_MINION_ERROR_HPP
