#ifndef FILECLIENT_PATHS_PATH_RESOLVER_HPP
#define FILECLIENT_PATHS_PATH_RESOLVER_HPP

#include <string>
#include "errors/minion_error.hpp"

namespace fileclient {
namespace paths {

constexpr const char* SALT_SCHEME = "salt://";
constexpr const char* DEFAULT_ENV = "base";

// Components of a URL-shaped string. A string without "://" has an empty
// scheme and everything lands in path.
struct Url {
  std::string scheme;
  std::string username;
  std::string password;
  bool has_credentials = false;
  std::string host;       // authority without credentials, keeps ":port"
  std::string path;
  std::string query;
  std::string fragment;

  bool is_virtual() const { return scheme == "salt"; }
  // Rebuilds the URL with any user:password@ removed
  std::string without_credentials() const;
};


// ---- VIRTUAL PATHS ----
bool has_scheme(const std::string& path);
// Returns the path with the salt:// prefix removed, throws PathSchemeError otherwise
std::string strip_scheme(const std::string& path);
// Removes the escape marker '|' that may lead a path
std::string unescape(const std::string& path);


// ---- URLS ----
Url classify_url(const std::string& url);


// ---- DIRECTORY PREFIXES ----
// Maps listed root-relative paths under a virtual directory onto
// destination-relative paths. For "salt://a/b" the copy root is "b" and the
// stripped prefix is "a", so "a/b/c.txt" maps to "b/c.txt".
class DirectoryPrefix {
public:
  explicit DirectoryPrefix(const std::string& virtual_path);

  // True when listed sits strictly below the directory ("foo" never matches "foobar/x")
  bool contains(const std::string& listed) const;
  std::string relative_destination(const std::string& listed) const;

  const std::string& path() const { return path_; }
  const std::string& stripped_prefix() const { return stripped_prefix_; }

private:
  std::string path_;
  std::string stripped_prefix_;
};

} // namespace paths
} // namespace fileclient

#endif // FILECLIENT_PATHS_PATH_RESOLVER_HPP
