#include "paths/path_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace paths {

namespace {

bool valid_scheme(const std::string& scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
    return false;
  }
  return std::all_of(scheme.begin(), scheme.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
  });
}

} // namespace

//==============================================
// VIRTUAL PATHS
//==============================================

bool has_scheme(const std::string& path) {
  return path.compare(0, std::strlen(SALT_SCHEME), SALT_SCHEME) == 0;
}

std::string strip_scheme(const std::string& path) {
  if (!has_scheme(path)) {
    BOOST_LOG_TRIVIAL(debug) << "Path resolver: Rejecting path without scheme: " << path;
    throw errors::PathSchemeError(path);
  }
  return path.substr(std::strlen(SALT_SCHEME));
}

std::string unescape(const std::string& path) {
  if (!path.empty() && path.front() == '|') {
    return path.substr(1);
  }
  return path;
}


//==============================================
// URLS
//==============================================

std::string Url::without_credentials() const {
  if (scheme.empty()) {
    return path;
  }
  std::string url = scheme + "://" + host + path;
  if (!query.empty()) {
    url += "?" + query;
  }
  if (!fragment.empty()) {
    url += "#" + fragment;
  }
  return url;
}

Url classify_url(const std::string& url) {
  Url result;

  const auto separator = url.find("://");
  if (separator == std::string::npos || !valid_scheme(url.substr(0, separator))) {
    result.path = url;
    return result;
  }

  result.scheme = url.substr(0, separator);
  std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string rest = url.substr(separator + 3);

  // Authority runs up to the first path, query or fragment delimiter
  const auto authority_end = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, authority_end);
  rest = authority_end == std::string::npos ? std::string() : rest.substr(authority_end);

  const auto at = authority.rfind('@');
  if (at != std::string::npos) {
    const std::string userinfo = authority.substr(0, at);
    const auto colon = userinfo.find(':');
    result.username = userinfo.substr(0, colon);
    if (colon != std::string::npos) {
      result.password = userinfo.substr(colon + 1);
    }
    result.has_credentials = true;
    authority = authority.substr(at + 1);
  }
  result.host = authority;

  const auto fragment_start = rest.find('#');
  if (fragment_start != std::string::npos) {
    result.fragment = rest.substr(fragment_start + 1);
    rest.erase(fragment_start);
  }
  const auto query_start = rest.find('?');
  if (query_start != std::string::npos) {
    result.query = rest.substr(query_start + 1);
    rest.erase(query_start);
  }
  result.path = rest;

  return result;
}


//==============================================
// DIRECTORY PREFIXES
//==============================================

DirectoryPrefix::DirectoryPrefix(const std::string& virtual_path)
  : path_(strip_scheme(virtual_path)) {
  while (!path_.empty() && path_.back() == '/') {
    path_.pop_back();
  }

  const auto last_separator = path_.rfind('/');
  if (last_separator != std::string::npos) {
    stripped_prefix_ = path_.substr(0, last_separator);
  }
}

bool DirectoryPrefix::contains(const std::string& listed) const {
  if (listed.size() <= path_.size() || listed.compare(0, path_.size(), path_) != 0) {
    return false;
  }
  return listed[path_.size()] == '/';
}

std::string DirectoryPrefix::relative_destination(const std::string& listed) const {
  std::string relative = listed.substr(stripped_prefix_.size());
  const auto first = relative.find_first_not_of('/');
  return first == std::string::npos ? std::string() : relative.substr(first);
}

} // namespace paths
} // namespace fileclient
