#include "store/cache_store.hpp"
#include "paths/path_resolver.hpp"
#include <algorithm>
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace store {

namespace {

std::string strip_leading_slashes(const std::string& path) {
  const auto first = path.find_first_not_of('/');
  return first == std::string::npos ? std::string() : path.substr(first);
}

// Lexical containment, no symlink resolution
bool is_within(const std::filesystem::path& path, const std::filesystem::path& root) {
  const auto normal_path = path.lexically_normal();
  const auto normal_root = root.lexically_normal();
  auto root_it = normal_root.begin();
  auto path_it = normal_path.begin();
  for (; root_it != normal_root.end(); ++root_it, ++path_it) {
    if (root_it->empty()) {
      continue;
    }
    if (path_it == normal_path.end() || *path_it != *root_it) {
      return false;
    }
  }
  return true;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CacheStore::CacheStore(const std::filesystem::path& cachedir) : cachedir_(cachedir) {
  BOOST_LOG_TRIVIAL(info) << "Cache store: Using cache root: " << cachedir_.string();
}


//==============================================
// DESTINATION RESOLUTION
//==============================================

std::filesystem::path CacheStore::cache_destination(const std::string& env,
                                                    const std::string& relative_path) const {
  std::filesystem::path dest = files_root(env) / strip_leading_slashes(relative_path);
  prepare_parent(dest);
  BOOST_LOG_TRIVIAL(debug) << "Cache store: Cache destination for " << relative_path
                           << " in " << env << ": " << dest.string();
  return dest;
}

std::filesystem::path CacheStore::local_file_destination(const std::string& relative_path) const {
  std::filesystem::path dest = local_files_root() / strip_leading_slashes(relative_path);
  prepare_parent(dest);
  return dest;
}

std::filesystem::path CacheStore::external_destination(const std::string& env, const std::string& host,
                                                       const std::string& url_path) const {
  std::filesystem::path dest = cachedir_ / "extrn_files" / env / host / strip_leading_slashes(url_path);
  prepare_parent(dest);
  return dest;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::filesystem::path CacheStore::store_local_file(const std::filesystem::path& source) const {
  BOOST_LOG_TRIVIAL(info) << "Cache store: Caching local file: " << source.string();

  std::ifstream input(source, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "Cache store: Failed to open local file: " << source.string();
    throw StoreError("Cache store: Failed to open local file: " + source.string());
  }

  std::filesystem::path dest = local_file_destination(source.string());
  std::ofstream output(dest, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw StoreError("Cache store: Failed to create file: " + dest.string());
  }

  size_t bytes_written = 0;
  char buffer[4096];

  // Copy in chunks, the final read may be partial
  while (input.read(buffer, sizeof(buffer))) {
    output.write(buffer, input.gcount());
    bytes_written += input.gcount();
  }
  if (input.gcount() > 0) {
    output.write(buffer, input.gcount());
    bytes_written += input.gcount();
  }

  if (!output) {
    throw StoreError("Cache store: Failed to write file: " + dest.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Cache store: Stored " << bytes_written << " bytes at: " << dest.string();
  return dest;
}

void CacheStore::ensure_directory(const std::filesystem::path& path) const {
  std::filesystem::path current;

  for (const auto& part : path) {
    current /= part;

    std::error_code ec;
    if (std::filesystem::is_directory(current, ec)) {
      continue;
    }

    // Directory wins over a stale cached file, but only inside the cache
    if (std::filesystem::is_regular_file(current, ec) && is_within(current, cachedir_)) {
      BOOST_LOG_TRIVIAL(debug) << "Cache store: Removing file in the way of directory: " << current.string();
      std::filesystem::remove(current, ec);
    }

    if (std::filesystem::create_directory(current, ec)) {
      std::filesystem::permissions(current, std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::replace, ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "Cache store: Failed to restrict permissions on "
                                   << current.string() << ": " << ec.message();
      }
      continue;
    }

    // Another caller may have created it in the meantime
    if (!std::filesystem::is_directory(current)) {
      BOOST_LOG_TRIVIAL(error) << "Cache store: Failed to create directory " << current.string()
                               << ": " << ec.message();
      throw StoreError("Cache store: Failed to create directory: " + current.string());
    }
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::filesystem::path> CacheStore::list_cached(const std::string& env) const {
  BOOST_LOG_TRIVIAL(debug) << "Cache store: Listing cached files for environment: " << env;

  std::vector<std::filesystem::path> files;
  collect_files(files_root(env), files);
  collect_files(local_files_root(), files);

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

std::optional<std::filesystem::path> CacheStore::is_cached(const std::string& path,
                                                           const std::string& env) const {
  std::error_code ec;

  // Virtual paths can only live in the files cache
  if (!paths::has_scheme(path)) {
    const auto local_dest = local_files_root() / strip_leading_slashes(path);
    if (std::filesystem::exists(local_dest, ec)) {
      return local_dest;
    }
  }

  const std::string relative = paths::has_scheme(path) ? paths::strip_scheme(path) : path;
  const auto files_dest = files_root(env) / strip_leading_slashes(relative);
  if (std::filesystem::exists(files_dest, ec)) {
    return files_dest;
  }

  BOOST_LOG_TRIVIAL(debug) << "Cache store: Not cached: " << path;
  return std::nullopt;
}


//==============================================
// GETTERS
//==============================================

std::filesystem::path CacheStore::files_root(const std::string& env) const {
  return cachedir_ / "files" / env;
}

std::filesystem::path CacheStore::local_files_root() const {
  return cachedir_ / "localfiles";
}


//==============================================
// UTILITY METHODS
//==============================================

void CacheStore::prepare_parent(const std::filesystem::path& dest) const {
  const auto parent = dest.parent_path();
  if (!parent.empty()) {
    ensure_directory(parent);
  }
}

void CacheStore::collect_files(const std::filesystem::path& root,
                               std::vector<std::filesystem::path>& files) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return;
  }

  const auto options = std::filesystem::directory_options::follow_directory_symlink
                     | std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::recursive_directory_iterator it(root, options, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Cache store: Error walking " << root.string() << ": " << ec.message();
  }
}

} // namespace store
} // namespace fileclient
