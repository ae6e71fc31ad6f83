#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <vector>
#include <stdexcept>

namespace fileclient {
namespace store {

// Owns the on-disk layout beneath the cache root:
//   <cachedir>/files/<env>/<relative-path>
//   <cachedir>/localfiles/<relative-path>
//   <cachedir>/extrn_files/<env>/<host>/<path>
// No locking is done: concurrent fetches of one path each overwrite it.
class CacheStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CacheStore(const std::filesystem::path& cachedir);


  // ---- DESTINATION RESOLUTION ----
  // Each of these creates the parent directories of the returned path
  std::filesystem::path cache_destination(const std::string& env, const std::string& relative_path) const;
  std::filesystem::path local_file_destination(const std::string& relative_path) const;
  std::filesystem::path external_destination(const std::string& env, const std::string& host,
                                             const std::string& url_path) const;


  // ---- CORE STORAGE OPERATIONS ----
  // Copies a local file into the localfiles cache
  std::filesystem::path store_local_file(const std::filesystem::path& source) const;
  // Creates a directory (and parents) inside the cache, tolerating races
  void ensure_directory(const std::filesystem::path& path) const;


  // ---- QUERY OPERATIONS ----
  // Sorted union of the files and localfiles caches, symlinks followed
  std::vector<std::filesystem::path> list_cached(const std::string& env) const;
  // Checks localfiles first, then the environment's files cache
  std::optional<std::filesystem::path> is_cached(const std::string& path, const std::string& env) const;


  // ---- GETTERS ----
  const std::filesystem::path& cachedir() const { return cachedir_; }
  std::filesystem::path files_root(const std::string& env) const;
  std::filesystem::path local_files_root() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path cachedir_;


  // ---- UTILITY METHODS ----
  // Creates the parent of dest with owner-only permissions. A regular file
  // sitting where a directory is needed gets removed first.
  void prepare_parent(const std::filesystem::path& dest) const;
  // Walks a tree and adds every regular file to files
  void collect_files(const std::filesystem::path& root, std::vector<std::filesystem::path>& files) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace fileclient
