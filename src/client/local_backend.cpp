#include "client/local_backend.hpp"
#include "paths/path_resolver.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace fileclient {
namespace client {

namespace {

// Pipe from a child process, closed on destruction
class ProcessReader {
public:
  explicit ProcessReader(const std::string& command) : pipe_(popen(command.c_str(), "r")) {
    if (!pipe_) {
      error_ = std::strerror(errno);
    }
  }

  ~ProcessReader() {
    if (pipe_) {
      pclose(pipe_);
    }
  }

  ProcessReader(const ProcessReader&) = delete;
  ProcessReader& operator=(const ProcessReader&) = delete;

  bool is_open() const { return pipe_ != nullptr; }
  const std::string& get_error() const { return error_; }

  std::string read_all() {
    std::string output;
    char buffer[4096];
    size_t bytes_read;
    while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), pipe_)) > 0) {
      output.append(buffer, bytes_read);
    }
    return output;
  }

private:
  FILE* pipe_;
  std::string error_;
};

// Same lookup as a shell would do for a bare command name
bool is_executable_on_path(const std::string& command) {
  if (command.find('/') != std::string::npos) {
    return access(command.c_str(), X_OK) == 0;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return false;
  }

  std::istringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    const auto candidate = std::filesystem::path(dir.empty() ? "." : dir) / command;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

std::string shell_quote(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  return quoted + "'";
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBackend::LocalBackend(const config::Config& config) : config_(config) {
  BOOST_LOG_TRIVIAL(info) << "Local client: Serving " << config_.file_roots.size() << " environments from file_roots";
}


//==============================================
// FETCHING
//==============================================

FetchResult LocalBackend::get_file(const std::string& path, const std::string& /*dest*/, bool /*makedirs*/,
                                   const std::string& env, int /*gzip*/) {
  const auto found = find_file(paths::strip_scheme(path), env);
  if (!found) {
    BOOST_LOG_TRIVIAL(debug) << "Local client: " << path << " not found in " << env;
    return FetchResult::failure(FetchStatus::NOT_FOUND);
  }
  return FetchResult::success(*found);
}

std::optional<std::filesystem::path> LocalBackend::find_file(const std::string& path, const std::string& env) const {
  const auto* roots = roots_for(env);
  if (!roots) {
    return std::nullopt;
  }

  std::string relative = paths::unescape(path);
  // Lookups never leave the root
  relative.erase(0, relative.find_first_not_of('/'));
  if (relative.empty()) {
    return std::nullopt;
  }

  for (const auto& root : *roots) {
    const auto full = std::filesystem::path(root) / relative;
    std::error_code ec;
    if (std::filesystem::is_regular_file(full, ec)) {
      return full;
    }
  }
  return std::nullopt;
}


//==============================================
// LISTINGS
//==============================================

Listing LocalBackend::file_list(const std::string& env) {
  std::vector<std::string> result;
  for (auto& walk : walk_roots(env)) {
    result.insert(result.end(), walk.files.begin(), walk.files.end());
  }
  return result;
}

Listing LocalBackend::dir_list(const std::string& env) {
  std::vector<std::string> result;
  for (auto& walk : walk_roots(env)) {
    result.insert(result.end(), walk.dirs.begin(), walk.dirs.end());
  }
  return result;
}

Listing LocalBackend::file_list_emptydirs(const std::string& env) {
  std::vector<std::string> result;
  for (auto& walk : walk_roots(env)) {
    result.insert(result.end(), walk.empty_dirs.begin(), walk.empty_dirs.end());
  }
  return result;
}

Listing LocalBackend::list_env(const std::string& env) {
  return file_list(env);
}


//==============================================
// METADATA
//==============================================

std::optional<crypto::DigestRecord> LocalBackend::hash_file(const std::string& path, const std::string& env) {
  if (!paths::has_scheme(path)) {
    return crypto::digest_file(path, crypto::DEFAULT_HASH_TYPE);
  }

  const auto found = find_file(paths::strip_scheme(path), env);
  if (!found) {
    return std::nullopt;
  }
  return crypto::digest_file(*found, config_.hash_type);
}

std::optional<network::Load> LocalBackend::master_opts() {
  return config::to_load(config_);
}

std::optional<network::StringListMap> LocalBackend::ext_nodes() {
  if (config_.external_nodes.empty()) {
    return network::StringListMap{};
  }
  if (!is_executable_on_path(config_.external_nodes)) {
    BOOST_LOG_TRIVIAL(error) << "Local client: Specified external nodes controller " << config_.external_nodes
                             << " is not available, please verify that it is installed";
    return network::StringListMap{};
  }

  const std::string command = config_.external_nodes + " " + shell_quote(config_.id);
  BOOST_LOG_TRIVIAL(debug) << "Local client: Running external nodes command: " << command;

  ProcessReader process(command);
  if (!process.is_open()) {
    BOOST_LOG_TRIVIAL(error) << "Local client: Failed to run " << command << ": " << process.get_error();
    return network::StringListMap{};
  }
  return parse_ext_nodes(process.read_all());
}

network::StringListMap LocalBackend::parse_ext_nodes(const std::string& yaml) {
  network::StringListMap result;

  YAML::Node data;
  try {
    data = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local client: Unreadable external nodes output: " << e.what();
    return result;
  }
  if (!data.IsMap()) {
    return result;
  }

  std::string env = paths::DEFAULT_ENV;
  if (data["environment"] && data["environment"].IsScalar()) {
    env = data["environment"].as<std::string>();
  }

  const YAML::Node classes = data["classes"];
  if (!classes) {
    return result;
  }

  network::StringList names;
  if (classes.IsMap()) {
    for (const auto& entry : classes) {
      names.push_back(entry.first.as<std::string>());
    }
  } else if (classes.IsSequence()) {
    for (const auto& item : classes) {
      names.push_back(item.as<std::string>());
    }
  } else {
    return result;
  }

  result[env] = names;
  return result;
}


//==============================================
// UTILITY METHODS
//==============================================

const std::vector<std::string>* LocalBackend::roots_for(const std::string& env) const {
  auto it = config_.file_roots.find(env);
  if (it == config_.file_roots.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Local client: No file_roots for environment " << env;
    return nullptr;
  }
  return &it->second;
}

std::vector<LocalBackend::RootWalk> LocalBackend::walk_roots(const std::string& env) const {
  std::vector<RootWalk> walks;
  if (const auto* roots = roots_for(env)) {
    for (const auto& root : *roots) {
      walks.push_back(walk_root(root));
    }
  }
  return walks;
}

LocalBackend::RootWalk LocalBackend::walk_root(const std::filesystem::path& root) {
  namespace fs = std::filesystem;

  RootWalk walk;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return walk;
  }

  const auto is_empty_dir = [](const fs::path& dir) {
    std::error_code iter_ec;
    fs::directory_iterator it(dir, iter_ec);
    return !iter_ec && it == fs::directory_iterator();
  };

  // The root itself is a walked directory
  walk.dirs.push_back(".");
  if (is_empty_dir(root)) {
    walk.empty_dirs.push_back(".");
  }

  const auto options = fs::directory_options::follow_directory_symlink
                     | fs::directory_options::skip_permission_denied;
  for (fs::recursive_directory_iterator it(root, options, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string relative = it->path().lexically_relative(root).generic_string();
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      walk.dirs.push_back(relative);
      if (is_empty_dir(it->path())) {
        walk.empty_dirs.push_back(relative);
      }
    } else {
      walk.files.push_back(relative);
    }
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local client: Error walking " << root.string() << ": " << ec.message();
  }

  std::sort(walk.files.begin(), walk.files.end());
  std::sort(walk.dirs.begin(), walk.dirs.end());
  std::sort(walk.empty_dirs.begin(), walk.empty_dirs.end());
  return walk;
}

} // namespace client
} // namespace fileclient
