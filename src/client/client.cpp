#include "client/client.hpp"
#include "client/local_backend.hpp"
#include "client/remote_backend.hpp"
#include "crypto/crypticle.hpp"
#include "network/master_channel.hpp"
#include "network/tcp_request_channel.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace fileclient {
namespace client {

namespace {

std::string strip_leading_slashes(const std::string& path) {
  const auto first = path.find_first_not_of('/');
  return first == std::string::npos ? std::string() : path.substr(first);
}

bool is_blank(const std::string& value) {
  return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Moves a file, copying when source and target are on different devices
void move_file(const std::filesystem::path& source, const std::filesystem::path& target) {
  std::error_code ec;
  std::filesystem::rename(source, target, ec);
  if (!ec) {
    return;
  }
  std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::remove(source);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(const config::Config& config, std::unique_ptr<FileBackend> backend)
  : config_(config),
    store_(config.cachedir),
    backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("Client: A file backend is required");
  }
}


//==============================================
// FETCHING
//==============================================

FetchResult Client::get_file(const std::string& path, const std::string& dest, bool makedirs,
                             const std::string& env, int gzip) {
  return backend_->get_file(path, dest, makedirs, env, gzip);
}

std::string Client::cache_file(const std::string& path, const std::string& env) {
  return get_url(path, "", true, env);
}

std::vector<std::string> Client::cache_files(const std::vector<std::string>& paths, const std::string& env) {
  std::vector<std::string> result;
  for (const auto& path : paths) {
    result.push_back(cache_file(path, env));
  }
  return result;
}

std::vector<std::string> Client::cache_files(const std::string& paths, const std::string& env) {
  // Every field counts, a trailing comma yields an empty path
  std::vector<std::string> split;
  std::string::size_type start = 0;
  for (auto comma = paths.find(','); comma != std::string::npos; comma = paths.find(',', start)) {
    split.push_back(paths.substr(start, comma - start));
    start = comma + 1;
  }
  split.push_back(paths.substr(start));
  return cache_files(split, env);
}

std::vector<std::string> Client::cache_master(const std::string& env) {
  std::vector<std::string> result;
  const auto files = file_list(env);
  if (!files) {
    return result;
  }
  for (const auto& path : *files) {
    result.push_back(cache_file(paths::SALT_SCHEME + path, env));
  }
  return result;
}

std::vector<std::string> Client::cache_dir(const std::string& path, const std::string& env, bool include_empty) {
  const paths::DirectoryPrefix prefix(path);
  BOOST_LOG_TRIVIAL(info) << "Client: Caching directory '" << prefix.path() << "/' for environment '" << env << "'";

  std::vector<std::string> result;
  if (const auto files = file_list(env)) {
    for (const auto& listed : *files) {
      if (is_blank(listed) || !prefix.contains(listed)) {
        continue;
      }
      const std::string cached = cache_file(paths::SALT_SCHEME + listed, env);
      if (!cached.empty()) {
        result.push_back(cached);
      }
    }
  }

  if (include_empty) {
    if (const auto empty_dirs = file_list_emptydirs(env)) {
      for (const auto& listed : *empty_dirs) {
        if (!prefix.contains(listed)) {
          continue;
        }
        const auto minion_dir = store_.files_root(env) / listed;
        store_.ensure_directory(minion_dir);
        result.push_back(minion_dir.string());
      }
    }
  }
  return result;
}

std::string Client::cache_local_file(const std::string& path) {
  return store_.store_local_file(path).string();
}

std::vector<std::string> Client::get_dir(const std::string& path, const std::string& dest,
                                         const std::string& env, int gzip) {
  const paths::DirectoryPrefix prefix(path);
  const std::filesystem::path dest_root(dest);
  std::vector<std::string> result;

  if (const auto files = file_list(env)) {
    for (const auto& listed : *files) {
      if (!prefix.contains(listed)) {
        continue;
      }
      const auto target = dest_root / prefix.relative_destination(listed);
      const auto fetched = get_file(paths::SALT_SCHEME + listed, target.string(), true, env, gzip);
      if (!fetched.ok()) {
        BOOST_LOG_TRIVIAL(warning) << "Client: Failed to fetch " << listed << ": "
                                   << fetch_status_to_string(fetched.status);
        continue;
      }
      result.push_back(fetched.path.string());
    }
  }

  if (const auto empty_dirs = file_list_emptydirs(env)) {
    for (const auto& listed : *empty_dirs) {
      if (!prefix.contains(listed)) {
        continue;
      }
      const auto minion_dir = dest_root / prefix.relative_destination(listed);
      std::filesystem::create_directories(minion_dir);
      result.push_back(minion_dir.string());
    }
  }

  std::sort(result.begin(), result.end());
  return result;
}

std::string Client::get_url(const std::string& url, const std::string& dest, bool makedirs,
                            const std::string& env) {
  const paths::Url parsed = paths::classify_url(url);
  if (parsed.is_virtual()) {
    const auto fetched = get_file(url, dest, makedirs, env);
    return fetched.ok() ? fetched.path.string() : std::string();
  }
  if (parsed.scheme.empty()) {
    throw errors::ForeignFetchError("Error reading " + url + ": unknown url type");
  }

  std::filesystem::path target;
  if (!dest.empty()) {
    target = dest;
    const auto destdir = target.parent_path();
    std::error_code ec;
    if (!destdir.empty() && !std::filesystem::is_directory(destdir, ec)) {
      if (!makedirs) {
        BOOST_LOG_TRIVIAL(warning) << "Client: Destination directory " << destdir.string() << " does not exist";
        return "";
      }
      std::filesystem::create_directories(destdir);
    }
  } else {
    target = store_.external_destination(env, parsed.host, parsed.path);
  }

  url_fetcher_.fetch(parsed, target);
  return target.string();
}

std::string Client::get_template(const std::string& url, const std::string& dest,
                                 const std::string& template_name, bool makedirs,
                                 const std::string& env, templates::TemplateParams params) {
  params["env"] = env;

  const std::string source = cache_file(url, env);
  std::error_code ec;
  if (source.empty() || !std::filesystem::exists(source, ec)) {
    return "";
  }

  if (!templates_.contains(template_name)) {
    BOOST_LOG_TRIVIAL(error) << "Client: Attempted to render template with unavailable engine " << template_name;
    return "";
  }

  const auto rendered = templates_.render(template_name, source, params);
  if (!rendered.result) {
    BOOST_LOG_TRIVIAL(error) << "Client: Failed to render template with error: " << rendered.data;
    return "";
  }

  const std::filesystem::path target = dest.empty() ? external_path(env, paths::classify_url(url))
                                                    : std::filesystem::path(dest);
  const auto destdir = target.parent_path();
  if (!destdir.empty() && !std::filesystem::is_directory(destdir, ec)) {
    if (!makedirs) {
      // Best effort, the rendered file is a temporary
      std::filesystem::remove(rendered.data, ec);
      return "";
    }
    std::filesystem::create_directories(destdir);
  }

  move_file(rendered.data, target);
  return target.string();
}


//==============================================
// STATES
//==============================================

std::optional<StateFile> Client::get_state(const std::string& sls, const std::string& env) {
  std::string relative = sls;
  std::replace(relative.begin(), relative.end(), '.', '/');

  for (const auto& candidate : {paths::SALT_SCHEME + relative + ".sls",
                                paths::SALT_SCHEME + relative + "/init.sls"}) {
    const std::string dest = cache_file(candidate, env);
    if (!dest.empty()) {
      return StateFile{candidate, dest};
    }
  }
  return std::nullopt;
}

std::vector<std::string> Client::list_states(const std::string& env) {
  static const std::string SLS_SUFFIX = ".sls";
  static const std::string INIT_SUFFIX = "/init.sls";

  std::vector<std::string> states;
  const auto files = file_list(env);
  if (!files) {
    return states;
  }

  for (const auto& path : *files) {
    if (path.size() <= SLS_SUFFIX.size() ||
        path.compare(path.size() - SLS_SUFFIX.size(), SLS_SUFFIX.size(), SLS_SUFFIX) != 0) {
      continue;
    }

    const bool is_init = path.size() > INIT_SUFFIX.size() &&
      path.compare(path.size() - INIT_SUFFIX.size(), INIT_SUFFIX.size(), INIT_SUFFIX) == 0;
    std::string state = path.substr(0, path.size() - (is_init ? INIT_SUFFIX.size() : SLS_SUFFIX.size()));
    std::replace(state.begin(), state.end(), '/', '.');
    states.push_back(state);
  }
  return states;
}


//==============================================
// LISTINGS
//==============================================

Listing Client::file_list(const std::string& env) {
  return backend_->file_list(env);
}

Listing Client::dir_list(const std::string& env) {
  return backend_->dir_list(env);
}

Listing Client::file_list_emptydirs(const std::string& env) {
  return backend_->file_list_emptydirs(env);
}

Listing Client::list_env(const std::string& env) {
  return backend_->list_env(env);
}

std::vector<std::string> Client::file_local_list(const std::string& env) {
  std::vector<std::string> result;
  for (const auto& path : store_.list_cached(env)) {
    result.push_back(path.string());
  }
  return result;
}

std::string Client::is_cached(const std::string& path, const std::string& env) {
  const auto cached = store_.is_cached(path, env);
  return cached ? cached->string() : std::string();
}


//==============================================
// METADATA
//==============================================

std::optional<crypto::DigestRecord> Client::hash_file(const std::string& path, const std::string& env) {
  return backend_->hash_file(path, env);
}

std::optional<network::Load> Client::master_opts() {
  return backend_->master_opts();
}

std::optional<network::StringListMap> Client::ext_nodes() {
  return backend_->ext_nodes();
}


//==============================================
// UTILITY METHODS
//==============================================

std::filesystem::path Client::external_path(const std::string& env, const paths::Url& url) const {
  return store_.cachedir() / "extrn_files" / env / url.host / strip_leading_slashes(url.path);
}


//==============================================
// FACTORY
//==============================================

std::unique_ptr<Client> make_client(const config::Config& config) {
  if (config.is_local()) {
    BOOST_LOG_TRIVIAL(info) << "Client: Using local file client";
    return std::make_unique<Client>(config, std::make_unique<LocalBackend>(config));
  }

  if (config.file_client != "remote") {
    BOOST_LOG_TRIVIAL(warning) << "Client: Unknown file_client '" << config.file_client << "', using remote";
  }

  auto crypticle = std::make_unique<crypto::Crypticle>(crypto::Crypticle::load_key(config.key_file));
  auto channel = std::make_unique<network::TcpRequestChannel>(config.master, config.master_port);
  auto master = std::make_unique<network::MasterChannel>(std::move(channel), std::move(crypticle),
                                                         config.request_tries, config.request_timeout);
  return std::make_unique<Client>(config, std::make_unique<RemoteBackend>(config, std::move(master)));
}

} // namespace client
} // namespace fileclient
