#include "config/config.hpp"
#include <boost/asio/ip/host_name.hpp>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace fileclient {
namespace config {

namespace {

template <typename T>
void read_scalar(const YAML::Node& root, const char* key, T& target) {
  const YAML::Node node = root[key];
  if (node && !node.IsNull()) {
    target = node.as<T>();
  }
}

void read_file_roots(const YAML::Node& root, Config& config) {
  const YAML::Node node = root["file_roots"];
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw ConfigError("file_roots must map environments to lists of directories");
  }

  config.file_roots.clear();
  for (const auto& entry : node) {
    const auto env = entry.first.as<std::string>();
    std::vector<std::string> roots;
    if (entry.second.IsSequence()) {
      for (const auto& item : entry.second) {
        roots.push_back(item.as<std::string>());
      }
    } else if (entry.second.IsScalar()) {
      roots.push_back(entry.second.as<std::string>());
    }
    config.file_roots[env] = roots;
  }
}

Config from_node(const YAML::Node& root) {
  Config config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw ConfigError("Configuration must be a mapping");
  }

  std::string cachedir = config.cachedir.string();
  std::string key_file = config.key_file.string();
  int master_port = config.master_port;

  read_scalar(root, "cachedir", cachedir);
  read_scalar(root, "file_client", config.file_client);
  read_scalar(root, "hash_type", config.hash_type);
  read_scalar(root, "external_nodes", config.external_nodes);
  read_scalar(root, "id", config.id);
  read_scalar(root, "master", config.master);
  read_scalar(root, "master_port", master_port);
  read_scalar(root, "key_file", key_file);
  read_scalar(root, "request_tries", config.request_tries);
  read_scalar(root, "request_timeout", config.request_timeout);
  read_scalar(root, "log_file", config.log_file);
  read_scalar(root, "log_level", config.log_level);
  read_file_roots(root, config);

  if (master_port <= 0 || master_port > UINT16_MAX) {
    throw ConfigError("master_port out of range: " + std::to_string(master_port));
  }
  if (config.request_tries < 1 || config.request_timeout < 1) {
    throw ConfigError("request_tries and request_timeout must be positive");
  }

  config.cachedir = cachedir;
  config.key_file = key_file;
  config.master_port = static_cast<uint16_t>(master_port);
  return config;
}

void apply_defaults(Config& config) {
  if (config.id.empty()) {
    config.id = boost::asio::ip::host_name();
  }
}

} // namespace

//==============================================
// LOADING
//==============================================

Config load_config(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading " << path.string();
  try {
    Config config = from_node(YAML::LoadFile(path.string()));
    apply_defaults(config);
    return config;
  } catch (const YAML::Exception& e) {
    throw ConfigError("Failed to read configuration " + path.string() + ": " + e.what());
  }
}

Config parse_config(const std::string& yaml) {
  try {
    Config config = from_node(YAML::Load(yaml));
    apply_defaults(config);
    return config;
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
  }
}


//==============================================
// WIRE FORM
//==============================================

network::Load to_load(const Config& config) {
  network::Load load;
  load.set("cachedir", config.cachedir.string());
  load.set("file_client", config.file_client);
  load.set("file_roots", network::StringListMap(config.file_roots.begin(), config.file_roots.end()));
  load.set("hash_type", config.hash_type);
  load.set("external_nodes", config.external_nodes);
  load.set("id", config.id);
  load.set("master", config.master);
  load.set("master_port", static_cast<int64_t>(config.master_port));
  load.set("request_tries", config.request_tries);
  load.set("request_timeout", config.request_timeout);
  load.set("log_level", config.log_level);
  return load;
}

} // namespace config
} // namespace fileclient
