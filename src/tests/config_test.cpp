#include <gtest/gtest.h>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace fileclient::config;

class ConfigTest : public TempDirTest {};

TEST_F(ConfigTest, DefaultsWhenKeysAreMissing) {
  const Config config = parse_config("{}");
  EXPECT_EQ(config.cachedir, "/var/cache/fileclient");
  EXPECT_EQ(config.file_client, "remote");
  EXPECT_FALSE(config.is_local());
  EXPECT_EQ(config.hash_type, "md5");
  EXPECT_EQ(config.master_port, 4506);
  EXPECT_EQ(config.request_tries, 3);
  EXPECT_EQ(config.request_timeout, 60);
  EXPECT_EQ(config.file_roots.at("base"), (std::vector<std::string>{"/srv/salt"}));
  EXPECT_FALSE(config.id.empty());
}

TEST_F(ConfigTest, ReadsEveryKey) {
  const auto path = test_dir / "minion.yaml";
  write_file(path,
    "cachedir: /tmp/cache\n"
    "file_client: local\n"
    "file_roots:\n"
    "  base:\n"
    "    - /srv/salt\n"
    "    - /srv/extra\n"
    "  prod: /srv/prod\n"
    "hash_type: sha256\n"
    "external_nodes: cobbler-ext-nodes\n"
    "id: web01\n"
    "master: salt.example.com\n"
    "master_port: 14506\n"
    "key_file: /etc/fileclient/session.key\n"
    "request_tries: 5\n"
    "request_timeout: 10\n"
    "log_file: /var/log/fileclient.log\n"
    "log_level: debug\n");

  const Config config = load_config(path);
  EXPECT_EQ(config.cachedir, "/tmp/cache");
  EXPECT_TRUE(config.is_local());
  EXPECT_EQ(config.file_roots.at("base"), (std::vector<std::string>{"/srv/salt", "/srv/extra"}));
  EXPECT_EQ(config.file_roots.at("prod"), (std::vector<std::string>{"/srv/prod"}));
  EXPECT_EQ(config.hash_type, "sha256");
  EXPECT_EQ(config.external_nodes, "cobbler-ext-nodes");
  EXPECT_EQ(config.id, "web01");
  EXPECT_EQ(config.master, "salt.example.com");
  EXPECT_EQ(config.master_port, 14506);
  EXPECT_EQ(config.key_file, "/etc/fileclient/session.key");
  EXPECT_EQ(config.request_tries, 5);
  EXPECT_EQ(config.request_timeout, 10);
  EXPECT_EQ(config.log_file, "/var/log/fileclient.log");
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, RejectsBrokenFiles) {
  EXPECT_THROW(load_config(test_dir / "missing.yaml"), ConfigError);
  EXPECT_THROW(parse_config("cachedir: [unterminated"), ConfigError);
  EXPECT_THROW(parse_config("- a\n- b\n"), ConfigError);
  EXPECT_THROW(parse_config("master_port: 70000"), ConfigError);
  EXPECT_THROW(parse_config("request_tries: 0"), ConfigError);
  EXPECT_THROW(parse_config("file_roots: [a, b]"), ConfigError);
  EXPECT_THROW(parse_config("request_timeout: soon"), ConfigError);
}

TEST_F(ConfigTest, UnknownClientMeansRemote) {
  EXPECT_FALSE(parse_config("file_client: carrier-pigeon").is_local());
}

TEST_F(ConfigTest, WireFormCarriesOptions) {
  const Config config = parse_config("id: web01\nhash_type: sha1\nfile_roots: {base: [/a, /b]}\n");
  const auto load = to_load(config);
  EXPECT_EQ(load.get_string("id"), "web01");
  EXPECT_EQ(load.get_string("hash_type"), "sha1");
  EXPECT_EQ(load.get_int("master_port"), 4506);
  EXPECT_EQ(load.get_map("file_roots").at("base"), (std::vector<std::string>{"/a", "/b"}));
}
