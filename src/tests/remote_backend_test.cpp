#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include "client/remote_backend.hpp"
#include "fake_master.hpp"
#include "test_utils.hpp"

using namespace fileclient::client;
using fileclient::config::Config;
using fileclient::network::Load;
using fileclient::network::MasterChannel;
using ::testing::ElementsAre;
namespace fs = std::filesystem;

class RemoteBackendTest : public TempDirTest {
protected:
  Config config;
  FakeMaster* master = nullptr;
  std::unique_ptr<RemoteBackend> backend;

  void SetUp() override {
    TempDirTest::SetUp();
    config.cachedir = test_dir / "cache";
    config.id = "web01";

    auto fake = std::make_unique<FakeMaster>(test_session_key());
    master = fake.get();
    auto channel = std::make_unique<MasterChannel>(
      std::move(fake), std::make_unique<fileclient::crypto::Crypticle>(test_session_key()));
    backend = std::make_unique<RemoteBackend>(config, std::move(channel));
  }

  fs::path cached(const std::string& relative, const std::string& env = "base") const {
    return config.cachedir / "files" / env / relative;
  }

  std::vector<int64_t> serve_offsets() const {
    std::vector<int64_t> offsets;
    for (const auto& request : master->requests) {
      if (request.get_string("cmd") == "_serve_file") {
        offsets.push_back(request.get_int("loc"));
      }
    }
    return offsets;
  }
};

TEST_F(RemoteBackendTest, StreamsChunksIntoCache) {
  master->files["base"]["conf/app.ini"] = "hello world!";

  const auto result = backend->get_file("salt://conf/app.ini", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.path, cached("conf/app.ini"));
  EXPECT_EQ(read_file(result.path), "hello world!");
  EXPECT_THAT(serve_offsets(), ElementsAre(0, 4, 8, 12));

  const Load& first = master->requests.front();
  EXPECT_EQ(first.get_string("path"), "conf/app.ini");
  EXPECT_EQ(first.get_string("env"), "base");
  EXPECT_FALSE(first.has("gzip"));
}

TEST_F(RemoteBackendTest, ZeroByteFileIsCreated) {
  master->files["base"]["empty.txt"] = "";

  const auto result = backend->get_file("salt://empty.txt", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.path, cached("empty.txt"));
  ASSERT_TRUE(fs::is_regular_file(result.path));
  EXPECT_EQ(fs::file_size(result.path), 0u);
  EXPECT_EQ(master->count("_serve_file"), 1);

  // The handle is closed, the file can be replaced right away
  fs::remove(result.path);
  EXPECT_FALSE(fs::exists(result.path));
}

TEST_F(RemoteBackendTest, UnknownFileIsNotFound) {
  const auto result = backend->get_file("salt://missing.txt", "", false, "base", 0);
  EXPECT_EQ(result.status, FetchStatus::NOT_FOUND);
  EXPECT_FALSE(fs::exists(cached("missing.txt")));
}

TEST_F(RemoteBackendTest, ExplicitDestinationNeedsParent) {
  master->files["base"]["motd"] = "welcome";
  const auto dest = test_dir / "out" / "deep" / "motd";

  const auto refused = backend->get_file("salt://motd", dest.string(), false, "base", 0);
  EXPECT_EQ(refused.status, FetchStatus::DESTINATION_UNAVAILABLE);
  EXPECT_TRUE(master->requests.empty());

  const auto fetched = backend->get_file("salt://motd", dest.string(), true, "base", 0);
  ASSERT_TRUE(fetched.ok());
  EXPECT_EQ(fetched.path, dest);
  EXPECT_EQ(read_file(dest), "welcome");
  EXPECT_FALSE(fs::exists(cached("motd")));
}

TEST_F(RemoteBackendTest, DecompressesRequestedGzipChunks) {
  master->files["base"]["big.txt"] = "compress me please";

  const auto result = backend->get_file("salt://big.txt", "", false, "base", 6);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(read_file(result.path), "compress me please");
  EXPECT_EQ(master->requests.front().get_int("gzip"), 6);
}

TEST_F(RemoteBackendTest, GzipFlagIgnoredWhenNotRequested) {
  master->handler = [](const Load& request) {
    Load reply;
    reply.set("dest", "raw.bin");
    reply.set("gzip", true);
    reply.set("data", request.get_int("loc") == 0 ? "raw" : "");
    return reply;
  };

  const auto result = backend->get_file("salt://raw.bin", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(read_file(result.path), "raw");
}

TEST_F(RemoteBackendTest, RepeatedHashMismatchStopsAfterThreeDownloads) {
  master->files["base"]["flaky.txt"] = "flaky content";
  master->forced_hsum = "ffffffffffffffffffffffffffffffff";

  const auto result = backend->get_file("salt://flaky.txt", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(read_file(result.path), "flaky content");

  // 13 bytes in chunks of 4 plus the closing empty reply, three times over
  EXPECT_THAT(serve_offsets(), ElementsAre(0, 4, 8, 12, 13,
                                           0, 4, 8, 12, 13,
                                           0, 4, 8, 12, 13));
}

TEST_F(RemoteBackendTest, SingleMismatchRefetchesFromStart) {
  master->files["base"]["once.txt"] = "abcdef";
  int closing_replies = 0;
  master->handler = [this, &closing_replies](const Load& request) {
    const std::string content = master->files["base"]["once.txt"];
    const auto loc = static_cast<size_t>(request.get_int("loc"));
    Load reply;
    reply.set("dest", "once.txt");
    if (loc < content.size()) {
      reply.set("data", content.substr(loc, 4));
      return reply;
    }
    reply.set("data", "");
    reply.set("hsum", ++closing_replies == 1 ? std::string("bad")
                                              : fileclient::crypto::hex_digest_of(content, "md5"));
    return reply;
  };

  const auto result = backend->get_file("salt://once.txt", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(read_file(result.path), "abcdef");
  EXPECT_EQ(closing_replies, 2);
  EXPECT_THAT(serve_offsets(), ElementsAre(0, 4, 6, 0, 4, 6));
}

TEST_F(RemoteBackendTest, VerifiesWithServerHashType) {
  master->files["base"]["sha.txt"] = "sha content";
  master->hash_type = "sha256";

  const auto result = backend->get_file("salt://sha.txt", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(master->count("_serve_file"), 4);
}

TEST_F(RemoteBackendTest, TimeoutAbortsAndLeavesPartialFile) {
  master->files["base"]["slow.txt"] = "0123456789";
  master->timeout_after = 2;

  const auto result = backend->get_file("salt://slow.txt", "", false, "base", 0);
  EXPECT_EQ(result.status, FetchStatus::TIMEOUT);
  EXPECT_EQ(read_file(cached("slow.txt")), "01234567");
}

TEST_F(RemoteBackendTest, DirectoryAtCachePathIsReplaced) {
  fs::create_directories(cached("was_dir/nested"));
  master->files["base"]["was_dir"] = "now a file";

  const auto result = backend->get_file("salt://was_dir", "", false, "base", 0);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(fs::is_regular_file(cached("was_dir")));
  EXPECT_EQ(read_file(cached("was_dir")), "now a file");
}

TEST_F(RemoteBackendTest, ListingsComeFromMaster) {
  master->files["base"]["a/one.txt"] = "1";
  master->files["base"]["b.txt"] = "2";
  master->empty_dirs["base"] = {"a/empty"};

  EXPECT_THAT(*backend->file_list("base"), ElementsAre("a/one.txt", "b.txt"));
  EXPECT_THAT(*backend->list_env("base"), ElementsAre("a/one.txt", "b.txt"));
  EXPECT_THAT(*backend->dir_list("base"), ElementsAre("a"));
  EXPECT_THAT(*backend->file_list_emptydirs("base"), ElementsAre("a/empty"));
  EXPECT_TRUE(backend->file_list("prod")->empty());
  EXPECT_EQ(master->requests.back().get_string("cmd"), "_file_list");
}

TEST_F(RemoteBackendTest, ListingTimeoutIsDistinctFromEmpty) {
  master->timeout_after = 0;
  EXPECT_FALSE(backend->file_list("base").has_value());
  EXPECT_FALSE(backend->dir_list("base").has_value());
  EXPECT_FALSE(backend->file_list_emptydirs("base").has_value());
  EXPECT_FALSE(backend->master_opts().has_value());
  EXPECT_FALSE(backend->ext_nodes().has_value());
  EXPECT_FALSE(backend->hash_file("salt://x", "base").has_value());
}

TEST_F(RemoteBackendTest, HashesThroughMaster) {
  master->files["base"]["abc.txt"] = "abc";

  const auto digest = backend->hash_file("salt://abc.txt", "base");
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(digest->hash_type, "md5");
  EXPECT_EQ(digest->hsum, "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_FALSE(backend->hash_file("salt://missing.txt", "base").has_value());

  const auto local = test_dir / "local.txt";
  write_file(local, "abc");
  const size_t before = master->requests.size();
  EXPECT_EQ(backend->hash_file(local.string(), "base")->hsum, "900150983cd24fb0d6963f7d28e17f72");
  EXPECT_EQ(master->requests.size(), before);
}

TEST_F(RemoteBackendTest, MasterOptsAndExtNodes) {
  master->master_opts.set("file_roots", fileclient::network::StringListMap{{"base", {"/srv/salt"}}});
  master->ext_nodes = {{"base", {"web", "db"}}};

  const auto opts = backend->master_opts();
  ASSERT_TRUE(opts.has_value());
  EXPECT_EQ(opts->get_map("file_roots").at("base"), (std::vector<std::string>{"/srv/salt"}));

  const auto nodes = backend->ext_nodes();
  ASSERT_TRUE(nodes.has_value());
  EXPECT_THAT(nodes->at("base"), ElementsAre("web", "db"));

  const Load& request = master->requests.back();
  EXPECT_EQ(request.get_string("id"), "web01");
  const Load sent_opts = fileclient::network::Codec().deserialize(request.get_string("opts"));
  EXPECT_EQ(sent_opts.get_string("id"), "web01");
  EXPECT_EQ(sent_opts.get_string("cachedir"), config.cachedir.string());
}

TEST(FetchSessionTest, RestartTruncates) {
  const auto path = std::filesystem::temp_directory_path() / "fileclient_fetch_session_test";
  {
    FetchSession session;
    session.open(path);
    session.write("first download");
    EXPECT_EQ(session.offset(), 14u);
    session.restart();
    EXPECT_EQ(session.offset(), 0u);
    session.write("second");
  }
  EXPECT_EQ(read_file(path), "second");
  std::filesystem::remove(path);
}
