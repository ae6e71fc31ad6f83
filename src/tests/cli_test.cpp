#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include "cli/cli.hpp"
#include "client/local_backend.hpp"
#include "test_utils.hpp"

using fileclient::cli::CLI;
using fileclient::client::Client;
using fileclient::client::LocalBackend;
using fileclient::config::Config;
using ::testing::HasSubstr;
using ::testing::Not;
namespace fs = std::filesystem;

class CLITest : public TempDirTest {
protected:
    Config config;
    std::unique_ptr<Client> client;
    fs::path root;

    void SetUp() override {
        TempDirTest::SetUp();
        root = test_dir / "root";
        write_file(root / "top.sls", "base: {}");
        write_file(root / "web" / "init.sls", "nginx: {}");
        write_file(root / "web" / "index.html", "<html/>");

        config.file_client = "local";
        config.cachedir = test_dir / "cache";
        config.file_roots = {{"base", {root.string()}}, {"dev", {root.string()}}};
        client = std::make_unique<Client>(config, std::make_unique<LocalBackend>(config));
    }

    std::string run(const std::string& commands, const std::string& env = "base") {
        std::istringstream input(commands);
        std::ostringstream output;
        CLI cli(*client, env, input, output);
        cli.run();
        return output.str();
    }
};

TEST_F(CLITest, ListsFilesAndStates) {
    const std::string output = run("file_list\nlist_states\nquit\n");
    EXPECT_THAT(output, HasSubstr("top.sls\nweb/index.html\nweb/init.sls\n"));
    EXPECT_THAT(output, HasSubstr("top\nweb\n"));
}

TEST_F(CLITest, SwitchesEnvironment) {
    std::istringstream input("env dev\nquit\n");
    std::ostringstream output;
    CLI cli(*client, "base", input, output);
    cli.run();

    EXPECT_EQ(cli.get_env(), "dev");
    EXPECT_THAT(output.str(), HasSubstr("Environment set to dev"));
}

TEST_F(CLITest, ReportsCachedAndMissingFiles) {
    const std::string output = run("get_state web\nis_cached salt://nothing\nget_state db\n");
    EXPECT_THAT(output, HasSubstr("salt://web/init.sls -> " + (root / "web" / "init.sls").string()));
    EXPECT_THAT(output, HasSubstr("Not cached: salt://nothing"));
    EXPECT_THAT(output, HasSubstr("No state db in base"));
}

TEST_F(CLITest, ReportsFetchResults) {
    const fs::path dest = test_dir / "out" / "index.html";
    const std::string output = run("get_file salt://web/index.html " + dest.string() + "\n"
                                   "get_file salt://absent.txt " + dest.string() + "\n");
    // Local roots are served in place
    EXPECT_THAT(output, HasSubstr((root / "web" / "index.html").string() + "\n"));
    EXPECT_THAT(output, HasSubstr("Failed to fetch salt://absent.txt: Not found"));
    EXPECT_FALSE(fs::exists(dest));
}

TEST_F(CLITest, HashesFiles) {
    const std::string output = run("hash_file salt://top.sls\nhash_file salt://absent\n");
    EXPECT_THAT(output, HasSubstr("md5 " + fileclient::crypto::hex_digest_of("base: {}", "md5")));
    EXPECT_THAT(output, HasSubstr("No hash available for salt://absent"));
}

TEST_F(CLITest, ErrorsDoNotStopTheShell) {
    const std::string output = run("cache_dir web\nbogus\nfile_list\n");
    EXPECT_THAT(output, HasSubstr("Error running cache_dir: Unsupported path: web"));
    EXPECT_THAT(output, HasSubstr("Unknown command or invalid arguments"));
    EXPECT_THAT(output, HasSubstr("top.sls"));
}

TEST_F(CLITest, QuitStopsReading) {
    const std::string output = run("quit\nfile_list\n");
    EXPECT_THAT(output, Not(HasSubstr("top.sls")));
}
