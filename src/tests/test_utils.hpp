#ifndef FILECLIENT_TEST_UTILS_HPP
#define FILECLIENT_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::add_common_attributes();
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

// 64 bytes of session key material shared by the client and the fake master
inline std::vector<uint8_t> test_session_key() {
    std::vector<uint8_t> key(64);
    for (size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<uint8_t>(i * 7 + 3);
    }
    return key;
}

// Fixture owning a scratch directory, removed after each test
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        init_logging();
        test_dir = std::filesystem::temp_directory_path() /
            ("fileclient_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(test_dir);
        ASSERT_TRUE(std::filesystem::exists(test_dir));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }
};

#endif // FILECLIENT_TEST_UTILS_HPP
