#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

namespace trivial = boost::log::trivial;

class LoggerTest : public TempDirTest {
protected:
    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        TempDirTest::TearDown();
    }

    bool log_contains(const std::filesystem::path& log_file, const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return content.find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(fileclient::logger::parse_severity("trace"), trivial::trace);
    EXPECT_EQ(fileclient::logger::parse_severity("debug"), trivial::debug);
    EXPECT_EQ(fileclient::logger::parse_severity("info"), trivial::info);
    EXPECT_EQ(fileclient::logger::parse_severity("warning"), trivial::warning);
    EXPECT_EQ(fileclient::logger::parse_severity("error"), trivial::error);
    EXPECT_EQ(fileclient::logger::parse_severity("fatal"), trivial::fatal);
    EXPECT_EQ(fileclient::logger::parse_severity("chatty"), trivial::warning);
}

TEST_F(LoggerTest, WritesToFileAboveLevel) {
    const auto log_file = test_dir / "client.log";
    fileclient::logger::init_logging(log_file.string(), "info");

    BOOST_LOG_TRIVIAL(debug) << "Test: hidden debug message";
    BOOST_LOG_TRIVIAL(info) << "Test: visible info message";
    BOOST_LOG_TRIVIAL(error) << "Test: visible error message";

    EXPECT_TRUE(log_contains(log_file, "visible info message"));
    EXPECT_TRUE(log_contains(log_file, "[error] Test: visible error message"));
    EXPECT_FALSE(log_contains(log_file, "hidden debug message"));
}
