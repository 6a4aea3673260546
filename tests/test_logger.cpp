#include "gtest/gtest.h"
#include "utils/logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using attn::utils::Logger;
using attn::utils::LogLevel;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = ::testing::TempDir() + "logger_level.log";
        std::remove(log_path.c_str());
    }

    void TearDown() override {
        Logger::initialize("test_logs/attn_tests.log", LogLevel::DEBUG, 1024 * 1024, 1, false, true);
        std::remove(log_path.c_str());
    }

    std::string read_log() const {
        std::ifstream file(log_path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string log_path;
};

TEST_F(LoggerTest, LoweringLevelAtRuntimeReachesTheSinks) {
    Logger::initialize(log_path, LogLevel::WARN, 1024 * 1024, 1, false, true);

    Logger::debug("hidden at warn");
    Logger::set_level(LogLevel::DEBUG);
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    Logger::debug("visible after lowering");
    Logger::shutdown();

    std::string contents = read_log();
    EXPECT_EQ(contents.find("hidden at warn"), std::string::npos);
    EXPECT_NE(contents.find("visible after lowering"), std::string::npos);
}

TEST_F(LoggerTest, ParseLevelAcceptsAnyCase) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("ERROR"), LogLevel::ERROR);
}
