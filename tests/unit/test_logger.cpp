/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <storjcloud/utils/logger.hpp>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace storjcloud::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setConsole(&output_);
    }

    void TearDown() override {
        Logger::instance().setConsole(nullptr);
        Logger::instance().setLogFile("");
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setColorEnabled(true);
    }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    const std::string out = output_.str();
    EXPECT_EQ(out.find("filtered"), std::string::npos);
    EXPECT_NE(out.find("visible warn"), std::string::npos);
    EXPECT_NE(out.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "should not appear");
    EXPECT_TRUE(output_.str().empty());
}

TEST_F(LoggerTest, FormatsPlaceholders) {
    LOG_INFO("Discovery", "Found node {} on port {}", "abc", 14002);

    const std::string out = output_.str();
    EXPECT_NE(out.find("[INFO ]"), std::string::npos);
    EXPECT_NE(out.find("[Discovery]"), std::string::npos);
    EXPECT_NE(out.find("Found node abc on port 14002"), std::string::npos);
}

TEST_F(LoggerTest, ExtraPlaceholdersAreLeftAlone) {
    LOG_INFO("Test", "value {} and {}", 1);
    EXPECT_NE(output_.str().find("value 1 and {}"), std::string::npos);
}

TEST_F(LoggerTest, NoColorCodesWhenDisabled) {
    LOG_WARN("Test", "plain");
    EXPECT_EQ(output_.str().find("\033["), std::string::npos);
}

TEST_F(LoggerTest, ColorCodesWhenEnabled) {
    Logger::instance().setColorEnabled(true);
    LOG_ERROR("Test", "colored");
    EXPECT_NE(output_.str().find("\033[31m"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggerTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel(" WARNING ", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("Off", level));
    EXPECT_EQ(level, LogLevel::OFF);

    level = LogLevel::ERROR;
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST_F(LoggerTest, LogFileReceivesLinesWithoutColor) {
    const std::string path = ::testing::TempDir() + "storjcloud_logger_test.log";
    std::remove(path.c_str());

    Logger::instance().setColorEnabled(true);
    ASSERT_TRUE(Logger::instance().setLogFile(path));
    LOG_INFO("File", "written to file");
    ASSERT_TRUE(Logger::instance().setLogFile(""));

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("written to file"), std::string::npos);
    EXPECT_EQ(content.str().find("\033["), std::string::npos);
    std::remove(path.c_str());
}

TEST_F(LoggerTest, LogFileOpenFailure) {
    EXPECT_FALSE(Logger::instance().setLogFile("/nonexistent-dir/sub/file.log"));
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "worker {} message {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(output_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
