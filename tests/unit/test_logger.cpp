/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <bsonuuid/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace bsonuuid::utils;
using ::testing::HasSubstr;
using ::testing::Not;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setSink(&captured_);
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::string output() const { return captured_.str(); }

    std::ostringstream captured_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    EXPECT_THAT(output(), Not(HasSubstr("filtered")));
    EXPECT_THAT(output(), HasSubstr("visible warn"));
    EXPECT_THAT(output(), HasSubstr("visible error"));
}

TEST_F(LoggerTest, OffSuppressesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_FATAL("Test", "not shown");
    EXPECT_TRUE(output().empty());
}

TEST_F(LoggerTest, PlaceholdersAreSubstituted) {
    LOG_INFO("Codec", "parsed {} of {} bytes", 16, "sixteen");
    EXPECT_THAT(output(), HasSubstr("parsed 16 of sixteen bytes"));
}

TEST_F(LoggerTest, ExtraPlaceholdersAreKept) {
    LOG_INFO("Codec", "value {} and {}", 1);
    EXPECT_THAT(output(), HasSubstr("value 1 and {}"));
}

TEST_F(LoggerTest, LineCarriesLevelAndComponent) {
    LOG_WARN("MyComponent", "Test message");
    EXPECT_THAT(output(), HasSubstr("[WARN ]"));
    EXPECT_THAT(output(), HasSubstr("[MyComponent] Test message"));
}

TEST_F(LoggerTest, LogIfSkipsWhenConditionFalse) {
    LOG_IF(LogLevel::INFO, "Test", false, "hidden");
    LOG_IF(LogLevel::INFO, "Test", true, "shown");
    EXPECT_THAT(output(), Not(HasSubstr("hidden")));
    EXPECT_THAT(output(), HasSubstr("shown"));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(parseLogLevel("OFF"), LogLevel::OFF);

    // Case sensitive, unknown falls back to INFO
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel(""), LogLevel::INFO);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread" + std::to_string(i), "Message {}", j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(output());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
