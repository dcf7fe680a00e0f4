/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <lanlight/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace lanlight::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(&output_);
    }

    void TearDown() override {
        Logger::instance().setOutput(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
        Logger::instance().setColorEnabled(true);
    }

    std::string output() const { return output_.str(); }

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

    EXPECT_EQ(output().find("filtered"), std::string::npos);
    EXPECT_NE(output().find("visible warn"), std::string::npos);
    EXPECT_NE(output().find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_ERROR("Test", "nothing");
    EXPECT_TRUE(output().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, PlaceholdersSubstitutedInOrder) {
    LOG_INFO("Discovery", "Device {} at {}:{}", "AA:BB", "192.168.1.5", 4003);
    EXPECT_NE(output().find("Device AA:BB at 192.168.1.5:4003"), std::string::npos);
}

TEST_F(LoggerTest, SurplusPlaceholdersKept) {
    LOG_INFO("Test", "{} and {}", 1);
    EXPECT_NE(output().find("1 and {}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentAndLevelTags) {
    LOG_WARN("MyComponent", "Test message");
    EXPECT_NE(output().find("[WARN ]"), std::string::npos);
    EXPECT_NE(output().find("[MyComponent]"), std::string::npos);
    EXPECT_EQ(output().find("\033["), std::string::npos);
}

TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("OFF"), LogLevel::OFF);
    EXPECT_EQ(Logger::parseLevel("bogus"), LogLevel::INFO);
    EXPECT_EQ(Logger::parseLevel("bogus", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, LevelTags) {
    EXPECT_STREQ(Logger::levelTag(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(Logger::levelTag(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(Logger::levelTag(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int logs_per_thread = 50;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread", "thread {} message {}", i, j);
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
