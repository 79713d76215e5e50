#include <gtest/gtest.h>
#include "core/Logging.h"
#include <thread>
#include <vector>

namespace asset_scan {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST_F(LoggingTest, MessagesBelowLevelAreSuppressed) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    testing::internal::CaptureStderr();
    logger.info("hidden");
    logger.error("shown");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[ERROR] shown"), std::string::npos);
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
}

TEST_F(LoggingTest, ConcurrentLogging) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < 50; ++j) logger.debug("thread " + std::to_string(i));
        });
    }
    for (auto& t : threads) t.join();
    SUCCEED();
}

}
