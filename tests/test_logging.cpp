#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <thread>
#include <vector>

namespace lanprobe {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, DefaultLogLevel) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, ParseLogLevelNames) {
    EXPECT_EQ(parse_log_level("error").value_or(LogLevel::Info), LogLevel::Error);
    EXPECT_EQ(parse_log_level("WARN").value_or(LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning").value_or(LogLevel::Info), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("Debug").value_or(LogLevel::Info), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("trace").value_or(LogLevel::Info), LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}

TEST_F(LoggingTest, FilteredLevelsDoNotThrow) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    EXPECT_NO_THROW(logger.log(LogLevel::Error, "Error message"));
    EXPECT_NO_THROW(logger.warn("filtered"));
    EXPECT_NO_THROW(logger.trace("filtered"));
}

TEST_F(LoggingTest, WritesToStderrOnly) {
    Logger& logger = Logger::instance();
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    logger.info("visible message");
    logger.debug("hidden message");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out.empty());
    EXPECT_THAT(err, testing::HasSubstr("[INFO] visible message"));
    EXPECT_THAT(err, testing::Not(testing::HasSubstr("hidden message")));
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < 50; ++j) logger.info("Thread " + std::to_string(i) + " log " + std::to_string(j));
        });
    }
    for (auto& t : threads) t.join();
    SUCCEED();
}

} // namespace lanprobe

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
