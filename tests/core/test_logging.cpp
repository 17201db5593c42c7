/**
 * @file test_logging.cpp
 * @brief Unit tests for logging system
 *
 * Tests level parsing, filtering, file output and thread safety.
 *
 * @date 2025-11-02
 */

#include <strata/core/logging.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace strata;

/**
 * @brief Global test environment to suppress verbose logging
 *
 * Sets log level to ERROR by default, so only error messages appear.
 * Individual tests can override this if they need to test other log levels.
 */
class QuietTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        // suppress INFO/DEBUG/TRACE logs during tests (only show errors)
        Logger::instance().set_level(LogLevel::ERROR);
        Logger::instance().set_colors_enabled(false);
    }

    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }
};

// Register the global environment
[[maybe_unused]] static auto* const quiet_env =
    ::testing::AddGlobalTestEnvironment(new QuietTestEnvironment);

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::instance().shutdown();
        Logger::instance().set_level(LogLevel::ERROR);
    }
};

// ========== Level Tests ==========

TEST_F(LoggingTest, ParseLogLevelAcceptsBothCases) {
    EXPECT_EQ(parse_log_level("trace").value(), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("DEBUG").value(), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("info").value(), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("WARN").value(), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error").value(), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("fatal").value(), LogLevel::FATAL);
}

TEST_F(LoggingTest, ParseLogLevelRejectsUnknownNames) {
    const auto result = parse_log_level("verbose");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_NE(result.error().message.find("verbose"), std::string::npos);
}

TEST_F(LoggingTest, LevelFiltering) {
    auto& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);

    EXPECT_EQ(logger.get_level(), LogLevel::WARN);
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN));
    EXPECT_TRUE(logger.is_enabled(LogLevel::FATAL));
}

// ========== Output Tests ==========

TEST_F(LoggingTest, WritesToLogFile) {
    const auto path = std::filesystem::temp_directory_path() / "strata_test_logs" / "logging_test.log";
    std::filesystem::remove(path);

    auto& logger = Logger::instance();
    ASSERT_TRUE(logger.initialize(path.string()));
    logger.set_level(LogLevel::ERROR);

    LOG_INFO("filtered out");
    LOG_ERROR("Disk is {} percent full", 97);
    logger.shutdown();

    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    std::stringstream contents;
    contents << file.rdbuf();

    EXPECT_NE(contents.str().find("Disk is 97 percent full"), std::string::npos);
    EXPECT_NE(contents.str().find("[ERROR]"), std::string::npos);
    EXPECT_EQ(contents.str().find("filtered out"), std::string::npos);
}

TEST_F(LoggingTest, FormattedLogging) {
    // quiet mode: formatting must still compile and not crash
    const int value = 42;
    const float pi = 3.14159f;
    LOG_INFO("Integer: {}", value);
    LOG_INFO("Float: {:.2f}", pi);
    LOG_INFO("Curly braces: {{ and }}");
    LOG_INFO("Long message: {}", std::string(10000, 'A'));

    SUCCEED();
}

/**
 * @brief Logging from multiple threads must not crash or race
 */
TEST_F(LoggingTest, ThreadSafety) {
    constexpr int num_threads = 4;
    constexpr int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                LOG_INFO("Thread {} message {}", t, i);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    SUCCEED();
}
