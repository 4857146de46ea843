#include <gtest/gtest.h>
#include "utils/logger.hpp"
#include "core/accountant_config.hpp"
#include <string>

TEST(LoggerTest, InfoLevelWorks) {
    dp_ledger::Logger& log = dp_ledger::Logger::get();
    log.set_level(dp_ledger::LogLevel::INFO);
    log.info("Test info message: %d", 42);
    EXPECT_EQ(log.get_level(), dp_ledger::LogLevel::INFO);
}

TEST(LoggerTest, LevelNamesRoundTrip) {
    EXPECT_EQ(dp_ledger::string_to_log_level("warn"), dp_ledger::LogLevel::WARN);
    EXPECT_EQ(dp_ledger::log_level_to_string(dp_ledger::LogLevel::DEBUG), "debug");
    EXPECT_THROW(dp_ledger::string_to_log_level("verbose"), dp_ledger::ConfigurationError);
}

TEST(LoggerTest, ApplyLoggingConfigSetsLevel) {
    dp_ledger::AccountantConfig cfg;
    cfg.log_level = dp_ledger::LogLevel::ERROR;
    dp_ledger::apply_logging_config(cfg);
    EXPECT_EQ(dp_ledger::Logger::get().get_level(), dp_ledger::LogLevel::ERROR);

    dp_ledger::Logger::get().set_level(dp_ledger::LogLevel::INFO);
}

TEST(LoggerTest, ThresholdFiltersLowerLevels) {
    dp_ledger::Logger& log = dp_ledger::Logger::get();

    log.set_level(dp_ledger::LogLevel::ERROR);
    testing::internal::CaptureStdout();
    log.warn("suppressed %d", 1);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");

    log.set_level(dp_ledger::LogLevel::WARN);
    testing::internal::CaptureStdout();
    log.info("suppressed %d", 2);
    log.warn("budget %s", "exceeded");
    const std::string out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(out.find("suppressed"), std::string::npos);
    EXPECT_NE(out.find("WARN"), std::string::npos);
    EXPECT_NE(out.find("budget exceeded"), std::string::npos);

    log.set_level(dp_ledger::LogLevel::INFO);
}
