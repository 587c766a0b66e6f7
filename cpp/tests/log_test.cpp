#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "nmsync/core/log.hpp"

using namespace nmsync::core;

namespace {

// Restores the process-wide level and environment after each test.
class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = log_level();
        unsetenv(kLogLevelEnv);
    }

    void TearDown() override {
        unsetenv(kLogLevelEnv);
        set_log_level(saved_);
    }

    LogLevel saved_{LogLevel::Warn};
};

} // namespace

TEST_F(LogTest, ParsesNamesCaseInsensitively) {
    LogLevel level{};
    ASSERT_TRUE(is_ok(parse_log_level("error", &level)));
    EXPECT_EQ(level, LogLevel::Error);
    ASSERT_TRUE(is_ok(parse_log_level("WARN", &level)));
    EXPECT_EQ(level, LogLevel::Warn);
    ASSERT_TRUE(is_ok(parse_log_level("warning", &level)));
    EXPECT_EQ(level, LogLevel::Warn);
    ASSERT_TRUE(is_ok(parse_log_level("Info", &level)));
    EXPECT_EQ(level, LogLevel::Info);
    ASSERT_TRUE(is_ok(parse_log_level("debug", &level)));
    EXPECT_EQ(level, LogLevel::Debug);
}

TEST_F(LogTest, RejectsUnknownNames) {
    LogLevel level = LogLevel::Info;
    Status s = parse_log_level("verbose", &level);
    EXPECT_EQ(s.domain, StatusDomain::Config);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(level, LogLevel::Info);

    EXPECT_EQ(parse_log_level(nullptr, &level).code, StatusCode::Invalid);
    EXPECT_EQ(parse_log_level("info", nullptr).code, StatusCode::Invalid);
}

TEST_F(LogTest, ThresholdGatesLevels) {
    set_log_level(LogLevel::Warn);
    EXPECT_TRUE(log_enabled(LogLevel::Error));
    EXPECT_TRUE(log_enabled(LogLevel::Warn));
    EXPECT_FALSE(log_enabled(LogLevel::Info));
    EXPECT_FALSE(log_enabled(LogLevel::Debug));

    set_log_level(LogLevel::Debug);
    EXPECT_TRUE(log_enabled(LogLevel::Debug));

    set_log_level(LogLevel::Error);
    EXPECT_FALSE(log_enabled(LogLevel::Warn));
}

TEST_F(LogTest, EnvironmentSetsLevel) {
    set_log_level(LogLevel::Warn);
    ASSERT_EQ(setenv(kLogLevelEnv, "debug", 1), 0);
    ASSERT_TRUE(is_ok(log_level_from_env()));
    EXPECT_EQ(log_level(), LogLevel::Debug);
}

TEST_F(LogTest, UnsetOrEmptyEnvironmentKeepsLevel) {
    set_log_level(LogLevel::Info);
    ASSERT_TRUE(is_ok(log_level_from_env()));
    EXPECT_EQ(log_level(), LogLevel::Info);

    ASSERT_EQ(setenv(kLogLevelEnv, "", 1), 0);
    ASSERT_TRUE(is_ok(log_level_from_env()));
    EXPECT_EQ(log_level(), LogLevel::Info);
}

TEST_F(LogTest, BadEnvironmentValueIsReported) {
    set_log_level(LogLevel::Info);
    ASSERT_EQ(setenv(kLogLevelEnv, "loud", 1), 0);
    Status s = log_level_from_env();
    EXPECT_EQ(s.domain, StatusDomain::Config);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(log_level(), LogLevel::Info);
}

TEST_F(LogTest, WritesPrefixedLinesToStderr) {
    set_log_level(LogLevel::Info);
    testing::internal::CaptureStderr();
    log_info("indexed %d files", 3);
    log_debug("hidden");
    log_status_error("open", make_status(StatusDomain::Bindings, StatusCode::Conflict));
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("info: indexed 3 files\n"), std::string::npos);
    EXPECT_EQ(err.find("hidden"), std::string::npos);
    EXPECT_NE(err.find("error: open failed (code=Conflict/4, domain=Bindings/2, aux=0): Conflict"),
              std::string::npos);
}
