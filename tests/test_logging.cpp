#include <gtest/gtest.h>
#include <common/logging.hpp>
#include <cstdlib>
#include <optional>
#include <string>

using namespace snowflake;

namespace {

// Restores SNOWFLAKE_LOG_LEVEL and the shared logger's level
class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* value = std::getenv(logging::LEVEL_VARIABLE)) {
            saved_env_ = value;
        }
        saved_level_ = logging::get_logger()->level();
    }

    void TearDown() override {
        if (saved_env_) {
            setenv(logging::LEVEL_VARIABLE, saved_env_->c_str(), 1);
        } else {
            unsetenv(logging::LEVEL_VARIABLE);
        }
        logging::get_logger()->set_level(saved_level_);
    }

    std::optional<std::string> saved_env_;
    spdlog::level::level_enum saved_level_ = spdlog::level::info;
};

}  // namespace

TEST_F(LoggingTest, LevelFromEnvironment) {
    unsetenv(logging::LEVEL_VARIABLE);
    EXPECT_EQ(logging::level_from_environment(), spdlog::level::info);

    setenv(logging::LEVEL_VARIABLE, "warn", 1);
    EXPECT_EQ(logging::level_from_environment(), spdlog::level::warn);

    setenv(logging::LEVEL_VARIABLE, "trace", 1);
    EXPECT_EQ(logging::level_from_environment(), spdlog::level::trace);

    setenv(logging::LEVEL_VARIABLE, "off", 1);
    EXPECT_EQ(logging::level_from_environment(), spdlog::level::off);

    setenv(logging::LEVEL_VARIABLE, "chatty", 1);
    EXPECT_EQ(logging::level_from_environment(), spdlog::level::info);
}

TEST_F(LoggingTest, VerboseLowersToDebug) {
    auto log = logging::get_logger();
    log->set_level(spdlog::level::warn);
    logging::enable_verbose();
    EXPECT_EQ(log->level(), spdlog::level::debug);
}

TEST_F(LoggingTest, VerboseKeepsTrace) {
    auto log = logging::get_logger();
    log->set_level(spdlog::level::trace);
    logging::enable_verbose();
    EXPECT_EQ(log->level(), spdlog::level::trace);
}
