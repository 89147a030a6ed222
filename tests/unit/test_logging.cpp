#include <gtest/gtest.h>
#include "fdk/logging.hpp"
#include "fdk/error.hpp"
#include <spdlog/spdlog.h>

using namespace fdk;

TEST(Logging, SharedNamedLogger) {
    auto a = logger();
    auto b = logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "fdk");
    EXPECT_EQ(spdlog::get("fdk"), a);
}

TEST(Logging, SetLevelByName) {
    set_log_level("debug");
    EXPECT_EQ(logger()->level(), spdlog::level::debug);
    set_log_level("off");
    EXPECT_EQ(logger()->level(), spdlog::level::off);
    set_log_level("info");
    EXPECT_EQ(logger()->level(), spdlog::level::info);
}

TEST(Logging, UnknownLevelThrows) {
    try {
        set_log_level("verbose");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "Unknown log level: verbose");
    }
}
