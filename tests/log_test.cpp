#include <spdlog/cfg/helpers.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>
#include <tempo.hpp>

using namespace tempo;

// Runs in its own process: the level must be configured before the logger exists
class LogTest : public ::testing::Test {};

TEST_F(LogTest, ConfiguredLevelIsKept) {
    ASSERT_FALSE(spdlog::get(log::LOGGER_NAME));
    spdlog::cfg::helpers::load_levels("tempo=debug");

    EXPECT_EQ(log::logger()->level(), spdlog::level::debug);
    EXPECT_EQ(spdlog::get(log::LOGGER_NAME).get(), log::logger().get());

    // Rejections are still reported through the expected error, whatever the level
    EXPECT_FALSE(Period::parse("1.23s456ns").has_value());

    log::set_level(spdlog::level::err);
    EXPECT_EQ(log::logger()->level(), spdlog::level::err);
}
