#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace Convida;

TEST(LoggingChannelsTest, ParseLevelString)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("trace"), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::parseLevelString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(LoggingChannels::parseLevelString("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevelString("critical"), spdlog::level::critical);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
    EXPECT_EQ(LoggingChannels::parseLevelString("loud"), spdlog::level::info);
}

TEST(LoggingChannelsTest, UnknownChannelFallsBackToDefaultLogger)
{
    auto logger = LoggingChannels::get("no-such-channel");
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger, spdlog::default_logger());
}

TEST(LoggingChannelsTest, ChannelNames)
{
    EXPECT_EQ(
        LoggingChannels::channelNames(),
        (std::vector<std::string>{ "universe", "tick", "pattern", "config", "cli" }));
}

TEST(LoggingChannelsTest, ConfigureFromString)
{
    // Sinks at off keep test output quiet. Re-initialization is skipped if
    // another test already set things up, which is fine here.
    LoggingChannels::initialize(spdlog::level::off, spdlog::level::off);

    for (const auto& name : LoggingChannels::channelNames()) {
        ASSERT_NE(spdlog::get(name), nullptr) << name;
    }

    LoggingChannels::configureFromString("tick:trace, pattern : debug");
    EXPECT_EQ(LoggingChannels::tick()->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::pattern()->level(), spdlog::level::debug);

    LoggingChannels::configureFromString("*:warn");
    EXPECT_EQ(LoggingChannels::tick()->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::universe()->level(), spdlog::level::warn);

    // Malformed items are skipped.
    LoggingChannels::configureFromString("config,cli:error");
    EXPECT_EQ(LoggingChannels::cli()->level(), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::config()->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("*:info");
}
