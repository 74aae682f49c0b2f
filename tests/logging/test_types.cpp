/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Tests for logging configuration types and level helpers

**************************************************/

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "logging/sink_factory.hpp"
#include "logging/types.hpp"

using namespace stormwatch::logging;

// ============================================================================
// Level Helper Tests
// ============================================================================

TEST(LevelHelpersTest, LevelNamesAreCaseInsensitive) {
    EXPECT_EQ(levelFromString("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("Fatal"), spdlog::level::critical);
    EXPECT_EQ(levelFromString("off"), spdlog::level::off);
}

TEST(LevelHelpersTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(levelFromString("loud"), spdlog::level::info);
    EXPECT_FALSE(isLevelName("loud"));
    EXPECT_TRUE(isLevelName("Trace"));
}

TEST(LevelHelpersTest, LevelToStringUsesSpdlogNames) {
    EXPECT_EQ(levelToString(spdlog::level::warn), "warning");
    EXPECT_EQ(levelFromString(levelToString(spdlog::level::err)),
              spdlog::level::err);
}

// ============================================================================
// SinkConfig Tests
// ============================================================================

TEST(SinkConfigTest, FromJsonAppliesDefaults) {
    const auto config = SinkConfig::fromJson({{"type", "rotating_file"},
                                              {"filePath", "logs/a.log"},
                                              {"maxFiles", 3}});
    EXPECT_EQ(config.name, "rotating_file");
    EXPECT_EQ(config.level, spdlog::level::trace);
    EXPECT_EQ(config.maxFiles, 3u);
    EXPECT_EQ(config.maxFileSize, 10u * 1024 * 1024);

    const auto j = config.toJson();
    EXPECT_EQ(j["filePath"], "logs/a.log");
    EXPECT_EQ(j["maxFiles"], 3);
    EXPECT_FALSE(j.contains("rotationHour"));
}

TEST(SinkConfigTest, ConsoleSinkOmitsFileOptions) {
    SinkConfig config;
    config.type = "console";
    EXPECT_FALSE(config.toJson().contains("filePath"));
}

// ============================================================================
// LoggingConfig Tests
// ============================================================================

TEST(LoggingConfigTest, FromJsonReadsSwitches) {
    const auto config = LoggingConfig::fromJson(
        {{"level", "debug"}, {"enableFile", true}, {"logDir", "/tmp/sw"}});
    EXPECT_EQ(config.level, spdlog::level::debug);
    EXPECT_TRUE(config.enableConsole);
    EXPECT_TRUE(config.enableFile);
    EXPECT_EQ(config.logDir, "/tmp/sw");
    EXPECT_TRUE(config.sinks.empty());
}

TEST(LoggingConfigTest, EffectiveSinksFollowSwitches) {
    LoggingConfig config;
    config.enableFile = true;
    config.logDir = "var";
    const auto sinks = config.effectiveSinks();
    ASSERT_EQ(sinks.size(), 2u);
    EXPECT_EQ(sinks[0].type, "console");
    EXPECT_EQ(sinks[1].type, "rotating_file");
    EXPECT_EQ(std::filesystem::path(sinks[1].filePath),
              std::filesystem::path("var") / "stormwatch.log");

    config.enableConsole = false;
    config.enableFile = false;
    EXPECT_TRUE(config.effectiveSinks().empty());
}

TEST(LoggingConfigTest, ExplicitSinksWinOverSwitches) {
    const auto config = LoggingConfig::fromJson(
        {{"enableFile", true},
         {"sinks", {{{"type", "file"}, {"filePath", "x.log"}}}}});
    const auto sinks = config.effectiveSinks();
    ASSERT_EQ(sinks.size(), 1u);
    EXPECT_EQ(sinks[0].type, "file");
}

TEST(LoggingConfigTest, JsonRoundTripKeepsValues) {
    LoggingConfig config;
    config.level = spdlog::level::err;
    config.maxFiles = 9;
    const auto reloaded = LoggingConfig::fromJson(config.toJson());
    EXPECT_EQ(reloaded.level, spdlog::level::err);
    EXPECT_EQ(reloaded.maxFiles, 9u);
    EXPECT_EQ(reloaded.pattern, config.pattern);
}

// ============================================================================
// SinkFactory Tests
// ============================================================================

TEST(SinkFactoryTest, KnownTypes) {
    for (const auto* type : {"console", "stdout", "file", "basic_file",
                             "rotating_file", "daily_file"}) {
        EXPECT_TRUE(SinkFactory::isKnownType(type)) << type;
    }
    EXPECT_FALSE(SinkFactory::isKnownType("syslog"));
}

TEST(SinkFactoryTest, UnknownTypeYieldsNull) {
    SinkConfig config;
    config.type = "carrier_pigeon";
    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}

TEST(SinkFactoryTest, FileSinkCreatesParentDirectory) {
    const auto dir = std::filesystem::temp_directory_path() /
                     "stormwatch_sink_factory_test";
    std::filesystem::remove_all(dir);

    SinkConfig config;
    config.type = "file";
    config.level = spdlog::level::warn;
    config.filePath = (dir / "nested" / "app.log").string();

    auto sink = SinkFactory::createSink(config);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
    EXPECT_TRUE(std::filesystem::exists(dir / "nested"));

    sink.reset();
    std::filesystem::remove_all(dir);
}
