/*
 * test_settings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Tests for settings sections, loading and validation

**************************************************/

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "config/settings.hpp"

using namespace stormwatch;
using namespace stormwatch::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() /
                   (std::string("stormwatch_settings_") +
                    ::testing::UnitTest::GetInstance()
                        ->current_test_info()
                        ->name());
        fs::create_directories(tempDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    auto writeFile(const std::string& name, const std::string& content)
        -> fs::path {
        const auto path = tempDir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    fs::path tempDir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(SettingsTest, DefaultsMatchDocumentedValues) {
    const Settings settings;
    EXPECT_EQ(settings.approval.timeoutSeconds, 900);
    EXPECT_EQ(settings.monitor.pollIntervalSeconds, 3600);
    EXPECT_EQ(settings.monitor.workerThreads, 4);
    EXPECT_EQ(settings.monitor.maxCycles, 0u);
    EXPECT_EQ(settings.audit.path, "audit.jsonl");
    EXPECT_EQ(settings.notifier.outboxPath, "outbox.jsonl");
    EXPECT_EQ(settings.retry.dispatch.maxRetries, 3);
    EXPECT_EQ(settings.retry.dispatch.strategy,
              workflow::RetryStrategy::Exponential);
    EXPECT_TRUE(settings.policy.requiresApproval.empty());
}

TEST_F(SettingsTest, CycleTimeoutDefaultsToApprovalWindowPlusSlack) {
    Settings settings;
    EXPECT_EQ(settings.effectiveCycleTimeout(), 1200s);
    settings.monitor.cycleTimeoutSeconds = 60;
    EXPECT_EQ(settings.effectiveCycleTimeout(), 60s);
}

TEST_F(SettingsTest, EmptyDocumentsYieldDefaults) {
    EXPECT_EQ(parseSettings("", "yaml").toJson(), Settings{}.toJson());
    EXPECT_EQ(parseSettings("{}", "json").toJson(), Settings{}.toJson());
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(SettingsTest, YamlOverridesSelectedValues) {
    const auto settings = parseSettings(R"(
stormwatch:
  monitor:
    locations: [Harbor, Ridge]
    pollIntervalSeconds: 600
  approval:
    timeoutSeconds: 120
  retry:
    dispatch:
      strategy: linear
      maxRetries: 5
  policy:
    requiresApproval:
      High: true
    minConfidence: 0.6
  notifier:
    recipients: [ops@example.org]
)",
                                        "yaml");

    EXPECT_EQ(settings.monitor.locations,
              (std::vector<std::string>{"Harbor", "Ridge"}));
    EXPECT_EQ(settings.monitor.pollIntervalSeconds, 600);
    EXPECT_EQ(settings.approval.timeoutSeconds, 120);
    EXPECT_EQ(settings.retry.dispatch.strategy, workflow::RetryStrategy::Linear);
    EXPECT_EQ(settings.retry.dispatch.maxRetries, 5);
    EXPECT_EQ(settings.retry.observation.maxRetries, 3);
    EXPECT_TRUE(settings.policy.requiresApproval.at(workflow::Severity::High));
    EXPECT_DOUBLE_EQ(settings.policy.minConfidence, 0.6);
    EXPECT_EQ(settings.notifier.recipients.size(), 1u);
}

TEST_F(SettingsTest, ConversionToRuntimeSettings) {
    auto settings = parseSettings(
        R"({"stormwatch": {"timeouts": {"dispatchMs": 2500, "planningMs": 1200},
                          "approval": {"timeoutSeconds": 30},
                          "policy": {"requiresApproval": {"Low": false}},
                          "notifier": {"recipients": ["ops@example.org"]}}})",
        "json");

    const auto engine = settings.toEngineSettings();
    EXPECT_EQ(engine.dispatchTimeout, 2500ms);
    EXPECT_EQ(engine.planningTimeout, 1200ms);
    EXPECT_EQ(engine.approvalTimeout, 30s);
    EXPECT_EQ(engine.recipients.front(), "ops@example.org");

    const auto monitor = settings.toMonitorSettings();
    EXPECT_EQ(monitor.cycleTimeout, 330s);

    const auto policy = settings.toSeverityPolicy();
    EXPECT_FALSE(policy.decide(workflow::Severity::Low).requiresApproval);
    EXPECT_TRUE(policy.decide(workflow::Severity::Medium).requiresApproval);
}

TEST_F(SettingsTest, RoundTripThroughJson) {
    auto settings = Settings{};
    settings.monitor.locations = {"Harbor"};
    settings.policy.requiresApproval[workflow::Severity::Critical] = true;

    const auto reloaded = Settings::fromJson(settings.toJson());
    EXPECT_EQ(reloaded.toJson(), settings.toJson());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(SettingsTest, InvalidValuesAreRejected) {
    EXPECT_THROW(
        parseSettings(R"({"stormwatch": {"approval": {"timeoutSeconds": 0}}})",
                      "json"),
        InvalidConfigException);
    EXPECT_THROW(parseSettings(
                     R"({"stormwatch": {"retry": {"dispatch": {"strategy": "random"}}}})",
                     "json"),
                 InvalidConfigException);
    EXPECT_THROW(parseSettings(
                     R"({"stormwatch": {"retry": {"observation": {"multiplier": 0.5}}}})",
                     "json"),
                 InvalidConfigException);
    EXPECT_THROW(parseSettings(
                     R"({"stormwatch": {"policy": {"requiresApproval": {"Extreme": true}}}})",
                     "json"),
                 InvalidConfigException);
    EXPECT_THROW(
        parseSettings(R"({"stormwatch": {"policy": {"minConfidence": 1.5}}})",
                      "json"),
        InvalidConfigException);
    EXPECT_THROW(
        parseSettings(R"({"stormwatch": {"monitor": {"workerThreads": 0}}})",
                      "json"),
        InvalidConfigException);
    EXPECT_THROW(parseSettings(R"({"stormwatch": {"audit": {"path": ""}}})",
                               "json"),
                 InvalidConfigException);
}

TEST_F(SettingsTest, WrongTypesAreRejected) {
    EXPECT_THROW(parseSettings(
                     R"({"stormwatch": {"timeouts": {"dispatchMs": "soon"}}})",
                     "json"),
                 InvalidConfigException);
    EXPECT_THROW(parseSettings(R"({"stormwatch": []})", "json"),
                 InvalidConfigException);
    EXPECT_THROW(parseSettings("[1, 2]", "json"), InvalidConfigException);
}

TEST_F(SettingsTest, SectionHelpers) {
    EXPECT_EQ(RetrySection::key(), "retry");
    EXPECT_EQ(MonitorSection::path(), "/stormwatch/monitor");

    EXPECT_THROW(ApprovalSection::fromJson({{"timeoutSeconds", -5}}),
                 InvalidConfigException);

    MonitorSection monitor;
    monitor.merge({{"locations", json::array({"Harbor"})}, {"maxCycles", 2}});
    EXPECT_EQ(monitor.locations.size(), 1u);
    EXPECT_EQ(monitor.maxCycles, 2u);
    EXPECT_EQ(monitor.workerThreads, 4);
    EXPECT_NE(monitor.toJson(), MonitorSection::defaults().toJson());
}

TEST_F(SettingsTest, MergeRejectsInvalidOverridesAndKeepsSection) {
    MonitorSection monitor;
    monitor.merge({{"maxCycles", 3}, {"locations", nullptr}});
    EXPECT_EQ(monitor.maxCycles, 3u);
    EXPECT_TRUE(monitor.locations.empty());

    EXPECT_THROW(monitor.merge({{"capabilityThreads", 0}}),
                 InvalidConfigException);
    EXPECT_EQ(monitor.capabilityThreads, 4);
    EXPECT_EQ(monitor.maxCycles, 3u);
}

TEST_F(SettingsTest, MonitorThreadsAndRetentionReachRuntimeSettings) {
    const auto settings = parseSettings(
        R"({"stormwatch": {"monitor": {"capabilityThreads": 6,
                                       "retainedCycles": 0}}})",
        "json");
    EXPECT_EQ(settings.toEngineSettings().capabilityThreads, 6);
    EXPECT_EQ(settings.toMonitorSettings().retainedCycles, 0u);

    const Settings defaults;
    EXPECT_EQ(defaults.toEngineSettings().capabilityThreads, 4);
    EXPECT_EQ(defaults.toMonitorSettings().retainedCycles, 2u);
}

TEST_F(SettingsTest, SchemaDescribesEverySection) {
    const auto schema = Settings::schema();
    const auto& sections = schema["properties"]["stormwatch"]["properties"];
    for (const auto* key : {"logging", "retry", "timeouts", "approval",
                            "policy", "notifier", "monitor", "audit",
                            "source"}) {
        EXPECT_TRUE(sections.contains(key)) << key;
    }
    EXPECT_EQ(sections["approval"]["properties"]["timeoutSeconds"]["default"],
              900);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(SettingsTest, LoadsYamlAndJsonFiles) {
    const auto yamlPath = writeFile("settings.yml",
                                    "stormwatch:\n  audit:\n    path: a.jsonl\n");
    EXPECT_EQ(loadSettings(yamlPath).audit.path, "a.jsonl");

    const auto jsonPath = writeFile(
        "settings.JSON", R"({"stormwatch": {"audit": {"path": "b.jsonl"}}})");
    EXPECT_EQ(loadSettings(jsonPath).audit.path, "b.jsonl");
}

TEST_F(SettingsTest, FileErrors) {
    EXPECT_THROW(loadSettings(tempDir_ / "absent.yaml"), ConfigIOException);
    EXPECT_THROW(loadSettings(writeFile("settings.toml", "x = 1")),
                 BadConfigException);
    EXPECT_THROW(loadSettings(writeFile("broken.json", "{not json")),
                 BadConfigException);
    EXPECT_THROW(parseSettings("{}", "ini"), BadConfigException);
}
