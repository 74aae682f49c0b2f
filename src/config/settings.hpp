/*
 * settings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Complete stormwatch settings and the settings file loader

**************************************************/

#ifndef STORMWATCH_CONFIG_SETTINGS_HPP
#define STORMWATCH_CONFIG_SETTINGS_HPP

#include <filesystem>

#include "sections.hpp"

#include "workflow/engine.hpp"
#include "workflow/monitor.hpp"
#include "workflow/severity_policy.hpp"

namespace stormwatch::config {

/**
 * @brief All sections of a settings document.
 *
 * The document has a single top-level "stormwatch" object with one key per
 * section; absent sections keep their defaults.
 */
struct Settings {
    LoggingSection logging;
    RetrySection retry;
    TimeoutsSection timeouts;
    ApprovalSection approval;
    PolicySection policy;
    NotifierSection notifier;
    MonitorSection monitor;
    AuditSection audit;
    SourceSection source;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Builds settings from a document
     * @throw InvalidConfigException for invalid values
     */
    [[nodiscard]] static auto fromJson(const json& j) -> Settings;

    /**
     * @brief JSON Schema of the whole document
     */
    [[nodiscard]] static auto schema() -> json;

    /**
     * @brief Cycle timeout with the "0 means approval timeout + 300 s"
     * default resolved
     */
    [[nodiscard]] auto effectiveCycleTimeout() const -> std::chrono::seconds;

    [[nodiscard]] auto toEngineSettings() const -> workflow::EngineSettings;
    [[nodiscard]] auto toMonitorSettings() const -> workflow::MonitorSettings;
    [[nodiscard]] auto toSeverityPolicy() const -> workflow::SeverityPolicy;
};

/**
 * @brief Loads a .json, .yaml or .yml settings file
 *
 * @throw ConfigIOException when the file is missing or unreadable
 * @throw BadConfigException when the file cannot be parsed
 * @throw InvalidConfigException when a value is invalid
 */
[[nodiscard]] auto loadSettings(const std::filesystem::path& path) -> Settings;

/**
 * @brief Parses settings text in the given format ("json" or "yaml")
 */
[[nodiscard]] auto parseSettings(std::string_view content,
                                 std::string_view format) -> Settings;

}  // namespace stormwatch::config

#endif  // STORMWATCH_CONFIG_SETTINGS_HPP
