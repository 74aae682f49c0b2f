/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Logging system type definitions

**************************************************/

#ifndef STORMWATCH_LOGGING_TYPES_HPP
#define STORMWATCH_LOGGING_TYPES_HPP

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/type/json.hpp"

namespace stormwatch::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file", "daily_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string filePath;
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    // Daily file options
    int rotationHour{0};
    int rotationMinute{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Configuration consumed by LoggingManager::initialize
 *
 * When @c sinks is empty, the console and file switches produce a console
 * sink and a rotating file sink under @c logDir.
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    bool enableConsole{true};
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"stormwatch"};
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Sink list derived from the switches when none is given
     */
    [[nodiscard]] auto effectiveSinks() const -> std::vector<SinkConfig>;
};

/**
 * @brief Convert level string to spdlog enum, info when unrecognised
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Whether @p level names a log level
 */
[[nodiscard]] auto isLevelName(const std::string& level) -> bool;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace stormwatch::logging

#endif  // STORMWATCH_LOGGING_TYPES_HPP
