/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace stormwatch::logging {

namespace {

auto lowered(const std::string& text) -> std::string {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", type},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};

    if (type == "file" || type == "basic_file" || type == "rotating_file" ||
        type == "daily_file") {
        j["filePath"] = filePath;
    }
    if (type == "rotating_file") {
        j["maxFileSize"] = maxFileSize;
        j["maxFiles"] = maxFiles;
    }
    if (type == "daily_file") {
        j["rotationHour"] = rotationHour;
        j["rotationMinute"] = rotationMinute;
    }
    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.filePath = j.value("filePath", "");
    config.maxFileSize = j.value("maxFileSize", size_t{10 * 1024 * 1024});
    config.maxFiles = j.value("maxFiles", size_t{5});
    config.rotationHour = j.value("rotationHour", 0);
    config.rotationMinute = j.value("rotationMinute", 0);
    if (config.name.empty()) {
        config.name = config.type;
    }
    return config;
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinksJson = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinksJson.push_back(sink.toJson());
    }
    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"enableConsole", enableConsole},
            {"enableFile", enableFile},
            {"logDir", logDir},
            {"logFilename", logFilename},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles},
            {"sinks", sinksJson}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelFromString(j.value("level", "info"));
    config.pattern = j.value("pattern", config.pattern);
    config.enableConsole = j.value("enableConsole", true);
    config.enableFile = j.value("enableFile", false);
    config.logDir = j.value("logDir", "logs");
    config.logFilename = j.value("logFilename", "stormwatch");
    config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
    config.maxFiles = j.value("maxFiles", config.maxFiles);

    if (j.contains("sinks") && j["sinks"].is_array()) {
        for (const auto& sinkJson : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sinkJson));
        }
    }
    return config;
}

auto LoggingConfig::effectiveSinks() const -> std::vector<SinkConfig> {
    if (!sinks.empty()) {
        return sinks;
    }

    std::vector<SinkConfig> result;
    if (enableConsole) {
        SinkConfig console;
        console.name = "console";
        console.type = "console";
        result.push_back(console);
    }
    if (enableFile) {
        SinkConfig file;
        file.name = "file";
        file.type = "rotating_file";
        file.filePath =
            (std::filesystem::path(logDir) / (logFilename + ".log")).string();
        file.maxFileSize = maxFileSize;
        file.maxFiles = maxFiles;
        result.push_back(file);
    }
    return result;
}

// ============================================================================
// Level helpers
// ============================================================================

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    const auto name = lowered(level);
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "info") {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning") {
        return spdlog::level::warn;
    }
    if (name == "error" || name == "err") {
        return spdlog::level::err;
    }
    if (name == "critical" || name == "fatal") {
        return spdlog::level::critical;
    }
    if (name == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

auto isLevelName(const std::string& level) -> bool {
    static const std::vector<std::string> kNames = {
        "trace", "debug", "info",     "warn",  "warning",
        "error", "err",   "critical", "fatal", "off"};
    return std::find(kNames.begin(), kNames.end(), lowered(level)) !=
           kNames.end();
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    const auto view = spdlog::level::to_string_view(level);
    return std::string(view.data(), view.size());
}

}  // namespace stormwatch::logging
