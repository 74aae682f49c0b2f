/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace stormwatch::logging {

auto SinkFactory::isKnownType(const std::string& type) -> bool {
    return type == "console" || type == "stdout" || type == "file" ||
           type == "basic_file" || type == "rotating_file" ||
           type == "daily_file";
}

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    if (!isKnownType(config.type)) {
        spdlog::warn("Unknown sink type '{}' for sink '{}', skipped",
                     config.type, config.name);
        return nullptr;
    }

    spdlog::sink_ptr sink;
    try {
        if (config.type == "console" || config.type == "stdout") {
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        } else {
            sink = createFileBackedSink(config);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    }

    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::createFileBackedSink(const SinkConfig& config)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(config.filePath);

    if (config.type == "rotating_file") {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
    }
    if (config.type == "daily_file") {
        return std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            config.filePath, config.rotationHour, config.rotationMinute);
    }
    // Appends so that restarts keep earlier diagnostics.
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath,
                                                               false);
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace stormwatch::logging
