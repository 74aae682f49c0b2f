/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "sink_factory.hpp"

namespace stormwatch::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::LoggingManager() {
    sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;
    for (const auto& sinkConfig : config.effectiveSinks()) {
        if (auto sink = SinkFactory::createSink(sinkConfig)) {
            sinks.push_back(std::move(sink));
        }
    }

    config_ = config;
    sinks_ = std::move(sinks);

    for (auto& [name, logger] : loggers_) {
        logger->sinks() = sinks_;
        logger->set_level(config_.level);
        logger->set_pattern(config_.pattern);
    }
    installDefaultLogger();

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
    loggers_.clear();
    spdlog::drop_all();

    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    auto logger = createLogger(name);
    loggers_.emplace(name, logger);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    config_.level = level;
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

auto LoggingManager::getGlobalLevel() const -> spdlog::level::level_enum {
    std::shared_lock lock(mutex_);
    return config_.level;
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

auto LoggingManager::createLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(config_.level);
    logger->set_pattern(config_.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void LoggingManager::installDefaultLogger() {
    auto logger = createLogger("stormwatch");
    spdlog::set_default_logger(logger);
}

}  // namespace stormwatch::logging
