/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Central Logging Manager - named spdlog loggers over a shared
sink set

**************************************************/

#ifndef STORMWATCH_LOGGING_LOGGING_MANAGER_HPP
#define STORMWATCH_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace stormwatch::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Every named logger shares the sinks built from the active LoggingConfig.
 * Loggers handed out before initialize() write to a colour console sink and
 * are moved onto the configured sinks when initialize() runs. The spdlog
 * default logger uses the same sinks.
 */
class LoggingManager {
public:
    /**
     * @brief Get singleton instance
     */
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     *
     * Calling it again replaces the sink set of all existing loggers.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set log level for all loggers
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto getGlobalLevel() const -> spdlog::level::level_enum;

    /**
     * @brief Flush all loggers
     */
    void flush();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

private:
    LoggingManager();
    ~LoggingManager();

    auto createLogger(const std::string& name)
        -> std::shared_ptr<spdlog::logger>;
    void installDefaultLogger();

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    bool initialized_{false};
};

}  // namespace stormwatch::logging

#endif  // STORMWATCH_LOGGING_LOGGING_MANAGER_HPP
