/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef STORMWATCH_LOGGING_SINK_FACTORY_HPP
#define STORMWATCH_LOGGING_SINK_FACTORY_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace stormwatch::logging {

/**
 * @brief Creates spdlog sinks: console (colour stdout), basic file,
 * size-rotating file and daily file.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @return The sink, or nullptr for an unknown type or a construction
     * failure (both are logged)
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto isKnownType(const std::string& type) -> bool;

private:
    static auto createFileBackedSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace stormwatch::logging

#endif  // STORMWATCH_LOGGING_SINK_FACTORY_HPP
