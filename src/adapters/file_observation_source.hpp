/*
 * file_observation_source.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Observation source backed by a JSON feed file

**************************************************/

#ifndef STORMWATCH_ADAPTERS_FILE_OBSERVATION_SOURCE_HPP
#define STORMWATCH_ADAPTERS_FILE_OBSERVATION_SOURCE_HPP

#include <filesystem>
#include <memory>

#include <spdlog/spdlog.h>

#include "workflow/capabilities.hpp"

namespace stormwatch::adapters {

/**
 * @brief Reads observations from a JSON document keyed by location.
 *
 * Each entry may carry description, temperature, windSpeed, humidity,
 * pressure, precipitation and cloudCover. The file is read again on every
 * fetch so that it can be edited while the program runs.
 */
class FileObservationSource : public workflow::ObservationSource {
public:
    explicit FileObservationSource(std::filesystem::path path);

    auto fetch(const std::string& location, std::chrono::milliseconds timeout)
        -> std::expected<workflow::Observation,
                         workflow::ObservationError> override;

    /**
     * @brief True when the feed file exists and parses
     */
    [[nodiscard]] auto checkReady() const -> bool;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    auto readFeed() const
        -> std::expected<workflow::json, workflow::ObservationError>;

    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace stormwatch::adapters

#endif  // STORMWATCH_ADAPTERS_FILE_OBSERVATION_SOURCE_HPP
