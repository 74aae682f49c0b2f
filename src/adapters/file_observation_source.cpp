/*
 * file_observation_source.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "file_observation_source.hpp"

#include <fstream>
#include <utility>

#include "atom/utils/uuid.hpp"

#include "logging/logging_manager.hpp"

namespace stormwatch::adapters {

using workflow::json;
using workflow::ObservationError;
using workflow::ObservationErrorCode;

namespace {

auto readNumber(const json& entry, const char* key) -> std::optional<double> {
    if (!entry.contains(key) || !entry.at(key).is_number()) {
        return std::nullopt;
    }
    return entry.at(key).get<double>();
}

}  // namespace

FileObservationSource::FileObservationSource(std::filesystem::path path)
    : path_(std::move(path)),
      logger_(logging::LoggingManager::getInstance().getLogger("adapters")) {}

auto FileObservationSource::readFeed() const
    -> std::expected<json, ObservationError> {
    std::ifstream file(path_);
    if (!file) {
        return std::unexpected(ObservationError{
            ObservationErrorCode::ProviderError,
            "Cannot open observation feed " + path_.string()});
    }
    try {
        auto feed = json::parse(file);
        if (!feed.is_object()) {
            return std::unexpected(ObservationError{
                ObservationErrorCode::ProviderError,
                "Observation feed must be an object keyed by location"});
        }
        return feed;
    } catch (const json::parse_error& e) {
        return std::unexpected(
            ObservationError{ObservationErrorCode::ProviderError,
                             std::string("Malformed observation feed: ") +
                                 e.what()});
    }
}

auto FileObservationSource::fetch(const std::string& location,
                                  std::chrono::milliseconds /*timeout*/)
    -> std::expected<workflow::Observation, ObservationError> {
    auto feed = readFeed();
    if (!feed) {
        logger_->warn("Observation feed unavailable: {}", feed.error().message);
        return std::unexpected(feed.error());
    }
    if (!feed->contains(location)) {
        return std::unexpected(
            ObservationError{ObservationErrorCode::NotFound,
                             "No observation for location '" + location + "'"});
    }

    const auto& entry = feed->at(location);
    if (!entry.is_object()) {
        return std::unexpected(ObservationError{
            ObservationErrorCode::ProviderError,
            "Observation for '" + location + "' is not an object"});
    }

    workflow::Observation obs;
    obs.id = atom::utils::UUID().toString();
    obs.location = location;
    obs.timestamp = workflow::Clock::now();
    obs.description = entry.value("description", std::string());
    obs.temperature = readNumber(entry, "temperature");
    obs.windSpeed = readNumber(entry, "windSpeed");
    obs.humidity = readNumber(entry, "humidity");
    obs.pressure = readNumber(entry, "pressure");
    obs.precipitation = readNumber(entry, "precipitation");
    obs.cloudCover = readNumber(entry, "cloudCover");
    obs.raw = entry;

    logger_->debug("Observation {} fetched for {}", obs.id, location);
    return obs;
}

auto FileObservationSource::checkReady() const -> bool {
    return readFeed().has_value();
}

}  // namespace stormwatch::adapters
