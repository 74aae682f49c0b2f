/*
 * threshold_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "threshold_classifier.hpp"

#include <fmt/format.h>

namespace stormwatch::adapters {

using workflow::ClassificationError;
using workflow::ClassificationErrorCode;
using workflow::ClassifierVerdict;

namespace {

constexpr double kHurricaneWind = 33.0;
constexpr double kFloodPrecipitation = 50.0;
constexpr double kSevereFloodPrecipitation = 100.0;
constexpr double kHeatwaveTemperature = 40.0;
constexpr double kSevereHeatwaveTemperature = 45.0;
constexpr double kStormWind = 17.0;
constexpr double kStormHumidity = 80.0;
constexpr double kStormPressure = 1010.0;
constexpr double kFreezingTemperature = -10.0;
constexpr double kBreezyWind = 10.0;

auto verdict(std::string type, std::string severity, std::string rationale)
    -> ClassifierVerdict {
    return ClassifierVerdict{std::move(type), std::move(severity),
                             std::move(rationale), std::nullopt};
}

}  // namespace

auto ThresholdClassifier::classify(const workflow::Observation& observation,
                                   std::chrono::milliseconds /*timeout*/)
    -> std::expected<ClassifierVerdict, ClassificationError> {
    if (!observation.windSpeed || !observation.pressure ||
        !observation.temperature) {
        return std::unexpected(ClassificationError{
            ClassificationErrorCode::MalformedOutput,
            "Observation lacks wind speed, pressure or temperature"});
    }

    const double wind = *observation.windSpeed;
    const double pressure = *observation.pressure;
    const double temperature = *observation.temperature;
    const double precipitation = observation.precipitation.value_or(0.0);
    const double humidity = observation.humidity.value_or(0.0);

    if (wind >= kHurricaneWind) {
        return verdict("Hurricane", "Critical",
                       fmt::format("wind {:.1f} m/s >= {:.0f} m/s", wind,
                                   kHurricaneWind));
    }
    if (precipitation >= kFloodPrecipitation) {
        const bool severe = precipitation >= kSevereFloodPrecipitation;
        return verdict(
            "Flood", severe ? "Critical" : "High",
            fmt::format("precipitation {:.1f} mm >= {:.0f} mm", precipitation,
                        severe ? kSevereFloodPrecipitation
                               : kFloodPrecipitation));
    }
    if (temperature >= kHeatwaveTemperature) {
        const bool severe = temperature >= kSevereHeatwaveTemperature;
        return verdict(
            "Heatwave", severe ? "Critical" : "High",
            fmt::format("temperature {:.1f} C >= {:.0f} C", temperature,
                        severe ? kSevereHeatwaveTemperature
                               : kHeatwaveTemperature));
    }
    if (wind >= kStormWind &&
        (humidity >= kStormHumidity || pressure <= kStormPressure)) {
        return verdict(
            "Severe Storm", "High",
            fmt::format("wind {:.1f} m/s >= {:.0f} m/s with {}", wind,
                        kStormWind,
                        humidity >= kStormHumidity
                            ? fmt::format("humidity {:.1f}% >= {:.0f}%",
                                          humidity, kStormHumidity)
                            : fmt::format("pressure {:.1f} hPa <= {:.0f} hPa",
                                          pressure, kStormPressure)));
    }
    if (temperature <= kFreezingTemperature && precipitation > 0.0) {
        return verdict("Winter Storm", "Medium",
                       fmt::format("temperature {:.1f} C <= {:.0f} C with "
                                   "precipitation {:.1f} mm",
                                   temperature, kFreezingTemperature,
                                   precipitation));
    }
    if (wind >= kBreezyWind) {
        return verdict("Severe Storm", "Low",
                       fmt::format("wind {:.1f} m/s >= {:.0f} m/s", wind,
                                   kBreezyWind));
    }
    return verdict("No Immediate Threat", "Low",
                   "all readings below alert thresholds");
}

}  // namespace stormwatch::adapters
