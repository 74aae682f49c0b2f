/*
 * alert_message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "alert_message.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <optional>

#include <fmt/format.h>

namespace stormwatch::workflow {

namespace {

auto formatValue(const std::optional<double>& value, const char* unit)
    -> std::string {
    if (!value) {
        return "N/A";
    }
    return fmt::format("{:.1f}{}", *value, unit);
}

auto localTimestamp(Clock::time_point time) -> std::string {
    const std::time_t seconds = Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                       local.tm_year + 1900, local.tm_mon + 1, local.tm_mday,
                       local.tm_hour, local.tm_min, local.tm_sec);
}

}  // namespace

auto routeDepartment(const Assessment& assessment) -> std::string {
    if (assessment.severity == Severity::Critical ||
        assessment.severity == Severity::High) {
        return kEmergencyResponse;
    }
    std::string type = assessment.disasterType;
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (type.find("flood") != std::string::npos ||
        type.find("storm") != std::string::npos) {
        return kPublicWorks;
    }
    return kCivilDefense;
}

auto buildAlert(const Observation& observation, const Assessment& assessment,
                bool humanVerified,
                const std::optional<std::string>& responsePlan,
                Clock::time_point generatedAt) -> AlertMessage {
    AlertMessage message;
    message.department = routeDepartment(assessment);

    const auto severity = severityToString(assessment.severity);
    if (!assessment.disasterType.empty()) {
        message.subject =
            fmt::format("Weather Alert: {} severity weather event in {}",
                        severity, observation.location);
    } else {
        message.subject =
            fmt::format("Weather Report for {}", observation.location);
    }

    std::string body;
    body += fmt::format("Weather Alert for {}\n\n", observation.location);
    body += "Current Conditions:\n";
    body += fmt::format("- Weather: {}\n", observation.description.empty()
                                               ? "N/A"
                                               : observation.description);
    body += fmt::format("- Temperature: {}\n",
                        formatValue(observation.temperature, " C"));
    body += fmt::format("- Wind Speed: {}\n",
                        formatValue(observation.windSpeed, " m/s"));
    body += fmt::format("- Humidity: {}\n",
                        formatValue(observation.humidity, "%"));
    body += fmt::format("- Pressure: {}\n",
                        formatValue(observation.pressure, " hPa"));
    body += fmt::format("- Cloud Cover: {}\n",
                        formatValue(observation.cloudCover, "%"));
    body += fmt::format("- Precipitation: {}\n\n",
                        formatValue(observation.precipitation, " mm"));

    body += "Assessment:\n";
    body += fmt::format("- Disaster Type: {}\n",
                        assessment.disasterType.empty()
                            ? "N/A"
                            : assessment.disasterType);
    body += fmt::format("- Severity: {}{}\n", severity,
                        assessment.ambiguous ? " (classifier output ambiguous)"
                                             : "");
    body += fmt::format("- Responsible Department: {}\n", message.department);
    if (!assessment.rationale.empty()) {
        body += fmt::format("- Rationale: {}\n", assessment.rationale);
    }
    body += "\n";

    if (responsePlan && !responsePlan->empty()) {
        body += fmt::format("{} Response Plan:\n{}\n\n", message.department,
                            *responsePlan);
    }

    body += fmt::format("This is an automated weather alert generated on {}.\n",
                        localTimestamp(generatedAt));
    if (humanVerified) {
        std::string lowered(severity);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        body += fmt::format(
            "\nNote: This {} severity alert has been verified by a human "
            "operator.\n",
            lowered);
    }

    message.body = std::move(body);
    return message;
}

}  // namespace stormwatch::workflow
