/*
 * alert_message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Alert text and responsible department for a classified
observation

**************************************************/

#ifndef STORMWATCH_WORKFLOW_ALERT_MESSAGE_HPP
#define STORMWATCH_WORKFLOW_ALERT_MESSAGE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace stormwatch::workflow {

inline constexpr const char* kEmergencyResponse = "Emergency Response";
inline constexpr const char* kPublicWorks = "Public Works";
inline constexpr const char* kCivilDefense = "Civil Defense";

/**
 * @brief Department that handles the event.
 *
 * Critical and High go to Emergency Response, flood and storm types to
 * Public Works, everything else to Civil Defense.
 */
[[nodiscard]] auto routeDepartment(const Assessment& assessment)
    -> std::string;

struct AlertMessage {
    std::string subject;
    std::string body;
    std::string department;
};

/**
 * @brief Formats the alert sent for an Incident
 *
 * @param humanVerified Adds the operator verification note
 * @param responsePlan Department plan, printed after the assessment
 * @param generatedAt Timestamp printed in the body, local time
 */
[[nodiscard]] auto buildAlert(
    const Observation& observation, const Assessment& assessment,
    bool humanVerified,
    const std::optional<std::string>& responsePlan = std::nullopt,
    Clock::time_point generatedAt = Clock::now()) -> AlertMessage;

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_ALERT_MESSAGE_HPP
