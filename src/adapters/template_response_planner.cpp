/*
 * template_response_planner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "template_response_planner.hpp"

#include <fmt/format.h>

#include "workflow/alert_message.hpp"

namespace stormwatch::adapters {

using workflow::PlanningError;
using workflow::PlanningErrorCode;

namespace {

auto eventName(const workflow::Assessment& assessment) -> std::string {
    return assessment.disasterType.empty() ? std::string("weather event")
                                           : assessment.disasterType;
}

}  // namespace

auto TemplateResponsePlanner::plan(const std::string& department,
                                   const std::string& location,
                                   const workflow::Assessment& assessment,
                                   std::chrono::milliseconds /*timeout*/)
    -> workflow::PlanResult {
    const auto event = eventName(assessment);
    const auto severity = workflow::severityToString(assessment.severity);

    if (department == workflow::kEmergencyResponse) {
        return fmt::format(
            "1. Activate the emergency operations centre for {}.\n"
            "2. Stage rescue and medical teams ahead of the {} ({} "
            "severity).\n"
            "3. Open shelters and begin evacuation of exposed areas.\n"
            "4. Issue public warnings every hour until the threat passes.",
            location, event, severity);
    }
    if (department == workflow::kCivilDefense) {
        return fmt::format(
            "1. Broadcast safety guidance for the {} to residents of {}.\n"
            "2. Check on vulnerable residents and care facilities.\n"
            "3. Keep volunteers on standby while severity is {}.",
            event, location, severity);
    }
    if (department == workflow::kPublicWorks) {
        return fmt::format(
            "1. Clear drains and culverts across {}.\n"
            "2. Inspect bridges, power lines and roads exposed to the {}.\n"
            "3. Pre-position pumps, sandbags and repair crews ({} "
            "severity).",
            location, event, severity);
    }
    return std::unexpected(PlanningError{
        PlanningErrorCode::Unavailable,
        fmt::format("No playbook for department '{}'", department)});
}

}  // namespace stormwatch::adapters
