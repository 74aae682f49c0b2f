/*
 * template_response_planner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Response planner filling department playbooks

**************************************************/

#ifndef STORMWATCH_ADAPTERS_TEMPLATE_RESPONSE_PLANNER_HPP
#define STORMWATCH_ADAPTERS_TEMPLATE_RESPONSE_PLANNER_HPP

#include "workflow/capabilities.hpp"

namespace stormwatch::adapters {

/**
 * @brief Builds a plan from a fixed playbook per department.
 *
 * Emergency Response lists immediate actions, Civil Defense public safety
 * measures and Public Works infrastructure protection. Any other department
 * yields Unavailable.
 */
class TemplateResponsePlanner : public workflow::ResponsePlanner {
public:
    auto plan(const std::string& department, const std::string& location,
              const workflow::Assessment& assessment,
              std::chrono::milliseconds timeout)
        -> workflow::PlanResult override;
};

}  // namespace stormwatch::adapters

#endif  // STORMWATCH_ADAPTERS_TEMPLATE_RESPONSE_PLANNER_HPP
