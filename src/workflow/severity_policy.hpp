/*
 * severity_policy.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Severity gating rule deciding whether a human has to approve
an alert before it is dispatched

**************************************************/

#ifndef STORMWATCH_WORKFLOW_SEVERITY_POLICY_HPP
#define STORMWATCH_WORKFLOW_SEVERITY_POLICY_HPP

#include <map>
#include <string_view>

#include "types.hpp"

namespace stormwatch::workflow {

struct PolicyDecision {
    bool requiresApproval{true};
};

/**
 * @brief Deterministic severity -> approval mapping
 *
 * Critical and High bypass approval, Medium and Low require it. Any of the
 * four can be overridden; unrecognised severity names always require
 * approval.
 */
class SeverityPolicy {
public:
    SeverityPolicy() = default;
    explicit SeverityPolicy(std::map<Severity, bool> overrides);

    [[nodiscard]] auto decide(Severity severity) const -> PolicyDecision;
    [[nodiscard]] auto decide(std::string_view severity) const
        -> PolicyDecision;

    [[nodiscard]] auto overrides() const -> const std::map<Severity, bool>& {
        return overrides_;
    }

    [[nodiscard]] static auto defaultRequiresApproval(Severity severity)
        -> bool;

private:
    std::map<Severity, bool> overrides_;
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_SEVERITY_POLICY_HPP
