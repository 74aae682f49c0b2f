/*
 * severity_policy.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "severity_policy.hpp"

#include <utility>

namespace stormwatch::workflow {

SeverityPolicy::SeverityPolicy(std::map<Severity, bool> overrides)
    : overrides_(std::move(overrides)) {}

auto SeverityPolicy::defaultRequiresApproval(Severity severity) -> bool {
    return severity == Severity::Medium || severity == Severity::Low;
}

auto SeverityPolicy::decide(Severity severity) const -> PolicyDecision {
    if (auto it = overrides_.find(severity); it != overrides_.end()) {
        return {it->second};
    }
    return {defaultRequiresApproval(severity)};
}

auto SeverityPolicy::decide(std::string_view severity) const
    -> PolicyDecision {
    auto parsed = parseSeverity(severity);
    if (!parsed) {
        return {true};
    }
    return decide(*parsed);
}

}  // namespace stormwatch::workflow
