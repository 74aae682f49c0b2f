/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <utility>

#include <fmt/format.h>

namespace stormwatch::workflow {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

constexpr std::array<std::pair<IncidentState, std::string_view>, 11>
    kStateNames{{
        {IncidentState::PendingObservation, "PENDING_OBSERVATION"},
        {IncidentState::Observed, "OBSERVED"},
        {IncidentState::Classified, "CLASSIFIED"},
        {IncidentState::AwaitingApproval, "AWAITING_APPROVAL"},
        {IncidentState::Approved, "APPROVED"},
        {IncidentState::Rejected, "REJECTED"},
        {IncidentState::Expired, "EXPIRED"},
        {IncidentState::Dispatched, "DISPATCHED"},
        {IncidentState::DispatchFailed, "DISPATCH_FAILED"},
        {IncidentState::Done, "DONE"},
        {IncidentState::Aborted, "ABORTED"},
    }};

constexpr std::array<std::pair<AuditEventKind, std::string_view>, 10>
    kEventNames{{
        {AuditEventKind::Observed, "observed"},
        {AuditEventKind::Classified, "classified"},
        {AuditEventKind::PolicyDecided, "policy-decided"},
        {AuditEventKind::ApprovalRequested, "approval-requested"},
        {AuditEventKind::ApprovalResolved, "approval-resolved"},
        {AuditEventKind::Dispatched, "dispatched"},
        {AuditEventKind::DispatchFailed, "dispatch-failed"},
        {AuditEventKind::Aborted, "aborted"},
        {AuditEventKind::RetryScheduled, "retry-scheduled"},
        {AuditEventKind::Closed, "closed"},
    }};

void putOptional(json& j, const char* key, const std::optional<double>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

}  // namespace

auto severityToString(Severity severity) -> std::string_view {
    switch (severity) {
        case Severity::Critical:
            return "Critical";
        case Severity::High:
            return "High";
        case Severity::Medium:
            return "Medium";
        case Severity::Low:
            return "Low";
    }
    return "Medium";
}

auto parseSeverity(std::string_view name) -> std::optional<Severity> {
    const auto lower = toLower(trim(name));
    if (lower == "critical") {
        return Severity::Critical;
    }
    if (lower == "high") {
        return Severity::High;
    }
    if (lower == "medium") {
        return Severity::Medium;
    }
    if (lower == "low") {
        return Severity::Low;
    }
    return std::nullopt;
}

auto stateToString(IncidentState state) -> std::string_view {
    for (const auto& [value, name] : kStateNames) {
        if (value == state) {
            return name;
        }
    }
    return "UNKNOWN";
}

auto parseState(std::string_view name) -> std::optional<IncidentState> {
    for (const auto& [value, text] : kStateNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

auto isTerminal(IncidentState state) -> bool {
    return state == IncidentState::Done ||
           state == IncidentState::Dispatched ||
           state == IncidentState::DispatchFailed ||
           state == IncidentState::Aborted;
}

auto isValidTransition(IncidentState from, IncidentState to) -> bool {
    if (isTerminal(from)) {
        return false;
    }
    if (to == IncidentState::Aborted) {
        return true;
    }
    switch (from) {
        case IncidentState::PendingObservation:
            return to == IncidentState::Observed;
        case IncidentState::Observed:
            return to == IncidentState::Classified;
        case IncidentState::Classified:
            return to == IncidentState::AwaitingApproval ||
                   to == IncidentState::Dispatched ||
                   to == IncidentState::DispatchFailed;
        case IncidentState::AwaitingApproval:
            return to == IncidentState::Approved ||
                   to == IncidentState::Rejected ||
                   to == IncidentState::Expired;
        case IncidentState::Approved:
            return to == IncidentState::Dispatched ||
                   to == IncidentState::DispatchFailed;
        case IncidentState::Rejected:
        case IncidentState::Expired:
            return to == IncidentState::Done;
        default:
            return false;
    }
}

auto eventKindToString(AuditEventKind kind) -> std::string_view {
    for (const auto& [value, name] : kEventNames) {
        if (value == kind) {
            return name;
        }
    }
    return "unknown";
}

auto parseEventKind(std::string_view name) -> std::optional<AuditEventKind> {
    for (const auto& [value, text] : kEventNames) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

auto resolutionToString(ApprovalResolution resolution) -> std::string_view {
    switch (resolution) {
        case ApprovalResolution::Pending:
            return "pending";
        case ApprovalResolution::Approved:
            return "approved";
        case ApprovalResolution::Rejected:
            return "rejected";
        case ApprovalResolution::Expired:
            return "expired";
    }
    return "pending";
}

auto Observation::toJson() const -> json {
    json j = {{"id", id},
              {"location", location},
              {"timestamp", formatTimestamp(timestamp)},
              {"description", description}};
    putOptional(j, "temperature", temperature);
    putOptional(j, "windSpeed", windSpeed);
    putOptional(j, "humidity", humidity);
    putOptional(j, "pressure", pressure);
    putOptional(j, "precipitation", precipitation);
    putOptional(j, "cloudCover", cloudCover);
    return j;
}

auto Assessment::toJson() const -> json {
    json j = {{"disasterType", disasterType},
              {"severityLabel", severityLabel},
              {"severity", std::string(severityToString(severity))},
              {"ambiguous", ambiguous},
              {"rationale", rationale},
              {"observationId", observationId}};
    putOptional(j, "confidence", confidence);
    return j;
}

auto makeAssessment(const ClassifierVerdict& verdict,
                    const Observation& observation, double minConfidence)
    -> Assessment {
    Assessment assessment;
    assessment.disasterType = verdict.disasterType;
    assessment.severityLabel = verdict.severity;
    assessment.rationale = verdict.rationale;
    assessment.observationId = observation.id;
    assessment.confidence = verdict.confidence;

    auto parsed = parseSeverity(verdict.severity);
    const bool lowConfidence = minConfidence > 0.0 && verdict.confidence &&
                               *verdict.confidence < minConfidence;
    if (!parsed || lowConfidence) {
        assessment.severity = Severity::Medium;
        assessment.ambiguous = true;
    } else {
        assessment.severity = *parsed;
    }
    return assessment;
}

auto formatTimestamp(Clock::time_point time) -> std::string {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            time.time_since_epoch())
                            .count() %
                        1000;
    const std::time_t seconds = Clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec,
                       millis < 0 ? millis + 1000 : millis);
}

}  // namespace stormwatch::workflow
