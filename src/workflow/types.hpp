/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Core value types of the incident workflow: severities, incident
states, audit event kinds, observations and assessments

**************************************************/

#ifndef STORMWATCH_WORKFLOW_TYPES_HPP
#define STORMWATCH_WORKFLOW_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace stormwatch::workflow {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

/**
 * @brief Severity levels produced by classification
 */
enum class Severity { Critical, High, Medium, Low };

[[nodiscard]] auto severityToString(Severity severity) -> std::string_view;

/**
 * @brief Parses a severity name, case-insensitive.
 * @return std::nullopt for anything that is not one of the four levels
 */
[[nodiscard]] auto parseSeverity(std::string_view name)
    -> std::optional<Severity>;

/**
 * @brief Workflow states of an Incident
 */
enum class IncidentState {
    PendingObservation,
    Observed,
    Classified,
    AwaitingApproval,
    Approved,
    Rejected,
    Expired,
    Dispatched,
    DispatchFailed,
    Done,
    Aborted
};

[[nodiscard]] auto stateToString(IncidentState state) -> std::string_view;
[[nodiscard]] auto parseState(std::string_view name)
    -> std::optional<IncidentState>;

/**
 * @brief DONE, DISPATCHED, DISPATCH_FAILED and ABORTED end an Incident.
 */
[[nodiscard]] auto isTerminal(IncidentState state) -> bool;

/**
 * @brief Whether the state machine allows moving from @p from to @p to.
 */
[[nodiscard]] auto isValidTransition(IncidentState from, IncidentState to)
    -> bool;

enum class AuditEventKind {
    Observed,
    Classified,
    PolicyDecided,
    ApprovalRequested,
    ApprovalResolved,
    Dispatched,
    DispatchFailed,
    Aborted,
    RetryScheduled,
    Closed
};

[[nodiscard]] auto eventKindToString(AuditEventKind kind) -> std::string_view;
[[nodiscard]] auto parseEventKind(std::string_view name)
    -> std::optional<AuditEventKind>;

enum class ApprovalResolution { Pending, Approved, Rejected, Expired };

[[nodiscard]] auto resolutionToString(ApprovalResolution resolution)
    -> std::string_view;

/**
 * @brief Operator decision passed to ApprovalGate::resolve
 */
enum class ApprovalDecision { Approve, Reject };

/**
 * @brief Immutable weather snapshot for one location
 */
struct Observation {
    std::string id;
    std::string location;
    Clock::time_point timestamp;
    std::string description;

    std::optional<double> temperature;    ///< degrees Celsius
    std::optional<double> windSpeed;      ///< m/s
    std::optional<double> humidity;       ///< percent
    std::optional<double> pressure;       ///< hPa
    std::optional<double> precipitation;  ///< mm
    std::optional<double> cloudCover;     ///< percent

    /// Provider payload, opaque to the workflow
    json raw;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief What a classifier returns before the workflow normalises it
 */
struct ClassifierVerdict {
    std::string disasterType;
    std::string severity;
    std::string rationale;
    std::optional<double> confidence;
};

/**
 * @brief Normalised classification of one Observation
 */
struct Assessment {
    std::string disasterType;
    std::string severityLabel;  ///< label as reported by the classifier
    Severity severity{Severity::Medium};
    bool ambiguous{false};
    std::string rationale;
    std::string observationId;
    std::optional<double> confidence;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Builds an Assessment from a verdict.
 *
 * An unrecognised severity label, or a confidence below @p minConfidence,
 * yields severity Medium with ambiguous set.
 */
[[nodiscard]] auto makeAssessment(const ClassifierVerdict& verdict,
                                  const Observation& observation,
                                  double minConfidence = 0.0) -> Assessment;

/**
 * @brief ISO-8601 UTC timestamp with millisecond precision
 */
[[nodiscard]] auto formatTimestamp(Clock::time_point time) -> std::string;

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_TYPES_HPP
