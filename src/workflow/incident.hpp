/*
 * incident.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Incident state and transition bookkeeping

**************************************************/

#ifndef STORMWATCH_WORKFLOW_INCIDENT_HPP
#define STORMWATCH_WORKFLOW_INCIDENT_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "alert_message.hpp"
#include "approval_gate.hpp"
#include "audit_log.hpp"
#include "types.hpp"

namespace stormwatch::workflow {

struct DispatchOutcome {
    bool delivered{false};
    int attempts{0};
    std::string department;
    std::optional<std::string> error;
};

/**
 * @brief Point-in-time copy of an Incident for readers outside the engine
 */
struct IncidentSnapshot {
    std::string id;
    std::string location;
    std::uint64_t cycle{0};
    IncidentState state{IncidentState::PendingObservation};
    std::optional<Observation> observation;
    std::optional<Assessment> assessment;
    std::optional<ApprovalRequest> approval;
    std::optional<std::string> responsePlan;
    std::optional<DispatchOutcome> dispatch;
    std::optional<std::string> abortReason;
    int observationAttempts{0};
    int classificationAttempts{0};
    std::uint64_t recordCount{0};
    Clock::time_point createdAt;
    Clock::time_point updatedAt;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief One workflow execution for a (location, cycle) pair
 *
 * Every state change goes through transition(), which checks it against the
 * state machine and returns the AuditRecord describing it. Sequence numbers
 * are assigned here so that records of one Incident are totally ordered.
 * Thread-safe; the engine additionally serialises the steps of one Incident.
 */
class Incident {
public:
    Incident(std::string location, std::uint64_t cycle);

    [[nodiscard]] static auto makeId(const std::string& location,
                                     std::uint64_t cycle) -> std::string;

    /**
     * @brief Moves to @p to and returns the matching record.
     * @throws InvalidStateException if the state machine forbids the move
     */
    auto transition(IncidentState to, AuditEventKind kind, json payload)
        -> AuditRecord;

    /**
     * @brief Record for a decision that leaves the state unchanged
     */
    auto decision(AuditEventKind kind, json payload) -> AuditRecord;

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto location() const -> const std::string& {
        return location_;
    }
    [[nodiscard]] auto cycle() const -> std::uint64_t { return cycle_; }
    [[nodiscard]] auto state() const -> IncidentState;
    [[nodiscard]] auto isTerminal() const -> bool;

    void setObservation(Observation observation);
    void setAssessment(Assessment assessment);
    void setApproval(ApprovalRequest request);
    void setAlert(AlertMessage alert);
    void setResponsePlan(std::string plan);
    void setAbortReason(std::string reason);

    [[nodiscard]] auto observation() const -> std::optional<Observation>;
    [[nodiscard]] auto assessment() const -> std::optional<Assessment>;
    [[nodiscard]] auto alert() const -> std::optional<AlertMessage>;
    [[nodiscard]] auto responsePlan() const -> std::optional<std::string>;
    [[nodiscard]] auto wasApproved() const -> bool;

    auto beginObservationAttempt() -> int;
    auto beginClassificationAttempt() -> int;
    auto beginDispatchAttempt() -> int;
    void finishDispatch(bool delivered, std::optional<std::string> error);

    [[nodiscard]] auto snapshot() const -> IncidentSnapshot;

private:
    auto makeRecord(AuditEventKind kind, IncidentState from, IncidentState to,
                    json payload) -> AuditRecord;

    const std::string id_;
    const std::string location_;
    const std::uint64_t cycle_;
    const Clock::time_point createdAt_;

    mutable std::mutex mutex_;
    IncidentState state_{IncidentState::PendingObservation};
    std::uint64_t sequence_{0};
    Clock::time_point updatedAt_;
    std::optional<Observation> observation_;
    std::optional<Assessment> assessment_;
    std::optional<ApprovalRequest> approval_;
    std::optional<AlertMessage> alert_;
    std::optional<std::string> responsePlan_;
    std::optional<DispatchOutcome> dispatch_;
    std::optional<std::string> abortReason_;
    int observationAttempts_{0};
    int classificationAttempts_{0};
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_INCIDENT_HPP
