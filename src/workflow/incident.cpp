/*
 * incident.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "incident.hpp"

#include <utility>

#include "exception.hpp"

namespace stormwatch::workflow {

auto IncidentSnapshot::toJson() const -> json {
    json j = {{"id", id},
              {"location", location},
              {"cycle", cycle},
              {"state", std::string(stateToString(state))},
              {"observationAttempts", observationAttempts},
              {"classificationAttempts", classificationAttempts},
              {"records", recordCount},
              {"createdAt", formatTimestamp(createdAt)},
              {"updatedAt", formatTimestamp(updatedAt)}};
    if (observation) {
        j["observation"] = observation->toJson();
    }
    if (assessment) {
        j["assessment"] = assessment->toJson();
    }
    if (approval) {
        j["approval"] = approval->toJson();
    }
    if (responsePlan) {
        j["responsePlan"] = *responsePlan;
    }
    if (dispatch) {
        j["dispatch"] = {{"delivered", dispatch->delivered},
                         {"attempts", dispatch->attempts},
                         {"department", dispatch->department}};
        if (dispatch->error) {
            j["dispatch"]["error"] = *dispatch->error;
        }
    }
    if (abortReason) {
        j["abortReason"] = *abortReason;
    }
    return j;
}

Incident::Incident(std::string location, std::uint64_t cycle)
    : id_(makeId(location, cycle)),
      location_(std::move(location)),
      cycle_(cycle),
      createdAt_(Clock::now()),
      updatedAt_(createdAt_) {}

auto Incident::makeId(const std::string& location, std::uint64_t cycle)
    -> std::string {
    return location + "#" + std::to_string(cycle);
}

auto Incident::transition(IncidentState to, AuditEventKind kind, json payload)
    -> AuditRecord {
    std::lock_guard lock(mutex_);
    if (!isValidTransition(state_, to)) {
        THROW_INVALID_STATE_EXCEPTION(
            "Incident " + id_ + " cannot move from " +
            std::string(stateToString(state_)) + " to " +
            std::string(stateToString(to)));
    }
    const auto from = state_;
    state_ = to;
    return makeRecord(kind, from, to, std::move(payload));
}

auto Incident::decision(AuditEventKind kind, json payload) -> AuditRecord {
    std::lock_guard lock(mutex_);
    return makeRecord(kind, state_, state_, std::move(payload));
}

auto Incident::makeRecord(AuditEventKind kind, IncidentState from,
                          IncidentState to, json payload) -> AuditRecord {
    AuditRecord record;
    record.sequence = ++sequence_;
    record.incidentId = id_;
    record.location = location_;
    record.cycle = cycle_;
    record.kind = kind;
    record.fromState = from;
    record.toState = to;
    record.timestamp = Clock::now();
    record.payload = std::move(payload);
    updatedAt_ = record.timestamp;
    return record;
}

auto Incident::state() const -> IncidentState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto Incident::isTerminal() const -> bool {
    std::lock_guard lock(mutex_);
    return workflow::isTerminal(state_);
}

void Incident::setObservation(Observation observation) {
    std::lock_guard lock(mutex_);
    observation_ = std::move(observation);
}

void Incident::setAssessment(Assessment assessment) {
    std::lock_guard lock(mutex_);
    assessment_ = std::move(assessment);
}

void Incident::setApproval(ApprovalRequest request) {
    std::lock_guard lock(mutex_);
    approval_ = std::move(request);
}

void Incident::setAlert(AlertMessage alert) {
    std::lock_guard lock(mutex_);
    alert_ = std::move(alert);
}

void Incident::setResponsePlan(std::string plan) {
    std::lock_guard lock(mutex_);
    responsePlan_ = std::move(plan);
}

void Incident::setAbortReason(std::string reason) {
    std::lock_guard lock(mutex_);
    abortReason_ = std::move(reason);
}

auto Incident::observation() const -> std::optional<Observation> {
    std::lock_guard lock(mutex_);
    return observation_;
}

auto Incident::assessment() const -> std::optional<Assessment> {
    std::lock_guard lock(mutex_);
    return assessment_;
}

auto Incident::alert() const -> std::optional<AlertMessage> {
    std::lock_guard lock(mutex_);
    return alert_;
}

auto Incident::responsePlan() const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    return responsePlan_;
}

auto Incident::wasApproved() const -> bool {
    std::lock_guard lock(mutex_);
    return approval_ &&
           approval_->resolution == ApprovalResolution::Approved;
}

auto Incident::beginObservationAttempt() -> int {
    std::lock_guard lock(mutex_);
    return ++observationAttempts_;
}

auto Incident::beginClassificationAttempt() -> int {
    std::lock_guard lock(mutex_);
    return ++classificationAttempts_;
}

auto Incident::beginDispatchAttempt() -> int {
    std::lock_guard lock(mutex_);
    if (!dispatch_) {
        dispatch_ = DispatchOutcome{};
        if (alert_) {
            dispatch_->department = alert_->department;
        }
    }
    return ++dispatch_->attempts;
}

void Incident::finishDispatch(bool delivered, std::optional<std::string> error) {
    std::lock_guard lock(mutex_);
    if (!dispatch_) {
        dispatch_ = DispatchOutcome{};
    }
    dispatch_->delivered = delivered;
    dispatch_->error = std::move(error);
}

auto Incident::snapshot() const -> IncidentSnapshot {
    std::lock_guard lock(mutex_);
    IncidentSnapshot snap;
    snap.id = id_;
    snap.location = location_;
    snap.cycle = cycle_;
    snap.state = state_;
    snap.observation = observation_;
    snap.assessment = assessment_;
    snap.approval = approval_;
    snap.responsePlan = responsePlan_;
    snap.dispatch = dispatch_;
    snap.abortReason = abortReason_;
    snap.observationAttempts = observationAttempts_;
    snap.classificationAttempts = classificationAttempts_;
    snap.recordCount = sequence_;
    snap.createdAt = createdAt_;
    snap.updatedAt = updatedAt_;
    return snap;
}

}  // namespace stormwatch::workflow
