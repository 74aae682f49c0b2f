/*
 * engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "engine.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "atom/utils/uuid.hpp"

#include "alert_message.hpp"
#include "exception.hpp"
#include "logging/logging_manager.hpp"
#include "timeout.hpp"

namespace stormwatch::workflow {

auto WorkflowEngine::create(std::shared_ptr<app::EventLoop> loop,
                            Capabilities capabilities, SeverityPolicy policy,
                            std::shared_ptr<AuditLog> audit,
                            EngineSettings settings)
    -> std::shared_ptr<WorkflowEngine> {
    return std::shared_ptr<WorkflowEngine>(
        new WorkflowEngine(std::move(loop), std::move(capabilities),
                           std::move(policy), std::move(audit),
                           std::move(settings)));
}

WorkflowEngine::WorkflowEngine(std::shared_ptr<app::EventLoop> loop,
                               Capabilities capabilities,
                               SeverityPolicy policy,
                               std::shared_ptr<AuditLog> audit,
                               EngineSettings settings)
    : loop_(std::move(loop)),
      capabilities_(std::move(capabilities)),
      policy_(std::move(policy)),
      audit_(std::move(audit)),
      settings_(std::move(settings)),
      observationRetry_(settings_.observationRetry),
      classificationRetry_(settings_.classificationRetry),
      dispatchRetry_(settings_.dispatchRetry),
      logger_(logging::LoggingManager::getInstance().getLogger("engine")) {
    if (!loop_ || !audit_) {
        THROW_WORKFLOW_EXCEPTION("WorkflowEngine needs an event loop and an audit log");
    }
    if (!capabilities_.source || !capabilities_.classifier ||
        !capabilities_.notifier) {
        THROW_WORKFLOW_EXCEPTION(
            "WorkflowEngine needs an observation source, a classifier and a "
            "notifier");
    }
    gate_ = std::make_shared<ApprovalGate>(loop_, settings_.approvalTimeout);
    callLoop_ = std::make_unique<app::EventLoop>(settings_.capabilityThreads);
}

// ============================================================================
// Public interface
// ============================================================================

auto WorkflowEngine::submit(const std::string& location, std::uint64_t cycle)
    -> std::string {
    if (shutdown_.load()) {
        THROW_INVALID_STATE_EXCEPTION("Engine is shut down, cannot submit " +
                                      location);
    }

    const auto id = Incident::makeId(location, cycle);
    SlotPtr slot;
    {
        std::lock_guard lock(mutex_);
        if (incidents_.contains(id)) {
            THROW_DUPLICATE_INCIDENT_EXCEPTION("Incident " + id +
                                               " already exists");
        }
        slot = std::make_shared<Slot>(location, cycle);
        incidents_.emplace(id, slot);
    }

    logger_->info("Incident {} submitted", id);
    schedule(slot, std::chrono::milliseconds(0),
             [this, slot]() { observeStep(slot, 1); });
    return id;
}

auto WorkflowEngine::runCycle(const std::vector<std::string>& locations,
                              std::uint64_t cycle)
    -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(locations.size());
    for (const auto& location : locations) {
        try {
            ids.push_back(submit(location, cycle));
        } catch (const DuplicateIncidentException& e) {
            logger_->warn("Skipping {} in cycle {}: {}", location, cycle,
                          e.what());
        }
    }
    return ids;
}

auto WorkflowEngine::waitFor(const std::string& incidentId,
                             std::chrono::milliseconds timeout)
    -> std::optional<IncidentState> {
    auto slot = findSlot(incidentId);
    std::unique_lock lock(mutex_);
    const bool done = stateChanged_.wait_for(
        lock, timeout, [&slot]() { return slot->incident.isTerminal(); });
    if (!done) {
        return std::nullopt;
    }
    return slot->incident.state();
}

auto WorkflowEngine::waitForAll(const std::vector<std::string>& incidentIds,
                                std::chrono::milliseconds timeout) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (const auto& id : incidentIds) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (!waitFor(id, std::max(remaining, std::chrono::milliseconds(0)))) {
            return false;
        }
    }
    return true;
}

auto WorkflowEngine::getIncident(const std::string& incidentId) const
    -> IncidentSnapshot {
    return findSlot(incidentId)->incident.snapshot();
}

auto WorkflowEngine::listIncidents() const -> std::vector<IncidentSnapshot> {
    std::vector<SlotPtr> slots;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, slot] : incidents_) {
            slots.push_back(slot);
        }
    }
    std::vector<IncidentSnapshot> result;
    result.reserve(slots.size());
    for (const auto& slot : slots) {
        result.push_back(slot->incident.snapshot());
    }
    std::sort(result.begin(), result.end(),
              [](const IncidentSnapshot& a, const IncidentSnapshot& b) {
                  return a.cycle != b.cycle ? a.cycle < b.cycle : a.id < b.id;
              });
    return result;
}

auto WorkflowEngine::resolveApproval(const std::string& requestId,
                                     ApprovalDecision decision)
    -> ApprovalRequest {
    return gate_->resolve(requestId, decision);
}

auto WorkflowEngine::pendingApprovals() const -> std::vector<ApprovalRequest> {
    return gate_->listPending();
}

auto WorkflowEngine::forget(const std::vector<std::string>& incidentIds)
    -> std::vector<std::string> {
    std::vector<std::string> kept;
    std::vector<std::string> dropped;
    {
        std::lock_guard lock(mutex_);
        for (const auto& id : incidentIds) {
            auto it = incidents_.find(id);
            if (it == incidents_.end()) {
                continue;
            }
            if (!it->second->incident.isTerminal()) {
                kept.push_back(id);
                continue;
            }
            incidents_.erase(it);
            dropped.push_back(id);
        }
    }
    for (const auto& id : dropped) {
        gate_->forget(id);
    }
    logger_->debug("Forgot {} finished incident(s), {} still running",
                   dropped.size(), kept.size());
    return kept;
}

auto WorkflowEngine::incidentCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return incidents_.size();
}

void WorkflowEngine::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    logger_->info("Workflow engine shutting down");

    std::set<std::string> closedIncidents;
    for (const auto& request : gate_->closeAll()) {
        closedIncidents.insert(request.incidentId);
    }

    std::vector<SlotPtr> slots;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, slot] : incidents_) {
            slots.push_back(slot);
        }
    }

    for (const auto& slot : slots) {
        std::lock_guard stepLock(slot->stepMutex);
        const auto state = slot->incident.state();
        if (state == IncidentState::AwaitingApproval &&
            closedIncidents.contains(slot->incident.id())) {
            if (auto request = gate_->findByIncident(slot->incident.id())) {
                slot->incident.setApproval(*request);
            }
            abort(slot, "shutdown", "approval still pending at shutdown");
        } else if (slot->backingOff && !workflow::isTerminal(state)) {
            abort(slot, "shutdown", "retry still pending at shutdown");
        }
    }
}

auto WorkflowEngine::isShutdown() const -> bool { return shutdown_.load(); }

// ============================================================================
// Scheduling
// ============================================================================

void WorkflowEngine::schedule(const SlotPtr& slot,
                              std::chrono::milliseconds delay,
                              std::function<void()> body) {
    if (!loop_->isRunning()) {
        std::lock_guard lock(slot->stepMutex);
        logger_->warn("Event loop stopped, incident {} cannot continue",
                      slot->incident.id());
        abort(slot, "shutdown", "event loop stopped");
        return;
    }
    auto self = shared_from_this();
    loop_->postDelayed(delay, [self, slot, body = std::move(body)]() {
        self->runGuarded(slot, body);
    });
}

void WorkflowEngine::runGuarded(const SlotPtr& slot,
                                const std::function<void()>& body) {
    std::lock_guard lock(slot->stepMutex);
    slot->backingOff = false;
    if (slot->incident.isTerminal()) {
        return;
    }
    if (shutdown_.load() &&
        slot->incident.state() == IncidentState::PendingObservation) {
        abort(slot, "shutdown", "engine shut down before observation");
        return;
    }
    try {
        body();
    } catch (const std::exception& e) {
        logger_->error("Incident {} failed in state {}: {}",
                       slot->incident.id(),
                       stateToString(slot->incident.state()), e.what());
        abort(slot, "internal-error", e.what());
    }
}

// ============================================================================
// Steps
// ============================================================================

template <typename Result, typename Call>
void WorkflowEngine::callCapability(
    const SlotPtr& slot, std::chrono::milliseconds timeout, Call call,
    std::function<void(std::optional<Result>)> finish) {
    std::weak_ptr<WorkflowEngine> weak = weak_from_this();
    invokeWithTimeout<Result>(
        *callLoop_, *loop_, std::move(call), timeout,
        [weak, slot, finish = std::move(finish)](std::optional<Result> outcome) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            self->schedule(slot, std::chrono::milliseconds(0),
                           [finish, outcome = std::move(outcome)]() {
                               finish(outcome);
                           });
        });
}

void WorkflowEngine::observeStep(const SlotPtr& slot, int attempt) {
    slot->incident.beginObservationAttempt();

    const auto location = slot->incident.location();
    const auto timeout = settings_.observationTimeout;
    callCapability<ObservationResult>(
        slot, timeout,
        [source = capabilities_.source, location,
         timeout]() -> ObservationResult {
            try {
                return source->fetch(location, timeout);
            } catch (const std::exception& e) {
                return std::unexpected(ObservationError{
                    ObservationErrorCode::ProviderError, e.what()});
            }
        },
        [this, slot, attempt, timeout](std::optional<ObservationResult> outcome) {
            if (!outcome) {
                outcome = std::unexpected(ObservationError{
                    ObservationErrorCode::Timeout,
                    fmt::format("no observation within {} ms",
                                timeout.count())});
            }
            finishObservation(slot, attempt, std::move(*outcome));
        });
}

void WorkflowEngine::finishObservation(const SlotPtr& slot, int attempt,
                                       ObservationResult result) {
    auto& incident = slot->incident;
    if (result) {
        auto observation = std::move(*result);
        if (observation.id.empty()) {
            observation.id = atom::utils::UUID().toString();
        }
        if (observation.location.empty()) {
            observation.location = incident.location();
        }
        auto payload = observation.toJson();
        incident.setObservation(std::move(observation));
        transition(slot, IncidentState::Observed, AuditEventKind::Observed,
                   std::move(payload));
        schedule(slot, std::chrono::milliseconds(0),
                 [this, slot]() { classifyStep(slot, 1); });
        return;
    }

    const auto& error = result.error();
    const auto detail =
        fmt::format("{}: {}", toString(error.code), error.message);
    logger_->warn("Incident {} observation attempt {} failed: {}",
                  incident.id(), attempt, detail);
    if (observationRetry_.shouldRetry(attempt, errorClassOf(error))) {
        scheduleRetry(slot, "observation", observationRetry_, attempt, detail,
                      &WorkflowEngine::observeStep);
        return;
    }
    abort(slot, "observation-unavailable", detail);
}

void WorkflowEngine::classifyStep(const SlotPtr& slot, int attempt) {
    auto& incident = slot->incident;
    incident.beginClassificationAttempt();

    auto observation = incident.observation();
    if (!observation) {
        THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                      " has no observation to classify");
    }
    const auto timeout = settings_.classificationTimeout;
    callCapability<ClassificationResult>(
        slot, timeout,
        [classifier = capabilities_.classifier, obs = *observation,
         timeout]() -> ClassificationResult {
            try {
                return classifier->classify(obs, timeout);
            } catch (const std::exception& e) {
                return std::unexpected(ClassificationError{
                    ClassificationErrorCode::ModelUnavailable, e.what()});
            }
        },
        [this, slot, attempt,
         timeout](std::optional<ClassificationResult> outcome) {
            if (!outcome) {
                outcome = std::unexpected(ClassificationError{
                    ClassificationErrorCode::Timeout,
                    fmt::format("no verdict within {} ms", timeout.count())});
            }
            finishClassification(slot, attempt, std::move(*outcome));
        });
}

void WorkflowEngine::finishClassification(const SlotPtr& slot, int attempt,
                                          ClassificationResult result) {
    auto& incident = slot->incident;
    if (result) {
        const auto observation = incident.observation();
        if (!observation) {
            THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                          " lost its observation");
        }
        auto assessment =
            makeAssessment(*result, *observation, settings_.minConfidence);
        if (assessment.ambiguous) {
            logger_->warn(
                "Incident {}: classifier output '{}' treated as Medium",
                incident.id(), assessment.severityLabel);
        }
        auto payload = assessment.toJson();
        incident.setAssessment(std::move(assessment));
        transition(slot, IncidentState::Classified, AuditEventKind::Classified,
                   std::move(payload));
        applyPolicy(slot);
        return;
    }

    const auto& error = result.error();
    const auto detail =
        fmt::format("{}: {}", toString(error.code), error.message);
    logger_->warn("Incident {} classification attempt {} failed: {}",
                  incident.id(), attempt, detail);
    if (classificationRetry_.shouldRetry(attempt, errorClassOf(error))) {
        scheduleRetry(slot, "classification", classificationRetry_, attempt,
                      detail, &WorkflowEngine::classifyStep);
        return;
    }
    abort(slot, "classification-failed", detail);
}

void WorkflowEngine::applyPolicy(const SlotPtr& slot) {
    auto& incident = slot->incident;
    const auto assessment = incident.assessment();
    if (!assessment) {
        THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                      " has no assessment");
    }

    const auto decision = policy_.decide(assessment->severity);
    const auto department = routeDepartment(*assessment);
    decide(slot, AuditEventKind::PolicyDecided,
           {{"severity", std::string(severityToString(assessment->severity))},
            {"ambiguous", assessment->ambiguous},
            {"requiresApproval", decision.requiresApproval},
            {"department", department}});

    if (!capabilities_.planner) {
        routeAfterPolicy(slot);
        return;
    }

    // One attempt; the alert goes out without a plan if it fails
    const auto timeout = settings_.planningTimeout;
    callCapability<PlanResult>(
        slot, timeout,
        [planner = capabilities_.planner, department,
         location = incident.location(), assessment = *assessment,
         timeout]() -> PlanResult {
            try {
                return planner->plan(department, location, assessment,
                                     timeout);
            } catch (const std::exception& e) {
                return std::unexpected(
                    PlanningError{PlanningErrorCode::Unavailable, e.what()});
            }
        },
        [this, slot, timeout](std::optional<PlanResult> outcome) {
            if (!outcome) {
                outcome = std::unexpected(PlanningError{
                    PlanningErrorCode::Timeout,
                    fmt::format("no plan within {} ms", timeout.count())});
            }
            finishPlanning(slot, std::move(*outcome));
        });
}

void WorkflowEngine::finishPlanning(const SlotPtr& slot, PlanResult result) {
    auto& incident = slot->incident;
    if (result && !result->empty()) {
        logger_->info("Incident {} response plan: {}", incident.id(),
                      *result);
        incident.setResponsePlan(std::move(*result));
    } else if (result) {
        logger_->warn("Incident {} planner returned an empty plan",
                      incident.id());
    } else {
        logger_->warn("Incident {} has no response plan: {}: {}",
                      incident.id(), toString(result.error().code),
                      result.error().message);
    }
    routeAfterPolicy(slot);
}

void WorkflowEngine::routeAfterPolicy(const SlotPtr& slot) {
    auto& incident = slot->incident;
    const auto assessment = incident.assessment();
    if (!assessment) {
        THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                      " has no assessment");
    }
    const auto decision = policy_.decide(assessment->severity);

    if (!decision.requiresApproval) {
        logger_->info("Incident {} is {}, dispatching without approval",
                      incident.id(), severityToString(assessment->severity));
        dispatchStep(slot, 1);
        return;
    }

    if (shutdown_.load()) {
        abort(slot, "shutdown", "engine shut down before approval request");
        return;
    }

    std::weak_ptr<WorkflowEngine> weak = weak_from_this();
    ApprovalRequest request;
    try {
        request = gate_->requestApproval(
            incident.id(), [weak, slot](const ApprovalRequest& resolved) {
                auto self = weak.lock();
                if (!self) {
                    return;
                }
                self->schedule(slot, std::chrono::milliseconds(0),
                               [self = self.get(), slot, resolved]() {
                                   self->onApprovalResolved(slot, resolved);
                               });
            });
    } catch (const InvalidStateException& e) {
        // shutdown() closed the gate after the check above
        abort(slot, "shutdown", e.what());
        return;
    }
    incident.setApproval(request);
    transition(slot, IncidentState::AwaitingApproval,
               AuditEventKind::ApprovalRequested, request.toJson());
}

void WorkflowEngine::onApprovalResolved(const SlotPtr& slot,
                                        const ApprovalRequest& request) {
    auto& incident = slot->incident;
    if (incident.state() != IncidentState::AwaitingApproval) {
        logger_->debug("Incident {} no longer awaits approval, ignoring {}",
                       incident.id(), request.id);
        return;
    }
    incident.setApproval(request);

    switch (request.resolution) {
        case ApprovalResolution::Approved:
            transition(slot, IncidentState::Approved,
                       AuditEventKind::ApprovalResolved, request.toJson());
            dispatchStep(slot, 1);
            break;
        case ApprovalResolution::Rejected:
            transition(slot, IncidentState::Rejected,
                       AuditEventKind::ApprovalResolved, request.toJson());
            transition(slot, IncidentState::Done, AuditEventKind::Closed,
                       {{"reason", "rejected"}});
            break;
        case ApprovalResolution::Expired:
            transition(slot, IncidentState::Expired,
                       AuditEventKind::ApprovalResolved, request.toJson());
            transition(slot, IncidentState::Done, AuditEventKind::Closed,
                       {{"reason", "expired"}});
            break;
        case ApprovalResolution::Pending:
            logger_->warn("Approval {} reported while still pending",
                          request.id);
            break;
    }
}

void WorkflowEngine::dispatchStep(const SlotPtr& slot, int attempt) {
    auto& incident = slot->incident;

    auto alert = incident.alert();
    if (!alert) {
        const auto observation = incident.observation();
        const auto assessment = incident.assessment();
        if (!observation || !assessment) {
            THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                          " is not classified");
        }
        alert = buildAlert(*observation, *assessment, incident.wasApproved(),
                           incident.responsePlan());
        incident.setAlert(*alert);
    }
    incident.beginDispatchAttempt();

    const auto timeout = settings_.dispatchTimeout;
    callCapability<NotifyResult>(
        slot, timeout,
        [notifier = capabilities_.notifier, recipients = settings_.recipients,
         message = *alert, timeout]() -> NotifyResult {
            try {
                return notifier->send(recipients, message.subject,
                                      message.body, timeout);
            } catch (const std::exception& e) {
                return std::unexpected(
                    NotifyError{NotifyErrorCode::Transient, e.what()});
            }
        },
        [this, slot, attempt, timeout](std::optional<NotifyResult> outcome) {
            if (!outcome) {
                outcome = std::unexpected(NotifyError{
                    NotifyErrorCode::Transient,
                    fmt::format("no acknowledgement within {} ms",
                                timeout.count())});
            }
            finishDispatch(slot, attempt, std::move(*outcome));
        });
}

void WorkflowEngine::finishDispatch(const SlotPtr& slot, int attempt,
                                    NotifyResult result) {
    auto& incident = slot->incident;
    const auto alert = incident.alert();
    if (!alert) {
        THROW_INVALID_STATE_EXCEPTION("Incident " + incident.id() +
                                      " has no alert to dispatch");
    }
    if (result) {
        incident.finishDispatch(true, std::nullopt);
        logger_->info("Incident {} dispatched to {} after {} attempt(s)",
                      incident.id(), alert->department, attempt);
        json payload = {{"attempts", attempt},
                        {"department", alert->department},
                        {"subject", alert->subject},
                        {"recipients", settings_.recipients}};
        if (auto plan = incident.responsePlan()) {
            payload["responsePlan"] = std::move(*plan);
        }
        transition(slot, IncidentState::Dispatched, AuditEventKind::Dispatched,
                   std::move(payload));
        return;
    }

    const auto& error = result.error();
    const auto detail =
        fmt::format("{}: {}", toString(error.code), error.message);
    logger_->warn("Incident {} dispatch attempt {} failed: {}", incident.id(),
                  attempt, detail);
    if (dispatchRetry_.shouldRetry(attempt, errorClassOf(error))) {
        scheduleRetry(slot, "dispatch", dispatchRetry_, attempt, detail,
                      &WorkflowEngine::dispatchStep);
        return;
    }

    incident.finishDispatch(false, detail);
    logger_->error("Incident {} dispatch failed after {} attempt(s): {}",
                   incident.id(), attempt, detail);
    transition(slot, IncidentState::DispatchFailed,
               AuditEventKind::DispatchFailed,
               {{"attempts", attempt},
                {"department", alert->department},
                {"errorClass", errorClassOf(error) == ErrorClass::Terminal
                                   ? "terminal"
                                   : "transient"},
                {"error", detail}});
}

// ============================================================================
// Helpers
// ============================================================================

void WorkflowEngine::scheduleRetry(const SlotPtr& slot, const char* capability,
                                   const RetryPolicy& policy, int attempt,
                                   const std::string& error, Step step) {
    if (shutdown_.load()) {
        abort(slot, "shutdown", "retry not scheduled after shutdown: " + error);
        return;
    }
    const auto delay = policy.calculateDelay(attempt);
    decide(slot, AuditEventKind::RetryScheduled,
           {{"capability", capability},
            {"attempt", attempt},
            {"nextAttempt", attempt + 1},
            {"delayMs", delay.count()},
            {"error", error}});
    slot->backingOff = true;
    schedule(slot, delay, [this, slot, step, attempt]() {
        (this->*step)(slot, attempt + 1);
    });
}

void WorkflowEngine::abort(const SlotPtr& slot, const std::string& reason,
                           const std::string& detail) {
    auto& incident = slot->incident;
    if (incident.isTerminal()) {
        return;
    }
    incident.setAbortReason(reason);
    logger_->warn("Incident {} aborted: {} ({})", incident.id(), reason,
                  detail);
    transition(slot, IncidentState::Aborted, AuditEventKind::Aborted,
               {{"reason", reason}, {"detail", detail}});
}

void WorkflowEngine::transition(const SlotPtr& slot, IncidentState to,
                                AuditEventKind kind, json payload) {
    auto record = slot->incident.transition(to, kind, std::move(payload));
    logger_->debug("Incident {} #{} {}: {} -> {}", record.incidentId,
                   record.sequence, eventKindToString(kind),
                   stateToString(record.fromState),
                   stateToString(record.toState));
    audit_->record(record);
    {
        // Orders the state change before waiters re-check their predicate
        std::lock_guard lock(mutex_);
    }
    stateChanged_.notify_all();
}

void WorkflowEngine::decide(const SlotPtr& slot, AuditEventKind kind,
                            json payload) {
    auto record = slot->incident.decision(kind, std::move(payload));
    audit_->record(record);
}

auto WorkflowEngine::findSlot(const std::string& incidentId) const
    -> SlotPtr {
    std::lock_guard lock(mutex_);
    auto it = incidents_.find(incidentId);
    if (it == incidents_.end()) {
        THROW_INCIDENT_NOT_FOUND_EXCEPTION("Unknown incident: " + incidentId);
    }
    return it->second;
}

}  // namespace stormwatch::workflow
