/*
 * engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Workflow engine sequencing observation, classification,
severity gating, human approval and dispatch for every Incident

**************************************************/

#ifndef STORMWATCH_WORKFLOW_ENGINE_HPP
#define STORMWATCH_WORKFLOW_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/eventloop.hpp"
#include "approval_gate.hpp"
#include "audit_log.hpp"
#include "capabilities.hpp"
#include "incident.hpp"
#include "retry.hpp"
#include "severity_policy.hpp"

namespace stormwatch::workflow {

/**
 * @brief Injected external collaborators
 */
struct Capabilities {
    std::shared_ptr<ObservationSource> source;
    std::shared_ptr<Classifier> classifier;
    std::shared_ptr<Notifier> notifier;
    /// Optional, alerts carry no response plan without it
    std::shared_ptr<ResponsePlanner> planner;
};

struct EngineSettings {
    RetryConfig observationRetry;
    RetryConfig classificationRetry;
    RetryConfig dispatchRetry;

    std::chrono::milliseconds observationTimeout{10000};
    std::chrono::milliseconds classificationTimeout{30000};
    std::chrono::milliseconds dispatchTimeout{15000};
    std::chrono::milliseconds approvalTimeout{std::chrono::seconds(900)};
    std::chrono::milliseconds planningTimeout{30000};

    /// Classifier confidence below this is treated as ambiguous, 0 disables
    double minConfidence{0.0};

    /// Threads running capability calls, apart from the step workers
    int capabilityThreads{4};

    std::vector<std::string> recipients;
};

/**
 * @brief Drives Incidents through the state machine
 *
 * PENDING_OBSERVATION -> OBSERVED -> CLASSIFIED -> [AWAITING_APPROVAL ->
 * APPROVED | REJECTED | EXPIRED] -> DISPATCHED | DISPATCH_FAILED | DONE, with
 * ABORTED reachable from every non-terminal state.
 *
 * Every step of an Incident runs as a task on the EventLoop and the steps of
 * one Incident never overlap, so its audit records come out in transition
 * order. Retries are delayed tasks and the approval wait is a callback from
 * the ApprovalGate, so no worker is held while an Incident waits. Capability
 * calls run on a separate pool and race a deadline timer on the EventLoop;
 * whichever settles first schedules the next step, so a slow provider only
 * delays its own Incident.
 *
 * Create through create(); scheduled tasks keep the engine alive.
 */
class WorkflowEngine : public std::enable_shared_from_this<WorkflowEngine> {
public:
    [[nodiscard]] static auto create(std::shared_ptr<app::EventLoop> loop,
                                     Capabilities capabilities,
                                     SeverityPolicy policy,
                                     std::shared_ptr<AuditLog> audit,
                                     EngineSettings settings)
        -> std::shared_ptr<WorkflowEngine>;

    /**
     * @brief Starts the Incident for @p location in @p cycle.
     * @return The Incident id
     * @throws DuplicateIncidentException if it already exists
     * @throws InvalidStateException after shutdown()
     */
    auto submit(const std::string& location, std::uint64_t cycle)
        -> std::string;

    /**
     * @brief Submits one Incident per location. Duplicates are logged and
     * skipped.
     */
    auto runCycle(const std::vector<std::string>& locations,
                  std::uint64_t cycle) -> std::vector<std::string>;

    /**
     * @brief Waits until the Incident is terminal.
     * @return The terminal state, or std::nullopt on timeout
     * @throws IncidentNotFoundException for an unknown id
     */
    auto waitFor(const std::string& incidentId,
                 std::chrono::milliseconds timeout)
        -> std::optional<IncidentState>;

    /**
     * @brief Waits until every listed Incident is terminal.
     * @return false if the timeout passed first
     */
    auto waitForAll(const std::vector<std::string>& incidentIds,
                    std::chrono::milliseconds timeout) -> bool;

    /**
     * @throws IncidentNotFoundException for an unknown id
     */
    [[nodiscard]] auto getIncident(const std::string& incidentId) const
        -> IncidentSnapshot;
    [[nodiscard]] auto listIncidents() const -> std::vector<IncidentSnapshot>;

    /**
     * @brief Applies an operator decision, see ApprovalGate::resolve
     */
    auto resolveApproval(const std::string& requestId,
                         ApprovalDecision decision) -> ApprovalRequest;
    [[nodiscard]] auto pendingApprovals() const
        -> std::vector<ApprovalRequest>;

    /**
     * @brief Drops terminal Incidents and their settled approval requests.
     * Unknown ids are ignored.
     * @return The ids that are still running and were kept
     */
    auto forget(const std::vector<std::string>& incidentIds)
        -> std::vector<std::string>;

    [[nodiscard]] auto incidentCount() const -> size_t;

    /**
     * @brief Stops accepting Incidents and aborts those waiting for approval
     * or for a retry with reason "shutdown". Running steps finish normally.
     */
    void shutdown();

    [[nodiscard]] auto isShutdown() const -> bool;
    [[nodiscard]] auto approvalGate() const -> std::shared_ptr<ApprovalGate> {
        return gate_;
    }
    [[nodiscard]] auto auditLog() const -> std::shared_ptr<AuditLog> {
        return audit_;
    }

private:
    struct Slot {
        Slot(const std::string& location, std::uint64_t cycle)
            : incident(location, cycle) {}

        /// Serialises the steps of one Incident; scheduling from inside a
        /// step re-enters it.
        std::recursive_mutex stepMutex;
        Incident incident;
        bool backingOff{false};
    };
    using SlotPtr = std::shared_ptr<Slot>;
    using Step = void (WorkflowEngine::*)(const SlotPtr&, int);

    WorkflowEngine(std::shared_ptr<app::EventLoop> loop,
                   Capabilities capabilities, SeverityPolicy policy,
                   std::shared_ptr<AuditLog> audit, EngineSettings settings);

    /**
     * @brief Runs @p body as a step of @p slot after @p delay. If the loop no
     * longer accepts work the Incident is aborted with reason "shutdown".
     */
    void schedule(const SlotPtr& slot, std::chrono::milliseconds delay,
                  std::function<void()> body);
    void runGuarded(const SlotPtr& slot, const std::function<void()>& body);

    /**
     * @brief Starts @p call on the capability pool. @p finish runs as a step
     * of @p slot with the result, or with std::nullopt after @p timeout.
     */
    template <typename Result, typename Call>
    void callCapability(const SlotPtr& slot, std::chrono::milliseconds timeout,
                        Call call,
                        std::function<void(std::optional<Result>)> finish);

    void observeStep(const SlotPtr& slot, int attempt);
    void finishObservation(const SlotPtr& slot, int attempt,
                           ObservationResult result);
    void classifyStep(const SlotPtr& slot, int attempt);
    void finishClassification(const SlotPtr& slot, int attempt,
                              ClassificationResult result);
    void dispatchStep(const SlotPtr& slot, int attempt);
    void finishDispatch(const SlotPtr& slot, int attempt, NotifyResult result);
    void onApprovalResolved(const SlotPtr& slot,
                            const ApprovalRequest& request);

    void applyPolicy(const SlotPtr& slot);
    void finishPlanning(const SlotPtr& slot, PlanResult result);
    void routeAfterPolicy(const SlotPtr& slot);
    void scheduleRetry(const SlotPtr& slot, const char* capability,
                       const RetryPolicy& policy, int attempt,
                       const std::string& error, Step step);
    void abort(const SlotPtr& slot, const std::string& reason,
               const std::string& detail);

    void transition(const SlotPtr& slot, IncidentState to,
                    AuditEventKind kind, json payload);
    void decide(const SlotPtr& slot, AuditEventKind kind, json payload);

    auto findSlot(const std::string& incidentId) const -> SlotPtr;

    std::shared_ptr<app::EventLoop> loop_;
    std::unique_ptr<app::EventLoop> callLoop_;
    Capabilities capabilities_;
    SeverityPolicy policy_;
    std::shared_ptr<AuditLog> audit_;
    EngineSettings settings_;
    RetryPolicy observationRetry_;
    RetryPolicy classificationRetry_;
    RetryPolicy dispatchRetry_;
    std::shared_ptr<ApprovalGate> gate_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable stateChanged_;
    std::unordered_map<std::string, SlotPtr> incidents_;
    std::atomic<bool> shutdown_{false};
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_ENGINE_HPP
