/*
 * approval_gate.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Store of pending human approvals with deadline expiry

**************************************************/

#ifndef STORMWATCH_WORKFLOW_APPROVAL_GATE_HPP
#define STORMWATCH_WORKFLOW_APPROVAL_GATE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "app/eventloop.hpp"
#include "types.hpp"

namespace stormwatch::workflow {

/**
 * @brief One request for a human decision on an Incident
 */
struct ApprovalRequest {
    std::string id;
    std::string incidentId;
    Clock::time_point requestedAt;
    Clock::time_point deadline;
    ApprovalResolution resolution{ApprovalResolution::Pending};
    std::optional<Clock::time_point> resolvedAt;

    [[nodiscard]] auto isPending() const -> bool {
        return resolution == ApprovalResolution::Pending;
    }

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Called once when a request leaves the pending state
 */
using ResolutionCallback = std::function<void(const ApprovalRequest&)>;

/**
 * @brief Suspends Incidents awaiting an approve/reject decision.
 *
 * Each request is resolved exactly once: by resolve(), by its expiry timer
 * or by close(). Whichever comes first wins and later resolve() calls throw
 * InvalidStateException. Expiry timers run on the EventLoop, so a request
 * expires even if nobody ever answers it.
 *
 * Create through std::make_shared; timers hold a weak reference.
 */
class ApprovalGate : public std::enable_shared_from_this<ApprovalGate> {
public:
    ApprovalGate(std::shared_ptr<app::EventLoop> loop,
                 std::chrono::milliseconds timeout);

    /**
     * @brief Opens a request for @p incidentId.
     *
     * Idempotent per Incident: while a request for the Incident exists the
     * existing one is returned and @p onResolved is discarded.
     *
     * @throws InvalidStateException after closeAll()
     */
    auto requestApproval(const std::string& incidentId,
                         ResolutionCallback onResolved) -> ApprovalRequest;

    /**
     * @brief Applies an operator decision.
     *
     * @throws ApprovalNotFoundException for an unknown id
     * @throws InvalidStateException if the request is already resolved or its
     * deadline has passed
     */
    auto resolve(const std::string& requestId, ApprovalDecision decision)
        -> ApprovalRequest;

    /**
     * @brief Expires every pending request without running its callback and
     * refuses new requests from then on.
     * @return The requests that were closed
     */
    auto closeAll() -> std::vector<ApprovalRequest>;

    [[nodiscard]] auto isClosed() const -> bool;

    /**
     * @brief Drops the settled request of @p incidentId. A pending request
     * is kept.
     * @return true if a request was dropped
     */
    auto forget(const std::string& incidentId) -> bool;

    /**
     * @brief Number of stored requests, pending or settled
     */
    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto getRequest(const std::string& requestId) const
        -> std::optional<ApprovalRequest>;
    [[nodiscard]] auto findByIncident(const std::string& incidentId) const
        -> std::optional<ApprovalRequest>;
    [[nodiscard]] auto listPending() const -> std::vector<ApprovalRequest>;
    [[nodiscard]] auto pendingCount() const -> size_t;

    [[nodiscard]] auto getTimeout() const -> std::chrono::milliseconds {
        return timeout_;
    }

private:
    struct Entry {
        ApprovalRequest request;
        ResolutionCallback callback;
    };

    void expire(const std::string& requestId);

    /**
     * @brief Moves a pending entry to @p resolution. Caller holds mutex_.
     * @return The callback to run once the lock is released
     */
    auto settle(Entry& entry, ApprovalResolution resolution)
        -> ResolutionCallback;

    void notify(const ResolutionCallback& callback,
                const ApprovalRequest& request);

    std::shared_ptr<app::EventLoop> loop_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> requests_;
    std::unordered_map<std::string, std::string> byIncident_;
    bool closed_{false};
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_APPROVAL_GATE_HPP
