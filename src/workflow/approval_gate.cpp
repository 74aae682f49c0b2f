/*
 * approval_gate.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "approval_gate.hpp"

#include <utility>

#include "atom/utils/uuid.hpp"

#include "exception.hpp"
#include "logging/logging_manager.hpp"

namespace stormwatch::workflow {

auto ApprovalRequest::toJson() const -> json {
    json j = {{"requestId", id},
              {"incidentId", incidentId},
              {"requestedAt", formatTimestamp(requestedAt)},
              {"deadline", formatTimestamp(deadline)},
              {"resolution", std::string(resolutionToString(resolution))}};
    if (resolvedAt) {
        j["resolvedAt"] = formatTimestamp(*resolvedAt);
    }
    return j;
}

ApprovalGate::ApprovalGate(std::shared_ptr<app::EventLoop> loop,
                           std::chrono::milliseconds timeout)
    : loop_(std::move(loop)),
      timeout_(timeout),
      logger_(logging::LoggingManager::getInstance().getLogger("approval")) {}

auto ApprovalGate::requestApproval(const std::string& incidentId,
                                   ResolutionCallback onResolved)
    -> ApprovalRequest {
    ApprovalRequest request;
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            THROW_INVALID_STATE_EXCEPTION(
                "Approval gate is closed, no request for incident " +
                incidentId);
        }
        if (auto it = byIncident_.find(incidentId); it != byIncident_.end()) {
            logger_->debug("Approval for incident {} already requested as {}",
                           incidentId, it->second);
            return requests_.at(it->second).request;
        }

        request.id = atom::utils::UUID().toString();
        request.incidentId = incidentId;
        request.requestedAt = Clock::now();
        request.deadline = request.requestedAt + timeout_;

        requests_.emplace(request.id, Entry{request, std::move(onResolved)});
        byIncident_.emplace(incidentId, request.id);
    }

    logger_->info("Approval {} requested for incident {}, expires in {} ms",
                  request.id, incidentId, timeout_.count());

    std::weak_ptr<ApprovalGate> weak = weak_from_this();
    loop_->postDelayed(timeout_, [weak, id = request.id]() {
        if (auto self = weak.lock()) {
            self->expire(id);
        }
    });
    return request;
}

auto ApprovalGate::resolve(const std::string& requestId,
                           ApprovalDecision decision) -> ApprovalRequest {
    ResolutionCallback callback;
    ApprovalRequest snapshot;
    bool settled = false;
    bool expiredNow = false;
    {
        std::lock_guard lock(mutex_);
        auto it = requests_.find(requestId);
        if (it == requests_.end()) {
            THROW_APPROVAL_NOT_FOUND_EXCEPTION("Unknown approval request: " +
                                               requestId);
        }
        auto& entry = it->second;
        if (entry.request.isPending() &&
            Clock::now() >= entry.request.deadline) {
            // The timer has not run yet, but the deadline already decided.
            callback = settle(entry, ApprovalResolution::Expired);
            settled = true;
            expiredNow = true;
        } else if (entry.request.isPending()) {
            callback = settle(entry, decision == ApprovalDecision::Approve
                                         ? ApprovalResolution::Approved
                                         : ApprovalResolution::Rejected);
            settled = true;
        }
        snapshot = entry.request;
    }

    if (!settled) {
        logger_->warn("Approval {} already {}, decision ignored", requestId,
                      resolutionToString(snapshot.resolution));
        THROW_INVALID_STATE_EXCEPTION("Approval request " + requestId +
                                      " is already " +
                                      std::string(resolutionToString(
                                          snapshot.resolution)));
    }

    notify(callback, snapshot);

    if (expiredNow) {
        THROW_INVALID_STATE_EXCEPTION("Approval request " + requestId +
                                      " expired");
    }
    logger_->info("Approval {} resolved as {}", requestId,
                  resolutionToString(snapshot.resolution));
    return snapshot;
}

auto ApprovalGate::closeAll() -> std::vector<ApprovalRequest> {
    std::vector<ApprovalRequest> closed;
    std::lock_guard lock(mutex_);
    closed_ = true;
    for (auto& [id, entry] : requests_) {
        if (entry.request.isPending()) {
            settle(entry, ApprovalResolution::Expired);
            closed.push_back(entry.request);
        }
    }
    if (!closed.empty()) {
        logger_->info("Closed {} pending approval request(s)", closed.size());
    }
    return closed;
}

auto ApprovalGate::isClosed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto ApprovalGate::forget(const std::string& incidentId) -> bool {
    std::lock_guard lock(mutex_);
    auto it = byIncident_.find(incidentId);
    if (it == byIncident_.end()) {
        return false;
    }
    auto entry = requests_.find(it->second);
    if (entry != requests_.end()) {
        if (entry->second.request.isPending()) {
            return false;
        }
        requests_.erase(entry);
    }
    byIncident_.erase(it);
    return true;
}

auto ApprovalGate::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return requests_.size();
}

auto ApprovalGate::getRequest(const std::string& requestId) const
    -> std::optional<ApprovalRequest> {
    std::lock_guard lock(mutex_);
    if (auto it = requests_.find(requestId); it != requests_.end()) {
        return it->second.request;
    }
    return std::nullopt;
}

auto ApprovalGate::findByIncident(const std::string& incidentId) const
    -> std::optional<ApprovalRequest> {
    std::lock_guard lock(mutex_);
    if (auto it = byIncident_.find(incidentId); it != byIncident_.end()) {
        return requests_.at(it->second).request;
    }
    return std::nullopt;
}

auto ApprovalGate::listPending() const -> std::vector<ApprovalRequest> {
    std::vector<ApprovalRequest> pending;
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : requests_) {
        if (entry.request.isPending()) {
            pending.push_back(entry.request);
        }
    }
    return pending;
}

auto ApprovalGate::pendingCount() const -> size_t {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, entry] : requests_) {
        if (entry.request.isPending()) {
            ++count;
        }
    }
    return count;
}

void ApprovalGate::expire(const std::string& requestId) {
    ResolutionCallback callback;
    ApprovalRequest snapshot;
    {
        std::lock_guard lock(mutex_);
        auto it = requests_.find(requestId);
        if (it == requests_.end() || !it->second.request.isPending()) {
            return;
        }
        callback = settle(it->second, ApprovalResolution::Expired);
        snapshot = it->second.request;
    }
    logger_->info("Approval {} for incident {} expired", requestId,
                  snapshot.incidentId);
    notify(callback, snapshot);
}

auto ApprovalGate::settle(Entry& entry, ApprovalResolution resolution)
    -> ResolutionCallback {
    entry.request.resolution = resolution;
    entry.request.resolvedAt = Clock::now();
    return std::exchange(entry.callback, nullptr);
}

void ApprovalGate::notify(const ResolutionCallback& callback,
                          const ApprovalRequest& request) {
    if (!callback) {
        return;
    }
    try {
        callback(request);
    } catch (const std::exception& e) {
        logger_->error("Approval callback for {} failed: {}", request.id,
                       e.what());
    }
}

}  // namespace stormwatch::workflow
