/*
 * monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "monitor.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "logging/logging_manager.hpp"

namespace stormwatch::workflow {

namespace {
constexpr std::chrono::milliseconds kWaitSlice{100};
}  // namespace

auto CycleSummary::count(IncidentState state) const -> size_t {
    auto it = byState.find(state);
    return it == byState.end() ? 0 : it->second;
}

auto CycleSummary::toJson() const -> json {
    json states = json::object();
    for (const auto& [state, n] : byState) {
        states[std::string(stateToString(state))] = n;
    }
    return {{"cycle", cycle},
            {"submitted", submitted},
            {"states", states},
            {"unfinished", unfinished},
            {"durationMs", duration.count()}};
}

MonitorService::MonitorService(std::shared_ptr<WorkflowEngine> engine,
                               MonitorSettings settings)
    : engine_(std::move(engine)),
      settings_(std::move(settings)),
      logger_(logging::LoggingManager::getInstance().getLogger("monitor")) {}

auto MonitorService::runOnce() -> CycleSummary {
    const auto started = std::chrono::steady_clock::now();
    CycleSummary summary;
    summary.cycle = nextCycle_.fetch_add(1);

    logger_->info("Cycle {} started for {} location(s)", summary.cycle,
                  settings_.locations.size());
    const auto ids = engine_->runCycle(settings_.locations, summary.cycle);
    summary.submitted = ids.size();

    if (!waitForCycle(ids)) {
        logger_->warn("Cycle {} stopped waiting before all incidents ended",
                      summary.cycle);
    }

    for (const auto& id : ids) {
        const auto snapshot = engine_->getIncident(id);
        if (isTerminal(snapshot.state)) {
            ++summary.byState[snapshot.state];
        } else {
            ++summary.unfinished;
        }
    }
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::string counts;
    for (const auto& [state, n] : summary.byState) {
        counts += fmt::format(" {}={}", stateToString(state), n);
    }
    logger_->info("Cycle {} finished in {} ms: {} incident(s),{} unfinished={}",
                  summary.cycle, summary.duration.count(), summary.submitted,
                  counts, summary.unfinished);

    completedCycles_.fetch_add(1);
    {
        std::lock_guard lock(mutex_);
        lastSummary_ = summary;
    }
    retain(ids);
    return summary;
}

void MonitorService::run() {
    logger_->info("Monitoring {} location(s) every {} s",
                  settings_.locations.size(), settings_.pollInterval.count());

    while (!isStopRequested()) {
        runOnce();

        if (settings_.maxCycles > 0 &&
            completedCycles_.load() >= settings_.maxCycles) {
            logger_->info("Reached {} cycle(s), monitoring finished",
                          settings_.maxCycles);
            break;
        }

        std::unique_lock lock(mutex_);
        if (stopSignal_.wait_for(lock, settings_.pollInterval,
                                 [this]() { return stopRequested_; })) {
            break;
        }
    }
    logger_->info("Monitoring stopped after {} cycle(s)",
                  completedCycles_.load());
}

void MonitorService::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopRequested_) {
            return;
        }
        stopRequested_ = true;
    }
    logger_->info("Monitoring stop requested");
    stopSignal_.notify_all();
}

auto MonitorService::isStopRequested() const -> bool {
    std::lock_guard lock(mutex_);
    return stopRequested_;
}

auto MonitorService::completedCycles() const -> std::uint64_t {
    return completedCycles_.load();
}

auto MonitorService::lastSummary() const -> std::optional<CycleSummary> {
    std::lock_guard lock(mutex_);
    return lastSummary_;
}

void MonitorService::retain(std::vector<std::string> ids) {
    retained_.push_back(std::move(ids));
    while (retained_.size() > settings_.retainedCycles) {
        auto oldest = std::move(retained_.front());
        retained_.pop_front();
        auto running = engine_->forget(oldest);
        if (running.empty()) {
            continue;
        }
        if (retained_.empty()) {
            retained_.push_back(std::move(running));
            break;
        }
        auto& newest = retained_.back();
        newest.insert(newest.end(), running.begin(), running.end());
    }
}

auto MonitorService::waitForCycle(const std::vector<std::string>& ids)
    -> bool {
    const auto deadline =
        std::chrono::steady_clock::now() + settings_.cycleTimeout;
    while (true) {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds(0)) {
            return false;
        }
        if (engine_->waitForAll(ids, std::min(remaining, kWaitSlice))) {
            return true;
        }
        if (isStopRequested()) {
            return false;
        }
    }
}

}  // namespace stormwatch::workflow
