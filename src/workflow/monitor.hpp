/*
 * monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Scheduled polling cycles over the monitored locations

**************************************************/

#ifndef STORMWATCH_WORKFLOW_MONITOR_HPP
#define STORMWATCH_WORKFLOW_MONITOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "engine.hpp"

namespace stormwatch::workflow {

struct MonitorSettings {
    std::vector<std::string> locations;
    std::chrono::seconds pollInterval{3600};
    /// 0 runs until stop()
    std::uint64_t maxCycles{0};
    std::chrono::milliseconds cycleTimeout{std::chrono::seconds(1200)};
    /// Cycles whose finished Incidents stay queryable in the engine
    std::uint64_t retainedCycles{2};
};

/**
 * @brief Outcome of one polling cycle
 */
struct CycleSummary {
    std::uint64_t cycle{0};
    size_t submitted{0};
    std::map<IncidentState, size_t> byState;
    /// Incidents still running when the cycle stopped waiting
    size_t unfinished{0};
    std::chrono::milliseconds duration{0};

    [[nodiscard]] auto count(IncidentState state) const -> size_t;
    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Runs polling cycles until stopped.
 *
 * A cycle submits one Incident per location and waits until all of them are
 * terminal, the cycle timeout passes or stop() is called. stop() never
 * interrupts a running step; it ends the current wait and prevents the next
 * cycle. Once more than retainedCycles cycles are summarised, the finished
 * Incidents of the oldest one are dropped from the engine; Incidents still
 * running move to the newest retained cycle.
 */
class MonitorService {
public:
    MonitorService(std::shared_ptr<WorkflowEngine> engine,
                   MonitorSettings settings);

    /**
     * @brief Executes the next cycle and waits for its Incidents.
     */
    auto runOnce() -> CycleSummary;

    /**
     * @brief Cycles until stop() or maxCycles, sleeping pollInterval in
     * between.
     */
    void run();

    void stop();

    [[nodiscard]] auto isStopRequested() const -> bool;
    [[nodiscard]] auto completedCycles() const -> std::uint64_t;
    [[nodiscard]] auto lastSummary() const -> std::optional<CycleSummary>;

private:
    auto waitForCycle(const std::vector<std::string>& ids) -> bool;
    void retain(std::vector<std::string> ids);

    std::shared_ptr<WorkflowEngine> engine_;
    MonitorSettings settings_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable stopSignal_;
    bool stopRequested_{false};
    std::optional<CycleSummary> lastSummary_;
    std::deque<std::vector<std::string>> retained_;
    std::atomic<std::uint64_t> nextCycle_{1};
    std::atomic<std::uint64_t> completedCycles_{0};
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_MONITOR_HPP
