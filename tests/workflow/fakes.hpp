/*
 * fakes.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Scripted capability fakes and mocks shared by workflow tests

**************************************************/

#ifndef STORMWATCH_TESTS_WORKFLOW_FAKES_HPP
#define STORMWATCH_TESTS_WORKFLOW_FAKES_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "workflow/capabilities.hpp"

namespace stormwatch::test {

using namespace stormwatch::workflow;

/**
 * @brief Replays a queue of results; the last one repeats when the queue
 * runs dry.
 */
template <typename Interface, typename Result>
class Scripted : public Interface {
public:
    void push(Result result) {
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(result));
    }

    void setLatency(std::chrono::milliseconds latency) { latency_ = latency; }

    [[nodiscard]] int calls() const { return calls_.load(); }

protected:
    auto next() -> Result {
        calls_.fetch_add(1);
        if (latency_.count() > 0) {
            std::this_thread::sleep_for(latency_);
        }
        std::lock_guard lock(mutex_);
        Result result = script_.front();
        if (script_.size() > 1) {
            script_.pop_front();
        }
        return result;
    }

private:
    std::mutex mutex_;
    std::deque<Result> script_;
    std::chrono::milliseconds latency_{0};
    std::atomic<int> calls_{0};
};

class ScriptedSource
    : public Scripted<ObservationSource,
                      std::expected<Observation, ObservationError>> {
public:
    auto fetch(const std::string& /*location*/,
               std::chrono::milliseconds /*timeout*/)
        -> std::expected<Observation, ObservationError> override {
        return next();
    }
};

/**
 * @brief Answers every location with a storm observation after a
 * per-location delay
 */
class SlowLocationSource : public ObservationSource {
public:
    explicit SlowLocationSource(
        std::map<std::string, std::chrono::milliseconds> latency)
        : latency_(std::move(latency)) {}

    auto fetch(const std::string& location,
               std::chrono::milliseconds /*timeout*/)
        -> std::expected<Observation, ObservationError> override;

private:
    std::map<std::string, std::chrono::milliseconds> latency_;
};

class ScriptedClassifier
    : public Scripted<Classifier,
                      std::expected<ClassifierVerdict, ClassificationError>> {
public:
    auto classify(const Observation& /*observation*/,
                  std::chrono::milliseconds /*timeout*/)
        -> std::expected<ClassifierVerdict, ClassificationError> override {
        return next();
    }
};

class ScriptedNotifier
    : public Scripted<Notifier, std::expected<void, NotifyError>> {
public:
    auto send(const std::vector<std::string>& /*recipients*/,
              const std::string& /*subject*/, const std::string& /*body*/,
              std::chrono::milliseconds /*timeout*/)
        -> std::expected<void, NotifyError> override {
        return next();
    }
};

class ScriptedPlanner : public Scripted<ResponsePlanner, PlanResult> {
public:
    auto plan(const std::string& /*department*/,
              const std::string& /*location*/,
              const Assessment& /*assessment*/,
              std::chrono::milliseconds /*timeout*/) -> PlanResult override {
        return next();
    }
};

class MockNotifier : public Notifier {
public:
    MOCK_METHOD((std::expected<void, NotifyError>), send,
                (const std::vector<std::string>& recipients,
                 const std::string& subject, const std::string& body,
                 std::chrono::milliseconds timeout),
                (override));
};

class MockClassifier : public Classifier {
public:
    MOCK_METHOD((std::expected<ClassifierVerdict, ClassificationError>),
                classify,
                (const Observation& observation,
                 std::chrono::milliseconds timeout),
                (override));
};

inline auto stormObservation(const std::string& location = "Harbor")
    -> Observation {
    Observation obs;
    obs.location = location;
    obs.timestamp = Clock::now();
    obs.description = "heavy rain";
    obs.temperature = 18.0;
    obs.windSpeed = 20.0;
    obs.humidity = 88.0;
    obs.pressure = 1006.0;
    obs.precipitation = 12.0;
    obs.cloudCover = 100.0;
    return obs;
}

inline auto SlowLocationSource::fetch(const std::string& location,
                                      std::chrono::milliseconds /*timeout*/)
    -> std::expected<Observation, ObservationError> {
    if (auto it = latency_.find(location); it != latency_.end()) {
        std::this_thread::sleep_for(it->second);
    }
    return stormObservation(location);
}

inline auto verdict(const std::string& type, const std::string& severity)
    -> ClassifierVerdict {
    return ClassifierVerdict{type, severity, "scripted verdict", std::nullopt};
}

}  // namespace stormwatch::test

#endif  // STORMWATCH_TESTS_WORKFLOW_FAKES_HPP
