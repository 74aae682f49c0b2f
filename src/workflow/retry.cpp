/*
 * retry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.cpp
 * @brief Retry policy implementation
 * @date 2026-10-18
 */

#include "retry.hpp"

#include <algorithm>
#include <cmath>

#include "logging/logging_manager.hpp"

namespace stormwatch::workflow {

auto retryStrategyToString(RetryStrategy strategy) -> std::string_view {
    switch (strategy) {
        case RetryStrategy::None:
            return "none";
        case RetryStrategy::Linear:
            return "linear";
        case RetryStrategy::Exponential:
            return "exponential";
    }
    return "none";
}

auto parseRetryStrategy(std::string_view name) -> std::optional<RetryStrategy> {
    if (name == "none") {
        return RetryStrategy::None;
    }
    if (name == "linear") {
        return RetryStrategy::Linear;
    }
    if (name == "exponential") {
        return RetryStrategy::Exponential;
    }
    return std::nullopt;
}

RetryPolicy::RetryPolicy(const RetryConfig& config) : config_(config) {}

const RetryConfig& RetryPolicy::getRetryConfig() const { return config_; }

int RetryPolicy::maxAttempts() const {
    if (config_.strategy == RetryStrategy::None) {
        return 1;
    }
    return std::max(0, config_.maxRetries) + 1;
}

bool RetryPolicy::shouldRetry(int attemptNumber, ErrorClass errorClass) const {
    if (errorClass == ErrorClass::Terminal) {
        return false;
    }
    if (attemptNumber >= maxAttempts()) {
        logging::LoggingManager::getInstance().getLogger("retry")->debug(
            "Retry budget exhausted after {} attempt(s)", attemptNumber);
        return false;
    }
    return true;
}

std::chrono::milliseconds RetryPolicy::calculateDelay(int attemptNumber) const {
    if (attemptNumber < 1) {
        return std::chrono::milliseconds(0);
    }

    std::chrono::milliseconds delay{0};
    switch (config_.strategy) {
        case RetryStrategy::Linear: {
            delay = config_.initialDelay * attemptNumber;
            break;
        }
        case RetryStrategy::Exponential: {
            // initialDelay * multiplier ^ (attemptNumber - 1)
            double expDelay = static_cast<double>(config_.initialDelay.count()) *
                              std::pow(config_.multiplier, attemptNumber - 1);
            const auto cap = static_cast<double>(config_.maxDelay.count());
            delay = std::chrono::milliseconds(
                static_cast<long long>(std::min(expDelay, cap)));
            break;
        }
        case RetryStrategy::None:
        default: {
            delay = config_.initialDelay;
            break;
        }
    }

    if (delay > config_.maxDelay) {
        delay = config_.maxDelay;
    }
    return delay;
}

}  // namespace stormwatch::workflow
