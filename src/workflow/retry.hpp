/*
 * retry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file retry.hpp
 * @brief Retry policy for calls to external capabilities
 * @date 2026-10-18
 */

#ifndef STORMWATCH_WORKFLOW_RETRY_HPP
#define STORMWATCH_WORKFLOW_RETRY_HPP

#include <chrono>
#include <optional>
#include <string_view>

#include "capabilities.hpp"

namespace stormwatch::workflow {

/**
 * @brief Enumeration of retry strategies
 */
enum class RetryStrategy {
    None,        ///< No retry attempts
    Linear,      ///< Delay grows linearly with the attempt number
    Exponential  ///< Delay multiplies with every attempt
};

[[nodiscard]] auto retryStrategyToString(RetryStrategy strategy)
    -> std::string_view;
[[nodiscard]] auto parseRetryStrategy(std::string_view name)
    -> std::optional<RetryStrategy>;

/**
 * @brief Configuration for retry behavior
 *
 * maxRetries counts retries, so a call is attempted at most maxRetries + 1
 * times.
 */
struct RetryConfig {
    RetryStrategy strategy{RetryStrategy::Exponential};
    int maxRetries{3};
    std::chrono::milliseconds initialDelay{200};
    std::chrono::milliseconds maxDelay{5000};
    double multiplier{2.0};

    RetryConfig() = default;

    RetryConfig(RetryStrategy strategy, int maxRetries,
                std::chrono::milliseconds initialDelay,
                std::chrono::milliseconds maxDelay, double multiplier)
        : strategy(strategy),
          maxRetries(maxRetries),
          initialDelay(initialDelay),
          maxDelay(maxDelay),
          multiplier(multiplier) {}
};

/**
 * @brief Decides whether a failed attempt is retried and after what delay
 *
 * The policy never sleeps; the engine schedules the next attempt on the
 * event loop so that a backing-off Incident does not hold a worker.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    explicit RetryPolicy(const RetryConfig& config);

    [[nodiscard]] const RetryConfig& getRetryConfig() const;

    /**
     * @brief Upper bound on attempts, first attempt included
     */
    [[nodiscard]] int maxAttempts() const;

    /**
     * @brief Whether another attempt follows a failure
     * @param attemptNumber Number of the attempt that failed (1-based)
     * @param errorClass Classification of the failure
     */
    [[nodiscard]] bool shouldRetry(int attemptNumber,
                                   ErrorClass errorClass) const;

    /**
     * @brief Delay before the retry that follows attempt @p attemptNumber
     * @param attemptNumber Number of the attempt that failed (1-based)
     */
    [[nodiscard]] std::chrono::milliseconds calculateDelay(
        int attemptNumber) const;

private:
    RetryConfig config_;
};

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_RETRY_HPP
