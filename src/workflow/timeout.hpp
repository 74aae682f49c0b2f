/*
 * timeout.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Bounded invocation of capability calls

**************************************************/

#ifndef STORMWATCH_WORKFLOW_TIMEOUT_HPP
#define STORMWATCH_WORKFLOW_TIMEOUT_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "app/eventloop.hpp"

namespace stormwatch::workflow {

/**
 * @brief A call racing its deadline. The first of complete() and expire()
 * runs the handler, the other one is ignored.
 */
template <typename Result>
class BoundedCall {
public:
    using Handler = std::function<void(std::optional<Result>)>;

    explicit BoundedCall(Handler handler) : handler_(std::move(handler)) {}

    /**
     * @return false if the deadline already settled the call
     */
    auto complete(Result result) -> bool { return settle(std::move(result)); }

    auto expire() -> bool { return settle(std::nullopt); }

    [[nodiscard]] auto isSettled() const -> bool { return settled_.load(); }

private:
    auto settle(std::optional<Result> outcome) -> bool {
        if (settled_.exchange(true)) {
            return false;
        }
        auto handler = std::move(handler_);
        handler(std::move(outcome));
        return true;
    }

    std::atomic<bool> settled_{false};
    Handler handler_;
};

/**
 * @brief Runs @p call on @p executor and arms a @p timeout timer on
 * @p timer. @p onSettled runs exactly once, with the result or with
 * std::nullopt when the deadline passed first.
 *
 * Neither loop waits on the call. A late result is discarded, so @p call
 * must own everything it touches. @p call reports failures in its result
 * and must not throw.
 */
template <typename Result, typename Call>
void invokeWithTimeout(app::EventLoop& executor, app::EventLoop& timer,
                       Call call, std::chrono::milliseconds timeout,
                       typename BoundedCall<Result>::Handler onSettled) {
    auto bounded = std::make_shared<BoundedCall<Result>>(std::move(onSettled));
    timer.postDelayed(timeout, [bounded]() { bounded->expire(); });
    executor.post([bounded, call = std::move(call)]() {
        if (bounded->isSettled()) {
            return;
        }
        bounded->complete(call());
    });
}

}  // namespace stormwatch::workflow

#endif  // STORMWATCH_WORKFLOW_TIMEOUT_HPP
