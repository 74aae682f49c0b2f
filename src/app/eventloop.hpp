/*
 * eventloop.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: Priority and deadline aware worker pool driving incident steps,
approval expiry timers and other deferred work

**************************************************/

#ifndef STORMWATCH_APP_EVENTLOOP_HPP
#define STORMWATCH_APP_EVENTLOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace stormwatch::app {

/**
 * @brief Thread pool with prioritised immediate tasks and deadline-ordered
 * delayed tasks.
 *
 * Immediate tasks run by priority (higher first), ties in submission order.
 * Delayed tasks are parked until their due time and then compete with the
 * immediate tasks under the same ordering. Posting after stop() is rejected
 * and the returned future reports std::future_errc::broken_promise.
 */
class EventLoop {
public:
    /**
     * @brief Constructs an EventLoop and starts its worker threads.
     *
     * @param thread_count Number of worker threads (at least 1)
     */
    explicit EventLoop(int thread_count = 1);

    /**
     * @brief Stops the loop and joins all worker threads. Called from one of
     * its own tasks, that worker is detached and exits once the task returns.
     */
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Lends the calling thread to the pool until stop() is called.
     */
    void run();

    /**
     * @brief Stops the loop. Queued tasks are discarded.
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief Number of queued tasks, immediate and delayed.
     */
    [[nodiscard]] auto pendingTasks() const -> size_t;

    [[nodiscard]] auto threadCount() const -> size_t;

    /**
     * @brief Posts a task with specified priority to the event loop.
     *
     * @param priority Task priority (higher values = higher priority)
     * @param function Callable object to execute
     * @param arguments Arguments to pass to the function
     * @return Future representing the task result
     */
    template <typename Function, typename... Arguments>
    auto post(int priority, Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task with default priority (0) to the event loop.
     */
    template <typename Function, typename... Arguments>
    auto post(Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a task that becomes eligible after the given delay.
     *
     * @param delay Execution delay
     * @param priority Task priority once due
     * @param function Callable object to execute
     * @param arguments Arguments to pass to the function
     * @return Future representing the task result
     */
    template <typename Function, typename... Arguments>
    auto postDelayed(std::chrono::milliseconds delay, int priority,
                     Function&& function, Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

    /**
     * @brief Posts a delayed task with default priority.
     */
    template <typename Function, typename... Arguments>
    auto postDelayed(std::chrono::milliseconds delay, Function&& function,
                     Arguments&&... arguments)
        -> std::future<std::invoke_result_t<Function, Arguments...>>;

private:
    struct Task {
        std::function<void()> function;
        int priority{0};
        std::chrono::steady_clock::time_point execution_time;
        std::uint64_t task_id{0};

        /**
         * @brief Ordering for the ready queue: lower priority sorts first,
         * later submissions sort first among equal priorities.
         */
        auto operator<(const Task& other) const -> bool;
    };

    struct DueLater {
        auto operator()(const Task& lhs, const Task& rhs) const -> bool {
            return lhs.execution_time > rhs.execution_time;
        }
    };

    /**
     * @brief Queues and flags shared with the workers.
     *
     * Workers own a reference, so a worker that releases the last owner of
     * the EventLoop keeps valid state until it returns.
     */
    struct State {
        std::priority_queue<Task> ready_tasks;
        std::priority_queue<Task, std::vector<Task>, DueLater> delayed_tasks;
        mutable std::mutex queue_mutex;
        std::condition_variable condition;
        std::atomic<bool> stop_flag{false};
        std::atomic<std::uint64_t> next_task_id{0};

        void promoteDueTasks(std::chrono::steady_clock::time_point now);
    };

    void enqueue(std::function<void()> function, int priority,
                 std::chrono::steady_clock::time_point execution_time);
    static void workerThread(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
    std::vector<std::jthread> thread_pool_;
};

// Template Implementation

template <typename Function, typename... Arguments>
auto EventLoop::post(int priority, Function&& function,
                     Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return postDelayed(std::chrono::milliseconds{0}, priority,
                       std::forward<Function>(function),
                       std::forward<Arguments>(arguments)...);
}

template <typename Function, typename... Arguments>
auto EventLoop::post(Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return post(0, std::forward<Function>(function),
                std::forward<Arguments>(arguments)...);
}

template <typename Function, typename... Arguments>
auto EventLoop::postDelayed(std::chrono::milliseconds delay, int priority,
                            Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    using return_type = std::invoke_result_t<Function, Arguments...>;
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<Function>(function),
                  std::forward<Arguments>(arguments)...));
    std::future<return_type> result = task->get_future();
    auto execution_time = std::chrono::steady_clock::now() + delay;
    // enqueue() drops the task after stop(), which breaks the promise.
    enqueue([task]() { (*task)(); }, priority, execution_time);
    return result;
}

template <typename Function, typename... Arguments>
auto EventLoop::postDelayed(std::chrono::milliseconds delay,
                            Function&& function, Arguments&&... arguments)
    -> std::future<std::invoke_result_t<Function, Arguments...>> {
    return postDelayed(delay, 0, std::forward<Function>(function),
                       std::forward<Arguments>(arguments)...);
}

}  // namespace stormwatch::app

#endif  // STORMWATCH_APP_EVENTLOOP_HPP
