/*
 * eventloop.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "eventloop.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace stormwatch::app {

auto EventLoop::Task::operator<(const Task& other) const -> bool {
    if (priority != other.priority) {
        return priority < other.priority;
    }
    return task_id > other.task_id;
}

EventLoop::EventLoop(int thread_count) : state_(std::make_shared<State>()) {
    thread_count = std::max(1, thread_count);
    spdlog::info("Initializing EventLoop with {} threads", thread_count);
    thread_pool_.reserve(static_cast<size_t>(thread_count));
    for (int i = 0; i < thread_count; ++i) {
        thread_pool_.emplace_back(&EventLoop::workerThread, state_);
    }
}

EventLoop::~EventLoop() {
    stop();
    for (auto& thread : thread_pool_) {
        if (!thread.joinable()) {
            continue;
        }
        // The last owner may release the loop from one of its own tasks.
        // That worker holds its own reference to state_ and leaves on return.
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
    spdlog::debug("EventLoop shutdown completed");
}

void EventLoop::run() {
    spdlog::debug("Caller thread joining EventLoop");
    workerThread(state_);
}

void EventLoop::stop() {
    bool expected = false;
    if (!state_->stop_flag.compare_exchange_strong(expected, true)) {
        return;
    }
    size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        discarded = state_->ready_tasks.size() + state_->delayed_tasks.size();
        state_->ready_tasks = {};
        state_->delayed_tasks = {};
    }
    state_->condition.notify_all();
    spdlog::info("EventLoop stopped, {} queued task(s) discarded", discarded);
}

auto EventLoop::isRunning() const -> bool { return !state_->stop_flag.load(); }

auto EventLoop::pendingTasks() const -> size_t {
    std::lock_guard<std::mutex> lock(state_->queue_mutex);
    return state_->ready_tasks.size() + state_->delayed_tasks.size();
}

auto EventLoop::threadCount() const -> size_t { return thread_pool_.size(); }

void EventLoop::enqueue(std::function<void()> function, int priority,
                        std::chrono::steady_clock::time_point execution_time) {
    {
        std::lock_guard<std::mutex> lock(state_->queue_mutex);
        if (state_->stop_flag.load()) {
            spdlog::warn("EventLoop stopped, rejecting task");
            return;
        }
        Task task{std::move(function), priority, execution_time,
                  state_->next_task_id.fetch_add(1)};
        if (execution_time <= std::chrono::steady_clock::now()) {
            state_->ready_tasks.push(std::move(task));
        } else {
            state_->delayed_tasks.push(std::move(task));
        }
    }
    // Delayed tasks may move the earliest deadline forward, so wake everyone
    // parked on the old one.
    state_->condition.notify_all();
}

void EventLoop::State::promoteDueTasks(
    std::chrono::steady_clock::time_point now) {
    while (!delayed_tasks.empty() && delayed_tasks.top().execution_time <= now) {
        ready_tasks.push(std::move(const_cast<Task&>(delayed_tasks.top())));
        delayed_tasks.pop();
    }
}

void EventLoop::workerThread(const std::shared_ptr<State>& shared) {
    // run() passes the member, which dies with an EventLoop released by one
    // of the tasks below.
    const std::shared_ptr<State> state = shared;
    spdlog::debug("Worker thread started [Thread ID: {}]",
                  std::hash<std::thread::id>{}(std::this_thread::get_id()));

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(state->queue_mutex);
            while (true) {
                if (state->stop_flag.load()) {
                    spdlog::debug("Worker thread terminated");
                    return;
                }
                state->promoteDueTasks(std::chrono::steady_clock::now());
                if (!state->ready_tasks.empty()) {
                    task = std::move(
                        const_cast<Task&>(state->ready_tasks.top()));
                    state->ready_tasks.pop();
                    break;
                }
                if (state->delayed_tasks.empty()) {
                    state->condition.wait(lock);
                } else {
                    state->condition.wait_until(
                        lock, state->delayed_tasks.top().execution_time);
                }
            }
        }

        try {
            task.function();
        } catch (const std::exception& e) {
            spdlog::error("Task execution failed: {}", e.what());
        }
    }
}

}  // namespace stormwatch::app
