/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <optional>
#include <vector>

#include "procpool/types.hpp"

namespace procpool {

using CompletionCallback = std::function<void(const TaskResult&)>;

namespace detail {
struct CompletionState {
    std::mutex mutex;
    std::condition_variable done;
    std::optional<TaskResult> result;
    std::vector<CompletionCallback> callbacks;
};
}

// Read side of a one-shot task result. Copies share the same result cell.
class TaskFuture {
public:
    TaskFuture() noexcept = default;

    // A future that is already resolved with `result`.
    [[nodiscard]] static TaskFuture completed(TaskResult result);

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }
    [[nodiscard]] bool ready() const;

    // Blocks until the result is available.
    TaskResult wait() const;
    [[nodiscard]] std::optional<TaskResult> waitFor(std::chrono::milliseconds timeout) const;

    // Invokes `callback` exactly once with the result. If the result is
    // already there the callback runs immediately on the calling thread,
    // otherwise on the thread that completes the promise.
    void onComplete(CompletionCallback callback) const;

private:
    friend class TaskPromise;
    explicit TaskFuture(std::shared_ptr<detail::CompletionState> state) noexcept : state_(std::move(state)) {}

    void requireState() const;

    std::shared_ptr<detail::CompletionState> state_;
};

// Write side. Only the first completion wins; later ones are ignored.
class TaskPromise {
public:
    TaskPromise();

    [[nodiscard]] TaskFuture future() const noexcept { return TaskFuture(state_); }
    [[nodiscard]] bool completed() const;

    bool tryComplete(TaskResult result);
    void completeWith(const TaskFuture& other);

private:
    std::shared_ptr<detail::CompletionState> state_;
};

} // namespace procpool
