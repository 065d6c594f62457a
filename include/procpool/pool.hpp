/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "procpool/cancellation.hpp"
#include "procpool/completion.hpp"
#include "procpool/task.hpp"
#include "procpool/types.hpp"

namespace procpool {

// Starts the work of an admitted task. The token is cancelled when the task
// is cancelled while running; the returned future must then settle.
using StartFunction = std::function<TaskFuture(const CancellationToken&)>;

enum class CancelOutcome : uint8_t {
    NotFound,
    RemovedWaiting,
    SignalledRunning
};

struct TaskSummary {
    TaskId id;
    std::string command;
    PriorityKey priority;
    TaskState state = TaskState::Waiting;
};

// Admission-controlled pool: at most capacity() tasks run at once, the rest
// wait ordered by priority (arrival order among equal priorities). The pool
// owns no thread; admission runs on whichever thread submits or completes a
// task.
class ExecutionPool {
public:
    explicit ExecutionPool(std::size_t capacity);
    ~ExecutionPool();

    ExecutionPool(const ExecutionPool&) = delete;
    ExecutionPool& operator=(const ExecutionPool&) = delete;
    ExecutionPool(ExecutionPool&&) = delete;
    ExecutionPool& operator=(ExecutionPool&&) = delete;

    [[nodiscard]] TaskFuture submit(const TaskHandle& handle, StartFunction start);

    CancelOutcome cancel(const TaskHandle& handle) { return cancel(handle.id()); }
    CancelOutcome cancel(const TaskId& id);
    void cancelAll();

    [[nodiscard]] std::vector<TaskSummary> runningSnapshot() const;
    [[nodiscard]] std::vector<TaskSummary> waitingSnapshot() const;

    // Blocks until nothing is waiting or running.
    void waitIdle() const;
    [[nodiscard]] bool waitIdleFor(std::chrono::milliseconds timeout) const;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t runningCount() const;
    [[nodiscard]] std::size_t waitingCount() const;

private:
    struct Entry {
        Entry(TaskHandle h, StartFunction s, std::uint64_t seq)
            : handle(std::move(h)), start(std::move(s)), sequence(seq) {}

        const TaskHandle handle;
        StartFunction start;
        TaskPromise promise;
        CancellationSource cancellation;
        const std::uint64_t sequence;
    };
    using EntryPtr = std::shared_ptr<Entry>;
    using Settled = std::pair<EntryPtr, TaskResult>;

    struct WaitingOrder {
        bool operator()(const EntryPtr& a, const EntryPtr& b) const noexcept;
    };

    void admitNext();
    [[nodiscard]] EntryPtr promoteLocked();
    void launch(const EntryPtr& entry) noexcept;
    void finish(const EntryPtr& entry, const TaskResult& result);
    [[nodiscard]] bool idleLocked() const noexcept;
    [[nodiscard]] static TaskSummary summarize(const Entry& entry, TaskState state);

    const std::size_t capacity_;

    // Guards every field below; running and waiting always change together.
    mutable std::mutex mutex_;
    mutable std::condition_variable idle_;
    std::set<EntryPtr, WaitingOrder> waiting_;
    std::unordered_map<TaskId, EntryPtr> waitingIndex_;
    std::unordered_map<TaskId, EntryPtr> running_;
    std::uint64_t nextSequence_ = 0;
    std::size_t settling_ = 0;
    bool draining_ = false;
    std::thread::id drainer_;
    // Tasks that settled on the drainer thread; published when the drain ends.
    std::vector<Settled> deferred_;
};

}
