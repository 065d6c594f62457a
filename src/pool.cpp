/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/pool.hpp"
#include "procpool/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace procpool {

bool ExecutionPool::WaitingOrder::operator()(const EntryPtr& a, const EntryPtr& b) const noexcept {
    if (a->handle.priority() != b->handle.priority()) {
        return a->handle.priority() < b->handle.priority();
    }
    return a->sequence < b->sequence;
}

ExecutionPool::ExecutionPool(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ExecutionPool capacity must be at least 1");
    }
    LOG_DEBUG("Pool created with capacity " + std::to_string(capacity_));
}

ExecutionPool::~ExecutionPool() {
    cancelAll();

    // Completion callbacks still reference this pool; wait for them to settle.
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return running_.empty() && settling_ == 0 && !draining_; });
    LOG_DEBUG("Pool destroyed");
}

TaskFuture ExecutionPool::submit(const TaskHandle& handle, StartFunction start) {
    if (!start) {
        return TaskFuture::completed(TaskResult::launchFailure("No start function for task " + handle.id()));
    }

    EntryPtr entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waitingIndex_.count(handle.id()) != 0 || running_.count(handle.id()) != 0) {
            LOG_WARN("Rejecting duplicate task id: " + handle.id());
            return TaskFuture::completed(TaskResult::launchFailure("Duplicate task id: " + handle.id()));
        }

        entry = std::make_shared<Entry>(handle, std::move(start), nextSequence_++);
        waiting_.insert(entry);
        waitingIndex_.emplace(handle.id(), entry);
    }

    LOG_DEBUG("Task queued: " + handle.id());
    TaskFuture future = entry->promise.future();
    admitNext();
    return future;
}

CancelOutcome ExecutionPool::cancel(const TaskId& id) {
    EntryPtr entry;
    bool wasWaiting = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto waiting = waitingIndex_.find(id);
        if (waiting != waitingIndex_.end()) {
            entry = waiting->second;
            waiting_.erase(entry);
            waitingIndex_.erase(waiting);
            wasWaiting = true;
            idle_.notify_all();
        } else {
            auto running = running_.find(id);
            if (running == running_.end()) {
                return CancelOutcome::NotFound;
            }
            entry = running->second;
        }
    }

    if (wasWaiting) {
        LOG_DEBUG("Task cancelled while waiting: " + id);
        entry->cancellation.cancel();
        entry->promise.tryComplete(TaskResult::cancelled());
        return CancelOutcome::RemovedWaiting;
    }

    // The entry leaves the running set once its start future settles.
    LOG_DEBUG("Cancellation requested for running task: " + id);
    entry->cancellation.cancel();
    return CancelOutcome::SignalledRunning;
}

void ExecutionPool::cancelAll() {
    std::vector<TaskId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(waiting_.size() + running_.size());
        for (const auto& entry : waiting_) {
            ids.push_back(entry->handle.id());
        }
        for (const auto& item : running_) {
            ids.push_back(item.first);
        }
    }

    if (!ids.empty()) {
        LOG_INFO("Cancelling " + std::to_string(ids.size()) + " task(s)");
    }
    for (const auto& id : ids) {
        cancel(id);
    }
}

void ExecutionPool::admitNext() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (draining_) {
            // The active drainer re-checks capacity before it stops.
            return;
        }
        draining_ = true;
        drainer_ = std::this_thread::get_id();
    }

    std::vector<Settled> settled;
    while (true) {
        EntryPtr entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry = promoteLocked();
            if (!entry) {
                settled.swap(deferred_);
                settling_ += settled.size();
                draining_ = false;
                drainer_ = std::thread::id();
                idle_.notify_all();
                break;
            }
        }
        launch(entry);
    }

    // Published outside the drainer role: their callbacks may submit and wait.
    for (const auto& item : settled) {
        item.first->promise.tryComplete(item.second);
        std::lock_guard<std::mutex> lock(mutex_);
        --settling_;
        idle_.notify_all();
    }
}

ExecutionPool::EntryPtr ExecutionPool::promoteLocked() {
    if (running_.size() >= capacity_ || waiting_.empty()) {
        return nullptr;
    }

    auto first = waiting_.begin();
    EntryPtr entry = *first;
    waiting_.erase(first);
    waitingIndex_.erase(entry->handle.id());
    running_.emplace(entry->handle.id(), entry);

    LOG_DEBUG("Task admitted: " + entry->handle.id() + " (" + std::to_string(running_.size()) +
              "/" + std::to_string(capacity_) + " running, " + std::to_string(waiting_.size()) + " waiting)");
    return entry;
}

void ExecutionPool::launch(const EntryPtr& entry) noexcept {
    TaskFuture started;
    try {
        StartFunction start = std::move(entry->start);
        entry->start = nullptr;
        started = start(entry->cancellation.token());
        if (!started.valid()) {
            started = TaskFuture::completed(TaskResult::launchFailure("Start function returned no future"));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to launch task " + entry->handle.id() + ": " + std::string(e.what()));
        started = TaskFuture::completed(TaskResult::launchFailure(e.what()));
    } catch (...) {
        LOG_ERROR("Failed to launch task " + entry->handle.id() + ": unknown error");
        started = TaskFuture::completed(TaskResult::launchFailure("Unknown launch error"));
    }

    started.onComplete([this, entry](const TaskResult& result) { finish(entry, result); });
}

void ExecutionPool::finish(const EntryPtr& entry, const TaskResult& result) {
    bool deferred = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.erase(entry->handle.id()) == 0) {
            LOG_ERROR("Completed task missing from running set: " + entry->handle.id());
        }
        if (draining_ && drainer_ == std::this_thread::get_id()) {
            deferred_.emplace_back(entry, result);
            deferred = true;
        } else {
            ++settling_;
        }
    }

    if (result) {
        LOG_DEBUG("Task succeeded: " + entry->handle.id());
    } else {
        LOG_DEBUG("Task failed: " + entry->handle.id() + " (" + toString(result.error) + "): " + result.message);
    }
    if (deferred) {
        return;
    }

    entry->promise.tryComplete(result);
    admitNext();

    std::lock_guard<std::mutex> lock(mutex_);
    --settling_;
    idle_.notify_all();
}

TaskSummary ExecutionPool::summarize(const Entry& entry, TaskState state) {
    return {entry.handle.id(), entry.handle.command(), entry.handle.priority(), state};
}

std::vector<TaskSummary> ExecutionPool::runningSnapshot() const {
    std::vector<EntryPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(running_.size());
        for (const auto& item : running_) {
            entries.push_back(item.second);
        }
    }
    std::sort(entries.begin(), entries.end(), WaitingOrder{});

    std::vector<TaskSummary> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(summarize(*entry, TaskState::Running));
    }
    return result;
}

std::vector<TaskSummary> ExecutionPool::waitingSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskSummary> result;
    result.reserve(waiting_.size());
    for (const auto& entry : waiting_) {
        result.push_back(summarize(*entry, TaskState::Waiting));
    }
    return result;
}

bool ExecutionPool::idleLocked() const noexcept {
    return waiting_.empty() && running_.empty() && settling_ == 0 && !draining_;
}

void ExecutionPool::waitIdle() const {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return idleLocked(); });
}

bool ExecutionPool::waitIdleFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return idleLocked(); });
}

std::size_t ExecutionPool::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

std::size_t ExecutionPool::waitingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_.size();
}

}
