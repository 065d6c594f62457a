/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/completion.hpp"
#include "procpool/logger.hpp"
#include <stdexcept>
#include <utility>

namespace procpool {

namespace {
void invoke(const CompletionCallback& callback, const TaskResult& result) noexcept {
    try {
        callback(result);
    } catch (const std::exception& e) {
        LOG_ERROR("Completion callback failed: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Completion callback failed with unknown error");
    }
}
}

TaskFuture TaskFuture::completed(TaskResult result) {
    TaskPromise promise;
    promise.tryComplete(std::move(result));
    return promise.future();
}

void TaskFuture::requireState() const {
    if (!state_) {
        throw std::logic_error("TaskFuture has no shared state");
    }
}

bool TaskFuture::ready() const {
    requireState();
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result.has_value();
}

TaskResult TaskFuture::wait() const {
    requireState();
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->done.wait(lock, [this] { return state_->result.has_value(); });
    return *state_->result;
}

std::optional<TaskResult> TaskFuture::waitFor(std::chrono::milliseconds timeout) const {
    requireState();
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->done.wait_for(lock, timeout, [this] { return state_->result.has_value(); })) {
        return std::nullopt;
    }
    return state_->result;
}

void TaskFuture::onComplete(CompletionCallback callback) const {
    requireState();
    TaskResult result;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->result) {
            state_->callbacks.push_back(std::move(callback));
            return;
        }
        result = *state_->result;
    }
    invoke(callback, result);
}

TaskPromise::TaskPromise() : state_(std::make_shared<detail::CompletionState>()) {
}

bool TaskPromise::completed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result.has_value();
}

bool TaskPromise::tryComplete(TaskResult result) {
    std::vector<CompletionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->result) {
            return false;
        }
        state_->result = result;
        callbacks.swap(state_->callbacks);
    }
    state_->done.notify_all();

    for (const auto& callback : callbacks) {
        invoke(callback, result);
    }
    return true;
}

void TaskPromise::completeWith(const TaskFuture& other) {
    TaskPromise target = *this;
    other.onComplete([target](const TaskResult& result) mutable {
        target.tryComplete(result);
    });
}

} // namespace procpool
