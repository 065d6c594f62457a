/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/task.hpp"
#include <atomic>
#include <chrono>
#include <sstream>
#include <utility>
#include <unistd.h>

namespace procpool {

const char* toString(TaskError error) noexcept {
    switch (error) {
        case TaskError::None: return "none";
        case TaskError::Cancelled: return "cancelled";
        case TaskError::ProcessExitFailure: return "process-exit-failure";
        case TaskError::LaunchFailure: return "launch-failure";
        default: return "unknown";
    }
}

const char* toString(TaskState state) noexcept {
    switch (state) {
        case TaskState::Waiting: return "waiting";
        case TaskState::Running: return "running";
        default: return "unknown";
    }
}

TaskHandle::TaskHandle(TaskId id, std::string command, PriorityKey priority)
    : id_(std::move(id)), command_(std::move(command)), priority_(std::move(priority)) {
}

TaskHandle TaskHandle::create(std::string command, PriorityKey priority) {
    return TaskHandle(generateId(), std::move(command), std::move(priority));
}

TaskId TaskHandle::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << std::to_string(now) << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

} // namespace procpool
