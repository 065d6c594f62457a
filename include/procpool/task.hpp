/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <tuple>

#include "procpool/types.hpp"

namespace procpool {

// Scheduling priority of a task. Lower keys run first: the context ordinal
// (usually the start of the period a job computes) is compared first and the
// job identifier breaks ties.
struct PriorityKey {
    std::int64_t context = 0;
    JobId job;

    friend bool operator<(const PriorityKey& a, const PriorityKey& b) noexcept {
        return std::tie(a.context, a.job) < std::tie(b.context, b.job);
    }
    friend bool operator==(const PriorityKey& a, const PriorityKey& b) noexcept {
        return a.context == b.context && a.job == b.job;
    }
    friend bool operator!=(const PriorityKey& a, const PriorityKey& b) noexcept { return !(a == b); }
};

class TaskHandle final {
public:
    TaskHandle(TaskId id, std::string command, PriorityKey priority);

    // Builds a handle with a freshly generated unique id.
    [[nodiscard]] static TaskHandle create(std::string command, PriorityKey priority);

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& command() const noexcept { return command_; }
    [[nodiscard]] const PriorityKey& priority() const noexcept { return priority_; }

private:
    [[nodiscard]] static TaskId generateId();

    TaskId id_;
    std::string command_;
    PriorityKey priority_;
};

} // namespace procpool
