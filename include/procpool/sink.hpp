/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <utility>

#include "procpool/types.hpp"

namespace procpool {

// Per-task output channel. Implementations must not block the caller and
// must be callable from any thread.
class TaskSink {
public:
    virtual ~TaskSink() = default;

    virtual void debug(const std::string& text) noexcept = 0;
    virtual void info(const std::string& text) noexcept = 0;
    virtual void error(const std::string& text) noexcept = 0;
};

// Forwards task output to the process logger, tagged with the task id.
class LoggerSink final : public TaskSink {
public:
    explicit LoggerSink(TaskId id) : id_(std::move(id)) {}

    void debug(const std::string& text) noexcept override;
    void info(const std::string& text) noexcept override;
    void error(const std::string& text) noexcept override;

private:
    [[nodiscard]] std::string tag(const std::string& text) const;

    TaskId id_;
};

}
