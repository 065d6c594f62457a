/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>

#include "procpool/config.hpp"
#include "procpool/monitor.hpp"
#include "procpool/pool.hpp"
#include "procpool/process.hpp"
#include "procpool/sink.hpp"
#include "procpool/task.hpp"

namespace procpool {

struct Submission {
    TaskHandle handle;
    TaskFuture future;
};

// Binds an ExecutionPool to a ProcessRunner: commands handed to exec() wait
// for a pool slot, then run as local shell processes.
class Dispatcher final {
public:
    explicit Dispatcher(const Config& config);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    // A null sink logs through a LoggerSink tagged with the task id.
    [[nodiscard]] Submission exec(const std::string& command, const PriorityKey& priority,
                                  std::shared_ptr<TaskSink> sink = nullptr);
    [[nodiscard]] Submission exec(const TaskHandle& handle, std::shared_ptr<TaskSink> sink = nullptr);

    CancelOutcome cancel(const TaskId& id);

    // Cancels everything and waits for running processes to be reaped.
    void shutdown() noexcept;

    [[nodiscard]] ExecutionPool& pool() noexcept { return *pool_; }
    [[nodiscard]] const MonitoringView& monitor() const noexcept { return *monitor_; }
    [[nodiscard]] bool isShutdown() const noexcept { return shutdown_.load(); }

private:
    Config config_;
    std::atomic<bool> shutdown_{false};

    // Declaration order matters: the pool waits on callbacks driven by the
    // runner, so it must be destroyed first.
    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<ExecutionPool> pool_;
    std::unique_ptr<MonitoringView> monitor_;
};

}
