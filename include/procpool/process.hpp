/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

#include "procpool/cancellation.hpp"
#include "procpool/completion.hpp"
#include "procpool/sink.hpp"

namespace procpool {

struct RunnerOptions {
    std::string shell = "/bin/sh";
    std::chrono::milliseconds killGrace{2000};
    std::chrono::milliseconds pollInterval{50};
};

// State of one spawned process, shared between the monitor thread and the
// cancellation hook. Lives until the process has been reaped.
struct ProcessRecord {
    pid_t pid = -1;
    std::string processId;

    std::mutex mutex;
    bool exitObserved = false;
    bool killRequested = false;
    bool escalated = false;
    std::chrono::steady_clock::time_point killRequestedAt;

    std::atomic<bool> done{false};
};

class ProcessRunner final {
public:
    explicit ProcessRunner(RunnerOptions options = {});
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;
    ProcessRunner(ProcessRunner&&) = delete;
    ProcessRunner& operator=(ProcessRunner&&) = delete;

    // Runs `command` through `shell -c`. Output is forwarded chunk by chunk:
    // stdout to sink->info, stderr to sink->error. Cancelling `token` kills
    // the process group (SIGTERM, then SIGKILL after killGrace).
    // Throws std::system_error if the process cannot be spawned.
    [[nodiscard]] TaskFuture run(const std::string& command,
                                 std::shared_ptr<TaskSink> sink,
                                 const CancellationToken& token);

    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] const RunnerOptions& options() const noexcept { return options_; }

    void killAll() noexcept;

private:
    struct Monitor {
        std::shared_ptr<ProcessRecord> record;
        std::thread thread;
    };

    struct Watch {
        std::shared_ptr<ProcessRecord> record;
        int outFd = -1;
        int errFd = -1;
        std::shared_ptr<TaskSink> sink;
        TaskPromise promise;
        CancellationToken token;
        CancellationToken::Registration registration = CancellationToken::kNoRegistration;
    };

    void monitor(Watch watch) noexcept;
    [[nodiscard]] static TaskResult interpret(const std::string& processId, bool killed, bool statusKnown, int status);
    void reapFinished();

    static void requestKill(ProcessRecord& record, std::chrono::milliseconds grace) noexcept;
    static void escalateIfDue(ProcessRecord& record, std::chrono::milliseconds grace) noexcept;

    RunnerOptions options_;

    mutable std::mutex mutex_;
    std::vector<Monitor> monitors_;
};

}
