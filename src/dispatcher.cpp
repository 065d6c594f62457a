/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/dispatcher.hpp"
#include "procpool/logger.hpp"

namespace procpool {

Dispatcher::Dispatcher(const Config& config)
    : config_(config),
      runner_(std::make_unique<ProcessRunner>(config.runnerOptions())),
      pool_(std::make_unique<ExecutionPool>(config.capacity)),
      monitor_(std::make_unique<MonitoringView>(*pool_)) {
    LOG_DEBUG("Dispatcher created - capacity: " + std::to_string(config_.capacity) +
              ", shell: " + config_.shell +
              ", kill grace: " + std::to_string(config_.killGrace.count()) + "ms");
}

Dispatcher::~Dispatcher() {
    shutdown();
}

Submission Dispatcher::exec(const std::string& command, const PriorityKey& priority,
                            std::shared_ptr<TaskSink> sink) {
    return exec(TaskHandle::create(command, priority), std::move(sink));
}

Submission Dispatcher::exec(const TaskHandle& handle, std::shared_ptr<TaskSink> sink) {
    if (!sink) {
        sink = std::make_shared<LoggerSink>(handle.id());
    }
    if (shutdown_.load()) {
        sink->error("Dispatcher is shut down, not running: " + handle.command());
        return {handle, TaskFuture::completed(TaskResult::cancelled())};
    }

    sink->debug("Waiting available resources to fork:");
    sink->debug(handle.command());
    sink->debug("...");

    ProcessRunner* runner = runner_.get();
    std::string command = handle.command();
    TaskFuture future = pool_->submit(handle, [runner, command, sink](const CancellationToken& token) {
        sink->debug("Running");
        return runner->run(command, sink, token);
    });
    return {handle, future};
}

CancelOutcome Dispatcher::cancel(const TaskId& id) {
    CancelOutcome outcome = pool_->cancel(id);
    if (outcome == CancelOutcome::NotFound) {
        LOG_DEBUG("Cancel ignored, task not found: " + id);
    }
    return outcome;
}

void Dispatcher::shutdown() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Shutting down dispatcher...");
    try {
        pool_->cancelAll();
        pool_->waitIdle();
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatcher shutdown error: " + std::string(e.what()));
        runner_->killAll();
    }
    LOG_DEBUG("Dispatcher shutdown complete");
}

}
