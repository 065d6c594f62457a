/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "procpool/pool.hpp"

namespace procpool {

struct HttpResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

// Read-only view over an ExecutionPool for introspection. Every call takes a
// fresh snapshot; nothing here mutates the pool.
class MonitoringView final {
public:
    static constexpr const char* kRunningPath = "/api/local/tasks/running";
    static constexpr const char* kWaitingPath = "/api/local/tasks/waiting";

    explicit MonitoringView(const ExecutionPool& pool) noexcept : pool_(pool) {}

    [[nodiscard]] std::vector<TaskSummary> listRunning() const { return pool_.runningSnapshot(); }
    [[nodiscard]] std::vector<TaskSummary> listWaiting() const { return pool_.waitingSnapshot(); }

    [[nodiscard]] nlohmann::json runningJson() const;
    [[nodiscard]] nlohmann::json waitingJson() const;

    // Serves the two task listing routes; the transport is up to the caller.
    [[nodiscard]] HttpResponse handle(const std::string& method, const std::string& path) const;

private:
    const ExecutionPool& pool_;
};

[[nodiscard]] nlohmann::json toJson(const TaskSummary& summary);
[[nodiscard]] nlohmann::json toJson(const std::vector<TaskSummary>& summaries);

}
