/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/monitor.hpp"
#include "procpool/logger.hpp"

namespace procpool {

nlohmann::json toJson(const TaskSummary& summary) {
    return {
        {"id", summary.id},
        {"command", summary.command},
        {"execution", {
            {"job", summary.priority.job},
            {"context", summary.priority.context},
            {"status", toString(summary.state)}
        }}
    };
}

nlohmann::json toJson(const std::vector<TaskSummary>& summaries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& summary : summaries) {
        array.push_back(toJson(summary));
    }
    return array;
}

nlohmann::json MonitoringView::runningJson() const {
    return toJson(listRunning());
}

nlohmann::json MonitoringView::waitingJson() const {
    return toJson(listWaiting());
}

HttpResponse MonitoringView::handle(const std::string& method, const std::string& path) const {
    const bool known = (path == kRunningPath || path == kWaitingPath);
    if (!known) {
        LOG_DEBUG("Monitoring route not found: " + method + " " + path);
        return {404, "application/json", R"({"error":"not found"})"};
    }
    if (method != "GET") {
        return {405, "application/json", R"({"error":"method not allowed"})"};
    }

    nlohmann::json body = (path == kRunningPath) ? runningJson() : waitingJson();
    return {200, "application/json", body.dump()};
}

}
