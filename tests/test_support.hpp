#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "procpool/pool.hpp"
#include "procpool/sink.hpp"

namespace procpool::testing {

// Polls `predicate` until it holds or `timeout` expires.
inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Sink that keeps everything it receives.
class CapturingSink final : public TaskSink {
public:
    void debug(const std::string& text) noexcept override { append(debug_, text); }
    void info(const std::string& text) noexcept override { append(info_, text); }
    void error(const std::string& text) noexcept override { append(error_, text); }

    std::vector<std::string> debugLines() const { return copy(debug_); }
    std::string infoText() const { return join(info_); }
    std::string errorText() const { return join(error_); }
    std::size_t infoChunks() const { return copy(info_).size(); }

private:
    void append(std::vector<std::string>& target, const std::string& text) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        target.push_back(text);
    }
    std::vector<std::string> copy(const std::vector<std::string>& source) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return source;
    }
    std::string join(const std::vector<std::string>& source) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        for (const auto& s : source) out += s;
        return out;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> debug_;
    std::vector<std::string> info_;
    std::vector<std::string> error_;
};

// Start functions whose completion is driven by the test. A cancelled
// token settles the task as Cancelled, like a killed process would.
class ManualTasks {
public:
    StartFunction starter(const std::string& name) {
        return [this, name](const CancellationToken& token) {
            TaskPromise promise;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                started_.push_back(name);
                promises_[name] = promise;
            }
            token.onCancel([promise]() mutable { promise.tryComplete(TaskResult::cancelled()); });
            return promise.future();
        };
    }

    bool complete(const std::string& name, TaskResult result = TaskResult::success()) {
        TaskPromise promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = promises_.find(name);
            if (it == promises_.end()) return false;
            promise = it->second;
        }
        return promise.tryComplete(std::move(result));
    }

    std::vector<std::string> started() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_;
    }

    bool wasStarted(const std::string& name) const {
        auto s = started();
        return std::find(s.begin(), s.end(), name) != s.end();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> started_;
    std::map<std::string, TaskPromise> promises_;
};

inline TaskHandle makeHandle(const std::string& id, std::int64_t context, const std::string& job = "job") {
    return TaskHandle(id, "echo " + id, PriorityKey{context, job});
}

inline std::vector<TaskId> ids(const std::vector<TaskSummary>& summaries) {
    std::vector<TaskId> out;
    for (const auto& s : summaries) out.push_back(s.id);
    return out;
}

}
