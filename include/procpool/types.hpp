#pragma once
#include <cstdint>
#include <string>

namespace procpool {

// Opaque task identifier.
using TaskId = std::string;

// Job identifier supplied by the surrounding scheduler.
using JobId = std::string;

// Where a task currently sits inside the pool.
enum class TaskState : std::uint8_t { Waiting, Running };

enum class TaskError : std::uint8_t {
    None = 0,
    Cancelled,
    ProcessExitFailure,
    LaunchFailure
};

struct TaskResult {
    bool ok = false;
    TaskError error = TaskError::None;
    int exitCode = 0;
    std::string message;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static TaskResult success() { return {true, TaskError::None, 0, ""}; }
    [[nodiscard]] static TaskResult cancelled() { return {false, TaskError::Cancelled, 0, "Execution cancelled"}; }
    [[nodiscard]] static TaskResult exitFailure(int code) {
        return {false, TaskError::ProcessExitFailure, code, "Process exited with code " + std::to_string(code)};
    }
    [[nodiscard]] static TaskResult launchFailure(const std::string& message) {
        return {false, TaskError::LaunchFailure, 0, message};
    }
};

[[nodiscard]] const char* toString(TaskError error) noexcept;
[[nodiscard]] const char* toString(TaskState state) noexcept;

} // namespace procpool
