/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/process.hpp"
#include "procpool/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace procpool {

namespace {
void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Signals the whole process group; falls back to the leader if the group
// is not established yet.
void signalProcess(pid_t pid, int sig) noexcept {
    if (::kill(-pid, sig) != 0 && errno == ESRCH) {
        ::kill(pid, sig);
    }
}
}

ProcessRunner::ProcessRunner(RunnerOptions options) : options_(std::move(options)) {
    if (options_.pollInterval.count() <= 0) {
        options_.pollInterval = std::chrono::milliseconds(50);
    }
    if (options_.killGrace.count() < 0) {
        options_.killGrace = std::chrono::milliseconds(0);
    }
}

ProcessRunner::~ProcessRunner() {
    killAll();

    std::vector<Monitor> monitors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitors.swap(monitors_);
    }
    for (auto& m : monitors) {
        if (m.thread.joinable()) {
            m.thread.join();
        }
    }
}

TaskFuture ProcessRunner::run(const std::string& command,
                              std::shared_ptr<TaskSink> sink,
                              const CancellationToken& token) {
    if (!sink) {
        throw std::invalid_argument("ProcessRunner::run requires a sink");
    }
    if (token.cancelled()) {
        sink->debug("Cancelled before launch");
        return TaskFuture::completed(TaskResult::cancelled());
    }

    reapFinished();

    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> errPipe{-1, -1};
    if (::pipe2(outPipe.data(), O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }
    if (::pipe2(errPipe.data(), O_CLOEXEC) != 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe2 failed");
    }
    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    const char* shell = options_.shell.c_str();
    const char* script = command.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        closeFd(devNull);
        throw std::system_error(err, std::generic_category(), "fork failed");
    }

    if (pid == 0) {
        // child: async-signal-safe calls only
        ::setpgid(0, 0);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        } else {
            ::close(STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execl(shell, shell, "-c", script, static_cast<char*>(nullptr));
        ::_exit(127);
    }

    // Both sides set the group so a kill issued right after fork reaches it.
    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(devNull);

    auto record = std::make_shared<ProcessRecord>();
    record->pid = pid;
    record->processId = std::to_string(pid);
    LOG_DEBUG("Spawned process " + record->processId + ": " + command);

    Watch watch;
    watch.record = record;
    watch.outFd = outPipe[0];
    watch.errFd = errPipe[0];
    watch.sink = std::move(sink);
    watch.token = token;
    TaskFuture future = watch.promise.future();

    const auto grace = options_.killGrace;
    watch.registration = token.onCancel([record, grace] { requestKill(*record, grace); });
    const auto registration = watch.registration;
    int outFd = watch.outFd;
    int errFd = watch.errFd;

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        Monitor m;
        m.record = record;
        m.thread = std::thread(&ProcessRunner::monitor, this, std::move(watch));
        monitors_.push_back(std::move(m));
    } catch (const std::system_error& e) {
        LOG_ERROR("Failed to start monitor for process " + record->processId + ": " + e.what());
        token.unregister(registration);
        signalProcess(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        closeFd(outFd);
        closeFd(errFd);
        throw;
    }

    return future;
}

void ProcessRunner::monitor(Watch watch) noexcept {
    ProcessRecord& record = *watch.record;
    setThreadName("proc-" + record.processId);

    std::array<char, 4096> buffer{};
    std::array<pollfd, 2> fds{};
    bool exited = false;
    bool statusKnown = false;
    int status = 0;
    auto exitedAt = std::chrono::steady_clock::now();
    const int pollMs = static_cast<int>(options_.pollInterval.count());

    while (watch.outFd >= 0 || watch.errFd >= 0 || !exited) {
        const bool exitedBeforePoll = exited;
        bool idle = true;

        if (watch.outFd >= 0 || watch.errFd >= 0) {
            fds[0].fd = watch.outFd;
            fds[1].fd = watch.errFd;
            for (auto& p : fds) {
                p.events = POLLIN;
                p.revents = 0;
            }
            int ready = ::poll(fds.data(), fds.size(), pollMs);
            if (ready < 0 && errno != EINTR) {
                LOG_ERROR("poll failed for process " + record.processId + ": " + std::string(std::strerror(errno)));
                closeFd(watch.outFd);
                closeFd(watch.errFd);
            } else if (ready > 0) {
                for (std::size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                        continue;
                    }
                    int& fd = (i == 0) ? watch.outFd : watch.errFd;
                    ssize_t n = ::read(fd, buffer.data(), buffer.size());
                    if (n > 0) {
                        idle = false;
                        std::string chunk(buffer.data(), static_cast<std::size_t>(n));
                        if (i == 0) {
                            watch.sink->info(chunk);
                        } else {
                            watch.sink->error(chunk);
                        }
                    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                        closeFd(fd);
                    }
                }
            }
        } else {
            std::this_thread::sleep_for(options_.pollInterval);
        }

        if (!exited) {
            std::lock_guard<std::mutex> lock(record.mutex);
            pid_t r = ::waitpid(record.pid, &status, WNOHANG);
            if (r == record.pid) {
                exited = true;
                statusKnown = true;
            } else if (r < 0 && errno != EINTR) {
                LOG_ERROR("waitpid failed for process " + record.processId + ": " + std::string(std::strerror(errno)));
                exited = true;
            }
            if (exited) {
                record.exitObserved = true;
                exitedAt = std::chrono::steady_clock::now();
            }
        }

        if (!exited) {
            escalateIfDue(record, options_.killGrace);
        } else if (watch.outFd >= 0 || watch.errFd >= 0) {
            // Background children may keep the pipes open after the shell
            // exits; stop reading once they go quiet.
            auto lingering = std::chrono::steady_clock::now() - exitedAt;
            if ((exitedBeforePoll && idle) || lingering > options_.killGrace) {
                closeFd(watch.outFd);
                closeFd(watch.errFd);
            }
        }
    }

    watch.token.unregister(watch.registration);
    bool killed = false;
    {
        std::lock_guard<std::mutex> lock(record.mutex);
        killed = record.killRequested;
    }
    TaskResult result = interpret(record.processId, killed, statusKnown, status);
    if (result) {
        LOG_DEBUG("Process " + record.processId + " exited successfully");
    } else {
        LOG_DEBUG("Process " + record.processId + ": " + result.message);
    }

    watch.promise.tryComplete(result);
    clearThreadName();
    record.done.store(true);
}

TaskResult ProcessRunner::interpret(const std::string& processId, bool killed, bool statusKnown, int status) {
    if (killed) {
        return TaskResult::cancelled();
    }
    if (!statusKnown) {
        return {false, TaskError::ProcessExitFailure, -1, "Exit status of process " + processId + " unavailable"};
    }
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        return code == 0 ? TaskResult::success() : TaskResult::exitFailure(code);
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        return {false, TaskError::ProcessExitFailure, 128 + sig, "Process killed by signal " + std::to_string(sig)};
    }
    return {false, TaskError::ProcessExitFailure, -1, "Process ended in unexpected state"};
}

void ProcessRunner::requestKill(ProcessRecord& record, std::chrono::milliseconds grace) noexcept {
    std::lock_guard<std::mutex> lock(record.mutex);
    if (record.exitObserved || record.killRequested) {
        return;
    }
    record.killRequested = true;
    record.killRequestedAt = std::chrono::steady_clock::now();

    if (grace.count() == 0) {
        record.escalated = true;
        signalProcess(record.pid, SIGKILL);
        LOG_INFO("Sent SIGKILL to process " + record.processId);
    } else {
        signalProcess(record.pid, SIGTERM);
        LOG_INFO("Sent SIGTERM to process " + record.processId);
    }
}

void ProcessRunner::escalateIfDue(ProcessRecord& record, std::chrono::milliseconds grace) noexcept {
    std::lock_guard<std::mutex> lock(record.mutex);
    if (!record.killRequested || record.escalated || record.exitObserved) {
        return;
    }
    if (std::chrono::steady_clock::now() - record.killRequestedAt < grace) {
        return;
    }
    record.escalated = true;
    signalProcess(record.pid, SIGKILL);
    LOG_WARN("Process " + record.processId + " ignored SIGTERM, sent SIGKILL");
}

void ProcessRunner::killAll() noexcept {
    std::vector<std::shared_ptr<ProcessRecord>> records;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : monitors_) {
            if (!m.record->done.load()) {
                records.push_back(m.record);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to collect running processes: " + std::string(e.what()));
        return;
    }

    for (const auto& record : records) {
        requestKill(*record, options_.killGrace);
    }
}

std::size_t ProcessRunner::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(monitors_.begin(), monitors_.end(),
        [](const Monitor& m) { return !m.record->done.load(); }));
}

void ProcessRunner::reapFinished() {
    std::vector<Monitor> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto split = std::stable_partition(monitors_.begin(), monitors_.end(),
            [](const Monitor& m) { return !m.record->done.load(); });
        std::move(split, monitors_.end(), std::back_inserter(finished));
        monitors_.erase(split, monitors_.end());
    }
    for (auto& m : finished) {
        if (m.thread.joinable()) {
            m.thread.join();
        }
    }
}

}
