/*
 * procpool - Command runner (procpool)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/dispatcher.hpp"
#include "procpool/logger.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace procpool;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flags, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;
static volatile sig_atomic_t g_dump_requested = 0;

void signalHandler(int signal) {
    if (signal == SIGUSR1) {
        g_dump_requested = 1;
    } else {
        g_shutdown_requested = 1;
    }
}

struct TaskLine {
    std::string command;
    PriorityKey priority;
};

void printUsage(const char* progName) {
    std::cout << "procpool Command Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] [file]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Reads one task per line from file (or stdin) and runs them with bounded\n";
    std::cout << "concurrency. A line is either a plain shell command or\n";
    std::cout << "  <context>[:<job>]<TAB><command>\n";
    std::cout << "where lower context values run first. Empty lines and lines starting\n";
    std::cout << "with # are ignored.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -j, --jobs <n>      Maximum concurrent processes\n";
    std::cout << "  --grace-ms <n>      Delay between SIGTERM and SIGKILL on cancel\n";
    std::cout << "  --shell <path>      Shell used to run commands (default /bin/sh)\n";
    std::cout << "  -q, --quiet         Only log warnings and errors\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT, SIGTERM     Cancel all queued and running tasks\n";
    std::cout << "  SIGUSR1             Print running/waiting tasks as JSON to stderr\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  PROCPOOL_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  PROCPOOL_CAPACITY        Default for --jobs\n";
    std::cout << "  PROCPOOL_KILL_GRACE_MS   Default for --grace-ms\n";
    std::cout << "  PROCPOOL_SHELL           Default for --shell\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " -j 4 tasks.txt\n";
    std::cout << "  printf 'make a\\nmake b\\n' | " << progName << " -j 2\n";
}

std::optional<std::size_t> parseCount(const std::string& value) {
    try {
        std::size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size() || parsed < 0) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Splits "<context>[:<job>]\t<command>"; anything else is a bare command
// ordered by its line number.
TaskLine parseLine(const std::string& line, std::size_t lineNumber) {
    TaskLine task;
    task.command = line;
    task.priority.context = static_cast<std::int64_t>(lineNumber);

    auto tab = line.find('\t');
    if (tab == std::string::npos) {
        return task;
    }

    std::string prefix = line.substr(0, tab);
    std::string job;
    auto colon = prefix.find(':');
    if (colon != std::string::npos) {
        job = prefix.substr(colon + 1);
        prefix = prefix.substr(0, colon);
    }

    try {
        std::size_t pos = 0;
        long long context = std::stoll(prefix, &pos);
        if (pos != prefix.size()) {
            return task;
        }
        task.priority.context = context;
        task.priority.job = job;
        task.command = line.substr(tab + 1);
    } catch (const std::exception&) {
        // not a priority prefix, keep the whole line as the command
    }
    return task;
}

std::vector<TaskLine> readTasks(std::istream& in) {
    std::vector<TaskLine> tasks;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        TaskLine task = parseLine(line, lineNumber);
        if (!task.command.empty()) {
            tasks.push_back(std::move(task));
        }
    }
    return tasks;
}

std::string describe(const TaskResult& result) {
    switch (result.error) {
        case TaskError::None: return "ok";
        case TaskError::Cancelled: return "cancelled";
        case TaskError::ProcessExitFailure: return "failed (exit " + std::to_string(result.exitCode) + ")";
        case TaskError::LaunchFailure: return "launch failed: " + result.message;
        default: return "unknown";
    }
}

int main(int argc, char* argv[]) {
    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv();
    std::string inputPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-j" || arg == "--jobs") && i + 1 < argc) {
            auto jobs = parseCount(argv[++i]);
            if (!jobs || *jobs == 0) {
                std::cerr << "Error: Invalid job count\n";
                return 1;
            }
            config.capacity = *jobs;
        } else if (arg == "--grace-ms" && i + 1 < argc) {
            auto grace = parseCount(argv[++i]);
            if (!grace) {
                std::cerr << "Error: Invalid grace period\n";
                return 1;
            }
            config.killGrace = std::chrono::milliseconds(*grace);
        } else if (arg == "--shell" && i + 1 < argc) {
            config.shell = argv[++i];
        } else if (arg == "-q" || arg == "--quiet") {
            Logger::setLevel(LogLevel::WARN);
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Error: Unknown option " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else {
            inputPath = arg;
        }
    }

    std::vector<TaskLine> tasks;
    if (inputPath.empty() || inputPath == "-") {
        if (isatty(fileno(stdin))) {
            printUsage(argv[0]);
            return 1;
        }
        tasks = readTasks(std::cin);
    } else {
        std::ifstream file(inputPath);
        if (!file) {
            std::cerr << "Error: Cannot open " << inputPath << "\n";
            return 1;
        }
        tasks = readTasks(file);
    }

    if (tasks.empty()) {
        std::cerr << "Error: No tasks to run\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGUSR1, signalHandler);

    try {
        Dispatcher dispatcher(config);
        LOG_INFO("Running " + std::to_string(tasks.size()) + " task(s) with capacity " +
                 std::to_string(config.capacity));

        std::vector<Submission> submissions;
        submissions.reserve(tasks.size());
        for (const auto& task : tasks) {
            submissions.push_back(dispatcher.exec(task.command, task.priority));
        }

        bool interrupted = false;
        auto allSettled = [&submissions] {
            for (const auto& s : submissions) {
                if (!s.future.ready()) return false;
            }
            return true;
        };

        while (!allSettled()) {
            if (g_shutdown_requested && !interrupted) {
                interrupted = true;
                std::cerr << "\nShutdown requested, cancelling tasks..." << std::endl;
                dispatcher.pool().cancelAll();
            }
            if (g_dump_requested) {
                g_dump_requested = 0;
                std::cerr << "running: " << dispatcher.monitor().runningJson().dump() << "\n";
                std::cerr << "waiting: " << dispatcher.monitor().waitingJson().dump() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        int failures = 0;
        for (const auto& s : submissions) {
            TaskResult result = s.future.wait();
            if (!result) ++failures;
            std::cout << s.handle.id() << "\t" << describe(result) << "\t" << s.handle.command() << "\n";
        }
        std::cout.flush();

        dispatcher.shutdown();

        if (interrupted) {
            return 130;
        }
        if (failures > 0) {
            LOG_WARN(std::to_string(failures) + " of " + std::to_string(submissions.size()) + " task(s) failed");
            return 1;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("procpool error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
