/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/config.hpp"
#include "procpool/logger.hpp"
#include <cstdlib>
#include <thread>

namespace procpool {

namespace {
std::size_t env_size(const char* name, std::size_t defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::size_t pos = 0;
        long long parsed = std::stoll(val, &pos);
        if (pos != std::string(val).size() || parsed < 0) {
            LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
            return defv;
        }
        return parsed == 0 ? defv : static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring malformed ") + name + "=" + val);
        return defv;
    }
}
}

std::size_t Config::defaultCapacity() noexcept {
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<std::size_t>(hw);
}

Config Config::fromEnv() {
    Config config;
    config.capacity = env_size("PROCPOOL_CAPACITY", config.capacity);
    config.killGrace = std::chrono::milliseconds(
        env_size("PROCPOOL_KILL_GRACE_MS", static_cast<std::size_t>(config.killGrace.count())));
    if (const char* shell = std::getenv("PROCPOOL_SHELL"); shell && *shell) {
        config.shell = shell;
    }
    return config;
}

RunnerOptions Config::runnerOptions() const {
    RunnerOptions options;
    options.shell = shell;
    options.killGrace = killGrace;
    return options;
}

}
