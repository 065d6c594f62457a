/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "procpool/process.hpp"

namespace procpool {

struct Config {
    std::size_t capacity = defaultCapacity();
    std::chrono::milliseconds killGrace{2000};
    std::string shell = "/bin/sh";

    // Reads PROCPOOL_CAPACITY, PROCPOOL_KILL_GRACE_MS and PROCPOOL_SHELL.
    // Unset, malformed or zero values keep the defaults.
    [[nodiscard]] static Config fromEnv();

    // Hardware concurrency, never less than 1.
    [[nodiscard]] static std::size_t defaultCapacity() noexcept;

    [[nodiscard]] RunnerOptions runnerOptions() const;
};

}
