/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/sink.hpp"
#include "procpool/logger.hpp"

namespace procpool {

std::string LoggerSink::tag(const std::string& text) const {
    // Process output arrives in arbitrary chunks; drop the trailing newline
    // so each chunk is one log record.
    std::string body = text;
    while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) {
        body.pop_back();
    }
    return "[" + id_ + "] " + body;
}

void LoggerSink::debug(const std::string& text) noexcept {
    try {
        LOG_DEBUG(tag(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Sink write failed: " + std::string(e.what()));
    }
}

void LoggerSink::info(const std::string& text) noexcept {
    try {
        LOG_INFO(tag(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Sink write failed: " + std::string(e.what()));
    }
}

void LoggerSink::error(const std::string& text) noexcept {
    try {
        LOG_ERROR(tag(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Sink write failed: " + std::string(e.what()));
    }
}

}
