/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "procpool/cancellation.hpp"
#include "procpool/logger.hpp"
#include <vector>

namespace procpool {

namespace {
void fire(const CancelHook& hook) noexcept {
    try {
        hook();
    } catch (const std::exception& e) {
        LOG_ERROR("Cancellation hook failed: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Cancellation hook failed with unknown error");
    }
}
}

bool CancellationToken::cancelled() const noexcept {
    return state_ && state_->cancelled.load();
}

CancellationToken::Registration CancellationToken::onCancel(CancelHook hook) const {
    if (!state_) {
        return kNoRegistration;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled.load()) {
            Registration id = state_->nextId++;
            state_->hooks.emplace(id, std::move(hook));
            return id;
        }
    }
    fire(hook);
    return kNoRegistration;
}

void CancellationToken::unregister(Registration registration) const noexcept {
    if (!state_ || registration == kNoRegistration) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->hooks.erase(registration);
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {
}

bool CancellationSource::cancel() {
    std::vector<CancelHook> hooks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return false;
        }
        hooks.reserve(state_->hooks.size());
        for (auto& entry : state_->hooks) {
            hooks.push_back(std::move(entry.second));
        }
        state_->hooks.clear();
    }

    // Hooks run in registration order, outside the lock.
    for (const auto& hook : hooks) {
        fire(hook);
    }
    return true;
}

} // namespace procpool
