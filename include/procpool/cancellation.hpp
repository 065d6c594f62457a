/*
 * procpool - Local Process Execution Pool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace procpool {

using CancelHook = std::function<void()>;

namespace detail {
struct CancellationState {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    std::uint64_t nextId = 1;
    std::map<std::uint64_t, CancelHook> hooks;
};
}

// Observer side of a cancellation request, handed down the call chain to
// whoever launches and monitors the work.
class CancellationToken {
public:
    using Registration = std::uint64_t;
    static constexpr Registration kNoRegistration = 0;

    // A token that can never be cancelled.
    CancellationToken() noexcept = default;

    [[nodiscard]] bool cancelled() const noexcept;
    [[nodiscard]] bool canBeCancelled() const noexcept { return state_ != nullptr; }

    // Registers a hook fired once on cancellation. When the token is already
    // cancelled the hook runs right away and kNoRegistration is returned.
    Registration onCancel(CancelHook hook) const;
    void unregister(Registration registration) const noexcept;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const noexcept { return CancellationToken(state_); }
    [[nodiscard]] bool cancelled() const noexcept { return state_->cancelled.load(); }

    // Returns false if cancellation had already been requested.
    bool cancel();

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace procpool
