#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "ssa_errors.hpp"

namespace ssa {

// Lets a caller abandon a long decomposition from another thread.
// Only checked between stages; an SVD already running finishes first.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() = default;
    explicit CancelToken(Clock::duration timeout) : deadline_(Clock::now() + timeout) {}

    void cancel() noexcept { cancelled_.store(true); }

    bool cancelled() const noexcept {
        if (cancelled_.load()) return true;
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    // Throws Cancelled if the token has fired. `stage` names the checkpoint.
    void check(const std::string& stage) const {
        if (cancelled()) {
            throw Cancelled("Cancelled before " + stage);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

// Null-safe checkpoint
inline void check_cancelled(const CancelToken* token, const std::string& stage) {
    if (token != nullptr) token->check(stage);
}

}
