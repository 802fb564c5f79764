#pragma once
#include <chrono>
#include <mutex>
#include "../interfaces/IRateLimiter.hpp"

namespace Loopnet {
    // Keeps at least `delay` between the start of consecutive dispatches,
    // across all callers.
    class RateLimiter : public IRateLimiter {
    public:
        explicit RateLimiter(std::chrono::steady_clock::duration delay);
        void WaitTurn() override;
    private:
        std::chrono::steady_clock::duration delay_;
        std::chrono::steady_clock::time_point last_dispatch_;
        bool has_dispatched_ = false;
        std::mutex mutex_;
    };
}
