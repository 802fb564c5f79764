#include "RateLimiter.hpp"
#include <thread>

namespace Loopnet {

RateLimiter::RateLimiter(std::chrono::steady_clock::duration delay) : delay_(delay) {}

void RateLimiter::WaitTurn() {
    std::chrono::steady_clock::time_point slot;
    {
        // Reserve the next slot under the lock, sleep outside it.
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        slot = now;
        if (has_dispatched_ && last_dispatch_ + delay_ > now) {
            slot = last_dispatch_ + delay_;
        }
        last_dispatch_ = slot;
        has_dispatched_ = true;
    }
    std::this_thread::sleep_until(slot);
}

}
