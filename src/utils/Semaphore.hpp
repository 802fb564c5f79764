#pragma once
#include <condition_variable>
#include <mutex>

namespace Loopnet {
    // Counting semaphore bounding concurrent outbound requests.
    class Semaphore {
    public:
        explicit Semaphore(int permits) : permits_(permits) {}

        void Acquire() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return permits_ > 0; });
            --permits_;
        }

        void Release() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++permits_;
            }
            cv_.notify_one();
        }

    private:
        int permits_;
        std::mutex mutex_;
        std::condition_variable cv_;
    };

    class SemaphoreGuard {
    public:
        explicit SemaphoreGuard(Semaphore& sem) : sem_(sem) { sem_.Acquire(); }
        ~SemaphoreGuard() { sem_.Release(); }
        SemaphoreGuard(const SemaphoreGuard&) = delete;
        SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;
    private:
        Semaphore& sem_;
    };
}
