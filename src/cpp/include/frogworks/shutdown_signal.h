#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace frogworks {

// Single-shot, multi-waiter notification. Once signaled it stays signaled.
class ShutdownSignal {
public:
    ShutdownSignal() = default;
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Returns true for the call that actually fired the signal, false afterwards
    bool signal() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (signaled_) {
                return false;
            }
            signaled_ = true;
        }
        cv_.notify_all();
        return true;
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return signaled_; });
    }

    // Returns true if signaled before the timeout elapsed
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return signaled_; });
    }

    bool is_signaled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return signaled_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool signaled_ = false;
};

} // namespace frogworks
