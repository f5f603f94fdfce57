// stop_signal.hpp
// Cooperative cancellation flag shared between the run loop and blocking data sources
// Setting it is idempotent; waiters wake up as soon as it is set

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cryptobt {

class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    // Returns true only for the call that actually set the flag
    bool requestStop() {
        bool was_set = stopped_.exchange(true, std::memory_order_acq_rel);
        if (!was_set) {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }
        return !was_set;
    }

    bool stopRequested() const {
        return stopped_.load(std::memory_order_acquire);
    }

    // Blocks for at most `timeout`. Returns true if stop was requested.
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return stopRequested(); });
    }

    void reset() {
        stopped_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> stopped_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace cryptobt
