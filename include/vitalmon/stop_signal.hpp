#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vitalmon {

// Cooperative cancellation flag whose waits wake as soon as it is raised
class StopSignal {
public:
    void raise();
    void clear();
    bool is_raised() const;

    // Sleep up to `timeout`; returns true if the signal was raised
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return raised_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool raised_ = false;
};

} // namespace vitalmon
