#include "vitalmon/stop_signal.hpp"

namespace vitalmon {

void StopSignal::raise() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raised_ = true;
    }
    cv_.notify_all();
}

void StopSignal::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    raised_ = false;
}

bool StopSignal::is_raised() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raised_;
}

} // namespace vitalmon
