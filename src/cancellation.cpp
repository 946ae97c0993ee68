#include "linkfetch/cancellation.hpp"

namespace linkfetch {

bool CancellationSignal::request(StopReason reason) {
    if (reason == StopReason::None) {
        return false;
    }

    StopReason expected = StopReason::None;
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepted = reason_.compare_exchange_strong(expected, reason);
    }
    if (accepted) {
        cv_.notify_all();
    }
    return accepted;
}

void CancellationSignal::force(StopReason reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reason_.store(reason);
    }
    cv_.notify_all();
}

void CancellationSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    reason_.store(StopReason::None);
}

bool CancellationSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return requested(); });
}

} // namespace linkfetch
