#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace linkfetch {

enum class StopReason {
    None,
    Pause,
    Stop,
    Shutdown
};

// Pending command for a running job. The worker polls it at chunk boundaries;
// commands never interrupt a write in progress.
class CancellationSignal {
public:
    // First request wins; returns false if another request is already pending.
    bool request(StopReason reason);
    // Overrides whatever is pending. Used when a job is removed mid-pause.
    void force(StopReason reason);
    void reset();

    [[nodiscard]] StopReason reason() const noexcept { return reason_.load(); }
    [[nodiscard]] bool requested() const noexcept {
        return reason_.load() != StopReason::None;
    }

    // Sleeps up to `timeout`; returns true early when a request arrives.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::atomic<StopReason> reason_{StopReason::None};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace linkfetch
