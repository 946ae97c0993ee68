#pragma once

#include "transfer_stream_reader.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace linkfetch {

enum class FailureClass {
    Transient,
    Permanent
};

enum class BackoffKind {
    Fixed,
    Exponential
};

// Decides whether a failed attempt is worth repeating and how long to wait.
// Delays never decrease from one attempt to the next and the number of
// attempts is capped by maxAttempts().
class RetryPolicy {
public:
    explicit RetryPolicy(int max_attempts) : max_attempts_(max_attempts < 1 ? 1 : max_attempts) {}
    virtual ~RetryPolicy() = default;

    [[nodiscard]] int maxAttempts() const noexcept { return max_attempts_; }

    // `attempts_made` counts attempts already finished, including the failed one.
    [[nodiscard]] bool shouldRetry(FailureClass failure, int attempts_made) const noexcept {
        return failure == FailureClass::Transient && attempts_made < max_attempts_;
    }

    // Wait before attempt number `next_attempt` (2 for the first retry).
    [[nodiscard]] virtual std::chrono::milliseconds delayBefore(int next_attempt) const = 0;

    // Stalls, connection errors, 5xx and 429 are transient; everything else
    // (other 4xx, write errors, HTML instead of a file) is permanent.
    [[nodiscard]] static FailureClass classify(const TransferResult& result) noexcept;
    [[nodiscard]] static FailureClass classifyHttpStatus(long status) noexcept;

    // "Download failed after N attempts: <last error>"
    [[nodiscard]] static std::string exhaustedMessage(int attempts, const std::string& last_error);

private:
    int max_attempts_;
};

class FixedBackoff final : public RetryPolicy {
public:
    FixedBackoff(int max_attempts, std::chrono::milliseconds delay)
        : RetryPolicy(max_attempts), delay_(delay) {}

    [[nodiscard]] std::chrono::milliseconds delayBefore(int next_attempt) const override;

private:
    std::chrono::milliseconds delay_;
};

class ExponentialBackoff final : public RetryPolicy {
public:
    ExponentialBackoff(int max_attempts, std::chrono::milliseconds base,
                       std::chrono::milliseconds cap)
        : RetryPolicy(max_attempts), base_(base), cap_(cap < base ? base : cap) {}

    [[nodiscard]] std::chrono::milliseconds delayBefore(int next_attempt) const override;

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
};

using RetryPolicyPtr = std::shared_ptr<const RetryPolicy>;

[[nodiscard]] RetryPolicyPtr makeRetryPolicy(BackoffKind kind, int max_attempts,
                                             std::chrono::milliseconds base,
                                             std::chrono::milliseconds cap);

} // namespace linkfetch
