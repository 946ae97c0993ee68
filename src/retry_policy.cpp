#include "linkfetch/retry_policy.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace linkfetch {

FailureClass RetryPolicy::classify(const TransferResult& result) noexcept {
    switch (result.outcome) {
    case TransferOutcome::Stalled:
    case TransferOutcome::ConnectionError:
        return FailureClass::Transient;
    case TransferOutcome::HttpError:
        return classifyHttpStatus(result.http_status);
    case TransferOutcome::Completed:
    case TransferOutcome::Canceled:
    case TransferOutcome::WriteError:
    case TransferOutcome::RejectedContent:
        return FailureClass::Permanent;
    }
    return FailureClass::Permanent;
}

FailureClass RetryPolicy::classifyHttpStatus(long status) noexcept {
    if (status == 429 || status == 408 || status >= 500) {
        return FailureClass::Transient;
    }
    return FailureClass::Permanent;
}

std::string RetryPolicy::exhaustedMessage(int attempts, const std::string& last_error) {
    return fmt::format("Download failed after {} attempts: {}", attempts, last_error);
}

std::chrono::milliseconds FixedBackoff::delayBefore(int) const { return delay_; }

std::chrono::milliseconds ExponentialBackoff::delayBefore(int next_attempt) const {
    // attempt 2 waits base, attempt 3 waits 2*base, ... capped.
    const int doublings = std::clamp(next_attempt - 2, 0, 20);
    const auto delay = base_ * (1LL << doublings);
    return std::min<std::chrono::milliseconds>(delay, cap_);
}

RetryPolicyPtr makeRetryPolicy(BackoffKind kind, int max_attempts,
                               std::chrono::milliseconds base,
                               std::chrono::milliseconds cap) {
    if (kind == BackoffKind::Fixed) {
        return std::make_shared<FixedBackoff>(max_attempts, base);
    }
    return std::make_shared<ExponentialBackoff>(max_attempts, base, cap);
}

} // namespace linkfetch
