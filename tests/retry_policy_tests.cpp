// Retry policy tests.
#include "test_support.hpp"

#include "linkfetch/retry_policy.hpp"

namespace {

using linkfetch::FailureClass;
using linkfetch::TransferOutcome;
using linkfetch::TransferResult;
using linkfetch::test::TestContext;
using std::chrono::milliseconds;

TransferResult resultWith(TransferOutcome outcome, long status = 0) {
    TransferResult result;
    result.outcome = outcome;
    result.http_status = status;
    return result;
}

void test_classification(TestContext& t) {
    using linkfetch::RetryPolicy;
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::Stalled)) == FailureClass::Transient,
            "stall should be transient");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::ConnectionError)) ==
                FailureClass::Transient,
            "connection error should be transient");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::HttpError, 503)) ==
                FailureClass::Transient,
            "HTTP 503 should be transient");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::HttpError, 429)) ==
                FailureClass::Transient,
            "HTTP 429 should be transient");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::HttpError, 404)) ==
                FailureClass::Permanent,
            "HTTP 404 should be permanent");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::HttpError, 403)) ==
                FailureClass::Permanent,
            "HTTP 403 should be permanent");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::WriteError)) ==
                FailureClass::Permanent,
            "write error should be permanent");
    t.check(RetryPolicy::classify(resultWith(TransferOutcome::RejectedContent)) ==
                FailureClass::Permanent,
            "HTML instead of a file should be permanent");
}

void test_attempt_cap(TestContext& t) {
    const auto policy = linkfetch::makeRetryPolicy(linkfetch::BackoffKind::Fixed, 3,
                                                   milliseconds(100), milliseconds(100));
    t.check(policy->maxAttempts() == 3, "max attempts should come from the factory");
    t.check(policy->shouldRetry(FailureClass::Transient, 1), "first failure should retry");
    t.check(policy->shouldRetry(FailureClass::Transient, 2), "second failure should retry");
    t.check(!policy->shouldRetry(FailureClass::Transient, 3), "third failure exhausts 3 attempts");
    t.check(!policy->shouldRetry(FailureClass::Permanent, 1), "permanent failures never retry");
    t.check(policy->delayBefore(2) == milliseconds(100), "fixed backoff keeps its delay");
    t.check(policy->delayBefore(5) == milliseconds(100), "fixed backoff never grows");
}

void test_exponential_backoff(TestContext& t) {
    const linkfetch::ExponentialBackoff policy(10, milliseconds(2000), milliseconds(30000));
    t.check(policy.delayBefore(2) == milliseconds(2000), "first retry waits the base delay");
    t.check(policy.delayBefore(3) == milliseconds(4000), "second retry doubles");
    t.check(policy.delayBefore(4) == milliseconds(8000), "third retry doubles again");
    t.check(policy.delayBefore(6) == milliseconds(30000), "delay is capped");
    t.check(policy.delayBefore(60) == milliseconds(30000), "huge attempt counts stay capped");

    milliseconds previous{0};
    bool monotonic = true;
    for (int attempt = 2; attempt < 20; ++attempt) {
        const auto delay = policy.delayBefore(attempt);
        monotonic = monotonic && delay >= previous;
        previous = delay;
    }
    t.check(monotonic, "backoff delays must never decrease");
}

void test_minimum_one_attempt(TestContext& t) {
    const linkfetch::FixedBackoff policy(0, milliseconds(1));
    t.check(policy.maxAttempts() == 1, "a policy always allows one attempt");
}

void test_exhausted_message(TestContext& t) {
    const auto message = linkfetch::RetryPolicy::exhaustedMessage(5, "No data received for 60000 ms");
    t.check(message == "Download failed after 5 attempts: No data received for 60000 ms",
            "exhausted message should name the attempts and the last error");
}

} // namespace

int main() {
    TestContext t;
    test_classification(t);
    test_attempt_cap(t);
    test_exponential_backoff(t);
    test_minimum_one_attempt(t);
    test_exhausted_message(t);
    return t.finish("linkfetch_retry_policy_tests");
}
