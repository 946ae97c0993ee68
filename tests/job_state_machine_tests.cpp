// Job record and state machine tests.
#include "test_support.hpp"

#include "linkfetch/job.hpp"
#include "linkfetch/job_state_machine.hpp"

#include <random>

namespace {

using linkfetch::Job;
using linkfetch::JobStateMachine;
using linkfetch::JobStatus;
using linkfetch::test::TestContext;

constexpr JobStatus kAllStatuses[] = {JobStatus::Queued,  JobStatus::Running,
                                      JobStatus::Paused,  JobStatus::Success,
                                      JobStatus::Failed,  JobStatus::Canceled};

Job freshJob() {
    Job job;
    job.id = "job-1";
    job.source_url = "https://1fichier.com/?abc";
    job.created_at = linkfetch::Clock::now();
    job.updated_at = job.created_at;
    return job;
}

void test_transition_table(TestContext& t) {
    t.check(JobStateMachine::canTransition(JobStatus::Queued, JobStatus::Running),
            "queued -> running should be allowed");
    t.check(JobStateMachine::canTransition(JobStatus::Queued, JobStatus::Canceled),
            "queued -> canceled should be allowed");
    t.check(!JobStateMachine::canTransition(JobStatus::Queued, JobStatus::Paused),
            "queued -> paused should be rejected");
    t.check(!JobStateMachine::canTransition(JobStatus::Queued, JobStatus::Success),
            "queued -> success should be rejected");

    for (auto to : {JobStatus::Success, JobStatus::Failed, JobStatus::Paused, JobStatus::Canceled}) {
        t.check(JobStateMachine::canTransition(JobStatus::Running, to),
                "running should reach " + std::string{linkfetch::toString(to)});
    }
    t.check(JobStateMachine::canTransition(JobStatus::Paused, JobStatus::Running),
            "paused -> running should be allowed");
    t.check(JobStateMachine::canTransition(JobStatus::Paused, JobStatus::Canceled),
            "paused -> canceled should be allowed");
    t.check(!JobStateMachine::canTransition(JobStatus::Paused, JobStatus::Success),
            "paused -> success should be rejected");

    for (auto from : {JobStatus::Success, JobStatus::Failed, JobStatus::Canceled}) {
        t.check(JobStateMachine::isTerminal(from), "terminal status should report terminal");
        for (auto to : kAllStatuses) {
            t.check(!JobStateMachine::canTransition(from, to),
                    "terminal status must not transition anywhere");
        }
    }
}

void test_illegal_transition_throws_conflict(TestContext& t) {
    Job job = freshJob();
    bool threw = false;
    try {
        JobStateMachine::transition(job, JobStatus::Success);
    } catch (const linkfetch::CommandConflictError& ex) {
        threw = true;
        t.checkContains(ex.what(), "job-1", "conflict message should name the job");
        t.checkContains(ex.what(), "queued", "conflict message should name the current state");
    }
    t.check(threw, "queued -> success should throw CommandConflictError");
    t.check(job.status == JobStatus::Queued, "rejected transition must not change the status");

    JobStateMachine::transition(job, JobStatus::Running);
    JobStateMachine::transition(job, JobStatus::Failed);
    threw = false;
    try {
        JobStateMachine::transition(job, JobStatus::Running);
    } catch (const linkfetch::CommandConflictError& ex) {
        threw = true;
        t.checkContains(ex.what(), "already failed", "terminal conflict should say so");
    }
    t.check(threw, "failed job must not be restarted");
}

void test_expected_state_guard(TestContext& t) {
    Job job = freshJob();
    JobStateMachine::transition(job, JobStatus::Running);
    bool threw = false;
    try {
        JobStateMachine::transition(job, JobStatus::Queued, JobStatus::Canceled);
    } catch (const linkfetch::CommandConflictError& ex) {
        threw = true;
        t.checkContains(ex.what(), "already left state 'queued'",
                        "guard should explain the lost race");
    }
    t.check(threw, "transition guarded by a stale state should throw");
    t.check(job.status == JobStatus::Running, "guarded failure leaves status untouched");
}

void test_transition_clears_flags(TestContext& t) {
    Job job = freshJob();
    JobStateMachine::transition(job, JobStatus::Running);
    job.pause_requested = true;
    JobStateMachine::transition(job, JobStatus::Paused);
    t.check(!job.pause_requested, "commit to paused should clear the pending pause");

    JobStateMachine::transition(job, JobStatus::Running);
    job.stop_requested = true;
    JobStateMachine::transition(job, JobStatus::Canceled);
    t.check(!job.stop_requested, "commit to canceled should clear the pending stop");
}

// saved_path is set iff status is success, over random command sequences.
void test_saved_path_invariant(TestContext& t) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> pick(0, 5);
    int violations = 0;
    for (int round = 0; round < 200; ++round) {
        Job job = freshJob();
        for (int step = 0; step < 12; ++step) {
            const JobStatus to = kAllStatuses[pick(rng)];
            try {
                JobStateMachine::transition(job, to);
                if (to == JobStatus::Success) {
                    job.saved_path = "/downloads/movies/file.mkv";
                }
            } catch (const linkfetch::CommandConflictError&) {
                // Illegal steps are expected in a random walk.
            }
            if (job.saved_path.has_value() != (job.status == JobStatus::Success)) {
                ++violations;
            }
        }
    }
    t.check(violations == 0, "saved_path must be set exactly when the job succeeded");
}

void test_updated_at_monotonic(TestContext& t) {
    Job job = freshJob();
    const auto future = linkfetch::Clock::now() + std::chrono::hours(1);
    job.updated_at = future;
    JobStateMachine::touch(job);
    t.check(job.updated_at == future, "touch must never move updated_at backwards");
    JobStateMachine::transition(job, JobStatus::Running);
    t.check(job.updated_at >= future, "transition must keep updated_at non-decreasing");
}

void test_progress_percent(TestContext& t) {
    Job job = freshJob();
    t.check(job.progressPercent() == 0.0, "no total means 0% while running");
    job.total_bytes = 200;
    job.bytes_downloaded = 50;
    t.check(job.progressPercent() == 25.0, "50 of 200 bytes should be 25%");
    job.bytes_downloaded = 400;
    t.check(job.progressPercent() == 100.0, "percent must be clamped to 100");

    Job unknown = freshJob();
    unknown.status = JobStatus::Success;
    unknown.bytes_downloaded = 10;
    t.check(unknown.progressPercent() == 100.0, "finished job with unknown total is 100%");
}

void test_status_names(TestContext& t) {
    for (auto status : kAllStatuses) {
        const auto parsed = linkfetch::jobStatusFromString(linkfetch::toString(status));
        t.check(parsed && *parsed == status, "status names should parse back");
    }
    t.check(!linkfetch::jobStatusFromString("done"), "unknown status name should not parse");
    t.check(linkfetch::toString(linkfetch::NotifyStatus::NotRequested) == "not_requested",
            "notify status uses snake_case names");
}

void test_job_ids(TestContext& t) {
    const std::string a = linkfetch::generateJobId();
    const std::string b = linkfetch::generateJobId();
    t.check(a != b, "job ids should be unique");
    t.check(a.size() == 36, "job id should be a 36 character UUID");
    t.check(a[14] == '4', "job id should be a version 4 UUID");
    t.check(a[8] == '-' && a[13] == '-' && a[18] == '-' && a[23] == '-',
            "job id should use UUID grouping");
}

void test_timestamps(TestContext& t) {
    const auto parsed = linkfetch::parseTimestamp("2024-05-01T10:00:00.123Z");
    t.check(parsed.has_value(), "ISO timestamp should parse");
    if (parsed) {
        t.check(linkfetch::formatTimestamp(*parsed) == "2024-05-01T10:00:00.123Z",
                "timestamp should format back to the same text");
    }
    t.check(!linkfetch::parseTimestamp("yesterday"), "garbage must not parse");
}

} // namespace

int main() {
    TestContext t;
    test_transition_table(t);
    test_illegal_transition_throws_conflict(t);
    test_expected_state_guard(t);
    test_transition_clears_flags(t);
    test_saved_path_invariant(t);
    test_updated_at_monotonic(t);
    test_progress_percent(t);
    test_status_names(t);
    test_job_ids(t);
    test_timestamps(t);
    return t.finish("linkfetch_job_state_machine_tests");
}
