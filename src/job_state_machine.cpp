#include "linkfetch/job_state_machine.hpp"

#include "linkfetch/errors.hpp"

#include <fmt/format.h>

namespace linkfetch {

bool JobStateMachine::isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Success || status == JobStatus::Failed ||
           status == JobStatus::Canceled;
}

bool JobStateMachine::canTransition(JobStatus from, JobStatus to) noexcept {
    switch (from) {
    case JobStatus::Queued:
        return to == JobStatus::Running || to == JobStatus::Canceled;
    case JobStatus::Running:
        return to == JobStatus::Success || to == JobStatus::Failed ||
               to == JobStatus::Paused || to == JobStatus::Canceled;
    case JobStatus::Paused:
        return to == JobStatus::Running || to == JobStatus::Canceled;
    case JobStatus::Success:
    case JobStatus::Failed:
    case JobStatus::Canceled:
        return false;
    }
    return false;
}

void JobStateMachine::transition(Job& job, JobStatus to) {
    if (!canTransition(job.status, to)) {
        throw CommandConflictError(describe(job, to));
    }

    job.status = to;
    job.pause_requested = false;
    if (to != JobStatus::Running) {
        job.stop_requested = false;
    }

    // saved_path belongs to success only; the caller sets it right after.
    if (to != JobStatus::Success) {
        job.saved_path.reset();
    }
    if (to == JobStatus::Running) {
        job.error_message.reset();
    }
    touch(job);
}

void JobStateMachine::transition(Job& job, JobStatus expected, JobStatus to) {
    if (job.status != expected) {
        throw CommandConflictError(
            fmt::format("Job {} already left state '{}' (now '{}')", job.id,
                        toString(expected), toString(job.status)));
    }
    transition(job, to);
}

void JobStateMachine::touch(Job& job) {
    const auto now = Clock::now();
    if (now > job.updated_at) {
        job.updated_at = now;
    }
}

std::string JobStateMachine::describe(const Job& job, JobStatus to) {
    if (isTerminal(job.status)) {
        return fmt::format("Job {} is already {}; cannot move to {}", job.id,
                           toString(job.status), toString(to));
    }
    return fmt::format("Invalid transition for job {}: {} -> {}", job.id,
                       toString(job.status), toString(to));
}

} // namespace linkfetch
