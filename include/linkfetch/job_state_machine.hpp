#pragma once

#include "job.hpp"

#include <string>

namespace linkfetch {

// Transition table for a job's status. The engine commits every status
// change through here while holding the job's lock.
class JobStateMachine {
public:
    [[nodiscard]] static bool isTerminal(JobStatus status) noexcept;
    [[nodiscard]] static bool canTransition(JobStatus from, JobStatus to) noexcept;

    // Throws CommandConflictError when `to` is not reachable from the
    // job's current status. On success updates status, updated_at and the
    // fields tied to the new status.
    static void transition(Job& job, JobStatus to);

    // Same check against an expected source state: fails with a conflict if
    // the job already left `expected`.
    static void transition(Job& job, JobStatus expected, JobStatus to);

    // Refreshes updated_at without letting it move backwards.
    static void touch(Job& job);

private:
    [[nodiscard]] static std::string describe(const Job& job, JobStatus to);
};

} // namespace linkfetch
