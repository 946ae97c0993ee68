#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace linkfetch {

enum class JobStatus {
    Queued,
    Running,
    Paused,
    Success,
    Failed,
    Canceled
};

enum class NotifyStatus {
    NotRequested,
    Requesting,
    Success,
    Failed
};

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Value snapshot of one download job. Callers never get a reference to the
// engine's copy.
struct Job {
    std::string id;
    std::string source_url;
    std::string target_dir;
    std::optional<std::string> file_name;

    std::uint64_t bytes_downloaded{0};
    std::optional<std::uint64_t> total_bytes;

    JobStatus status{JobStatus::Queued};
    std::optional<std::string> error_message;
    std::optional<std::string> saved_path;

    int attempts{0};
    bool pause_requested{false};
    bool stop_requested{false};
    // Paused by a shutdown or crash rather than by the operator; resumes on
    // the next start.
    bool interrupted{false};

    NotifyStatus notify_status{NotifyStatus::NotRequested};
    std::optional<std::string> notify_message;
    std::optional<Timestamp> notify_requested_at;
    std::optional<Timestamp> notify_completed_at;

    Timestamp created_at{};
    Timestamp updated_at{};

    [[nodiscard]] double progressPercent() const;
    [[nodiscard]] bool isTerminal() const;
};

[[nodiscard]] std::string_view toString(JobStatus status);
[[nodiscard]] std::string_view toString(NotifyStatus status);
[[nodiscard]] std::optional<JobStatus> jobStatusFromString(std::string_view text);
[[nodiscard]] std::optional<NotifyStatus> notifyStatusFromString(std::string_view text);

// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string generateJobId();

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T10:00:00.123Z.
[[nodiscard]] std::string formatTimestamp(Timestamp ts);
[[nodiscard]] std::optional<Timestamp> parseTimestamp(std::string_view text);

} // namespace linkfetch
