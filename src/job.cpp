#include "linkfetch/job.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <random>

#include <fmt/format.h>

namespace linkfetch {

double Job::progressPercent() const {
    if (total_bytes && *total_bytes > 0) {
        const double ratio = static_cast<double>(bytes_downloaded) /
                             static_cast<double>(*total_bytes);
        return std::clamp(ratio * 100.0, 0.0, 100.0);
    }
    // Unknown total: nothing to compare against until the stream hits EOF.
    return status == JobStatus::Success ? 100.0 : 0.0;
}

bool Job::isTerminal() const {
    return status == JobStatus::Success || status == JobStatus::Failed ||
           status == JobStatus::Canceled;
}

std::string_view toString(JobStatus status) {
    switch (status) {
    case JobStatus::Queued:
        return "queued";
    case JobStatus::Running:
        return "running";
    case JobStatus::Paused:
        return "paused";
    case JobStatus::Success:
        return "success";
    case JobStatus::Failed:
        return "failed";
    case JobStatus::Canceled:
        return "canceled";
    }
    return "unknown";
}

std::string_view toString(NotifyStatus status) {
    switch (status) {
    case NotifyStatus::NotRequested:
        return "not_requested";
    case NotifyStatus::Requesting:
        return "requesting";
    case NotifyStatus::Success:
        return "success";
    case NotifyStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::optional<JobStatus> jobStatusFromString(std::string_view text) {
    for (auto status : {JobStatus::Queued, JobStatus::Running, JobStatus::Paused,
                        JobStatus::Success, JobStatus::Failed, JobStatus::Canceled}) {
        if (toString(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<NotifyStatus> notifyStatusFromString(std::string_view text) {
    for (auto status : {NotifyStatus::NotRequested, NotifyStatus::Requesting,
                        NotifyStatus::Success, NotifyStatus::Failed}) {
        if (toString(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

std::string generateJobId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dis;

    std::uint64_t hi = dis(gen);
    std::uint64_t lo = dis(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<std::uint32_t>(hi >> 32),
                       static_cast<std::uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<std::uint32_t>(hi & 0xFFFF),
                       static_cast<std::uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::string formatTimestamp(Timestamp ts) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        ts.time_since_epoch())
                        .count();
    const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, ms % 1000);
}

std::optional<Timestamp> parseTimestamp(std::string_view text) {
    const std::string input{text};
    std::tm utc{};
    int millis = 0;
    const int fields = std::sscanf(input.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                                   &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                                   &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis);
    if (fields < 6) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    const std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

} // namespace linkfetch
