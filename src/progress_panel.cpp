#include "linkfetch/progress_panel.hpp"

#include "linkfetch/job_engine.hpp"

#include <algorithm>
#include <iterator>
#include <iostream>
#include <thread>

#include <fmt/format.h>

namespace linkfetch {

namespace {

constexpr std::size_t kNameWidth = 24;
constexpr int kBarWidth = 30;

std::string displayName(const Job& job) {
    std::string name = job.file_name.value_or(std::string{});
    if (name.empty()) {
        name = job.source_url;
    }
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth - 3) + "...";
    }
    return name;
}

} // namespace

ProgressPanel::ProgressPanel(const JobEngine& engine) : ProgressPanel(engine, std::cout) {}

ProgressPanel::ProgressPanel(const JobEngine& engine, std::ostream& out)
    : engine_(engine), out_(out) {}

void ProgressPanel::run(std::chrono::milliseconds interval) {
    std::size_t previous_lines = 0;
    while (true) {
        const auto jobs = engine_.list();
        redraw(buildPanel(jobs), previous_lines);

        if (!hasActiveJobs(jobs)) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }
    out_ << std::flush;
}

std::string ProgressPanel::buildPanel(const std::vector<Job>& jobs) {
    std::string panel;
    panel.reserve(jobs.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("linkfetch ({} jobs)\n", jobs.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    bool totals_known = !jobs.empty();
    for (const auto& job : jobs) {
        panel += formatJobLine(job);
        panel.push_back('\n');

        if (job.total_bytes) {
            total_all += *job.total_bytes;
            downloaded_all += job.bytes_downloaded;
        } else {
            totals_known = false;
        }
    }

    panel.append("--------------------------------------------------\n");
    if (totals_known && total_all > 0) {
        const double ratio = static_cast<double>(downloaded_all) / static_cast<double>(total_all);
        panel += fmt::format("Overall: {:>3}%", static_cast<int>(ratio * 100.0));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatJobLine(const Job& job) {
    const std::string name = displayName(job);

    if (job.status == JobStatus::Queued) {
        return fmt::format("{:<24} [Queued]", name);
    }
    if (!job.total_bytes && job.status == JobStatus::Running) {
        const char* phase = job.bytes_downloaded == 0 ? "Connecting..." : "Streaming";
        return fmt::format("{:<24} [{}] {}", name, phase, formatSize(job.bytes_downloaded));
    }

    const double percent = job.progressPercent();
    const int filled = static_cast<int>(percent / 100.0 * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < filled) ? u8"█" : u8"░";
    }

    std::string line = fmt::format("{:<24} [{}] {:>3}% ({}/{})", name, bar,
                                   static_cast<int>(percent), formatSize(job.bytes_downloaded),
                                   job.total_bytes ? formatSize(*job.total_bytes) : "?");

    switch (job.status) {
    case JobStatus::Running:
        if (job.attempts > 1) {
            line += fmt::format("  retry {}", job.attempts);
        }
        break;
    case JobStatus::Paused:
        line.append("  Paused");
        break;
    case JobStatus::Success:
        line.append("  Done");
        break;
    case JobStatus::Failed:
        line += fmt::format("  Failed: {}", job.error_message.value_or("unknown error"));
        break;
    case JobStatus::Canceled:
        line.append("  Canceled");
        break;
    case JobStatus::Queued:
        break;
    }
    return line;
}

std::string ProgressPanel::formatSize(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    double scaled = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (scaled >= 1024.0 && unit + 1 < std::size(kUnits)) {
        scaled /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", scaled, kUnits[unit]);
}

bool ProgressPanel::hasActiveJobs(const std::vector<Job>& jobs) {
    return std::any_of(jobs.begin(), jobs.end(), [](const Job& job) {
        return job.status == JobStatus::Queued || job.status == JobStatus::Running;
    });
}

void ProgressPanel::redraw(const std::string& panel, std::size_t& previous_lines) {
    const auto current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines > 0) {
        out_ << "\033[" << previous_lines << "F\033[J";
    }
    out_ << panel;
    previous_lines = current_lines;
}

} // namespace linkfetch
