// Terminal progress panel formatting tests.
#include "test_support.hpp"

#include "linkfetch/progress_panel.hpp"

namespace {

using linkfetch::Job;
using linkfetch::JobStatus;
using linkfetch::ProgressPanel;
using linkfetch::test::TestContext;

Job jobWith(JobStatus status, std::uint64_t bytes, std::optional<std::uint64_t> total) {
    Job job;
    job.id = "id";
    job.source_url = "https://1fichier.com/?abc";
    job.file_name = "film.mkv";
    job.status = status;
    job.bytes_downloaded = bytes;
    job.total_bytes = total;
    return job;
}

void test_format_size(TestContext& t) {
    t.check(ProgressPanel::formatSize(512) == "512 B", "bytes");
    t.check(ProgressPanel::formatSize(1536) == "1.5 KB", "kilobytes");
    t.check(ProgressPanel::formatSize(5 * 1024 * 1024) == "5.0 MB", "megabytes");
    t.check(ProgressPanel::formatSize(3ULL * 1024 * 1024 * 1024) == "3.0 GB", "gigabytes");
    t.check(ProgressPanel::formatSize(1023) == "1023 B", "just under a kilobyte");
    t.check(ProgressPanel::formatSize(2ULL * 1024 * 1024 * 1024 * 1024) == "2.0 TB", "terabytes");
    t.check(ProgressPanel::formatSize(5000ULL * 1024 * 1024 * 1024 * 1024) == "5000.0 TB",
            "largest unit keeps growing");
}

void test_job_lines(TestContext& t) {
    const auto running = ProgressPanel::formatJobLine(jobWith(JobStatus::Running, 512, 1024));
    t.checkContains(running, "film.mkv", "line shows the file name");
    t.checkContains(running, " 50%", "line shows the percentage");
    t.checkContains(running, "(512 B/1.0 KB)", "line shows byte counts");

    const auto queued = ProgressPanel::formatJobLine(jobWith(JobStatus::Queued, 0, std::nullopt));
    t.checkContains(queued, "[Queued]", "queued jobs are labeled");

    auto failed = jobWith(JobStatus::Failed, 10, 100);
    failed.error_message = "HTTP error 404";
    t.checkContains(ProgressPanel::formatJobLine(failed), "Failed: HTTP error 404",
                    "failed jobs show their error");

    t.checkContains(ProgressPanel::formatJobLine(jobWith(JobStatus::Success, 7, std::nullopt)),
                    "100%", "finished job with unknown size shows 100%");
    t.checkContains(ProgressPanel::formatJobLine(jobWith(JobStatus::Running, 0, std::nullopt)),
                    "Connecting...", "running job without data yet is connecting");

    auto unnamed = jobWith(JobStatus::Queued, 0, std::nullopt);
    unnamed.file_name.reset();
    t.checkContains(ProgressPanel::formatJobLine(unnamed), "https://1fichier.com/",
                    "jobs without a file name show their source");
}

void test_panel_and_activity(TestContext& t) {
    const std::vector<Job> jobs{jobWith(JobStatus::Success, 100, 100),
                                jobWith(JobStatus::Running, 0, 100)};
    const auto panel = ProgressPanel::buildPanel(jobs);
    t.checkContains(panel, "(2 jobs)", "header counts jobs");
    t.checkContains(panel, "Overall:  50%", "overall progress spans all jobs");
    t.check(ProgressPanel::hasActiveJobs(jobs), "running job keeps the panel alive");

    const std::vector<Job> settled{jobWith(JobStatus::Success, 100, 100),
                                   jobWith(JobStatus::Canceled, 3, std::nullopt)};
    t.checkContains(ProgressPanel::buildPanel(settled), "Overall: N/A",
                    "unknown totals disable the overall figure");
    t.check(!ProgressPanel::hasActiveJobs(settled), "settled jobs end the panel");
}

} // namespace

int main() {
    TestContext t;
    test_format_size(t);
    test_job_lines(t);
    test_panel_and_activity(t);
    return t.finish("linkfetch_progress_panel_tests");
}
