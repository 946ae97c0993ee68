#pragma once

#include "job.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace linkfetch {

class JobEngine;

// Live terminal view of the engine's jobs, redrawn in place.
class ProgressPanel {
public:
    explicit ProgressPanel(const JobEngine& engine);
    ProgressPanel(const JobEngine& engine, std::ostream& out);

    // Redraws every `interval` until no job is queued or running.
    void run(std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    [[nodiscard]] static std::string buildPanel(const std::vector<Job>& jobs);
    [[nodiscard]] static std::string formatJobLine(const Job& job);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);
    [[nodiscard]] static bool hasActiveJobs(const std::vector<Job>& jobs);

private:
    void redraw(const std::string& panel, std::size_t& previous_lines);

    const JobEngine& engine_;
    std::ostream& out_;
};

} // namespace linkfetch
