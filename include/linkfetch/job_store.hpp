#pragma once

#include "job.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace linkfetch {

// Snapshot of the job set on disk so queued and interrupted jobs survive a
// restart. The whole set is rewritten atomically (temp file + rename).
class JobStore {
public:
    explicit JobStore(std::filesystem::path path);

    // Throws Error when the file cannot be written.
    void save(const std::vector<Job>& jobs);

    // Empty when the file does not exist yet. Throws Error on a corrupt file.
    [[nodiscard]] std::vector<Job> load() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static nlohmann::json toJson(const Job& job);
    [[nodiscard]] static Job fromJson(const nlohmann::json& value);

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace linkfetch
