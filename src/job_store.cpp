#include "linkfetch/job_store.hpp"

#include "linkfetch/errors.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace linkfetch {

namespace {

using nlohmann::json;

constexpr int kFormatVersion = 1;

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json timestampToJson(const std::optional<Timestamp>& value) {
    return value ? json(formatTimestamp(*value)) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::optional<Timestamp> timestampFromJson(const json& object, const char* key) {
    const auto text = optionalFromJson<std::string>(object, key);
    if (!text) {
        return std::nullopt;
    }
    return parseTimestamp(*text);
}

} // namespace

JobStore::JobStore(std::filesystem::path path) : path_(std::move(path)) {}

json JobStore::toJson(const Job& job) {
    return json{
        {"id", job.id},
        {"source_url", job.source_url},
        {"target_dir", job.target_dir},
        {"file_name", optionalToJson(job.file_name)},
        {"bytes_downloaded", job.bytes_downloaded},
        {"total_bytes", optionalToJson(job.total_bytes)},
        {"status", std::string{toString(job.status)}},
        {"error_message", optionalToJson(job.error_message)},
        {"saved_path", optionalToJson(job.saved_path)},
        {"interrupted", job.interrupted},
        {"notify_status", std::string{toString(job.notify_status)}},
        {"notify_message", optionalToJson(job.notify_message)},
        {"notify_requested_at", timestampToJson(job.notify_requested_at)},
        {"notify_completed_at", timestampToJson(job.notify_completed_at)},
        {"created_at", formatTimestamp(job.created_at)},
        {"updated_at", formatTimestamp(job.updated_at)},
    };
}

Job JobStore::fromJson(const json& value) {
    Job job;
    job.id = value.at("id").get<std::string>();
    job.source_url = value.at("source_url").get<std::string>();
    job.target_dir = value.at("target_dir").get<std::string>();
    job.file_name = optionalFromJson<std::string>(value, "file_name");
    job.bytes_downloaded = value.value("bytes_downloaded", std::uint64_t{0});
    job.total_bytes = optionalFromJson<std::uint64_t>(value, "total_bytes");

    const auto status = jobStatusFromString(value.at("status").get<std::string>());
    if (!status) {
        throw Error(fmt::format("Job {} has an unknown status", job.id));
    }
    job.status = *status;

    job.error_message = optionalFromJson<std::string>(value, "error_message");
    job.saved_path = optionalFromJson<std::string>(value, "saved_path");
    job.interrupted = value.value("interrupted", false);

    job.notify_status = notifyStatusFromString(value.value("notify_status", std::string{}))
                            .value_or(NotifyStatus::NotRequested);
    job.notify_message = optionalFromJson<std::string>(value, "notify_message");
    job.notify_requested_at = timestampFromJson(value, "notify_requested_at");
    job.notify_completed_at = timestampFromJson(value, "notify_completed_at");

    job.created_at = timestampFromJson(value, "created_at").value_or(Clock::now());
    job.updated_at = timestampFromJson(value, "updated_at").value_or(job.created_at);
    return job;
}

void JobStore::save(const std::vector<Job>& jobs) {
    json document{{"version", kFormatVersion}, {"jobs", json::array()}};
    for (const auto& job : jobs) {
        document["jobs"].push_back(toJson(job));
    }
    const std::string text = document.dump(2);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    auto temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        out << text;
        out.flush();
        if (!out) {
            throw Error(fmt::format("Cannot write job store {}", temp.string()));
        }
    }
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        throw Error(fmt::format("Cannot replace job store {}: {}", path_.string(), ec.message()));
    }
}

std::vector<Job> JobStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }

    std::ifstream in(path_);
    if (!in) {
        throw Error(fmt::format("Cannot read job store {}", path_.string()));
    }
    std::ostringstream text;
    text << in.rdbuf();

    const json document = json::parse(text.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw Error(fmt::format("Job store {} is corrupt", path_.string()));
    }

    std::vector<Job> jobs;
    try {
        for (const auto& entry : document.value("jobs", json::array())) {
            jobs.push_back(fromJson(entry));
        }
    } catch (const json::exception& ex) {
        throw Error(fmt::format("Job store {} is corrupt: {}", path_.string(), ex.what()));
    }
    return jobs;
}

} // namespace linkfetch
