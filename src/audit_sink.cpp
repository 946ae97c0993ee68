#include "linkfetch/audit_sink.hpp"

#include "linkfetch/logging.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace linkfetch {

JsonLinesAuditSink::JsonLinesAuditSink(std::filesystem::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            logger()->warn("Cannot create audit log folder {}: {}",
                           path_.parent_path().string(), ec.message());
        }
    }
}

std::string JsonLinesAuditSink::toJsonLine(const AuditEvent& event) {
    nlohmann::json line{
        {"timestamp", formatTimestamp(event.timestamp)},
        {"job_id", event.job_id},
        {"from_state", event.from_state},
        {"to_state", event.to_state},
    };
    if (!event.detail.empty()) {
        line["detail"] = event.detail;
    }
    return line.dump(-1, ' ', true);
}

void JsonLinesAuditSink::append(const AuditEvent& event) {
    const std::string line = toJsonLine(event);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path_, std::ios::app);
    out << line << '\n';
    out.flush();
    if (!out) {
        // Logged only; audit failures never reach the job.
        logger()->error("Failed to append audit event for job {} to {}", event.job_id,
                        path_.string());
    }
}

} // namespace linkfetch
