#pragma once

#include "job.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace linkfetch {

struct AuditEvent {
    std::string job_id;
    // Empty for a newly submitted job.
    std::string from_state;
    // A JobStatus name, or "removed".
    std::string to_state;
    Timestamp timestamp{};
    std::string detail;
};

// Append-only record of job lifecycle events.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void append(const AuditEvent& event) = 0;
};

using AuditSinkPtr = std::shared_ptr<AuditSink>;

class NullAuditSink final : public AuditSink {
public:
    void append(const AuditEvent&) override {}
};

// One JSON object per line, appended to `path`.
class JsonLinesAuditSink final : public AuditSink {
public:
    explicit JsonLinesAuditSink(std::filesystem::path path);

    void append(const AuditEvent& event) override;

    [[nodiscard]] static std::string toJsonLine(const AuditEvent& event);

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace linkfetch
