#pragma once

#include "audit_sink.hpp"
#include "config.hpp"
#include "job.hpp"
#include "job_store.hpp"
#include "notifier.hpp"
#include "resolver.hpp"
#include "retry_policy.hpp"
#include "transfer_stream_reader.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace linkfetch {

// Everything the engine talks to outside its own process state. Null members
// fall back to: no notifications, a discarding audit sink, the retry policy
// described by the config, no persistence. Resolver and reader are required.
struct EngineAdapters {
    ResolverPtr resolver;
    TransferStreamReaderPtr reader;
    NotifierPtr notifier;
    AuditSinkPtr audit;
    RetryPolicyPtr retry;
    std::shared_ptr<JobStore> store;
};

// Owns every job record and the worker pool that runs them. All public
// methods are thread-safe and return value snapshots.
class JobEngine {
public:
    // `config` must already be validated.
    JobEngine(EngineConfig config, EngineAdapters adapters);
    ~JobEngine();

    JobEngine(const JobEngine&) = delete;
    JobEngine& operator=(const JobEngine&) = delete;

    // Production wiring: libcurl reader, 1fichier resolver, Plex notifier
    // when configured, JSON-lines audit log and job store when paths are set.
    [[nodiscard]] static std::unique_ptr<JobEngine> makeDefault(EngineConfig config);

    // Restores persisted jobs and starts the workers. Throws Error when the
    // job store cannot be read.
    void start();

    // Throws ValidationError; nothing is recorded in that case.
    Job submit(const std::string& url,
               const std::optional<std::string>& destination = std::nullopt);

    [[nodiscard]] std::vector<Job> list() const;
    [[nodiscard]] Job get(const std::string& job_id) const;

    // Commands throw NotFoundError or CommandConflictError.
    Job pause(const std::string& job_id);
    Job resume(const std::string& job_id);
    Job stop(const std::string& job_id);
    void remove(const std::string& job_id);

    // Drops every success/failed/canceled job; returns how many went.
    std::size_t cleanCompleted();

    // True once no job is queued, running or waiting to be resumed.
    bool waitIdle(std::chrono::milliseconds timeout);

    // Stops accepting work, pauses running jobs at their next chunk boundary
    // and joins the workers. Safe to call more than once.
    void shutdown();

    [[nodiscard]] const EngineConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace linkfetch
