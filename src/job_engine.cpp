#include "linkfetch/job_engine.hpp"

#include "linkfetch/cancellation.hpp"
#include "linkfetch/curl_stream_reader.hpp"
#include "linkfetch/destination_file.hpp"
#include "linkfetch/errors.hpp"
#include "linkfetch/job_state_machine.hpp"
#include "linkfetch/logging.hpp"
#include "linkfetch/validation.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

namespace linkfetch {

namespace fs = std::filesystem;

namespace {

struct JobEntry {
    mutable std::mutex mutex;
    Job job;
    CancellationSignal signal;
    // A worker owns the job; cleared in the same critical section that
    // commits the worker's final state.
    bool active{false};
    // Resume accepted, waiting for a worker to claim the job.
    bool resume_pending{false};
};

using JobEntryPtr = std::shared_ptr<JobEntry>;

Job snapshotOf(const JobEntry& entry) {
    std::lock_guard<std::mutex> lock(entry.mutex);
    return entry.job;
}

AuditEvent makeEvent(const Job& job, std::string from, std::string to, std::string detail = {}) {
    AuditEvent event;
    event.job_id = job.id;
    event.from_state = std::move(from);
    event.to_state = std::move(to);
    event.timestamp = job.updated_at;
    event.detail = std::move(detail);
    return event;
}

// Outcome of a single resolve + stream attempt.
struct Attempt {
    enum class Kind {
        Completed,
        Interrupted,
        Failed
    };

    Kind kind{Kind::Failed};
    FailureClass failure{FailureClass::Permanent};
    std::string message;
    std::string saved_path;

    static Attempt completed(std::string path) {
        Attempt attempt;
        attempt.kind = Kind::Completed;
        attempt.saved_path = std::move(path);
        return attempt;
    }

    static Attempt interrupted() {
        Attempt attempt;
        attempt.kind = Kind::Interrupted;
        return attempt;
    }

    static Attempt failed(FailureClass failure, std::string message) {
        Attempt attempt;
        attempt.failure = failure;
        attempt.message = std::move(message);
        return attempt;
    }
};

// Final state a worker commits for a job it ran.
struct Settlement {
    JobStatus status{JobStatus::Failed};
    std::optional<std::string> error;
    std::optional<std::string> saved_path;
    bool interrupted{false};
};

Settlement failedWith(std::string message) {
    Settlement settlement;
    settlement.status = JobStatus::Failed;
    settlement.error = std::move(message);
    return settlement;
}

std::string pickFileName(const ResolvedLink& link, const std::string& source_url) {
    const std::string candidates[] = {
        link.suggested_file_name.value_or(std::string{}),
        fileNameFromUrl(link.direct_url),
        fileNameFromUrl(source_url),
    };
    for (const auto& candidate : candidates) {
        if (!candidate.empty() && !isGenericFileName(candidate)) {
            return sanitizeFileName(candidate);
        }
    }
    for (const auto& candidate : candidates) {
        if (!candidate.empty()) {
            return sanitizeFileName(candidate);
        }
    }
    return "download.bin";
}

constexpr std::uint64_t kErrorPageMaxBytes = 1024;
constexpr std::size_t kErrorPageSniffBytes = 256;

// A tiny body with no media extension that mentions HTML or the host is the
// host's error page, not the file.
bool looksLikeErrorPage(const fs::path& part, const std::string& final_name) {
    std::error_code ec;
    const auto size = fs::file_size(part, ec);
    if (ec || size >= kErrorPageMaxBytes) {
        return false;
    }
    std::string extension = fs::path(final_name).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!extension.empty() && extension != ".bin" && extension != ".html") {
        return false;
    }

    std::ifstream in(part, std::ios::binary);
    std::string prefix(kErrorPageSniffBytes, '\0');
    in.read(prefix.data(), static_cast<std::streamsize>(prefix.size()));
    prefix.resize(static_cast<std::size_t>(in.gcount()));
    std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return prefix.find("<html") != std::string::npos ||
           prefix.find("1fichier") != std::string::npos;
}

void rejectPendingCommand(const Job& job) {
    if (job.pause_requested) {
        throw CommandConflictError(fmt::format("Job {} already has a pending pause", job.id));
    }
    if (job.stop_requested) {
        throw CommandConflictError(fmt::format("Job {} already has a pending stop", job.id));
    }
}

void rejectTerminal(const Job& job, const char* command) {
    if (JobStateMachine::isTerminal(job.status)) {
        throw CommandConflictError(
            fmt::format("Job {} is already {}; cannot {}", job.id, toString(job.status), command));
    }
}

} // namespace

class JobEngine::Impl {
public:
    Impl(EngineConfig config, EngineAdapters adapters)
        : config_(std::move(config)), adapters_(std::move(adapters)) {
        if (!adapters_.resolver || !adapters_.reader) {
            throw ConfigError("JobEngine needs a resolver and a stream reader");
        }
        if (!adapters_.audit) {
            adapters_.audit = std::make_shared<NullAuditSink>();
        }
        if (!adapters_.retry) {
            adapters_.retry = makeRetryPolicy(config_.retry.backoff, config_.retry.max_attempts,
                                              config_.retry.base_delay, config_.retry.max_delay);
        }
    }

    void start() {
        if (started_ || stopping_) {
            return;
        }
        started_ = true;
        if (adapters_.store) {
            restore();
        }

        const int count = std::max(1, config_.max_concurrent_jobs);
        workers_.reserve(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
        logger()->info("Job engine started with {} workers", count);
    }

    Job submit(const std::string& url, const std::optional<std::string>& destination) {
        if (stopping_) {
            throw CommandConflictError("Job engine is shutting down");
        }
        validateSourceUrl(url, config_.allowed_hosts, config_.require_https);
        const fs::path directory = destination && !destination->empty()
                                       ? validateDestination(*destination, config_.allowed_roots)
                                       : config_.default_destination;

        auto entry = std::make_shared<JobEntry>();
        Job& job = entry->job;
        job.id = generateJobId();
        job.source_url = url;
        job.target_dir = directory.string();
        job.created_at = Clock::now();
        job.updated_at = job.created_at;
        const Job copy = job;

        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            jobs_.emplace(copy.id, entry);
            order_.push_back(copy.id);
        }
        publish(makeEvent(copy, "", std::string{toString(JobStatus::Queued)}, url));
        enqueue(copy.id);
        return copy;
    }

    std::vector<Job> list() const {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        std::vector<Job> jobs;
        jobs.reserve(order_.size());
        for (const auto& id : order_) {
            jobs.push_back(snapshotOf(*jobs_.at(id)));
        }
        return jobs;
    }

    Job get(const std::string& job_id) const { return snapshotOf(*find(job_id)); }

    Job pause(const std::string& job_id) {
        const auto entry = find(job_id);
        Job copy;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            rejectTerminal(job, "pause");
            if (job.status != JobStatus::Running) {
                throw CommandConflictError(fmt::format(
                    "Job {} is {}; only running jobs can be paused", job.id, toString(job.status)));
            }
            rejectPendingCommand(job);
            if (!entry->signal.request(StopReason::Pause)) {
                throw CommandConflictError(fmt::format("Job {} is already being interrupted", job.id));
            }
            job.pause_requested = true;
            JobStateMachine::touch(job);
            copy = job;
        }
        logger()->info("Job {}: pause requested", job_id);
        return copy;
    }

    Job resume(const std::string& job_id) {
        const auto entry = find(job_id);
        Job copy;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            rejectTerminal(job, "resume");
            if (job.status != JobStatus::Paused) {
                throw CommandConflictError(fmt::format(
                    "Job {} is {}; only paused jobs can be resumed", job.id, toString(job.status)));
            }
            if (entry->resume_pending) {
                throw CommandConflictError(fmt::format("Job {} is already waiting to resume", job.id));
            }
            entry->resume_pending = true;
            JobStateMachine::touch(job);
            copy = job;
        }
        logger()->info("Job {}: resume requested at {} bytes", job_id, copy.bytes_downloaded);
        enqueue(job_id);
        return copy;
    }

    Job stop(const std::string& job_id) {
        const auto entry = find(job_id);
        std::optional<AuditEvent> event;
        Job copy;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            rejectTerminal(job, "stop");
            rejectPendingCommand(job);
            if (job.status == JobStatus::Running) {
                if (!entry->signal.request(StopReason::Stop)) {
                    throw CommandConflictError(
                        fmt::format("Job {} is already being interrupted", job.id));
                }
                job.stop_requested = true;
                JobStateMachine::touch(job);
            } else {
                const auto from = toString(job.status);
                JobStateMachine::transition(job, JobStatus::Canceled);
                entry->resume_pending = false;
                event = makeEvent(job, std::string{from}, std::string{toString(job.status)},
                                  "stopped");
            }
            copy = job;
        }

        if (event) {
            removePartFile(copy);
            publish(*event);
        } else {
            logger()->info("Job {}: stop requested", job_id);
        }
        return copy;
    }

    void remove(const std::string& job_id) {
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            const auto it = jobs_.find(job_id);
            if (it == jobs_.end()) {
                throw NotFoundError(job_id);
            }
            const auto entry = it->second;

            std::optional<AuditEvent> cancel_event;
            Job copy;
            {
                std::lock_guard<std::mutex> entry_lock(entry->mutex);
                Job& job = entry->job;
                if (job.status == JobStatus::Running) {
                    // The worker still owns the file; it commits canceled and
                    // deletes the part file on its way out.
                    entry->signal.force(StopReason::Stop);
                    job.pause_requested = false;
                    job.stop_requested = true;
                    JobStateMachine::touch(job);
                } else if (!JobStateMachine::isTerminal(job.status)) {
                    const auto from = toString(job.status);
                    JobStateMachine::transition(job, JobStatus::Canceled);
                    entry->resume_pending = false;
                    cancel_event = makeEvent(job, std::string{from},
                                             std::string{toString(job.status)}, "removed");
                }
                copy = job;
            }

            if (cancel_event) {
                adapters_.audit->append(*cancel_event);
                removePartFile(copy);
            }
            AuditEvent removal = makeEvent(copy, std::string{toString(copy.status)}, "removed");
            removal.timestamp = Clock::now();
            adapters_.audit->append(removal);

            jobs_.erase(it);
            order_.erase(std::remove(order_.begin(), order_.end(), job_id), order_.end());
        }
        logger()->info("Job {} removed", job_id);
        persist();
        signalStateChange();
    }

    std::size_t cleanCompleted() {
        std::size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            std::vector<std::string> kept;
            kept.reserve(order_.size());
            for (const auto& id : order_) {
                const Job job = snapshotOf(*jobs_.at(id));
                if (!JobStateMachine::isTerminal(job.status)) {
                    kept.push_back(id);
                    continue;
                }
                AuditEvent removal = makeEvent(job, std::string{toString(job.status)}, "removed",
                                               "cleaned");
                removal.timestamp = Clock::now();
                adapters_.audit->append(removal);
                jobs_.erase(id);
                ++removed;
            }
            order_ = std::move(kept);
        }
        if (removed > 0) {
            logger()->info("Cleaned {} finished jobs", removed);
            persist();
            signalStateChange();
        }
        return removed;
    }

    bool waitIdle(std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (hasPendingWork()) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::unique_lock<std::mutex> lock(queue_mutex_);
            idle_cv_.wait_for(lock, std::chrono::milliseconds(20));
        }
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();

        {
            std::lock_guard<std::mutex> lock(jobs_mutex_);
            for (const auto& [id, entry] : jobs_) {
                std::lock_guard<std::mutex> entry_lock(entry->mutex);
                if (entry->active) {
                    entry->signal.request(StopReason::Shutdown);
                }
            }
        }

        if (workers_.empty()) {
            return;
        }
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        persist();
        signalStateChange();
        logger()->info("Job engine stopped");
    }

    const EngineConfig& config() const noexcept { return config_; }

private:
    JobEntryPtr find(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            throw NotFoundError(job_id);
        }
        return it->second;
    }

    JobEntryPtr findIfPresent(const std::string& job_id) const {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        const auto it = jobs_.find(job_id);
        return it == jobs_.end() ? nullptr : it->second;
    }

    void enqueue(const std::string& job_id) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            run_queue_.push_back(job_id);
        }
        queue_cv_.notify_one();
    }

    void restore() {
        const auto jobs = adapters_.store->load();
        std::size_t requeued = 0;
        for (Job job : jobs) {
            auto entry = std::make_shared<JobEntry>();
            job.pause_requested = false;
            job.stop_requested = false;

            if (job.status == JobStatus::Running) {
                // The process died mid-transfer.
                job.status = JobStatus::Paused;
                job.interrupted = true;
                JobStateMachine::touch(job);
                adapters_.audit->append(makeEvent(job, std::string{toString(JobStatus::Running)},
                                                  std::string{toString(JobStatus::Paused)},
                                                  "recovered after restart"));
            }
            if (job.status == JobStatus::Paused) {
                job.bytes_downloaded = 0;
                if (job.file_name) {
                    std::error_code ec;
                    const auto size = fs::file_size(partPath(job), ec);
                    if (!ec) {
                        job.bytes_downloaded = size;
                    }
                }
            }

            const bool requeue = job.status == JobStatus::Queued ||
                                 (job.status == JobStatus::Paused && job.interrupted);
            entry->resume_pending = job.status == JobStatus::Paused && job.interrupted;
            entry->job = std::move(job);

            std::string id = entry->job.id;
            {
                std::lock_guard<std::mutex> lock(jobs_mutex_);
                if (!jobs_.emplace(id, entry).second) {
                    continue;
                }
                order_.push_back(id);
            }
            if (requeue) {
                enqueue(id);
                ++requeued;
            }
        }
        logger()->info("Restored {} jobs from {} ({} requeued)", jobs.size(),
                       adapters_.store->path().string(), requeued);
    }

    void workerLoop() {
        while (true) {
            std::string job_id;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                queue_cv_.wait(lock, [this]() { return stopping_ || !run_queue_.empty(); });
                if (stopping_) {
                    return;
                }
                job_id = std::move(run_queue_.front());
                run_queue_.pop_front();
                ++in_flight_;
            }

            if (const auto entry = findIfPresent(job_id)) {
                runJob(entry);
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                --in_flight_;
            }
            idle_cv_.notify_all();
        }
    }

    void runJob(const JobEntryPtr& entry) {
        AuditEvent claim;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            const bool runnable = job.status == JobStatus::Queued ||
                                  (job.status == JobStatus::Paused && entry->resume_pending);
            if (entry->active || !runnable || stopping_) {
                return;
            }
            const auto from = toString(job.status);
            entry->resume_pending = false;
            entry->signal.reset();
            JobStateMachine::transition(job, JobStatus::Running);
            job.attempts = 0;
            job.interrupted = false;
            entry->active = true;
            claim = makeEvent(job, std::string{from}, std::string{toString(job.status)});
        }
        publish(claim);

        Settlement settlement;
        try {
            settlement = execute(entry);
        } catch (const std::exception& ex) {
            settlement = failedWith(ex.what());
        }
        settle(entry, settlement);

        if (settlement.status == JobStatus::Success && adapters_.notifier) {
            notifyLibrary(entry, *settlement.saved_path);
        }
    }

    Settlement execute(const JobEntryPtr& entry) {
        const auto& policy = *adapters_.retry;
        for (int attempt = 1;; ++attempt) {
            {
                std::lock_guard<std::mutex> lock(entry->mutex);
                entry->job.attempts = attempt;
                JobStateMachine::touch(entry->job);
            }
            if (entry->signal.requested()) {
                return interruption(*entry);
            }

            const Attempt outcome = runAttempt(entry);
            if (outcome.kind == Attempt::Kind::Completed) {
                Settlement settlement;
                settlement.status = JobStatus::Success;
                settlement.saved_path = outcome.saved_path;
                return settlement;
            }
            if (outcome.kind == Attempt::Kind::Interrupted) {
                return interruption(*entry);
            }

            if (outcome.failure == FailureClass::Permanent) {
                return failedWith(outcome.message);
            }
            if (!policy.shouldRetry(outcome.failure, attempt)) {
                return failedWith(RetryPolicy::exhaustedMessage(attempt, outcome.message));
            }

            const auto delay = policy.delayBefore(attempt + 1);
            logger()->warn("Job {}: attempt {}/{} failed ({}); retrying in {} ms",
                           entry->job.id, attempt, policy.maxAttempts(), outcome.message,
                           delay.count());
            if (entry->signal.waitFor(delay)) {
                return interruption(*entry);
            }
        }
    }

    Attempt runAttempt(const JobEntryPtr& entry) {
        const Job job = snapshotOf(*entry);

        ResolvedLink link;
        try {
            link = adapters_.resolver->resolve(job.source_url);
        } catch (const ResolutionError& ex) {
            return Attempt::failed(ex.transient() ? FailureClass::Transient : FailureClass::Permanent,
                                   ex.what());
        }
        if (entry->signal.requested()) {
            return Attempt::interrupted();
        }

        // The folder may have been swapped for a symlink since submit.
        fs::path directory;
        try {
            directory = validateDestination(job.target_dir, config_.allowed_roots);
        } catch (const ValidationError& ex) {
            return Attempt::failed(FailureClass::Permanent, ex.what());
        }
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return Attempt::failed(FailureClass::Permanent,
                                   fmt::format("Cannot create folder {}: {}", directory.string(),
                                               ec.message()));
        }

        std::string name;
        try {
            name = reserveFileName(*entry, directory, link);
        } catch (const TransferError& ex) {
            return Attempt::failed(FailureClass::Permanent, ex.what());
        }

        if (link.total_bytes) {
            if (auto conflict = recordTotal(*entry, *link.total_bytes)) {
                return Attempt::failed(FailureClass::Permanent, *conflict);
            }
        }

        const fs::path part = directory / partFileName(name);
        std::uint64_t offset = 0;
        if (const auto size = fs::file_size(part, ec); !ec) {
            offset = size;
        }
        const auto known_total = snapshotOf(*entry).total_bytes;
        if (known_total && offset > *known_total) {
            offset = 0;
        }
        setBytes(*entry, offset);

        if (known_total && offset == *known_total && offset > 0) {
            return finalize(*entry, directory, name);
        }

        std::unique_ptr<DestinationFile> file;
        try {
            file = std::make_unique<DestinationFile>(part, offset, config_.flush_interval_bytes);
        } catch (const TransferError& ex) {
            return Attempt::failed(FailureClass::Permanent, ex.what());
        }

        TransferRequest request;
        request.url = link.direct_url;
        request.offset = offset;
        request.timeouts = config_.timeouts;

        const auto progress = [&entry](std::uint64_t bytes, std::optional<std::uint64_t> total) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& current = entry->job;
            if (total && !current.total_bytes) {
                current.total_bytes = total;
            }
            current.bytes_downloaded = bytes;
            JobStateMachine::touch(current);
            logger()->trace("Job {}: {} bytes", current.id, bytes);
        };

        TransferResult result = adapters_.reader->read(request, *file, entry->signal, progress);
        if (!file->close() && result.outcome == TransferOutcome::Completed) {
            result.outcome = TransferOutcome::WriteError;
            result.message = file->lastError();
        }
        setBytes(*entry, file->offset());

        if (result.total_bytes) {
            if (auto conflict = recordTotal(*entry, *result.total_bytes)) {
                return Attempt::failed(FailureClass::Permanent, *conflict);
            }
        }

        switch (result.outcome) {
        case TransferOutcome::Completed: {
            const auto expected = snapshotOf(*entry).total_bytes;
            const std::uint64_t written = file->offset();
            if (expected && written != *expected) {
                return Attempt::failed(
                    FailureClass::Transient,
                    fmt::format("Transfer incomplete: {} of {} bytes", written, *expected));
            }
            return finalize(*entry, directory, name, result.suggested_file_name);
        }
        case TransferOutcome::Canceled:
            return Attempt::interrupted();
        default:
            return Attempt::failed(RetryPolicy::classify(result), result.message);
        }
    }

    // Picks the final name on the first attempt and creates its part file so
    // concurrent jobs never choose the same name.
    std::string reserveFileName(JobEntry& entry, const fs::path& directory,
                                const ResolvedLink& link) {
        std::string source_url;
        {
            std::lock_guard<std::mutex> lock(entry.mutex);
            if (entry.job.file_name) {
                return *entry.job.file_name;
            }
            source_url = entry.job.source_url;
        }

        std::lock_guard<std::mutex> names_lock(names_mutex_);
        const std::string name = disambiguateFileName(directory, pickFileName(link, source_url));
        const fs::path part = directory / partFileName(name);
        std::ofstream placeholder(part, std::ios::binary | std::ios::app);
        if (!placeholder) {
            throw TransferError(fmt::format("Cannot create {}", part.string()));
        }

        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.job.file_name = name;
        JobStateMachine::touch(entry.job);
        return name;
    }

    // Moves the part file into place. A non-generic name announced by the
    // server replaces the reserved one.
    Attempt finalize(JobEntry& entry, const fs::path& directory, const std::string& name,
                     const std::optional<std::string>& announced = std::nullopt) {
        std::string wanted = name;
        if (announced && !announced->empty() && !isGenericFileName(*announced)) {
            wanted = sanitizeFileName(*announced);
        }

        const fs::path part = directory / partFileName(name);
        std::error_code ec;
        if (looksLikeErrorPage(part, wanted)) {
            fs::remove(part, ec);
            if (ec) {
                logger()->warn("Cannot delete {}: {}", part.string(), ec.message());
            }
            return Attempt::failed(FailureClass::Permanent,
                                   "1fichier returned an HTML page instead of a file");
        }

        std::lock_guard<std::mutex> names_lock(names_mutex_);
        std::string final_name = wanted;
        if (wanted != name) {
            final_name = disambiguateFileName(directory, wanted);
        } else if (fs::exists(directory / final_name, ec)) {
            final_name = disambiguateFileName(directory, name);
        }
        const fs::path target = directory / final_name;
        fs::rename(part, target, ec);
        if (ec) {
            return Attempt::failed(FailureClass::Permanent,
                                   fmt::format("Cannot move download into place at {}: {}",
                                               target.string(), ec.message()));
        }

        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.job.file_name = final_name;
        JobStateMachine::touch(entry.job);
        return Attempt::completed(target.string());
    }

    // A total that changes between attempts means the file behind the link
    // is not the one we started with.
    static std::optional<std::string> recordTotal(JobEntry& entry, std::uint64_t total) {
        std::lock_guard<std::mutex> lock(entry.mutex);
        Job& job = entry.job;
        if (!job.total_bytes) {
            job.total_bytes = total;
            return std::nullopt;
        }
        if (*job.total_bytes != total) {
            return fmt::format("Source size changed from {} to {} bytes", *job.total_bytes, total);
        }
        return std::nullopt;
    }

    static void setBytes(JobEntry& entry, std::uint64_t bytes) {
        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.job.bytes_downloaded = bytes;
        JobStateMachine::touch(entry.job);
    }

    static Settlement interruption(const JobEntry& entry) {
        Settlement settlement;
        switch (entry.signal.reason()) {
        case StopReason::Stop:
            settlement.status = JobStatus::Canceled;
            break;
        case StopReason::Shutdown:
            settlement.status = JobStatus::Paused;
            settlement.interrupted = true;
            break;
        default:
            settlement.status = JobStatus::Paused;
            break;
        }
        return settlement;
    }

    void settle(const JobEntryPtr& entry, const Settlement& settlement) {
        AuditEvent event;
        Job copy;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            entry->active = false;
            const auto from = toString(job.status);
            try {
                JobStateMachine::transition(job, JobStatus::Running, settlement.status);
            } catch (const CommandConflictError& ex) {
                logger()->error("{}", ex.what());
                return;
            }
            job.error_message = settlement.error;
            job.saved_path = settlement.saved_path;
            job.interrupted = settlement.interrupted;
            copy = job;
            event = makeEvent(job, std::string{from}, std::string{toString(job.status)},
                              settlement.error.value_or(settlement.saved_path.value_or("")));
        }

        if (copy.status == JobStatus::Canceled) {
            removePartFile(copy);
        }
        publish(event);
    }

    void notifyLibrary(const JobEntryPtr& entry, const std::string& saved_path) {
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->job.notify_status = NotifyStatus::Requesting;
            entry->job.notify_requested_at = Clock::now();
            JobStateMachine::touch(entry->job);
        }

        NotifyResult result;
        try {
            result = adapters_.notifier->notify(saved_path);
        } catch (const std::exception& ex) {
            result.success = false;
            result.message = ex.what();
        }

        std::string job_id;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);
            Job& job = entry->job;
            job.notify_status = result.success ? NotifyStatus::Success : NotifyStatus::Failed;
            job.notify_message = result.message;
            job.notify_completed_at = Clock::now();
            JobStateMachine::touch(job);
            job_id = job.id;
        }
        if (!result.success) {
            logger()->warn("Job {}: library refresh failed: {}", job_id,
                           result.message.value_or("unknown error"));
        }
        persist();
        signalStateChange();
    }

    void removePartFile(const Job& job) {
        if (!job.file_name) {
            return;
        }
        std::error_code ec;
        const auto part = partPath(job);
        fs::remove(part, ec);
        if (ec) {
            logger()->warn("Job {}: cannot delete {}: {}", job.id, part.string(), ec.message());
        }
    }

    static fs::path partPath(const Job& job) {
        return fs::path(job.target_dir) / partFileName(*job.file_name);
    }

    // Never called with jobs_mutex_ or an entry mutex held.
    void publish(const AuditEvent& event) {
        adapters_.audit->append(event);
        if (event.to_state == toString(JobStatus::Failed)) {
            logger()->error("Job {}: {} -> {}: {}", event.job_id, event.from_state,
                            event.to_state, event.detail);
        } else {
            logger()->info("Job {}: {} -> {}", event.job_id,
                           event.from_state.empty() ? "new" : event.from_state, event.to_state);
        }
        persist();
        signalStateChange();
    }

    void persist() {
        if (!adapters_.store) {
            return;
        }
        std::lock_guard<std::mutex> lock(persist_mutex_);
        try {
            adapters_.store->save(list());
        } catch (const Error& ex) {
            logger()->error("Cannot persist jobs: {}", ex.what());
        }
    }

    void signalStateChange() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
        }
        idle_cv_.notify_all();
    }

    bool hasPendingWork() const {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!run_queue_.empty() || in_flight_ > 0) {
                return true;
            }
        }
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (const auto& [id, entry] : jobs_) {
            std::lock_guard<std::mutex> entry_lock(entry->mutex);
            const auto status = entry->job.status;
            if (status == JobStatus::Queued || status == JobStatus::Running ||
                entry->resume_pending) {
                return true;
            }
        }
        return false;
    }

    EngineConfig config_;
    EngineAdapters adapters_;

    // Lock order: jobs_mutex_ before any entry mutex. queue_mutex_,
    // names_mutex_ and persist_mutex_ are never held together with another.
    mutable std::mutex jobs_mutex_;
    std::unordered_map<std::string, JobEntryPtr> jobs_;
    std::vector<std::string> order_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<std::string> run_queue_;
    std::size_t in_flight_{0};

    std::mutex names_mutex_;
    std::mutex persist_mutex_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::vector<std::thread> workers_;
};

JobEngine::JobEngine(EngineConfig config, EngineAdapters adapters)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(adapters))) {}

JobEngine::~JobEngine() {
    if (impl_) {
        impl_->shutdown();
    }
}

std::unique_ptr<JobEngine> JobEngine::makeDefault(EngineConfig config) {
    EngineAdapters adapters;
    adapters.reader = std::make_shared<CurlStreamReader>();

    OneFichierResolver::Options resolver_options;
    resolver_options.api_key = config.resolver.onefichier_api_key;
    resolver_options.api_base = config.resolver.onefichier_api_base;
    adapters.resolver = std::make_shared<OneFichierResolver>(std::move(resolver_options));

    if (!config.notifier.plex_base_url.empty()) {
        PlexNotifier::Options notifier_options;
        notifier_options.base_url = config.notifier.plex_base_url;
        notifier_options.token = config.notifier.plex_token;
        notifier_options.section_id = config.notifier.plex_section_id;
        adapters.notifier = std::make_shared<PlexNotifier>(std::move(notifier_options));
    }
    if (!config.audit_log.empty()) {
        adapters.audit = std::make_shared<JsonLinesAuditSink>(config.audit_log);
    }
    if (!config.state_file.empty()) {
        adapters.store = std::make_shared<JobStore>(config.state_file);
    }
    return std::make_unique<JobEngine>(std::move(config), std::move(adapters));
}

void JobEngine::start() { impl_->start(); }

Job JobEngine::submit(const std::string& url, const std::optional<std::string>& destination) {
    return impl_->submit(url, destination);
}

std::vector<Job> JobEngine::list() const { return impl_->list(); }

Job JobEngine::get(const std::string& job_id) const { return impl_->get(job_id); }

Job JobEngine::pause(const std::string& job_id) { return impl_->pause(job_id); }

Job JobEngine::resume(const std::string& job_id) { return impl_->resume(job_id); }

Job JobEngine::stop(const std::string& job_id) { return impl_->stop(job_id); }

void JobEngine::remove(const std::string& job_id) { impl_->remove(job_id); }

std::size_t JobEngine::cleanCompleted() { return impl_->cleanCompleted(); }

bool JobEngine::waitIdle(std::chrono::milliseconds timeout) { return impl_->waitIdle(timeout); }

void JobEngine::shutdown() { impl_->shutdown(); }

const EngineConfig& JobEngine::config() const noexcept { return impl_->config(); }

} // namespace linkfetch
