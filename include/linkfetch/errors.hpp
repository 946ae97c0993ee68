#pragma once

#include <stdexcept>
#include <string>

namespace linkfetch {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected submit input. No job record exists when this is thrown.
class ValidationError : public Error {
public:
    using Error::Error;
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& job_id)
        : Error("Job not found: " + job_id), job_id_(job_id) {}

    [[nodiscard]] const std::string& jobId() const noexcept { return job_id_; }

private:
    std::string job_id_;
};

// A command asked for a transition the job's current state does not allow.
class CommandConflictError : public Error {
public:
    using Error::Error;
};

class ResolutionError : public Error {
public:
    explicit ResolutionError(const std::string& message, bool transient = false)
        : Error(message), transient_(transient) {}

    [[nodiscard]] bool transient() const noexcept { return transient_; }

private:
    bool transient_;
};

class TransferError : public Error {
public:
    explicit TransferError(const std::string& message, bool transient = false)
        : Error(message), transient_(transient) {}

    [[nodiscard]] bool transient() const noexcept { return transient_; }

private:
    bool transient_;
};

// Recorded on the job's notify sub-state, never promoted to a job failure.
class NotifyError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace linkfetch
