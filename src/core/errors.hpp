#pragma once

#include <string>
#include <stdexcept>

// Failure classification shared by pipeline steps, the remote client and
// the worker boundary.
enum class ErrorKind {
    None,
    InvalidTask,           // malformed descriptor
    ResourceUnavailable,   // local file missing or unreadable
    ConnectionError,       // transient network/server failure
    AuthorizationError,
    VerificationMismatch,  // integrity check failed after a full transfer
    RemoteStateVanished,   // dataset/resource deleted remotely
    Unexpected,            // anything else escaping a step
};

const char* error_kind_name(ErrorKind kind);
ErrorKind parse_error_kind(const std::string& name);

// Transient kinds are retried automatically by the worker, up to the
// per-job attempt ceiling. Everything else waits for the user.
bool is_retriable(ErrorKind kind);

struct JobError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool empty() const { return kind == ErrorKind::None; }
    std::string describe() const;
};

// Thrown by pipeline steps and the remote client.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    JobError as_job_error() const { return {kind_, what()}; }

private:
    ErrorKind kind_;
};

// Thrown at a chunk or step boundary when the job was aborted or the
// worker pool is shutting down. Not an error: the job keeps its step.
class TransferInterrupted : public std::runtime_error {
public:
    explicit TransferInterrupted(bool aborted)
        : std::runtime_error(aborted ? "aborted by user" : "worker shutting down"),
          aborted_(aborted) {}

    bool aborted() const noexcept { return aborted_; }

private:
    bool aborted_;
};
