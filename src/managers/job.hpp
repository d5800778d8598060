#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <atomic>
#include <chrono>
#include <functional>
#include <core/types.hpp>
#include <core/errors.hpp>
#include "task.hpp"
#include "job_record.hpp"

using Clock = std::chrono::steady_clock;

// Read-only view handed to front ends.
struct JobStatus {
    std::string job_id;
    Direction direction = Direction::Upload;
    JobState state = JobState::Init;
    int priority = 0;
    int64_t bytes_done = 0;
    int64_t bytes_total = 0;
    double rate = 0.0;           // bytes/s
    int attempt_count = 0;
    JobError last_error;
    bool claimed = false;
    std::string dataset_id;
};

// Transfer rate over the time a job actually moves bytes. Time outside
// start()/stop() (waiting on the server to finalize, backoff) is not
// counted.
class RateMeter {
public:
    void start(Clock::time_point now);
    void stop(Clock::time_point now);
    void add(int64_t bytes, Clock::time_point now);

    // Smoothed rate while running, the run average otherwise.
    double rate(Clock::time_point now) const;

    bool running() const { return running_; }

private:
    bool running_ = false;
    Clock::time_point started_;
    Clock::time_point bucket_start_;
    double active_secs_ = 0.0;
    int64_t bytes_ = 0;
    int64_t bucket_bytes_ = 0;
    double ewma_ = 0.0;
    bool have_ewma_ = false;
};

// Delay before re-claiming after the given (1-based) attempt:
// base * 2^(attempt-1), capped, then scaled by 1 ± jitter. `unit` is a
// uniform sample from [0, 1).
int64_t backoff_delay_ms(int attempt, const TransferConfig& cfg, double unit);

class Job {
public:
    Job(TaskDescriptor task, JobRecord record);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    const TaskDescriptor& task() const { return task_; }
    const std::string& id() const { return task_.job_id; }
    Direction direction() const { return task_.direction; }

    JobState state() const;
    JobRecord record() const;
    void update(const std::function<void(JobRecord&)>& fn);

    // ── State machine ─────────────────────────────────────────

    // Move to the next pipeline step; clears last_error.
    void advance();

    // Any legal edge; throws std::logic_error otherwise.
    void transition(JobState to);

    // Non-terminal -> Error, remembering the failed step.
    void fail(const JobError& err);

    // Non-terminal -> Aborted. Returns false if already terminal.
    bool mark_aborted();

    // Transient failure: count the attempt and stay at the start of the
    // current step until the backoff elapses. Fails the job instead once
    // the attempt ceiling is reached; returns false in that case.
    bool schedule_retry(const JobError& err, const TransferConfig& cfg);

    // Verification mismatch: count the attempt and go back to Transferring.
    bool restart_transfer(const JobError& err, const TransferConfig& cfg);

    // Wait state (disk space, server hash pending): re-check later
    // without counting an attempt.
    void defer(std::chrono::milliseconds delay);

    // Explicit user re-attempt from Error/Aborted: resets attempt_count
    // and returns to the failed step.
    Result<void> retry_by_user();

    // ── Execution claim ───────────────────────────────────────

    bool try_claim();
    void release();
    bool claimed() const { return claimed_.load(); }

    void request_abort() { abort_requested_.store(true); }
    bool abort_requested() const { return abort_requested_.load(); }

    void mark_removed() { removed_.store(true); }
    bool removed() const { return removed_.load(); }

    // Not terminal and past its backoff. Dependencies are the queue's concern.
    bool ready_at(Clock::time_point now) const;

    // ── Progress ──────────────────────────────────────────────

    void set_resource_transferred(size_t index, int64_t bytes, int64_t delta);
    void set_download_offset(int64_t offset, int64_t delta);
    void rate_start();
    void rate_stop();

    JobStatus status() const;

    // Every state the job has been in since construction, in order.
    std::vector<JobState> history() const;

    // Serializes registry writes of this job.
    std::mutex& persist_mutex() { return persist_mutex_; }

private:
    const TaskDescriptor task_;
    mutable std::mutex mutex_;
    JobRecord record_;
    std::vector<JobState> history_;
    Clock::time_point not_before_;
    RateMeter rate_;

    std::atomic<bool> claimed_{false};
    std::atomic<bool> abort_requested_{false};
    std::atomic<bool> removed_{false};
    std::mutex persist_mutex_;

    void transition_locked(JobState to);
};
