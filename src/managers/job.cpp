#include "job.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

// ── RateMeter ──────────────────────────────────────────────

static constexpr double RATE_BUCKET_SECS = 1.0;
static constexpr double RATE_ALPHA = 0.3;

void RateMeter::start(Clock::time_point now) {
    if (running_) return;
    running_ = true;
    started_ = now;
    bucket_start_ = now;
    bucket_bytes_ = 0;
}

void RateMeter::stop(Clock::time_point now) {
    if (!running_) return;
    active_secs_ += std::chrono::duration<double>(now - started_).count();
    running_ = false;
}

void RateMeter::add(int64_t bytes, Clock::time_point now) {
    bytes_ += bytes;
    if (!running_) return;
    bucket_bytes_ += bytes;

    double elapsed = std::chrono::duration<double>(now - bucket_start_).count();
    if (elapsed >= RATE_BUCKET_SECS) {
        double sample = bucket_bytes_ / elapsed;
        ewma_ = have_ewma_ ? RATE_ALPHA * sample + (1.0 - RATE_ALPHA) * ewma_ : sample;
        have_ewma_ = true;
        bucket_start_ = now;
        bucket_bytes_ = 0;
    }
}

double RateMeter::rate(Clock::time_point now) const {
    if (running_ && have_ewma_) return ewma_;

    double secs = active_secs_;
    if (running_) secs += std::chrono::duration<double>(now - started_).count();
    if (secs <= 0.0) return 0.0;
    return bytes_ / secs;
}

// ── Backoff ────────────────────────────────────────────────

int64_t backoff_delay_ms(int attempt, const TransferConfig& cfg, double unit) {
    if (attempt < 1) attempt = 1;
    double delay = static_cast<double>(cfg.backoff_base_ms);
    // 2^20 is far beyond any sane cap; avoids overflow for large attempt counts
    delay *= std::pow(2.0, std::min(attempt - 1, 20));
    delay = std::min(delay, static_cast<double>(cfg.backoff_cap_ms));
    delay *= 1.0 + cfg.backoff_jitter * (2.0 * unit - 1.0);
    return static_cast<int64_t>(std::max(0.0, delay));
}

static double jitter_sample() {
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

// ── Job ────────────────────────────────────────────────────

Job::Job(TaskDescriptor task, JobRecord record)
    : task_(std::move(task)), record_(std::move(record)),
      not_before_(Clock::now()) {
    history_.push_back(record_.state);
}

JobState Job::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_.state;
}

JobRecord Job::record() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_;
}

void Job::update(const std::function<void(JobRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(record_);
    record_.updated_at = now_iso();
}

void Job::transition_locked(JobState to) {
    JobState from = record_.state;
    if (!is_legal_transition(task_.direction, from, to)) {
        throw std::logic_error(fmt::format("{}: illegal transition {} -> {}",
                                           task_.job_id, state_name(from), state_name(to)));
    }
    record_.state = to;
    record_.updated_at = now_iso();
    history_.push_back(to);
}

void Job::advance() {
    JobState from, to;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = record_.state;
        to = next_state(task_.direction, from);
        transition_locked(to);
        record_.last_error = JobError{};
    }
    job_event(task_.job_id, fmt::format("{} -> {}", state_name(from), state_name(to)));
}

void Job::transition(JobState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(to);
}

void Job::fail(const JobError& err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.state == JobState::Error) {
            record_.last_error = err;
            return;
        }
        if (is_terminal(record_.state)) return;
        record_.failed_state = record_.state;
        record_.last_error = err;
        transition_locked(JobState::Error);
    }
    job_event(task_.job_id, "error: " + err.describe());
}

bool Job::mark_aborted() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(record_.state)) return false;
        record_.failed_state = record_.state;
        transition_locked(JobState::Aborted);
        rate_.stop(Clock::now());
    }
    job_event(task_.job_id, "aborted");
    return true;
}

bool Job::schedule_retry(const JobError& err, const TransferConfig& cfg) {
    int attempt;
    int64_t delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_.attempt_count++;
        attempt = record_.attempt_count;
        if (attempt >= cfg.max_attempts) {
            record_.failed_state = record_.state;
            record_.last_error = err;
            record_.last_error.message = fmt::format("{} (gave up after {} attempts)",
                                                     err.message, attempt);
            transition_locked(JobState::Error);
            delay = -1;
        } else {
            record_.last_error = err;
            delay = backoff_delay_ms(attempt, cfg, jitter_sample());
            not_before_ = Clock::now() + std::chrono::milliseconds(delay);
        }
    }

    if (delay < 0) {
        job_event(task_.job_id, fmt::format("error: {} (attempt ceiling {} reached)",
                                            err.describe(), cfg.max_attempts));
        return false;
    }
    job_event(task_.job_id, fmt::format("attempt {} failed ({}), retrying in {} ms",
                                        attempt, err.describe(), delay));
    return true;
}

bool Job::restart_transfer(const JobError& err, const TransferConfig& cfg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record_.attempt_count++;
        record_.last_error = err;
        if (record_.attempt_count >= cfg.max_attempts) {
            record_.failed_state = record_.state;
            transition_locked(JobState::Error);
        } else {
            transition_locked(JobState::Transferring);
            not_before_ = Clock::now();
        }
    }
    bool restarted = state() == JobState::Transferring;
    job_event(task_.job_id, restarted
        ? "verification mismatch, transferring again: " + err.message
        : "error: " + err.describe());
    return restarted;
}

void Job::defer(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    not_before_ = Clock::now() + delay;
}

Result<void> Job::retry_by_user() {
    JobState target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record_.state != JobState::Error && record_.state != JobState::Aborted) {
            return Result<void>::Err(fmt::format("{} is {}, nothing to retry",
                                                 task_.job_id, state_name(record_.state)));
        }

        target = record_.failed_state;
        if (record_.last_error.kind == ErrorKind::RemoteStateVanished) {
            // The remote side is gone: start over from parsing. A draft we
            // created ourselves is recreated there.
            target = JobState::Parsing;
            if (task_.direction == Direction::Upload && task_.dataset_id.empty()) {
                record_.dataset_id.clear();
                for (auto& r : record_.resources) {
                    r.uploaded = false;
                    r.verified = false;
                    r.supplements_sent = false;
                    r.transferred = 0;
                    r.resource_id.clear();
                }
            }
        }
        if (target == JobState::Init || !in_pipeline(task_.direction, target)
            || is_terminal(target)) {
            target = JobState::Parsing;
        }

        transition_locked(target);
        record_.attempt_count = 0;
        record_.last_error = JobError{};
        not_before_ = Clock::now();
        abort_requested_.store(false);
    }
    job_event(task_.job_id, fmt::format("user retry, resuming at {}", state_name(target)));
    return Result<void>::Ok();
}

bool Job::try_claim() {
    bool expected = false;
    return claimed_.compare_exchange_strong(expected, true);
}

void Job::release() {
    claimed_.store(false);
}

bool Job::ready_at(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !is_terminal(record_.state) && now >= not_before_;
}

void Job::set_resource_transferred(size_t index, int64_t bytes, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index < record_.resources.size()) {
        record_.resources[index].transferred = bytes;
    }
    if (delta > 0) rate_.add(delta, Clock::now());
}

void Job::set_download_offset(int64_t offset, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.download.confirmed_offset = offset;
    if (delta > 0) rate_.add(delta, Clock::now());
}

void Job::rate_start() {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_.start(Clock::now());
}

void Job::rate_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    rate_.stop(Clock::now());
}

JobStatus Job::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    JobStatus s;
    s.job_id = task_.job_id;
    s.direction = task_.direction;
    s.state = record_.state;
    s.priority = task_.priority;
    s.attempt_count = record_.attempt_count;
    s.last_error = record_.last_error;
    s.claimed = claimed_.load();
    s.dataset_id = record_.dataset_id;
    s.rate = rate_.rate(Clock::now());

    if (task_.direction == Direction::Upload) {
        for (const auto& r : record_.resources) {
            s.bytes_total += r.size;
            s.bytes_done += r.uploaded ? r.size : r.transferred;
        }
    } else {
        s.bytes_total = std::max<int64_t>(record_.download.expected_size, 0);
        s.bytes_done = record_.download.confirmed_offset;
    }
    return s;
}

std::vector<JobState> Job::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}
