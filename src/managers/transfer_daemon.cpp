#include "transfer_daemon.hpp"
#include "job_log.hpp"
#include <fmt/format.h>

TransferDaemon::TransferDaemon(TransferQueue& queue, int workers)
    : queue_(queue), workers_(workers > 0 ? workers : 1) {}

TransferDaemon::~TransferDaemon() {
    stop();
}

void TransferDaemon::start() {
    if (running_.exchange(true)) return;
    stopping_.store(false);
    queue_.context().stopping = &stopping_;
    queue_.set_notify([this] { wake(); });

    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&TransferDaemon::worker_loop, this, i);
    }
    xfer_log(fmt::format("{} workers started: {}", direction_name(queue_.direction()), workers_));
}

void TransferDaemon::stop() {
    if (!running_.load()) return;
    stopping_.store(true);
    wake();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    queue_.set_notify(nullptr);
    running_.store(false);
    xfer_log(fmt::format("{} workers stopped", direction_name(queue_.direction())));
}

void TransferDaemon::wake() {
    { std::lock_guard<std::mutex> lock(wake_mutex_); }
    wake_cv_.notify_all();
}

void TransferDaemon::worker_loop(int index) {
    int poll_ms = queue_.context().transfer().poll_interval_ms;
    while (!stopping_.load()) {
        auto job = queue_.claim_next();
        if (!job) {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(poll_ms),
                              [this] { return stopping_.load(); });
            continue;
        }
        xfer_log(fmt::format("{} worker {} picked up {}",
                             direction_name(queue_.direction()), index, job->id()));
        drive(*job);
        queue_.release(job);
    }
}

void TransferDaemon::handle_error(Job& job, const JobError& err) {
    const TransferConfig& tc = queue_.context().transfer();
    if (err.kind == ErrorKind::VerificationMismatch && job.state() == JobState::Verifying) {
        job.restart_transfer(err, tc);
    } else if (is_retriable(err.kind)) {
        job.schedule_retry(err, tc);
    } else {
        job.fail(err);
    }
}

void TransferDaemon::drive(Job& job) {
    Pipeline& pipeline = queue_.pipeline();
    StepContext& ctx = queue_.context();

    while (!is_terminal(job.state())) {
        try {
            ctx.checkpoint(job);
            StepOutcome out = pipeline.run_step(job, ctx);
            if (out.wait) {
                job.defer(out.delay);
                queue_.persist(job);
                return;
            }
            job.advance();
            queue_.persist(job);
            if (job.state() == JobState::Done) {
                pipeline.on_done(job, ctx);
            }
        } catch (const TransferInterrupted& e) {
            if (e.aborted() && job.mark_aborted()) {
                try {
                    pipeline.on_abort(job, ctx);
                } catch (const std::exception& cleanup) {
                    xfer_log(fmt::format("[{}] cleanup after abort failed: {}",
                                         job.id(), cleanup.what()));
                }
            }
            queue_.persist(job);
            return;
        } catch (const TransferError& e) {
            handle_error(job, e.as_job_error());
            queue_.persist(job);
            return;
        } catch (const std::exception& e) {
            job.fail({ErrorKind::Unexpected, e.what()});
            queue_.persist(job);
            return;
        } catch (...) {
            job.fail({ErrorKind::Unexpected, "unknown exception"});
            queue_.persist(job);
            return;
        }
    }
}
