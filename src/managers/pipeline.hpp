#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <core/config.hpp>
#include <remote/remote_client.hpp>
#include "job.hpp"
#include "task.hpp"
#include "compression_cache.hpp"

// Everything a step may touch besides the job itself.
class StepContext {
public:
    StepContext(RemoteClient& remote, CompressionCache& cache, const Config& config,
                TaskDatasetMap* task_map = nullptr)
        : remote(remote), cache(cache), config(config), task_map(task_map) {}

    RemoteClient& remote;
    CompressionCache& cache;
    const Config& config;
    TaskDatasetMap* task_map;

    // Set by the worker pool; checkpoint() stops steps while it is true.
    const std::atomic<bool>* stopping = nullptr;

    // Writes the job to the registry. Unset in tests that do not persist.
    std::function<void(Job&)> persist;

    // Throws TransferInterrupted if the job was aborted or the pool is
    // stopping. Steps call it at every chunk boundary.
    void checkpoint(const Job& job) const {
        if (job.abort_requested()) throw TransferInterrupted(true);
        if (stopping && stopping->load()) throw TransferInterrupted(false);
    }

    void save(Job& job) const {
        if (persist) persist(job);
    }

    const TransferConfig& transfer() const { return config.transfer(); }
};

// Counts wall time toward the job's transfer rate while in scope.
class RateScope {
public:
    explicit RateScope(Job& job) : job_(job) { job_.rate_start(); }
    ~RateScope() { job_.rate_stop(); }

    RateScope(const RateScope&) = delete;
    RateScope& operator=(const RateScope&) = delete;

private:
    Job& job_;
};

struct StepOutcome {
    bool wait = false;
    std::chrono::milliseconds delay{0};

    static StepOutcome advanced() { return {}; }
    static StepOutcome wait_for(int ms) { return {true, std::chrono::milliseconds(ms)}; }
};

// One direction's step implementations. A step either completes (the
// driver then advances the job), asks to be re-run later, or throws
// TransferError / TransferInterrupted.
class Pipeline {
public:
    virtual ~Pipeline() = default;

    virtual Direction direction() const = 0;

    // Run the job's current step once.
    virtual StepOutcome run_step(Job& job, StepContext& ctx) = 0;

    // Job reached Aborted: drop partial artifacts past the last
    // confirmed watermark.
    virtual void on_abort(Job& job, StepContext& ctx) = 0;

    // Job reached Done.
    virtual void on_done(Job& job, StepContext& ctx) = 0;

    // Job deleted by the user: drop everything it left behind locally.
    virtual void on_remove(Job& job, StepContext& ctx) = 0;

    // Startup check of a restored, unfinished job against the server.
    // Fails the job with RemoteStateVanished when its remote side is gone.
    virtual void reconcile(Job& job, StepContext& ctx) = 0;
};
