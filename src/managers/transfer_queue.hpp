#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <shared_mutex>
#include <functional>
#include <core/types.hpp>
#include "job.hpp"
#include "job_registry.hpp"
#include "pipeline.hpp"

enum class EnqueueOutcome {
    Accepted,
    Duplicate,          // a job with this id already exists; nothing changed
    ResourceNotFound,   // a local resource file is missing
    Invalid,            // descriptor failed structural checks
};

const char* enqueue_outcome_name(EnqueueOutcome o);

struct EnqueueResult {
    EnqueueOutcome outcome = EnqueueOutcome::Invalid;
    std::string job_id;
    std::string message;

    bool accepted() const { return outcome == EnqueueOutcome::Accepted; }
};

struct QueueSummary {
    std::map<JobState, int> counts;
    int total = 0;
    int claimed = 0;
    int64_t bytes_done = 0;
    int64_t bytes_total = 0;
    double rate = 0.0;   // sum over jobs, bytes/s
};

// Jobs of one direction. Thread-safe: workers claim from it while front
// ends submit, abort and list.
class TransferQueue {
public:
    TransferQueue(Pipeline& pipeline, StepContext context, const JobRegistry* registry);

    Direction direction() const { return pipeline_.direction(); }
    Pipeline& pipeline() { return pipeline_; }
    StepContext& context() { return context_; }

    // Validate, register and persist a new job. Never replaces an
    // existing job with the same id.
    EnqueueResult enqueue(TaskDescriptor task);

    // Adopt a job loaded from the registry at startup.
    std::shared_ptr<Job> restore(RegistryEntry entry);

    std::shared_ptr<Job> find(const std::string& job_id) const;

    // Stop a job at its next chunk boundary. An idle job is aborted here.
    Result<void> abort(const std::string& job_id);

    // Re-attempt an errored or aborted job from its failed step.
    Result<void> retry(const std::string& job_id);

    // Abort if running, then drop the job, its registry entry and local artifacts.
    Result<void> remove(const std::string& job_id);

    // Highest-priority ready job whose dependencies are done, claimed for
    // the caller; nullptr if none. Must be paired with release().
    std::shared_ptr<Job> claim_next();
    void release(const std::shared_ptr<Job>& job);

    // Write the job to the registry unless it was removed.
    void persist(Job& job);

    // Display order: dependencies first, then priority, then submission.
    std::vector<JobStatus> snapshot() const;
    QueueSummary summary() const;
    std::vector<std::string> job_ids() const;

    // Some job can still make progress without user action.
    bool has_pending_work() const;

    // Called after anything that may make a job claimable.
    void set_notify(std::function<void()> fn) { notify_ = std::move(fn); }

private:
    using JobPtr = std::shared_ptr<Job>;

    Pipeline& pipeline_;
    StepContext context_;
    const JobRegistry* registry_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, JobPtr> jobs_;
    int64_t next_sequence_ = 1;
    std::function<void()> notify_;

    std::vector<JobPtr> ordered_locked() const;
    bool dependencies_done_locked(const Job& job) const;
    bool dependencies_blocked_locked(const Job& job) const;
    void notify();
};
