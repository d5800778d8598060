#include "transfer_queue.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <mutex>
#include <set>
#include <tuple>

namespace {

// Releases a claim taken with try_claim() on scope exit.
class ClaimGuard {
public:
    explicit ClaimGuard(Job& job) : job_(job) {}
    ~ClaimGuard() { job_.release(); }

    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;

private:
    Job& job_;
};

} // namespace

const char* enqueue_outcome_name(EnqueueOutcome o) {
    switch (o) {
        case EnqueueOutcome::Accepted:         return "accepted";
        case EnqueueOutcome::Duplicate:        return "duplicate";
        case EnqueueOutcome::ResourceNotFound: return "resource-not-found";
        case EnqueueOutcome::Invalid:          return "invalid";
    }
    return "invalid";
}

TransferQueue::TransferQueue(Pipeline& pipeline, StepContext context, const JobRegistry* registry)
    : pipeline_(pipeline), context_(std::move(context)), registry_(registry) {
    context_.persist = [this](Job& job) { persist(job); };
}

void TransferQueue::notify() {
    if (notify_) notify_();
}

// ── Submission ─────────────────────────────────────────────

EnqueueResult TransferQueue::enqueue(TaskDescriptor task) {
    EnqueueResult result;
    if (task.job_id.empty()) task.job_id = derive_job_id(task);
    result.job_id = task.job_id;

    if (task.direction != direction()) {
        result.message = fmt::format("{} job submitted to the {} queue",
                                     direction_name(task.direction), direction_name(direction()));
        return result;
    }
    auto checked = check_task(task);
    if (checked.is_err()) {
        result.message = checked.error;
        return result;
    }
    for (const auto& r : task.resources) {
        if (!is_readable_file(r.path)) {
            result.outcome = EnqueueOutcome::ResourceNotFound;
            result.message = fmt::format("resource '{}' not found: {}", r.name, r.path);
            return result;
        }
    }

    std::shared_ptr<Job> job;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (jobs_.count(task.job_id)) {
            result.outcome = EnqueueOutcome::Duplicate;
            result.message = fmt::format("{} is already queued", task.job_id);
            return result;
        }
        JobRecord rec;
        rec.sequence = next_sequence_++;
        rec.submitted_at = now_iso();
        rec.updated_at = rec.submitted_at;
        rec.dataset_id = task.dataset_id;
        job = std::make_shared<Job>(std::move(task), std::move(rec));
        jobs_[job->id()] = job;
    }

    persist(*job);
    job_event(job->id(), fmt::format("queued (priority {})", job->task().priority));
    result.outcome = EnqueueOutcome::Accepted;
    notify();
    return result;
}

std::shared_ptr<Job> TransferQueue::restore(RegistryEntry entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(entry.task.job_id);
    if (it != jobs_.end()) return it->second;

    if (entry.record.sequence <= 0) entry.record.sequence = next_sequence_;
    next_sequence_ = std::max(next_sequence_, entry.record.sequence + 1);
    auto job = std::make_shared<Job>(std::move(entry.task), std::move(entry.record));
    jobs_[job->id()] = job;
    return job;
}

std::shared_ptr<Job> TransferQueue::find(const std::string& job_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    return it == jobs_.end() ? nullptr : it->second;
}

// ── User actions ───────────────────────────────────────────

Result<void> TransferQueue::abort(const std::string& job_id) {
    auto job = find(job_id);
    if (!job) return Result<void>::Err(fmt::format("no job {}", job_id));
    if (is_terminal(job->state())) {
        return Result<void>::Err(fmt::format("{} is already {}", job_id, state_name(job->state())));
    }

    job->request_abort();
    if (job->try_claim()) {
        // Idle: abort right here instead of waiting for a worker
        ClaimGuard claim(*job);
        if (job->mark_aborted()) {
            try {
                pipeline_.on_abort(*job, context_);
            } catch (const std::exception& e) {
                xfer_log(fmt::format("[{}] cleanup after abort failed: {}", job_id, e.what()));
            }
        }
        persist(*job);
    }
    return Result<void>::Ok();
}

Result<void> TransferQueue::retry(const std::string& job_id) {
    auto job = find(job_id);
    if (!job) return Result<void>::Err(fmt::format("no job {}", job_id));
    if (!job->try_claim()) {
        return Result<void>::Err(fmt::format("{} is busy, try again", job_id));
    }

    Result<void> r = Result<void>::Ok();
    {
        ClaimGuard claim(*job);
        r = job->retry_by_user();
        if (r.is_ok()) persist(*job);
    }
    if (r.is_ok()) notify();
    return r;
}

Result<void> TransferQueue::remove(const std::string& job_id) {
    auto job = find(job_id);
    if (!job) return Result<void>::Err(fmt::format("no job {}", job_id));

    job->mark_removed();
    job->request_abort();
    // A worker holding the job lets go at its next chunk boundary
    while (!job->try_claim()) {
        platform::sleep_ms(10);
    }
    ClaimGuard claim(*job);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        jobs_.erase(job_id);
    }
    {
        std::lock_guard<std::mutex> lock(job->persist_mutex());
        if (registry_) registry_->remove(direction(), job_id);
    }
    try {
        pipeline_.on_remove(*job, context_);
    } catch (const std::exception& e) {
        xfer_log(fmt::format("[{}] cleanup after removal failed: {}", job_id, e.what()));
    }
    job_event(job_id, "removed");
    notify();
    return Result<void>::Ok();
}

// ── Scheduling ─────────────────────────────────────────────

bool TransferQueue::dependencies_done_locked(const Job& job) const {
    for (const auto& dep : job.task().depends_on) {
        auto it = jobs_.find(dep);
        if (it == jobs_.end() || it->second->state() != JobState::Done) return false;
    }
    return true;
}

bool TransferQueue::dependencies_blocked_locked(const Job& job) const {
    // Missing, failed or cyclic dependencies never resolve on their own
    std::set<std::string> seen;
    std::vector<const Job*> stack{&job};
    while (!stack.empty()) {
        const Job* cur = stack.back();
        stack.pop_back();
        for (const auto& dep : cur->task().depends_on) {
            if (dep == job.id()) return true;
            auto it = jobs_.find(dep);
            if (it == jobs_.end()) return true;
            JobState s = it->second->state();
            if (s == JobState::Error || s == JobState::Aborted) return true;
            if (s != JobState::Done && seen.insert(dep).second) {
                stack.push_back(it->second.get());
            }
        }
    }
    return false;
}

std::vector<TransferQueue::JobPtr> TransferQueue::ordered_locked() const {
    struct Item {
        int priority;
        int64_t sequence;
        JobPtr job;
    };
    std::vector<Item> items;
    items.reserve(jobs_.size());
    for (const auto& kv : jobs_) {
        items.push_back({kv.second->task().priority, kv.second->record().sequence, kv.second});
    }
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return std::make_tuple(-a.priority, a.sequence) < std::make_tuple(-b.priority, b.sequence);
    });

    std::vector<JobPtr> out;
    std::set<std::string> placed;
    std::vector<bool> used(items.size(), false);
    while (out.size() < items.size()) {
        size_t pick = items.size();
        for (size_t i = 0; i < items.size(); ++i) {
            if (used[i]) continue;
            bool ready = true;
            for (const auto& dep : items[i].job->task().depends_on) {
                if (jobs_.count(dep) && !placed.count(dep)) {
                    ready = false;
                    break;
                }
            }
            if (ready) {
                pick = i;
                break;
            }
        }
        if (pick == items.size()) {
            // Cycle: take the best remaining job as is
            for (size_t i = 0; i < items.size(); ++i) {
                if (!used[i]) {
                    pick = i;
                    break;
                }
            }
        }
        used[pick] = true;
        placed.insert(items[pick].job->id());
        out.push_back(items[pick].job);
    }
    return out;
}

std::shared_ptr<Job> TransferQueue::claim_next() {
    auto now = Clock::now();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& job : ordered_locked()) {
        if (job->claimed() || job->removed()) continue;
        if (!job->ready_at(now)) continue;
        if (!dependencies_done_locked(*job)) continue;
        if (job->try_claim()) return job;
    }
    return nullptr;
}

void TransferQueue::release(const std::shared_ptr<Job>& job) {
    if (!job) return;
    job->release();
    notify();
}

void TransferQueue::persist(Job& job) {
    if (!registry_) return;
    std::lock_guard<std::mutex> lock(job.persist_mutex());
    if (job.removed()) return;
    auto r = registry_->save(job.task(), job.record());
    if (r.is_err()) xfer_log(r.error);
}

// ── Views ──────────────────────────────────────────────────

std::vector<JobStatus> TransferQueue::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<JobStatus> out;
    for (const auto& job : ordered_locked()) out.push_back(job->status());
    return out;
}

QueueSummary TransferQueue::summary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    QueueSummary s;
    for (const auto& kv : jobs_) {
        JobStatus st = kv.second->status();
        s.counts[st.state]++;
        s.total++;
        if (st.claimed) s.claimed++;
        s.bytes_done += st.bytes_done;
        s.bytes_total += st.bytes_total;
        s.rate += st.rate;
    }
    return s;
}

std::vector<std::string> TransferQueue::job_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& kv : jobs_) ids.push_back(kv.first);
    return ids;
}

bool TransferQueue::has_pending_work() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& kv : jobs_) {
        if (is_terminal(kv.second->state())) continue;
        if (dependencies_blocked_locked(*kv.second)) continue;
        return true;
    }
    return false;
}
