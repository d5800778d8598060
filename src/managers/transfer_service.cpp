#include "transfer_service.hpp"
#include "job_log.hpp"
#include <remote/ckan_client.hpp>
#include <fmt/format.h>
#include <set>

TransferService::TransferService(Config config, std::unique_ptr<RemoteClient> remote)
    : config_(std::move(config)), remote_(std::move(remote)) {
    const StorageConfig& storage = config_.storage();
    if (!storage.log_dir.empty()) set_xfer_log_dir(storage.log_dir);

    if (!remote_) {
        remote_ = std::make_unique<CkanClient>(config_.server(), config_.transfer());
    }
    cache_ = std::make_unique<CompressionCache>(config_.cache().dir, config_.cache().max_bytes);
    registry_ = std::make_unique<JobRegistry>(storage.registry_dir);
    task_map_ = std::make_unique<TaskDatasetMap>(storage.task_map_path);

    StepContext ctx(*remote_, *cache_, config_, task_map_.get());
    uploads_ = std::make_unique<TransferQueue>(upload_pipeline_, ctx, registry_.get());
    downloads_ = std::make_unique<TransferQueue>(download_pipeline_, ctx, registry_.get());
    upload_daemon_ = std::make_unique<TransferDaemon>(*uploads_, config_.transfer().upload_workers);
    download_daemon_ = std::make_unique<TransferDaemon>(*downloads_, config_.transfer().download_workers);
}

TransferService::~TransferService() {
    stop();
}

// ── Lifecycle ─────────────────────────────────────────────────

int TransferService::restore_queue(TransferQueue& queue, std::vector<std::string>& warnings) {
    auto entries = registry_->load_all(queue.direction(), &warnings);
    int restored = 0;
    for (auto& entry : entries) {
        auto job = queue.restore(std::move(entry));
        try {
            queue.pipeline().reconcile(*job, queue.context());
        } catch (const TransferError& e) {
            if (e.kind() == ErrorKind::ConnectionError) {
                // Server unreachable: the job finds out when it runs
                xfer_log(fmt::format("[{}] not reconciled: {}", job->id(), e.what()));
            } else {
                job->fail(e.as_job_error());
            }
        }
        queue.persist(*job);
        restored++;
    }
    return restored;
}

Result<void> TransferService::restore(StatusCallback cb) {
    std::vector<std::string> warnings;
    int uploads = 0, downloads = 0, purged = 0;
    try {
        uploads = restore_queue(*uploads_, warnings);
        downloads = restore_queue(*downloads_, warnings);

        auto ids = uploads_->job_ids();
        purged = cache_->purge_orphans(std::set<std::string>(ids.begin(), ids.end()));
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("restore failed: {}", e.what()));
    }

    for (const auto& w : warnings) {
        xfer_log("warning: " + w);
        if (cb) cb(w);
    }
    std::string msg = fmt::format("restored {} upload and {} download jobs", uploads, downloads);
    if (purged > 0) msg += fmt::format(", removed {} orphaned cache entries", purged);
    xfer_log(msg);
    if (cb) cb(msg);
    return Result<void>::Ok();
}

void TransferService::start() {
    upload_daemon_->start();
    download_daemon_->start();
}

void TransferService::stop() {
    if (upload_daemon_) upload_daemon_->stop();
    if (download_daemon_) download_daemon_->stop();
}

bool TransferService::running() const {
    return upload_daemon_->running() || download_daemon_->running();
}

// ── Submission ────────────────────────────────────────────────

EnqueueResult TransferService::submit(TaskDescriptor task) {
    return queue(task.direction).enqueue(std::move(task));
}

std::vector<EnqueueResult> TransferService::submit_task_files(const std::vector<fs::path>& paths,
                                                              std::vector<std::string>* warnings) {
    TaskFileBatch batch = load_task_files(paths, task_map_.get());
    if (warnings) {
        warnings->insert(warnings->end(), batch.warnings.begin(), batch.warnings.end());
    }
    std::vector<EnqueueResult> results;
    for (auto& task : batch.tasks) {
        results.push_back(submit(std::move(task)));
    }
    return results;
}

EnqueueResult TransferService::submit_download(const std::string& resource_id,
                                               const std::string& download_dir, int priority,
                                               bool condensed) {
    TaskDescriptor task;
    task.direction = Direction::Download;
    task.resource_id = resource_id;
    task.download_dir = download_dir;
    task.priority = priority;
    task.condensed = condensed;
    task.job_id = derive_job_id(task);
    return submit(std::move(task));
}

// ── Job operations ────────────────────────────────────────────

TransferQueue* TransferService::queue_for(const std::string& job_id) const {
    if (uploads_->find(job_id)) return uploads_.get();
    if (downloads_->find(job_id)) return downloads_.get();
    return nullptr;
}

Result<void> TransferService::abort_job(const std::string& job_id) {
    auto* q = queue_for(job_id);
    if (!q) return Result<void>::Err(fmt::format("no job {}", job_id));
    return q->abort(job_id);
}

Result<void> TransferService::retry_job(const std::string& job_id) {
    auto* q = queue_for(job_id);
    if (!q) return Result<void>::Err(fmt::format("no job {}", job_id));
    return q->retry(job_id);
}

Result<void> TransferService::remove_job(const std::string& job_id) {
    auto* q = queue_for(job_id);
    if (!q) return Result<void>::Err(fmt::format("no job {}", job_id));
    return q->remove(job_id);
}

// ── State queries ─────────────────────────────────────────────

TransferQueue& TransferService::queue(Direction d) {
    return d == Direction::Upload ? *uploads_ : *downloads_;
}

const TransferQueue& TransferService::queue(Direction d) const {
    return d == Direction::Upload ? *uploads_ : *downloads_;
}

std::vector<JobStatus> TransferService::list_jobs(Direction d) const {
    return queue(d).snapshot();
}

QueueSummary TransferService::summary(Direction d) const {
    return queue(d).summary();
}

bool TransferService::has_pending_work() const {
    return uploads_->has_pending_work() || downloads_->has_pending_work();
}
