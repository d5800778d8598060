#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <core/config.hpp>
#include <remote/remote_client.hpp>
#include "compression_cache.hpp"
#include "job_registry.hpp"
#include "task.hpp"
#include "upload_pipeline.hpp"
#include "download_pipeline.hpp"
#include "transfer_queue.hpp"
#include "transfer_daemon.hpp"

namespace fs = std::filesystem;

// Headless service facade: owns the remote client, cache, registry and
// both queues with their worker pools. Any front end drives it.
class TransferService {
public:
    // `remote` defaults to a CkanClient built from the config.
    explicit TransferService(Config config, std::unique_ptr<RemoteClient> remote = nullptr);
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────

    // Load persisted jobs, check unfinished ones against the server and
    // drop cache entries no job refers to. Call once, before start().
    Result<void> restore(StatusCallback cb = nullptr);

    void start();

    // Graceful: running steps stop at the next chunk boundary and keep
    // their state for the next run.
    void stop();

    bool running() const;

    // ── Submission ────────────────────────────────────────────

    EnqueueResult submit(TaskDescriptor task);

    // Load task files and submit every one that parses. Files that do
    // not parse are reported in `warnings`.
    std::vector<EnqueueResult> submit_task_files(const std::vector<fs::path>& paths,
                                                 std::vector<std::string>* warnings = nullptr);

    EnqueueResult submit_download(const std::string& resource_id,
                                  const std::string& download_dir, int priority = 0,
                                  bool condensed = false);

    // ── Job operations ────────────────────────────────────────

    Result<void> abort_job(const std::string& job_id);
    Result<void> retry_job(const std::string& job_id);
    Result<void> remove_job(const std::string& job_id);

    // ── State queries ─────────────────────────────────────────

    std::vector<JobStatus> list_jobs(Direction d) const;
    QueueSummary summary(Direction d) const;

    // Some job in either direction can still progress without the user.
    bool has_pending_work() const;

    const Config& config() const { return config_; }
    TransferQueue& queue(Direction d);
    const TransferQueue& queue(Direction d) const;
    CompressionCache& cache() { return *cache_; }
    TaskDatasetMap& task_map() { return *task_map_; }

private:
    Config config_;
    std::unique_ptr<RemoteClient> remote_;
    std::unique_ptr<CompressionCache> cache_;
    std::unique_ptr<JobRegistry> registry_;
    std::unique_ptr<TaskDatasetMap> task_map_;
    UploadPipeline upload_pipeline_;
    DownloadPipeline download_pipeline_;
    std::unique_ptr<TransferQueue> uploads_;
    std::unique_ptr<TransferQueue> downloads_;
    std::unique_ptr<TransferDaemon> upload_daemon_;
    std::unique_ptr<TransferDaemon> download_daemon_;

    TransferQueue* queue_for(const std::string& job_id) const;
    int restore_queue(TransferQueue& queue, std::vector<std::string>& warnings);
};
