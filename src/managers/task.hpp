#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include "job_state.hpp"

namespace fs = std::filesystem;

struct ResourceSpec {
    std::string path;                                   // local file
    std::string name;                                   // remote resource name
    std::map<std::string, std::string> supplements;     // "sp:section:key" -> JSON value text
    std::vector<std::string> depends_on;                // names of resources in the same dataset
};

// Immutable description of one transfer. Owned by whoever submits it.
struct TaskDescriptor {
    std::string job_id;                  // "upload-<task_id>" / "download-<resource_id>[_cond]"
    Direction direction = Direction::Upload;
    int priority = 0;                    // higher runs first
    std::vector<std::string> depends_on; // job ids that must reach done first

    // Upload
    std::string task_id;
    std::string dataset_id;              // empty: a draft is created while parsing
    std::string dataset_json;            // dataset dictionary used to create the draft
    std::vector<ResourceSpec> resources;

    // Download
    std::string resource_id;
    std::string download_dir;
    bool condensed = false;              // RT-DC resources: fetch the condensed copy
};

// Task ids are restricted to [0-9a-z_-].
bool is_valid_task_id(const std::string& id);

// Stable job identity. Empty if the descriptor carries nothing to derive it from.
std::string derive_job_id(const TaskDescriptor& task);

// Structural checks that do not touch the file system or network.
Result<void> check_task(const TaskDescriptor& task);

// Indices into task.resources, dependencies first, otherwise in task order.
// Throws TransferError(InvalidTask) for unknown names or cycles.
std::vector<size_t> resource_upload_order(const TaskDescriptor& task);

bool is_readable_file(const fs::path& path);

// Append-only ledger "task_id dataset_id", one pair per line. Ensures a
// re-loaded task file reuses the draft created for it the first time.
class TaskDatasetMap {
public:
    explicit TaskDatasetMap(fs::path path);

    std::optional<std::string> get(const std::string& task_id) const;

    // Appends a line. Re-adding the same pair is a no-op; a different
    // dataset id for a known task is an error.
    Result<void> add(const std::string& task_id, const std::string& dataset_id);

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::map<std::string, std::string> map_;
    mutable std::mutex mutex_;

    void load();
};

struct TaskFileBatch {
    std::vector<TaskDescriptor> tasks;
    std::vector<std::string> warnings;   // one per file that could not be loaded
};

// Parse a JSON task file (upload_job or download_job form). Missing
// resources are looked up again beside the task file before failing.
Result<TaskDescriptor> load_task_file(const fs::path& path,
                                      const TaskDatasetMap* map = nullptr);

// Load many files; a bad file becomes a warning and the rest still load.
TaskFileBatch load_task_files(const std::vector<fs::path>& paths,
                              const TaskDatasetMap* map = nullptr);
