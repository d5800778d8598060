#include "task.hpp"
#include "job_log.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>

using json = nlohmann::json;

bool is_valid_task_id(const std::string& id) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || c == '-' || c == '_';
    });
}

std::string derive_job_id(const TaskDescriptor& task) {
    if (task.direction == Direction::Download) {
        if (task.resource_id.empty()) return "";
        return "download-" + task.resource_id + (task.condensed ? "_cond" : "");
    }
    if (!task.task_id.empty()) return "upload-" + task.task_id;
    if (!task.dataset_id.empty()) return "upload-" + task.dataset_id;
    return "";
}

Result<void> check_task(const TaskDescriptor& task) {
    if (task.job_id.empty()) {
        return Result<void>::Err("task has no identity (task_id, dataset_id or resource_id)");
    }

    if (task.direction == Direction::Download) {
        if (task.resource_id.empty()) return Result<void>::Err("download task without resource_id");
        if (task.download_dir.empty()) return Result<void>::Err("download task without download_path");
        return Result<void>::Ok();
    }

    if (!task.task_id.empty() && !is_valid_task_id(task.task_id)) {
        return Result<void>::Err(fmt::format(
            "invalid task id '{}': only [0-9a-z_-] allowed", task.task_id));
    }
    if (task.resources.empty()) {
        return Result<void>::Err("upload task lists no resources");
    }
    if (task.dataset_id.empty() && task.dataset_json.empty()) {
        return Result<void>::Err("upload task has neither dataset_id nor dataset_dict");
    }

    std::set<std::string> names;
    for (const auto& r : task.resources) {
        if (r.name.empty()) return Result<void>::Err("resource without name: " + r.path);
        if (!names.insert(r.name).second) {
            return Result<void>::Err("duplicate resource name: " + r.name);
        }
        for (const auto& key : r.supplements) {
            if (key.first.rfind("sp:", 0) != 0) {
                return Result<void>::Err(fmt::format(
                    "resource '{}': supplement key '{}' is not of the form sp:section:key",
                    r.name, key.first));
            }
        }
    }
    return Result<void>::Ok();
}

std::vector<size_t> resource_upload_order(const TaskDescriptor& task) {
    std::map<std::string, size_t> by_name;
    for (size_t i = 0; i < task.resources.size(); i++) {
        by_name[task.resources[i].name] = i;
    }

    // Depth-first, visiting in task order so independent resources keep it
    enum Mark { NONE, VISITING, DONE };
    std::vector<Mark> mark(task.resources.size(), NONE);
    std::vector<size_t> order;

    std::function<void(size_t)> visit = [&](size_t i) {
        if (mark[i] == DONE) return;
        if (mark[i] == VISITING) {
            throw TransferError(ErrorKind::InvalidTask,
                                "resource dependency cycle at " + task.resources[i].name);
        }
        mark[i] = VISITING;
        for (const auto& dep : task.resources[i].depends_on) {
            auto it = by_name.find(dep);
            if (it == by_name.end()) {
                throw TransferError(ErrorKind::InvalidTask, fmt::format(
                    "resource '{}' depends on unknown resource '{}'",
                    task.resources[i].name, dep));
            }
            visit(it->second);
        }
        mark[i] = DONE;
        order.push_back(i);
    };

    for (size_t i = 0; i < task.resources.size(); i++) visit(i);
    return order;
}

bool is_readable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    std::ifstream f(path, std::ios::binary);
    return static_cast<bool>(f);
}

// ── TaskDatasetMap ─────────────────────────────────────────

TaskDatasetMap::TaskDatasetMap(fs::path path) : path_(std::move(path)) {
    load();
}

void TaskDatasetMap::load() {
    std::ifstream in(path_);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;
        std::istringstream ls(line);
        std::string task_id, dataset_id;
        ls >> task_id >> dataset_id;
        if (!is_valid_task_id(task_id) || dataset_id.empty()) {
            xfer_log("task map: skipping malformed line: " + line);
            continue;
        }
        map_[task_id] = dataset_id;
    }
}

std::optional<std::string> TaskDatasetMap::get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(task_id);
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

Result<void> TaskDatasetMap::add(const std::string& task_id, const std::string& dataset_id) {
    if (!is_valid_task_id(task_id)) {
        return Result<void>::Err("invalid task id: " + task_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(task_id);
    if (it != map_.end()) {
        if (it->second == dataset_id) return Result<void>::Ok();
        return Result<void>::Err(fmt::format(
            "task '{}' is already bound to dataset '{}'", task_id, it->second));
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        return Result<void>::Err("cannot append to " + path_.string());
    }
    out << task_id << " " << dataset_id << "\n";
    map_[task_id] = dataset_id;
    return Result<void>::Ok();
}

// ── Task files ─────────────────────────────────────────────

static Result<std::string> resolve_resource_path(const std::string& raw, const fs::path& task_dir) {
    fs::path p(raw);
    if (is_readable_file(p)) return Result<std::string>::Ok(fs::absolute(p).string());

    // Task files are often moved together with their data
    fs::path beside = p.is_relative() ? task_dir / p : task_dir / p.filename();
    if (is_readable_file(beside)) return Result<std::string>::Ok(fs::absolute(beside).string());

    return Result<std::string>::Err("resource not found: " + raw);
}

static std::map<std::string, std::string> flatten_supplements(const json& node) {
    std::map<std::string, std::string> out;
    if (!node.is_object()) return out;
    for (auto sec = node.begin(); sec != node.end(); ++sec) {
        if (!sec.value().is_object()) continue;
        for (auto kv = sec.value().begin(); kv != sec.value().end(); ++kv) {
            out[fmt::format("sp:{}:{}", sec.key(), kv.key())] = kv.value().dump();
        }
    }
    return out;
}

static Result<TaskDescriptor> parse_upload_job(const json& root, const fs::path& path,
                                               const TaskDatasetMap* map) {
    const json& uj = root["upload_job"];
    TaskDescriptor task;
    task.direction = Direction::Upload;
    task.task_id = uj.value("task_id", "");
    task.priority = uj.value("priority", 0);

    if (!task.task_id.empty() && !is_valid_task_id(task.task_id)) {
        return Result<TaskDescriptor>::Err(fmt::format(
            "{}: invalid task id '{}'", path.string(), task.task_id));
    }

    json dataset_dict = root.value("dataset_dict", json::object());
    if (!dataset_dict.is_object()) {
        return Result<TaskDescriptor>::Err(path.string() + ": dataset_dict must be an object");
    }

    // Dataset id candidates: upload_job, dataset_dict and the task map must agree
    std::set<std::string> ids;
    if (uj.contains("dataset_id") && uj["dataset_id"].is_string()) ids.insert(uj["dataset_id"].get<std::string>());
    if (dataset_dict.contains("id") && dataset_dict["id"].is_string()) ids.insert(dataset_dict["id"].get<std::string>());
    if (map && !task.task_id.empty()) {
        auto known = map->get(task.task_id);
        if (known) ids.insert(*known);
    }
    ids.erase("");
    if (ids.size() > 1) {
        return Result<TaskDescriptor>::Err(fmt::format(
            "{}: ambiguous dataset id for task '{}'", path.string(), task.task_id));
    }
    if (!ids.empty()) task.dataset_id = *ids.begin();
    if (!dataset_dict.empty()) task.dataset_json = dataset_dict.dump();

    auto paths = uj.value("resource_paths", std::vector<std::string>{});
    auto names = uj.value("resource_names", std::vector<std::string>{});
    json supplements = uj.value("resource_supplements", json::array());
    json depends = uj.value("resource_depends_on", json::array());

    if (!names.empty() && names.size() != paths.size()) {
        return Result<TaskDescriptor>::Err(fmt::format(
            "{}: {} resource_names for {} resource_paths", path.string(), names.size(), paths.size()));
    }
    if (!supplements.empty() && supplements.size() != paths.size()) {
        return Result<TaskDescriptor>::Err(fmt::format(
            "{}: {} resource_supplements for {} resource_paths",
            path.string(), supplements.size(), paths.size()));
    }

    fs::path task_dir = path.parent_path();
    for (size_t i = 0; i < paths.size(); i++) {
        auto resolved = resolve_resource_path(paths[i], task_dir);
        if (resolved.is_err()) {
            return Result<TaskDescriptor>::Err(fmt::format("{}: {}", path.string(), resolved.error));
        }
        ResourceSpec r;
        r.path = resolved.value;
        r.name = names.empty() ? fs::path(paths[i]).filename().string() : names[i];
        if (i < supplements.size()) r.supplements = flatten_supplements(supplements[i]);
        if (i < depends.size() && depends[i].is_array()) {
            r.depends_on = depends[i].get<std::vector<std::string>>();
        }
        task.resources.push_back(std::move(r));
    }

    for (const auto& dep : uj.value("depends_on", std::vector<std::string>{})) {
        task.depends_on.push_back("upload-" + dep);
    }

    task.job_id = derive_job_id(task);
    auto ok = check_task(task);
    if (ok.is_err()) {
        return Result<TaskDescriptor>::Err(fmt::format("{}: {}", path.string(), ok.error));
    }
    return Result<TaskDescriptor>::Ok(task);
}

static Result<TaskDescriptor> parse_download_job(const json& root, const fs::path& path) {
    const json& dj = root["download_job"];
    TaskDescriptor task;
    task.direction = Direction::Download;
    task.resource_id = dj.value("resource_id", "");
    task.download_dir = dj.value("download_path", "");
    task.priority = dj.value("priority", 0);
    task.condensed = dj.value("condensed", false);
    if (!task.download_dir.empty() && fs::path(task.download_dir).is_relative()) {
        task.download_dir = (path.parent_path() / task.download_dir).lexically_normal().string();
    }
    task.job_id = derive_job_id(task);

    auto ok = check_task(task);
    if (ok.is_err()) {
        return Result<TaskDescriptor>::Err(fmt::format("{}: {}", path.string(), ok.error));
    }
    return Result<TaskDescriptor>::Ok(task);
}

Result<TaskDescriptor> load_task_file(const fs::path& path, const TaskDatasetMap* map) {
    std::ifstream in(path);
    if (!in) {
        return Result<TaskDescriptor>::Err("cannot read task file " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    std::string text = buf.str();
    trim(text);
    if (text.empty()) {
        return Result<TaskDescriptor>::Err(path.string() + ": empty task file");
    }

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            return Result<TaskDescriptor>::Err(path.string() + ": not a JSON object");
        }
        if (root.contains("upload_job") && root["upload_job"].is_object()) {
            return parse_upload_job(root, fs::absolute(path), map);
        }
        if (root.contains("download_job") && root["download_job"].is_object()) {
            return parse_download_job(root, fs::absolute(path));
        }
        return Result<TaskDescriptor>::Err(path.string() + ": neither upload_job nor download_job");
    } catch (const json::exception& e) {
        return Result<TaskDescriptor>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }
}

TaskFileBatch load_task_files(const std::vector<fs::path>& paths, const TaskDatasetMap* map) {
    TaskFileBatch batch;
    for (const auto& p : paths) {
        auto r = load_task_file(p, map);
        if (r.is_ok()) {
            batch.tasks.push_back(std::move(r.value));
        } else {
            xfer_log("task file skipped: " + r.error);
            batch.warnings.push_back(r.error);
        }
    }
    return batch;
}
