#include "job_registry.hpp"
#include "job_log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

JobRegistry::JobRegistry(fs::path dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_ / direction_name(Direction::Upload));
    fs::create_directories(dir_ / direction_name(Direction::Download));
}

fs::path JobRegistry::entry_path(Direction d, const std::string& job_id) const {
    return dir_ / direction_name(d) / (job_id + ".yaml");
}

bool JobRegistry::contains(Direction d, const std::string& job_id) const {
    return fs::exists(entry_path(d, job_id));
}

// ── Serialization ──────────────────────────────────────────

static void emit_task(YAML::Emitter& out, const TaskDescriptor& t) {
    out << YAML::Key << "task" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "job_id" << YAML::Value << t.job_id;
    out << YAML::Key << "direction" << YAML::Value << direction_name(t.direction);
    out << YAML::Key << "priority" << YAML::Value << t.priority;
    out << YAML::Key << "depends_on" << YAML::Value << YAML::Flow << t.depends_on;
    if (t.direction == Direction::Upload) {
        out << YAML::Key << "task_id" << YAML::Value << t.task_id;
        out << YAML::Key << "dataset_id" << YAML::Value << t.dataset_id;
        out << YAML::Key << "dataset_json" << YAML::Value << t.dataset_json;
        out << YAML::Key << "resources" << YAML::Value << YAML::BeginSeq;
        for (const auto& r : t.resources) {
            out << YAML::BeginMap;
            out << YAML::Key << "path" << YAML::Value << r.path;
            out << YAML::Key << "name" << YAML::Value << r.name;
            out << YAML::Key << "supplements" << YAML::Value << r.supplements;
            out << YAML::Key << "depends_on" << YAML::Value << YAML::Flow << r.depends_on;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    } else {
        out << YAML::Key << "resource_id" << YAML::Value << t.resource_id;
        out << YAML::Key << "download_dir" << YAML::Value << t.download_dir;
        out << YAML::Key << "condensed" << YAML::Value << t.condensed;
    }
    out << YAML::EndMap;
}

static void emit_record(YAML::Emitter& out, const JobRecord& r) {
    out << YAML::Key << "state" << YAML::Value << state_name(r.state);
    out << YAML::Key << "failed_state" << YAML::Value << state_name(r.failed_state);
    out << YAML::Key << "attempt_count" << YAML::Value << r.attempt_count;
    out << YAML::Key << "verify_polls" << YAML::Value << r.verify_polls;
    out << YAML::Key << "last_error" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "kind" << YAML::Value << error_kind_name(r.last_error.kind);
    out << YAML::Key << "message" << YAML::Value << r.last_error.message;
    out << YAML::EndMap;
    out << YAML::Key << "dataset_id" << YAML::Value << r.dataset_id;
    out << YAML::Key << "sequence" << YAML::Value << r.sequence;
    out << YAML::Key << "submitted_at" << YAML::Value << r.submitted_at;
    out << YAML::Key << "updated_at" << YAML::Value << r.updated_at;

    out << YAML::Key << "resources" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : r.resources) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "source_path" << YAML::Value << p.source_path;
        out << YAML::Key << "cache_key" << YAML::Value << p.cache_key;
        out << YAML::Key << "upload_path" << YAML::Value << p.upload_path;
        out << YAML::Key << "size" << YAML::Value << p.size;
        out << YAML::Key << "transferred" << YAML::Value << p.transferred;
        out << YAML::Key << "uploaded" << YAML::Value << p.uploaded;
        out << YAML::Key << "verified" << YAML::Value << p.verified;
        out << YAML::Key << "force_replace" << YAML::Value << p.force_replace;
        out << YAML::Key << "supplements_sent" << YAML::Value << p.supplements_sent;
        out << YAML::Key << "resource_id" << YAML::Value << p.resource_id;
        out << YAML::Key << "sha256" << YAML::Value << p.sha256;
        out << YAML::Key << "md5" << YAML::Value << p.md5;
        out << YAML::Key << "verify_method" << YAML::Value << p.verify_method;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    const auto& d = r.download;
    out << YAML::Key << "download" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "resource_name" << YAML::Value << d.resource_name;
    out << YAML::Key << "dataset_id" << YAML::Value << d.dataset_id;
    out << YAML::Key << "dataset_name" << YAML::Value << d.dataset_name;
    out << YAML::Key << "final_path" << YAML::Value << d.final_path;
    out << YAML::Key << "temp_path" << YAML::Value << d.temp_path;
    out << YAML::Key << "expected_size" << YAML::Value << d.expected_size;
    out << YAML::Key << "confirmed_offset" << YAML::Value << d.confirmed_offset;
    out << YAML::Key << "expected_sha256" << YAML::Value << d.expected_sha256;
    out << YAML::Key << "sha256" << YAML::Value << d.sha256;
    out << YAML::Key << "md5" << YAML::Value << d.md5;
    out << YAML::Key << "etag" << YAML::Value << d.etag;
    out << YAML::Key << "verify_method" << YAML::Value << d.verify_method;
    out << YAML::Key << "condensed" << YAML::Value << d.condensed;
    out << YAML::EndMap;
}

std::string JobRegistry::serialize(const TaskDescriptor& task, const JobRecord& record) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    emit_task(out, task);
    out << YAML::Key << "record" << YAML::Value << YAML::BeginMap;
    emit_record(out, record);
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

static std::vector<std::string> as_string_list(const YAML::Node& n) {
    std::vector<std::string> out;
    if (n && n.IsSequence()) {
        for (const auto& v : n) out.push_back(v.as<std::string>());
    }
    return out;
}

RegistryEntry JobRegistry::parse(const std::string& yaml_text) {
    YAML::Node root = YAML::Load(yaml_text);
    const YAML::Node t = root["task"];
    const YAML::Node r = root["record"];
    if (!t || !t.IsMap() || !r || !r.IsMap()) {
        throw std::runtime_error("registry entry lacks task/record sections");
    }

    RegistryEntry e;
    TaskDescriptor& task = e.task;
    task.job_id = t["job_id"].as<std::string>("");
    task.direction = parse_direction(t["direction"].as<std::string>(""));
    task.priority = t["priority"].as<int>(0);
    task.depends_on = as_string_list(t["depends_on"]);
    task.task_id = t["task_id"].as<std::string>("");
    task.dataset_id = t["dataset_id"].as<std::string>("");
    task.dataset_json = t["dataset_json"].as<std::string>("");
    task.resource_id = t["resource_id"].as<std::string>("");
    task.download_dir = t["download_dir"].as<std::string>("");
    task.condensed = t["condensed"].as<bool>(false);
    if (t["resources"] && t["resources"].IsSequence()) {
        for (const auto& n : t["resources"]) {
            ResourceSpec rs;
            rs.path = n["path"].as<std::string>("");
            rs.name = n["name"].as<std::string>("");
            if (n["supplements"] && n["supplements"].IsMap()) {
                rs.supplements = n["supplements"].as<std::map<std::string, std::string>>();
            }
            rs.depends_on = as_string_list(n["depends_on"]);
            task.resources.push_back(rs);
        }
    }
    if (task.job_id.empty()) {
        throw std::runtime_error("registry entry without job_id");
    }

    JobRecord& rec = e.record;
    rec.state = parse_state(r["state"].as<std::string>(""), JobState::Init);
    rec.failed_state = parse_state(r["failed_state"].as<std::string>(""), JobState::Init);
    rec.attempt_count = r["attempt_count"].as<int>(0);
    rec.verify_polls = r["verify_polls"].as<int>(0);
    if (r["last_error"]) {
        rec.last_error.kind = parse_error_kind(r["last_error"]["kind"].as<std::string>(""));
        rec.last_error.message = r["last_error"]["message"].as<std::string>("");
    }
    rec.dataset_id = r["dataset_id"].as<std::string>("");
    rec.sequence = r["sequence"].as<int64_t>(0);
    rec.submitted_at = r["submitted_at"].as<std::string>("");
    rec.updated_at = r["updated_at"].as<std::string>("");

    if (r["resources"] && r["resources"].IsSequence()) {
        for (const auto& n : r["resources"]) {
            ResourceProgress p;
            p.name = n["name"].as<std::string>("");
            p.source_path = n["source_path"].as<std::string>("");
            p.cache_key = n["cache_key"].as<std::string>("");
            p.upload_path = n["upload_path"].as<std::string>("");
            p.size = n["size"].as<int64_t>(0);
            p.transferred = n["transferred"].as<int64_t>(0);
            p.uploaded = n["uploaded"].as<bool>(false);
            p.verified = n["verified"].as<bool>(false);
            p.force_replace = n["force_replace"].as<bool>(false);
            p.supplements_sent = n["supplements_sent"].as<bool>(false);
            p.resource_id = n["resource_id"].as<std::string>("");
            p.sha256 = n["sha256"].as<std::string>("");
            p.md5 = n["md5"].as<std::string>("");
            p.verify_method = n["verify_method"].as<std::string>("");
            rec.resources.push_back(p);
        }
    }

    const YAML::Node d = r["download"];
    if (d && d.IsMap()) {
        auto& dl = rec.download;
        dl.resource_name = d["resource_name"].as<std::string>("");
        dl.dataset_id = d["dataset_id"].as<std::string>("");
        dl.dataset_name = d["dataset_name"].as<std::string>("");
        dl.final_path = d["final_path"].as<std::string>("");
        dl.temp_path = d["temp_path"].as<std::string>("");
        dl.expected_size = d["expected_size"].as<int64_t>(-1);
        dl.confirmed_offset = d["confirmed_offset"].as<int64_t>(0);
        dl.expected_sha256 = d["expected_sha256"].as<std::string>("");
        dl.sha256 = d["sha256"].as<std::string>("");
        dl.md5 = d["md5"].as<std::string>("");
        dl.etag = d["etag"].as<std::string>("");
        dl.verify_method = d["verify_method"].as<std::string>("");
        dl.condensed = d["condensed"].as<bool>(false);
    }
    return e;
}

// ── Store ──────────────────────────────────────────────────

std::vector<RegistryEntry> JobRegistry::load_all(Direction d, std::vector<std::string>* warnings) const {
    std::vector<RegistryEntry> entries;
    fs::path sub = dir_ / direction_name(d);
    std::error_code ec;

    for (const auto& f : fs::directory_iterator(sub, ec)) {
        if (f.path().extension() != ".yaml") continue;
        try {
            std::ifstream in(f.path());
            std::stringstream buf;
            buf << in.rdbuf();
            RegistryEntry e = parse(buf.str());
            if (e.task.direction != d) {
                throw std::runtime_error("direction does not match directory");
            }
            entries.push_back(std::move(e));
        } catch (const std::exception& ex) {
            std::string msg = fmt::format("registry: {} is unreadable ({}), moved aside",
                                          f.path().string(), ex.what());
            xfer_log(msg);
            if (warnings) warnings->push_back(msg);
            fs::path aside = f.path();
            aside += ".corrupt";
            fs::rename(f.path(), aside, ec);
        }
    }

    std::sort(entries.begin(), entries.end(), [](const RegistryEntry& a, const RegistryEntry& b) {
        return a.record.sequence < b.record.sequence;
    });
    return entries;
}

Result<void> JobRegistry::save(const TaskDescriptor& task, const JobRecord& record) const {
    try {
        platform::atomic_write_file(entry_path(task.direction, task.job_id),
                                    serialize(task, record));
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("registry: cannot save {}: {}", task.job_id, e.what()));
    }
}

void JobRegistry::remove(Direction d, const std::string& job_id) const {
    std::error_code ec;
    fs::remove(entry_path(d, job_id), ec);
    if (ec) xfer_log(fmt::format("registry: cannot remove {}: {}", job_id, ec.message()));
}
