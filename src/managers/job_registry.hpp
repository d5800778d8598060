#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "task.hpp"
#include "job_record.hpp"

namespace fs = std::filesystem;

struct RegistryEntry {
    TaskDescriptor task;
    JobRecord record;
};

// Durable job store: one YAML file per job under
// <dir>/<direction>/<job_id>.yaml, each replaced atomically, so adding or
// updating a job never rewrites the others.
class JobRegistry {
public:
    explicit JobRegistry(fs::path dir);

    // All entries of one direction. Unreadable files are moved aside to
    // <file>.corrupt and reported in `warnings`.
    std::vector<RegistryEntry> load_all(Direction d, std::vector<std::string>* warnings = nullptr) const;

    Result<void> save(const TaskDescriptor& task, const JobRecord& record) const;
    void remove(Direction d, const std::string& job_id) const;
    bool contains(Direction d, const std::string& job_id) const;

    fs::path entry_path(Direction d, const std::string& job_id) const;
    const fs::path& dir() const { return dir_; }

    static std::string serialize(const TaskDescriptor& task, const JobRecord& record);
    static RegistryEntry parse(const std::string& yaml_text);

private:
    fs::path dir_;
};
