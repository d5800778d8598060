#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <core/errors.hpp>
#include "job_state.hpp"

// Per-resource upload progress and resumption tokens.
struct ResourceProgress {
    std::string name;            // remote name (".gz" appended when compressed)
    std::string source_path;
    std::string cache_key;       // content identity; empty if sent uncompressed
    std::string upload_path;     // cached payload or the source itself
    int64_t size = 0;            // bytes to send
    int64_t transferred = 0;
    bool uploaded = false;
    bool verified = false;
    bool force_replace = false;  // set after a verification mismatch
    bool supplements_sent = false;
    std::string resource_id;     // remote id once created
    std::string sha256;          // computed while streaming
    std::string md5;
    std::string verify_method;   // "sha256" or "etag"
};

struct DownloadProgress {
    std::string resource_name;
    std::string dataset_id;
    std::string dataset_name;
    std::string final_path;
    std::string temp_path;        // <final_path>~
    int64_t expected_size = -1;
    int64_t confirmed_offset = 0; // bytes known to be on disk in temp_path
    std::string expected_sha256;
    std::string sha256;
    std::string md5;
    std::string etag;
    std::string verify_method;
    bool condensed = false;       // fetching the server's condensed RT-DC copy
};

// Mutable, persisted part of a job. Everything needed to resume after a
// restart lives here; the descriptor is stored beside it.
struct JobRecord {
    JobState state = JobState::Init;
    JobState failed_state = JobState::Init;  // step that raised the last error
    int attempt_count = 0;
    int verify_polls = 0;                    // server hash still pending
    JobError last_error;
    std::string dataset_id;                  // upload target, draft or given
    std::vector<ResourceProgress> resources;
    DownloadProgress download;
    int64_t sequence = 0;                    // submission order
    std::string submitted_at;
    std::string updated_at;
};
