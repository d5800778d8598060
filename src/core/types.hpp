#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ServerConfig {
    std::string url;                 // e.g. "https://dcor.mpl.mpg.de"
    std::string api_key;
    bool ssl_verify = true;
    std::string ca_bundle;           // optional custom certificate
};

struct TransferConfig {
    int upload_workers = DEFAULT_UPLOAD_WORKERS;
    int download_workers = DEFAULT_DOWNLOAD_WORKERS;
    int64_t chunk_size = CHUNK_SIZE_BYTES;
    int64_t persist_interval = PERSIST_INTERVAL_BYTES;
    int max_attempts = MAX_ATTEMPTS;
    int backoff_base_ms = BACKOFF_BASE_MS;
    int backoff_cap_ms = BACKOFF_CAP_MS;
    double backoff_jitter = BACKOFF_JITTER;
    int api_timeout = API_TIMEOUT_SECS;
    int connect_timeout = CONNECT_TIMEOUT_SECS;
    int stream_timeout = STREAM_LOW_SPEED_SECS;
    int activate_timeout = ACTIVATE_TIMEOUT_SECS;
    int poll_interval_ms = WORKER_POLL_MS;
    int disk_recheck_ms = DISK_RECHECK_MS;
    int verify_poll_ms = VERIFY_POLL_MS;
    int verify_max_polls = VERIFY_MAX_POLLS;
};

struct CacheConfig {
    std::string dir;                               // compression cache root
    int64_t max_bytes = CACHE_SOFT_CAP_BYTES;
    std::vector<std::string> compress_suffixes;    // resources compressed before upload
};

struct StorageConfig {
    std::string registry_dir;        // one YAML file per job
    std::string log_dir;
    std::string task_map_path;       // task id -> dataset id ledger
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
