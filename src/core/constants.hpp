#pragma once

#include <cstdint>

// ── Transfer ────────────────────────────────────────────────
constexpr int64_t CHUNK_SIZE_BYTES        = 1024 * 1024;          // 1 MiB per read/write
constexpr int64_t PERSIST_INTERVAL_BYTES  = 64LL * 1024 * 1024;   // Save progress every 64 MiB
constexpr int DEFAULT_UPLOAD_WORKERS      = 2;
constexpr int DEFAULT_DOWNLOAD_WORKERS    = 2;

// ── Timeouts ────────────────────────────────────────────────
constexpr int API_TIMEOUT_SECS            = 30;    // Plain API calls (package_show etc.)
constexpr int CONNECT_TIMEOUT_SECS        = 15;
constexpr int STREAM_LOW_SPEED_SECS       = 120;   // Abort a stream stalled for this long
constexpr int ACTIVATE_TIMEOUT_SECS       = 600;   // Dataset activation may run for minutes

// ── Retry ───────────────────────────────────────────────────
constexpr int MAX_ATTEMPTS                = 10;
constexpr int BACKOFF_BASE_MS             = 2000;
constexpr int BACKOFF_CAP_MS              = 300000;  // 5 min
constexpr double BACKOFF_JITTER           = 0.10;    // ±10%

// ── Polling ─────────────────────────────────────────────────
constexpr int WORKER_POLL_MS              = 500;   // Idle worker wake-up interval
constexpr int DISK_RECHECK_MS             = 5000;  // waiting-disk re-check timer
constexpr int VERIFY_POLL_MS              = 5000;  // Server hash not yet computed
constexpr int VERIFY_MAX_POLLS            = 60;

// ── Cache management ──────────────────────────────────────────
constexpr int64_t CACHE_SOFT_CAP_BYTES    = 20LL * 1024 * 1024 * 1024;  // 20 GB
constexpr int64_t DISK_HEADROOM_BYTES     = 256LL * 1024 * 1024;        // keep free on target disk
constexpr int GZIP_LEVEL                  = 6;

// ── Remote ──────────────────────────────────────────────────
constexpr const char* CKAN_API_PATH       = "/api/3/action/";
constexpr const char* CKAN_API_KEY_HEADER = "X-CKAN-API-Key";
// Use fmt::format: fmt::format(CKAN_DOWNLOAD_URL, server, dataset_id, resource_id, name)
constexpr const char* CKAN_DOWNLOAD_URL   = "{}/dataset/{}/resource/{}/download/{}";
constexpr const char* CKAN_CONDENSED_URL  = "{}/dataset/{}/resource/{}/condensed.rtdc";
constexpr const char* RTDC_MIMETYPE       = "RT-DC";
constexpr const char* USER_AGENT          = "repoxfer/0.1.0";

// ── Local paths ─────────────────────────────────────────────
constexpr const char* PARTIAL_SUFFIX      = "~";   // download in progress: <final>~
constexpr const char* API_KEY_ENV         = "REPOXFER_API_KEY";
