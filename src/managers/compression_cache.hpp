#pragma once

#include <string>
#include <set>
#include <map>
#include <optional>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <filesystem>
#include <cstdint>
#include <ctime>

namespace fs = std::filesystem;

// gzip `src` into `dst`. `on_chunk` runs before every input chunk and may
// throw to interrupt. Throws TransferError on I/O failure.
void gzip_file(const fs::path& src, const fs::path& dst,
               const std::function<void()>& on_chunk = nullptr);

struct CacheEntryInfo {
    std::string key;
    fs::path payload;
    int64_t size = 0;
    std::time_t produced_at = 0;
    std::set<std::string> owners;   // job ids
    int pins = 0;
};

// Compressed upload payloads keyed by content identity.
//
// Layout: <dir>/<key>/payload + entry.yaml once complete. A directory
// with only payload.part (and the producing job in `producer`) is an
// in-progress or crashed production.
class CompressionCache {
public:
    // Writes the payload to the given path; may throw.
    using Producer = std::function<void(const fs::path& out)>;

    CompressionCache(fs::path dir, int64_t max_bytes);

    // Hash of canonical path, size and mtime. Throws TransferError
    // (ResourceUnavailable) if the source cannot be stat'ed.
    static std::string content_identity(const fs::path& source);

    // Returns the payload for `key`, producing it if needed. Concurrent
    // callers with the same key wait for the single producer. `owner` is
    // recorded so purge_orphans() can tell live entries from dead ones.
    fs::path get_or_create(const std::string& key, const std::string& owner,
                           const Producer& producer);

    bool contains(const std::string& key) const;
    std::optional<CacheEntryInfo> info(const std::string& key) const;

    // Pinned entries are in use by a transfer and never evicted.
    void pin(const std::string& key);
    void unpin(const std::string& key);

    // Evict least-recently-produced entries until `bytes_needed` more
    // fit under the ceiling. Returns bytes freed.
    int64_t evict_if_needed(int64_t bytes_needed);

    // Fits under the ceiling and on the file system.
    bool has_room(int64_t bytes_needed) const;

    int64_t usage_bytes() const;
    int64_t max_bytes() const { return max_bytes_; }

    // Remove complete entries whose owners all left the registry, and
    // partial productions that no producer is working on. Returns the
    // number of directories removed.
    int purge_orphans(const std::set<std::string>& live_job_ids);

    // Remove partial productions started by `job_id` (abort). Complete
    // entries are kept.
    void discard_incomplete(const std::string& job_id);

    // Drop `job_id` from every entry's owners; entries left without an
    // owner and without pins are deleted.
    void release_owner(const std::string& job_id);

private:
    struct Entry {
        int64_t size = 0;
        std::time_t produced_at = 0;
        std::set<std::string> owners;
        int pins = 0;
        bool producing = false;
        std::string producer;   // job id of the running production
    };

    fs::path dir_;
    int64_t max_bytes_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Entry> entries_;

    void load();
    fs::path entry_dir(const std::string& key) const { return dir_ / key; }
    void write_meta_locked(const std::string& key, const Entry& e);
    void remove_entry_locked(const std::string& key);
    int64_t usage_locked() const;
};

// Keeps a cache entry pinned for the lifetime of the guard.
class CachePin {
public:
    CachePin(CompressionCache& cache, std::string key)
        : cache_(&cache), key_(std::move(key)) { cache_->pin(key_); }
    ~CachePin() { if (cache_) cache_->unpin(key_); }

    CachePin(const CachePin&) = delete;
    CachePin& operator=(const CachePin&) = delete;

private:
    CompressionCache* cache_;
    std::string key_;
};
