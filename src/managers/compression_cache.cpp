#include "compression_cache.hpp"
#include "job_log.hpp"
#include "verifier.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <zlib.h>
#include <algorithm>
#include <fstream>
#include <vector>

static const char* PAYLOAD_NAME = "payload";
static const char* PARTIAL_NAME = "payload.part";
static const char* META_NAME = "entry.yaml";
static const char* PRODUCER_NAME = "producer";

// ── gzip ───────────────────────────────────────────────────

void gzip_file(const fs::path& src, const fs::path& dst,
               const std::function<void()>& on_chunk) {
    std::ifstream in(src, std::ios::binary);
    if (!in) {
        throw TransferError(ErrorKind::ResourceUnavailable, "cannot read " + src.string());
    }
    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransferError(ErrorKind::Unexpected, "cannot write " + dst.string());
    }

    z_stream stream{};
    // windowBits 15 + 16 selects the gzip wrapper
    if (deflateInit2(&stream, GZIP_LEVEL, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw TransferError(ErrorKind::Unexpected, "zlib deflateInit2 failed");
    }

    std::vector<char> inbuf(CHUNK_SIZE_BYTES);
    std::vector<char> outbuf(CHUNK_SIZE_BYTES);
    int flush = Z_NO_FLUSH;

    try {
        do {
            if (on_chunk) on_chunk();
            in.read(inbuf.data(), static_cast<std::streamsize>(inbuf.size()));
            std::streamsize got = in.gcount();
            if (in.bad()) {
                throw TransferError(ErrorKind::ResourceUnavailable, "read error on " + src.string());
            }
            flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;
            stream.next_in = reinterpret_cast<Bytef*>(inbuf.data());
            stream.avail_in = static_cast<uInt>(got);

            do {
                stream.next_out = reinterpret_cast<Bytef*>(outbuf.data());
                stream.avail_out = static_cast<uInt>(outbuf.size());
                int rc = deflate(&stream, flush);
                if (rc == Z_STREAM_ERROR) {
                    throw TransferError(ErrorKind::Unexpected, "zlib deflate failed");
                }
                size_t have = outbuf.size() - stream.avail_out;
                out.write(outbuf.data(), static_cast<std::streamsize>(have));
                if (!out) {
                    throw TransferError(ErrorKind::Unexpected, "write error on " + dst.string());
                }
            } while (stream.avail_out == 0);
        } while (flush != Z_FINISH);
    } catch (...) {
        deflateEnd(&stream);
        throw;
    }

    deflateEnd(&stream);
    out.flush();
    if (!out) {
        throw TransferError(ErrorKind::Unexpected, "write error on " + dst.string());
    }
}

// ── CompressionCache ───────────────────────────────────────

CompressionCache::CompressionCache(fs::path dir, int64_t max_bytes)
    : dir_(std::move(dir)), max_bytes_(max_bytes) {
    fs::create_directories(dir_);
    load();
}

std::string CompressionCache::content_identity(const fs::path& source) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(source, ec);
    if (ec) canonical = fs::absolute(source);

    auto size = fs::file_size(canonical, ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot stat {}: {}", source.string(), ec.message()));
    }
    auto mtime = fs::last_write_time(canonical, ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot stat {}: {}", source.string(), ec.message()));
    }

    std::string ident = fmt::format("{}\n{}\n{}", canonical.string(), size,
                                    static_cast<long long>(mtime.time_since_epoch().count()));
    StreamHasher h;
    h.update(ident.data(), ident.size());
    return h.finish().sha256.substr(0, 40);
}

void CompressionCache::load() {
    std::error_code ec;
    for (const auto& d : fs::directory_iterator(dir_, ec)) {
        if (!d.is_directory()) continue;
        fs::path meta = d.path() / META_NAME;
        fs::path payload = d.path() / PAYLOAD_NAME;
        if (!fs::exists(meta) || !fs::exists(payload)) continue;  // partial, see purge_orphans

        try {
            YAML::Node root = YAML::LoadFile(meta.string());
            Entry e;
            e.size = root["size"].as<int64_t>(0);
            e.produced_at = static_cast<std::time_t>(root["produced_at"].as<int64_t>(0));
            if (root["owners"] && root["owners"].IsSequence()) {
                for (const auto& o : root["owners"]) e.owners.insert(o.as<std::string>());
            }
            if (e.size != static_cast<int64_t>(fs::file_size(payload))) {
                xfer_log("cache: size mismatch, dropping " + d.path().string());
                fs::remove_all(d.path(), ec);
                continue;
            }
            entries_[d.path().filename().string()] = e;
        } catch (const std::exception& ex) {
            // Corrupted metadata: the payload cannot be trusted either
            xfer_log(fmt::format("cache: dropping {} ({})", d.path().string(), ex.what()));
            fs::remove_all(d.path(), ec);
        }
    }
}

void CompressionCache::write_meta_locked(const std::string& key, const Entry& e) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "size" << YAML::Value << e.size;
    out << YAML::Key << "produced_at" << YAML::Value << static_cast<int64_t>(e.produced_at);
    out << YAML::Key << "owners" << YAML::Value << YAML::BeginSeq;
    for (const auto& o : e.owners) out << o;
    out << YAML::EndSeq;
    out << YAML::EndMap;
    platform::atomic_write_file(entry_dir(key) / META_NAME, out.c_str());
}

void CompressionCache::remove_entry_locked(const std::string& key) {
    std::error_code ec;
    fs::remove_all(entry_dir(key), ec);
    if (ec) xfer_log(fmt::format("cache: cannot remove {}: {}", key, ec.message()));
    entries_.erase(key);
}

int64_t CompressionCache::usage_locked() const {
    int64_t total = 0;
    for (const auto& kv : entries_) {
        if (!kv.second.producing) total += kv.second.size;
    }
    return total;
}

fs::path CompressionCache::get_or_create(const std::string& key, const std::string& owner,
                                         const Producer& producer) {
    fs::path dir = entry_dir(key);
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            auto it = entries_.find(key);
            if (it == entries_.end()) break;
            if (!it->second.producing) {
                if (it->second.owners.insert(owner).second) {
                    write_meta_locked(key, it->second);
                }
                return dir / PAYLOAD_NAME;
            }
            cv_.wait(lock);
        }

        Entry e;
        e.producing = true;
        e.producer = owner;
        entries_[key] = e;
    }

    try {
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir);
        {
            std::ofstream marker(dir / PRODUCER_NAME);
            marker << owner << "\n";
        }

        producer(dir / PARTIAL_NAME);
        fs::rename(dir / PARTIAL_NAME, dir / PAYLOAD_NAME);

        std::lock_guard<std::mutex> lock(mutex_);
        Entry& e = entries_[key];
        e.producing = false;
        e.producer.clear();
        e.size = static_cast<int64_t>(fs::file_size(dir / PAYLOAD_NAME));
        e.produced_at = std::time(nullptr);
        e.owners.insert(owner);
        write_meta_locked(key, e);
        fs::remove(dir / PRODUCER_NAME, ec);
        xfer_log(fmt::format("cache: produced {} ({}) for {}", key, format_bytes(e.size), owner));
    } catch (...) {
        // Failed or interrupted production leaves nothing behind
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remove_entry_locked(key);
        }
        cv_.notify_all();
        throw;
    }

    cv_.notify_all();
    return dir / PAYLOAD_NAME;
}

bool CompressionCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && !it->second.producing;
}

std::optional<CacheEntryInfo> CompressionCache::info(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.producing) return std::nullopt;
    CacheEntryInfo i;
    i.key = key;
    i.payload = entry_dir(key) / PAYLOAD_NAME;
    i.size = it->second.size;
    i.produced_at = it->second.produced_at;
    i.owners = it->second.owners;
    i.pins = it->second.pins;
    return i;
}

void CompressionCache::pin(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) it->second.pins++;
}

void CompressionCache::unpin(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.pins > 0) it->second.pins--;
}

int64_t CompressionCache::evict_if_needed(int64_t bytes_needed) {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t usage = usage_locked();
    if (usage + bytes_needed <= max_bytes_) return 0;

    std::vector<std::pair<std::time_t, std::string>> candidates;
    for (const auto& kv : entries_) {
        if (kv.second.producing || kv.second.pins > 0) continue;
        candidates.emplace_back(kv.second.produced_at, kv.first);
    }
    std::sort(candidates.begin(), candidates.end());

    int64_t freed = 0;
    for (const auto& c : candidates) {
        if (usage - freed + bytes_needed <= max_bytes_) break;
        int64_t size = entries_[c.second].size;
        xfer_log(fmt::format("cache: evicting {} ({})", c.second, format_bytes(size)));
        remove_entry_locked(c.second);
        freed += size;
    }
    return freed;
}

bool CompressionCache::has_room(int64_t bytes_needed) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (usage_locked() + bytes_needed > max_bytes_) return false;
    }
    int64_t free_bytes = platform::disk_free_bytes(dir_);
    if (free_bytes < 0) return true;  // unknown: let the write fail loudly instead
    return free_bytes >= bytes_needed + DISK_HEADROOM_BYTES;
}

int64_t CompressionCache::usage_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return usage_locked();
}

int CompressionCache::purge_orphans(const std::set<std::string>& live_job_ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    int removed = 0;

    std::vector<std::string> dead;
    for (auto& kv : entries_) {
        Entry& e = kv.second;
        if (e.producing || e.pins > 0) continue;
        std::set<std::string> live;
        for (const auto& o : e.owners) {
            if (live_job_ids.count(o)) live.insert(o);
        }
        if (live.empty()) {
            dead.push_back(kv.first);
        } else if (live.size() != e.owners.size()) {
            e.owners = live;
            write_meta_locked(kv.first, e);
        }
    }
    for (const auto& key : dead) {
        xfer_log("cache: purging orphan " + key);
        remove_entry_locked(key);
        removed++;
    }

    // Directories without a complete entry are crashed productions
    std::error_code ec;
    for (const auto& d : fs::directory_iterator(dir_, ec)) {
        std::string key = d.path().filename().string();
        if (entries_.count(key)) continue;
        xfer_log("cache: removing stale partial " + key);
        fs::remove_all(d.path(), ec);
        removed++;
    }
    return removed;
}

void CompressionCache::discard_incomplete(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    for (const auto& d : fs::directory_iterator(dir_, ec)) {
        std::string key = d.path().filename().string();
        if (entries_.count(key)) continue;   // complete, or a live production cleaning up itself

        std::ifstream marker(d.path() / PRODUCER_NAME);
        std::string producer;
        std::getline(marker, producer);
        trim(producer);
        if (producer == job_id) {
            xfer_log(fmt::format("cache: discarding partial {} of {}", key, job_id));
            fs::remove_all(d.path(), ec);
        }
    }
}

void CompressionCache::release_owner(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> dead;
    for (auto& kv : entries_) {
        Entry& e = kv.second;
        if (!e.owners.erase(job_id)) continue;
        if (e.owners.empty() && e.pins == 0 && !e.producing) {
            dead.push_back(kv.first);
        } else {
            write_meta_locked(kv.first, e);
        }
    }
    for (const auto& key : dead) remove_entry_locked(key);
}
