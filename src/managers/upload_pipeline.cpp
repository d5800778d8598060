#include "upload_pipeline.hpp"
#include "verifier.hpp"
#include "job_log.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include <optional>

namespace {

// Streams a local file to the server in chunk-sized reads. `on_chunk`
// sees every chunk before it is handed to libcurl and may throw.
class FileUploadSource : public UploadSource {
public:
    using ChunkFn = std::function<void(const char* data, size_t len, int64_t sent)>;

    FileUploadSource(const fs::path& path, int64_t size, int64_t chunk_size, ChunkFn on_chunk)
        : in_(path, std::ios::binary), path_(path), size_(size),
          chunk_size_(chunk_size > 0 ? chunk_size : CHUNK_SIZE_BYTES),
          on_chunk_(std::move(on_chunk)) {
        if (!in_) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("cannot open {}", path.string()));
        }
    }

    int64_t size() const override { return size_; }

    size_t read(char* buf, size_t len) override {
        if (sent_ >= size_) return 0;
        int64_t want = std::min<int64_t>({static_cast<int64_t>(len), chunk_size_, size_ - sent_});
        in_.read(buf, want);
        auto got = static_cast<size_t>(in_.gcount());
        if (got == 0) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("{} shrank while uploading ({} of {} bytes)",
                                            path_.string(), sent_, size_));
        }
        sent_ += static_cast<int64_t>(got);
        if (on_chunk_) on_chunk_(buf, got, sent_);
        return got;
    }

    bool complete() const { return sent_ == size_; }

private:
    std::ifstream in_;
    fs::path path_;
    int64_t size_;
    int64_t chunk_size_;
    int64_t sent_ = 0;
    ChunkFn on_chunk_;
};

int64_t file_size_or_throw(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot stat {}: {}", path.string(), ec.message()));
    }
    return static_cast<int64_t>(size);
}

nlohmann::json supplement_value(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception&) {
        return nlohmann::json(text);
    }
}

// True when every wanted key is already present with an equal JSON value.
bool supplements_match(const std::map<std::string, std::string>& wanted,
                       const std::map<std::string, std::string>& have) {
    for (const auto& [key, value] : wanted) {
        auto it = have.find(key);
        if (it == have.end() || supplement_value(it->second) != supplement_value(value)) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string UploadPipeline::upload_name(const ResourceSpec& spec, bool compressed) {
    if (!compressed || ends_with_ci(spec.name, ".gz")) return spec.name;
    return spec.name + ".gz";
}

StepOutcome UploadPipeline::run_step(Job& job, StepContext& ctx) {
    switch (job.state()) {
        case JobState::Init:         return StepOutcome::advanced();
        case JobState::Parsing:      return parse(job, ctx);
        case JobState::WaitingDisk:  return wait_disk(job, ctx);
        case JobState::Compressing:  return compress(job, ctx);
        case JobState::Transferring: return transfer(job, ctx);
        case JobState::Verifying:    return verify(job, ctx);
        case JobState::Finalizing:   return finalize(job, ctx);
        default: break;
    }
    throw TransferError(ErrorKind::Unexpected,
                        fmt::format("no upload step for state {}", state_name(job.state())));
}

// ── Parsing ────────────────────────────────────────────────

StepOutcome UploadPipeline::parse(Job& job, StepContext& ctx) {
    const TaskDescriptor& task = job.task();
    auto checked = check_task(task);
    if (checked.is_err()) {
        throw TransferError(ErrorKind::InvalidTask, checked.error);
    }
    resource_upload_order(task);

    std::vector<int64_t> sizes;
    for (const auto& r : task.resources) {
        if (!is_readable_file(r.path)) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("resource '{}' is not readable: {}", r.name, r.path));
        }
        sizes.push_back(file_size_or_throw(r.path));
    }

    int timeout = ctx.transfer().api_timeout;
    std::string dataset_id = job.record().dataset_id;
    if (dataset_id.empty()) dataset_id = task.dataset_id;

    if (dataset_id.empty()) {
        dataset_id = ctx.remote.create_draft_dataset(task.dataset_json, timeout);
        job.update([&](JobRecord& rec) { rec.dataset_id = dataset_id; });
        if (ctx.task_map && !task.task_id.empty()) {
            auto added = ctx.task_map->add(task.task_id, dataset_id);
            if (added.is_err()) {
                xfer_log(fmt::format("[{}] warning: {}", job.id(), added.error));
            }
        }
        // The draft id is the resumption token for everything that follows
        ctx.save(job);
        job_event(job.id(), fmt::format("created draft dataset {}", dataset_id));
    } else if (!ctx.remote.dataset_exists(dataset_id, timeout)) {
        throw TransferError(ErrorKind::RemoteStateVanished,
                            fmt::format("dataset {} does not exist on the server", dataset_id));
    }

    job.update([&](JobRecord& rec) {
        rec.dataset_id = dataset_id;
        if (rec.resources.size() == task.resources.size()) {
            for (size_t i = 0; i < rec.resources.size(); ++i) {
                if (!rec.resources[i].uploaded) rec.resources[i].size = sizes[i];
            }
            return;
        }
        rec.resources.clear();
        for (size_t i = 0; i < task.resources.size(); ++i) {
            ResourceProgress p;
            p.name = task.resources[i].name;
            p.source_path = task.resources[i].path;
            p.upload_path = task.resources[i].path;
            p.size = sizes[i];
            rec.resources.push_back(p);
        }
    });
    return StepOutcome::advanced();
}

// ── Waiting for disk ───────────────────────────────────────

StepOutcome UploadPipeline::wait_disk(Job& job, StepContext& ctx) {
    JobRecord rec = job.record();
    int64_t needed = 0;
    for (const auto& r : rec.resources) {
        if (r.uploaded || !ctx.config.should_compress(r.source_path)) continue;
        if (ctx.cache.contains(CompressionCache::content_identity(r.source_path))) continue;
        // gzip output of incompressible data is marginally larger than its input
        needed += r.size + r.size / 100;
    }
    if (needed == 0) return StepOutcome::advanced();

    if (needed > ctx.cache.max_bytes()) {
        // Stays here until the cache limit is raised or resources shrink
        std::string why = fmt::format("compressed resources need {} but the cache is capped at {}",
                                      format_bytes(needed), format_bytes(ctx.cache.max_bytes()));
        if (rec.last_error.message != why) {
            job.update([&](JobRecord& jr) { jr.last_error = {ErrorKind::ResourceUnavailable, why}; });
            job_event(job.id(), "waiting: " + why);
        }
        return StepOutcome::wait_for(ctx.transfer().disk_recheck_ms);
    }

    ctx.cache.evict_if_needed(needed);
    if (ctx.cache.has_room(needed)) return StepOutcome::advanced();

    job_event(job.id(), fmt::format("waiting for {} of cache space", format_bytes(needed)));
    return StepOutcome::wait_for(ctx.transfer().disk_recheck_ms);
}

// ── Compressing ────────────────────────────────────────────

fs::path UploadPipeline::ensure_payload(Job& job, StepContext& ctx, size_t index) {
    const ResourceSpec& spec = job.task().resources[index];
    std::string key = CompressionCache::content_identity(spec.path);

    fs::path payload = ctx.cache.get_or_create(key, job.id(), [&](const fs::path& out) {
        job_event(job.id(), fmt::format("compressing {}", spec.name));
        gzip_file(spec.path, out, [&] { ctx.checkpoint(job); });
    });
    int64_t size = file_size_or_throw(payload);

    job.update([&](JobRecord& rec) {
        auto& p = rec.resources[index];
        if (p.cache_key != key) {
            // Source changed since the last run: earlier digests are void
            p.transferred = 0;
            p.sha256.clear();
            p.md5.clear();
        }
        p.cache_key = key;
        p.upload_path = payload.string();
        p.size = size;
        p.name = upload_name(spec, true);
    });
    return payload;
}

StepOutcome UploadPipeline::compress(Job& job, StepContext& ctx) {
    JobRecord rec = job.record();
    for (size_t i = 0; i < rec.resources.size(); ++i) {
        if (rec.resources[i].uploaded) continue;
        ctx.checkpoint(job);

        const ResourceSpec& spec = job.task().resources[i];
        if (ctx.config.should_compress(spec.path)) {
            ensure_payload(job, ctx, i);
            continue;
        }
        int64_t size = file_size_or_throw(spec.path);
        job.update([&](JobRecord& r) {
            auto& p = r.resources[i];
            p.name = upload_name(spec, false);
            p.upload_path = spec.path;
            p.cache_key.clear();
            p.size = size;
        });
    }
    ctx.save(job);
    return StepOutcome::advanced();
}

// ── Transferring ───────────────────────────────────────────

void UploadPipeline::send_resource(Job& job, StepContext& ctx, size_t index) {
    ResourceProgress r = job.record().resources[index];
    if (r.uploaded) return;

    const ResourceSpec& spec = job.task().resources[index];
    const TransferConfig& tc = ctx.transfer();
    const std::string dataset_id = job.record().dataset_id;

    // Cached payloads may have been evicted since compressing; pin before use
    fs::path payload = r.upload_path;
    std::optional<CachePin> pin;
    if (!r.cache_key.empty()) {
        for (int tries = 0; tries < 2; ++tries) {
            payload = ensure_payload(job, ctx, index);
            pin.emplace(ctx.cache, job.record().resources[index].cache_key);
            if (fs::exists(payload)) break;
            pin.reset();
        }
        if (!pin) {
            throw TransferError(ErrorKind::ConnectionError,
                                fmt::format("cached payload for {} vanished", r.name));
        }
        r = job.record().resources[index];
    }

    if (!r.force_replace) {
        auto existing = ctx.remote.find_resource(dataset_id, r.name, tc.api_timeout);
        if (existing) {
            // Sent by an earlier run that died before recording it
            Digests d = hash_file(payload);
            job.update([&](JobRecord& rec) {
                auto& p = rec.resources[index];
                p.uploaded = true;
                p.resource_id = existing->id;
                p.supplements_sent = supplements_match(spec.supplements, existing->supplements);
                p.sha256 = d.sha256;
                p.md5 = d.md5;
                p.transferred = p.size;
            });
            job_event(job.id(), fmt::format("{} already on the server as {}, not sending again",
                                            r.name, existing->id));
            ctx.save(job);
            return;
        }
    }

    int64_t size = file_size_or_throw(payload);
    StreamHasher hasher;
    int64_t last_saved = 0;
    job.set_resource_transferred(index, 0, 0);

    FileUploadSource source(payload, size, tc.chunk_size,
        [&](const char* data, size_t len, int64_t sent) {
            ctx.checkpoint(job);
            hasher.update(data, len);
            job.set_resource_transferred(index, sent, static_cast<int64_t>(len));
            if (sent - last_saved >= tc.persist_interval) {
                ctx.save(job);
                last_saved = sent;
            }
        });

    ResourceMetadata meta;
    meta.name = r.name;
    if (r.force_replace) meta.replace_id = r.resource_id;

    job_event(job.id(), fmt::format("sending {} ({})", r.name, format_bytes(size)));
    RemoteResource created;
    try {
        created = ctx.remote.create_or_patch_resource(dataset_id, meta, source, tc.stream_timeout);
    } catch (const TransferError& e) {
        if (e.kind() != ErrorKind::ConnectionError || !source.complete()
            || !meta.replace_id.empty()) {
            throw;
        }
        // The whole body went out; only the response may have been lost
        auto existing = ctx.remote.find_resource(dataset_id, r.name, tc.api_timeout);
        if (!existing) throw;
        created = *existing;
        job_event(job.id(), fmt::format("response for {} lost, resource {} exists",
                                        r.name, created.id));
    }

    if (!source.complete()) {
        throw TransferError(ErrorKind::ConnectionError,
                            fmt::format("upload of {} ended after {} of {} bytes",
                                        r.name, hasher.bytes(), size));
    }
    Digests d = hasher.finish();

    job.update([&](JobRecord& rec) {
        auto& p = rec.resources[index];
        p.uploaded = true;
        p.verified = false;
        p.force_replace = false;
        p.resource_id = created.id;
        if (meta.replace_id.empty()) {
            p.supplements_sent = supplements_match(spec.supplements, created.supplements);
        }
        p.sha256 = d.sha256;
        p.md5 = d.md5;
        p.transferred = size;
    });
    ctx.save(job);
    job_event(job.id(), fmt::format("sent {} as resource {}", r.name, created.id));
}

void UploadPipeline::send_supplements(Job& job, StepContext& ctx, size_t index) {
    ResourceProgress r = job.record().resources[index];
    if (!r.uploaded || r.supplements_sent) return;

    const ResourceSpec& spec = job.task().resources[index];
    if (!spec.supplements.empty()) {
        ctx.checkpoint(job);
        ctx.remote.update_resource_supplements(job.record().dataset_id, r.resource_id,
                                               spec.supplements, ctx.transfer().api_timeout);
        job_event(job.id(), fmt::format("set {} supplements on {}", spec.supplements.size(), r.name));
    }
    job.update([&](JobRecord& rec) { rec.resources[index].supplements_sent = true; });
    ctx.save(job);
}

StepOutcome UploadPipeline::transfer(Job& job, StepContext& ctx) {
    auto order = resource_upload_order(job.task());
    RateScope rate(job);
    for (size_t i : order) {
        ctx.checkpoint(job);
        send_resource(job, ctx, i);
        send_supplements(job, ctx, i);
    }
    return StepOutcome::advanced();
}

// ── Verifying ──────────────────────────────────────────────

StepOutcome UploadPipeline::verify(Job& job, StepContext& ctx) {
    JobRecord rec = job.record();
    const TransferConfig& tc = ctx.transfer();
    bool pending = false;
    std::vector<std::string> mismatched;

    for (size_t i = 0; i < rec.resources.size(); ++i) {
        const ResourceProgress& r = rec.resources[i];
        if (r.verified) continue;
        if (!r.uploaded || r.resource_id.empty()) {
            throw TransferError(ErrorKind::VerificationMismatch,
                                fmt::format("{} was never sent", r.name));
        }
        ctx.checkpoint(job);

        Digests local{r.sha256, r.md5};
        if (local.sha256.empty()) {
            local = hash_file(r.cache_key.empty() ? fs::path(r.upload_path)
                                                  : ensure_payload(job, ctx, i));
        }

        RemoteTokens tokens;
        if (auto hash = ctx.remote.query_resource_hash(r.resource_id, tc.api_timeout)) {
            tokens.sha256 = *hash;
        } else {
            tokens.etag = ctx.remote.resource_info(r.resource_id, tc.api_timeout).etag;
        }

        VerifyResult v = verify_tokens(local, tokens);
        if (!v.available) {
            pending = true;
            continue;
        }
        if (v.match) {
            job.update([&](JobRecord& jr) {
                auto& p = jr.resources[i];
                p.verified = true;
                p.verify_method = token_kind_name(v.kind);
            });
            job_event(job.id(), fmt::format("{} verified by {}{}", r.name, token_kind_name(v.kind),
                                            v.fell_back ? " (server exposes no SHA-256)" : ""));
        } else {
            mismatched.push_back(fmt::format("{} (server {}, local {})",
                                             r.name, v.expected, v.computed));
            job.update([&](JobRecord& jr) {
                auto& p = jr.resources[i];
                p.uploaded = false;
                p.verified = false;
                p.force_replace = true;
                p.transferred = 0;
            });
        }
    }

    if (!mismatched.empty()) {
        std::string list;
        for (const auto& m : mismatched) list += (list.empty() ? "" : ", ") + m;
        ctx.save(job);
        throw TransferError(ErrorKind::VerificationMismatch, "checksum mismatch: " + list);
    }

    if (pending) {
        int polls = 0;
        job.update([&](JobRecord& jr) { polls = ++jr.verify_polls; });
        if (polls > tc.verify_max_polls) {
            job.update([](JobRecord& jr) { jr.verify_polls = 0; });
            throw TransferError(ErrorKind::ConnectionError,
                                fmt::format("server reported no checksum after {} polls", polls - 1));
        }
        return StepOutcome::wait_for(tc.verify_poll_ms);
    }

    job.update([](JobRecord& jr) { jr.verify_polls = 0; });
    return StepOutcome::advanced();
}

// ── Finalizing ─────────────────────────────────────────────

StepOutcome UploadPipeline::finalize(Job& job, StepContext& ctx) {
    JobRecord rec = job.record();
    if (rec.resources.empty()) {
        throw TransferError(ErrorKind::InvalidTask, "a dataset without resources is never activated");
    }
    for (const auto& r : rec.resources) {
        if (!r.verified) {
            throw TransferError(ErrorKind::Unexpected,
                                fmt::format("{} is not verified, refusing to activate", r.name));
        }
    }
    ctx.checkpoint(job);
    ctx.remote.activate_dataset(rec.dataset_id, ctx.transfer().activate_timeout);
    job_event(job.id(), fmt::format("dataset {} activated", rec.dataset_id));
    return StepOutcome::advanced();
}

// ── Lifecycle hooks ────────────────────────────────────────

void UploadPipeline::on_abort(Job& job, StepContext& ctx) {
    ctx.cache.discard_incomplete(job.id());
}

void UploadPipeline::on_done(Job& job, StepContext& ctx) {
    ctx.cache.release_owner(job.id());
}

void UploadPipeline::on_remove(Job& job, StepContext& ctx) {
    ctx.cache.discard_incomplete(job.id());
    ctx.cache.release_owner(job.id());
}

void UploadPipeline::reconcile(Job& job, StepContext& ctx) {
    JobState s = job.state();
    if (is_terminal(s)) return;
    JobRecord rec = job.record();
    if (rec.dataset_id.empty()) return;

    int timeout = ctx.transfer().api_timeout;
    if (!ctx.remote.dataset_exists(rec.dataset_id, timeout)) {
        job.fail({ErrorKind::RemoteStateVanished,
                  fmt::format("dataset {} no longer exists on the server", rec.dataset_id)});
        return;
    }

    bool past_transfer = s == JobState::Verifying || s == JobState::Finalizing;
    for (size_t i = 0; i < rec.resources.size(); ++i) {
        const auto& r = rec.resources[i];
        if (!r.uploaded) continue;
        if (ctx.remote.resource_exists(rec.dataset_id, r.name, timeout)) continue;

        if (past_transfer) {
            job.fail({ErrorKind::RemoteStateVanished,
                      fmt::format("resource {} no longer exists on the server", r.name)});
            return;
        }
        job.update([&](JobRecord& jr) {
            auto& p = jr.resources[i];
            p.uploaded = false;
            p.verified = false;
            p.supplements_sent = false;
            p.transferred = 0;
            p.resource_id.clear();
        });
        job_event(job.id(), fmt::format("{} missing on the server, will send it again", r.name));
    }
}
