#include "download_pipeline.hpp"
#include "verifier.hpp"
#include "job_log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace {

// Appends to the partial file. Every chunk is flushed before it counts
// toward the confirmed offset.
class FileSink : public DownloadSink {
public:
    using BeforeFn = std::function<void()>;
    using AfterFn = std::function<void(const char* data, size_t len, int64_t offset)>;

    FileSink(const fs::path& path, int64_t offset, BeforeFn before, AfterFn after)
        : out_(path, std::ios::binary | std::ios::app), path_(path), offset_(offset),
          before_(std::move(before)), after_(std::move(after)) {
        if (!out_) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("cannot open {} for writing", path.string()));
        }
    }

    void write(const char* data, size_t len) override {
        if (before_) before_();
        out_.write(data, static_cast<std::streamsize>(len));
        out_.flush();
        if (!out_) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("write to {} failed", path_.string()));
        }
        offset_ += static_cast<int64_t>(len);
        if (after_) after_(data, len, offset_);
    }

private:
    std::ofstream out_;
    fs::path path_;
    int64_t offset_;
    BeforeFn before_;
    AfterFn after_;
};

int64_t size_on_disk(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

void discard_partial(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot remove {}: {}", temp.string(), ec.message()));
    }
}

void move_into_place(const DownloadProgress& d) {
    std::error_code ec;
    fs::rename(d.temp_path, d.final_path, ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot move {} into place: {}", d.temp_path, ec.message()));
    }
}

} // namespace

std::string condensed_name(const std::string& name) {
    auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) return name + "_condensed";
    return name.substr(0, dot) + "_condensed" + name.substr(dot);
}

StepOutcome DownloadPipeline::run_step(Job& job, StepContext& ctx) {
    switch (job.state()) {
        case JobState::Init:         return StepOutcome::advanced();
        case JobState::Parsing:      return parse(job, ctx);
        case JobState::Transferring: return transfer(job, ctx);
        case JobState::Verifying:    return verify(job, ctx);
        default: break;
    }
    throw TransferError(ErrorKind::Unexpected,
                        fmt::format("no download step for state {}", state_name(job.state())));
}

// ── Parsing ────────────────────────────────────────────────

StepOutcome DownloadPipeline::parse(Job& job, StepContext& ctx) {
    const TaskDescriptor& task = job.task();
    auto checked = check_task(task);
    if (checked.is_err()) {
        throw TransferError(ErrorKind::InvalidTask, checked.error);
    }

    const TransferConfig& tc = ctx.transfer();
    RemoteResource info = ctx.remote.resource_info(task.resource_id, tc.api_timeout);
    std::string name = info.name.empty() ? task.resource_id : info.name;
    std::string dataset_dir = info.dataset_name.empty() ? info.dataset_id : info.dataset_name;

    // The condensed copy is generated by the server: no size or checksum is known
    bool condensed = task.condensed && info.mimetype == RTDC_MIMETYPE;
    int64_t expected_size = condensed ? -1 : info.size;
    std::string expected_sha256 = condensed ? "" : info.sha256;
    if (condensed) {
        name = condensed_name(name);
    } else if (task.condensed) {
        job_event(job.id(), fmt::format("{} is not RT-DC, fetching the file itself", name));
    }

    fs::path final_path = fs::path(task.download_dir) / dataset_dir / name;
    fs::path temp_path = final_path;
    temp_path += PARTIAL_SUFFIX;

    DownloadProgress prev = job.record().download;
    bool changed = (!prev.expected_sha256.empty() && !expected_sha256.empty()
                    && prev.expected_sha256 != expected_sha256)
                || (prev.expected_size >= 0 && expected_size >= 0 && prev.expected_size != expected_size);
    if (changed) {
        discard_partial(temp_path);
        job_event(job.id(), "resource changed on the server, starting over");
    }

    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        // Complete copy from an earlier run: reuse it if it matches
        if (expected_sha256.empty() || hash_file(final_path).sha256 != normalize_etag(expected_sha256)) {
            throw TransferError(ErrorKind::InvalidTask,
                                fmt::format("{} already exists", final_path.string()));
        }
        fs::rename(final_path, temp_path, ec);
        if (ec) {
            throw TransferError(ErrorKind::ResourceUnavailable,
                                fmt::format("cannot rename {}: {}", final_path.string(), ec.message()));
        }
        job_event(job.id(), fmt::format("{} already present, checking it", final_path.string()));
    }

    fs::create_directories(final_path.parent_path(), ec);
    if (ec) {
        throw TransferError(ErrorKind::ResourceUnavailable,
                            fmt::format("cannot create {}: {}",
                                        final_path.parent_path().string(), ec.message()));
    }

    int64_t offset = size_on_disk(temp_path);
    job.update([&](JobRecord& rec) {
        auto& d = rec.download;
        d.resource_name = name;
        d.dataset_id = info.dataset_id;
        d.dataset_name = dataset_dir;
        d.final_path = final_path.string();
        d.temp_path = temp_path.string();
        d.expected_size = expected_size;
        d.expected_sha256 = expected_sha256;
        d.confirmed_offset = offset;
        d.condensed = condensed;
        rec.dataset_id = info.dataset_id;
    });

    if (expected_size >= 0) {
        int64_t remaining = std::max<int64_t>(expected_size - offset, 0);
        int64_t free_bytes = platform::disk_free_bytes(final_path.parent_path());
        if (free_bytes >= 0 && free_bytes < remaining + DISK_HEADROOM_BYTES) {
            job_event(job.id(), fmt::format("waiting for disk space: need {}, {} free",
                                            format_bytes(remaining), format_bytes(free_bytes)));
            return StepOutcome::wait_for(tc.disk_recheck_ms);
        }
    }
    return StepOutcome::advanced();
}

// ── Transferring ───────────────────────────────────────────

StepOutcome DownloadPipeline::transfer(Job& job, StepContext& ctx) {
    DownloadProgress d = job.record().download;
    const TransferConfig& tc = ctx.transfer();
    fs::path temp = d.temp_path;

    int64_t offset = size_on_disk(temp);
    if (d.condensed && offset > 0) {
        // Condensed copies are regenerated per request, a partial one cannot be continued
        discard_partial(temp);
        offset = 0;
    }
    if (d.expected_size >= 0 && offset > d.expected_size) {
        job_event(job.id(), fmt::format("partial file is longer than the resource ({} > {}), starting over",
                                        offset, d.expected_size));
        discard_partial(temp);
        offset = 0;
    }

    // Bytes already on disk are hashed locally, not fetched again
    StreamHasher hasher;
    if (offset > 0) {
        hash_file_into(hasher, temp, offset, [&] { ctx.checkpoint(job); });
        job_event(job.id(), fmt::format("resuming at {}", format_bytes(offset)));
    }
    job.set_download_offset(offset, 0);

    std::string etag = d.etag;
    int64_t total = d.expected_size;
    if (total < 0 || offset < total) {
        RateScope rate(job);
        int64_t last_saved = offset;
        FileSink sink(temp, offset,
            [&] { ctx.checkpoint(job); },
            [&](const char* data, size_t len, int64_t at) {
                hasher.update(data, len);
                job.set_download_offset(at, static_cast<int64_t>(len));
                if (at - last_saved >= tc.persist_interval) {
                    ctx.save(job);
                    last_saved = at;
                }
            });
        DownloadResult res = ctx.remote.download_resource(job.task().resource_id, d.condensed,
                                                          offset, sink, tc.stream_timeout);
        if (!res.etag.empty()) etag = res.etag;
        if (total < 0) total = res.total;
    }

    int64_t received = hasher.bytes();
    if (total >= 0 && received < total) {
        ctx.save(job);
        throw TransferError(ErrorKind::ConnectionError,
                            fmt::format("download stopped at {} of {} bytes", received, total));
    }
    if (total >= 0 && received > total) {
        discard_partial(temp);
        job.set_download_offset(0, 0);
        throw TransferError(ErrorKind::VerificationMismatch,
                            fmt::format("received {} bytes, resource has {}", received, total));
    }

    Digests digests = hasher.finish();
    job.update([&](JobRecord& rec) {
        auto& p = rec.download;
        p.sha256 = digests.sha256;
        p.md5 = digests.md5;
        p.etag = etag;
        p.confirmed_offset = received;
        if (p.expected_size < 0) p.expected_size = received;
    });
    ctx.save(job);
    return StepOutcome::advanced();
}

// ── Verifying ──────────────────────────────────────────────

StepOutcome DownloadPipeline::verify(Job& job, StepContext& ctx) {
    JobRecord rec = job.record();
    const DownloadProgress& d = rec.download;
    const TransferConfig& tc = ctx.transfer();

    if (d.condensed) {
        move_into_place(d);
        job_event(job.id(), fmt::format("saved {} (condensed copy, {})", d.final_path,
                                        format_bytes(d.confirmed_offset)));
        return StepOutcome::advanced();
    }

    Digests local{d.sha256, d.md5};
    if (local.sha256.empty()) {
        local = hash_file(d.temp_path);
    }

    RemoteTokens tokens;
    tokens.sha256 = d.expected_sha256;
    tokens.etag = d.etag;
    if (tokens.sha256.empty()) {
        if (auto hash = ctx.remote.query_resource_hash(job.task().resource_id, tc.api_timeout)) {
            tokens.sha256 = *hash;
        }
    }

    VerifyResult v = verify_tokens(local, tokens);
    if (!v.available) {
        int polls = 0;
        job.update([&](JobRecord& jr) { polls = ++jr.verify_polls; });
        if (polls > tc.verify_max_polls) {
            job.update([](JobRecord& jr) { jr.verify_polls = 0; });
            throw TransferError(ErrorKind::ConnectionError,
                                fmt::format("server reported no checksum after {} polls", polls - 1));
        }
        return StepOutcome::wait_for(tc.verify_poll_ms);
    }

    if (!v.match) {
        discard_partial(d.temp_path);
        job.update([](JobRecord& jr) {
            jr.verify_polls = 0;
            jr.download.confirmed_offset = 0;
            jr.download.sha256.clear();
            jr.download.md5.clear();
        });
        ctx.save(job);
        throw TransferError(ErrorKind::VerificationMismatch,
                            fmt::format("checksum mismatch for {}: server {}, local {}",
                                        d.resource_name, v.expected, v.computed));
    }

    move_into_place(d);
    job.update([&](JobRecord& jr) {
        jr.verify_polls = 0;
        jr.download.verify_method = token_kind_name(v.kind);
    });
    job_event(job.id(), fmt::format("saved {} (verified by {}{})", d.final_path,
                                    token_kind_name(v.kind),
                                    v.fell_back ? ", server exposes no SHA-256" : ""));
    return StepOutcome::advanced();
}

// ── Lifecycle hooks ────────────────────────────────────────

void DownloadPipeline::on_abort(Job& job, StepContext&) {
    DownloadProgress d = job.record().download;
    if (d.temp_path.empty()) return;
    std::error_code ec;
    if (!fs::exists(d.temp_path, ec)) return;
    if (size_on_disk(d.temp_path) > d.confirmed_offset) {
        fs::resize_file(d.temp_path, static_cast<uintmax_t>(d.confirmed_offset), ec);
        if (ec) {
            xfer_log(fmt::format("[{}] cannot truncate {}: {}", job.id(), d.temp_path, ec.message()));
        }
    }
}

void DownloadPipeline::on_done(Job& job, StepContext&) {
    job_event(job.id(), "download complete");
}

void DownloadPipeline::on_remove(Job& job, StepContext&) {
    DownloadProgress d = job.record().download;
    if (d.temp_path.empty()) return;
    std::error_code ec;
    fs::remove(d.temp_path, ec);
    if (ec) {
        xfer_log(fmt::format("[{}] cannot remove {}: {}", job.id(), d.temp_path, ec.message()));
    }
}

void DownloadPipeline::reconcile(Job& job, StepContext& ctx) {
    JobState s = job.state();
    if (is_terminal(s) || s == JobState::Init) return;
    try {
        ctx.remote.resource_info(job.task().resource_id, ctx.transfer().api_timeout);
    } catch (const TransferError& e) {
        if (e.kind() != ErrorKind::RemoteStateVanished) throw;
        job.fail({ErrorKind::RemoteStateVanished,
                  fmt::format("resource {} no longer exists on the server: {}",
                              job.task().resource_id, e.what())});
    }
}
