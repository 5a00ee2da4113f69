#include "download_pipeline.hpp"
#include "job_ledger.hpp"
#include <core/log.hpp>
#include <platform/byte_stream.hpp>
#include <platform/durable_file.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <filesystem>

std::string partial_path(const std::string& local_path) {
    return local_path + ".part";
}

// Every byte was checkpointed and the partial file already renamed into place;
// only the Completed transition is missing.
static bool published_before_completion(const TransferJob& job) {
    if (!job.size_known || job.cursor != job.size_bytes) return false;
    std::error_code ec;
    if (std::filesystem::exists(partial_path(job.local_path), ec) || ec) return false;
    uint64_t size = std::filesystem::file_size(job.local_path, ec);
    return !ec && size == job.size_bytes;
}

DownloadPipeline::DownloadPipeline(ObjectStore& store, JobLedger& ledger, TransferGate& gate,
                                   RetryController& retry, RestoreOrchestrator& restore,
                                   const Clock& clock, DigestFactory digests,
                                   PipelineOptions options)
    : store_(store), ledger_(ledger), gate_(gate), retry_(retry), restore_(restore),
      clock_(clock), digests_(std::move(digests)), options_(options) {}

Result<PassResult> DownloadPipeline::download(const TransferJob& initial,
                                              const ControlCheck& control,
                                              const ProgressCallback& progress) {
    TransferJob job = initial;

    PassControl ctl = poll_control(control, job.id);
    if (ctl != PassControl::Continue) return stop_pass(ledger_, job, ctl, clock_.now());

    if (published_before_completion(job)) {
        auto digest = digests_();
        if (!digest->load_state(job.digest_state)) {
            return fail_pass(ledger_, job, ErrorClass::LocalIOFailure,
                             "unreadable digest state in checkpoint");
        }
        if (job.state != JobState::Streaming) {
            auto t = ledger_.transition(job.id, JobState::Streaming);
            if (t.is_err()) return Result<PassResult>::Err(t.error);
            job = t.value;
        }
        append_job_log(job.id, fmt::format("{} already in place, recording completion",
                                           job.local_path));
        return complete(job, digest->hex(), true, progress);
    }

    // ── Restore check ───────────────────────────────────────
    auto acc = restore_.ensure_accessible(job.object_key, clock_.now());
    if (acc.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, acc.error);

    switch (acc.value.kind) {
        case Accessibility::Kind::Accessible:
            break;
        case Accessibility::Kind::NotYetReady: {
            auto d = retry_.defer(job, acc.value.recheck_after, acc.value.message);
            if (d.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, d.error);
            return wait_pass(ledger_, d.value, JobState::WaitingOnRestore,
                             acc.value.recheck_after, acc.value.message);
        }
        case Accessibility::Kind::StoreFailure:
            return store_failure_pass(ledger_, retry_, job, acc.value.store_error, clock_.now());
        case Accessibility::Kind::Rejected:
            return fail_pass(ledger_, job, ErrorClass::RemoteRejected, acc.value.message);
    }

    const ObjectInfo& info = acc.value.info;
    if (!job.size_known) {
        auto s = ledger_.set_size(job.id, info.size_bytes);
        if (s.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, s.error);
        job = s.value;
    } else if (info.size_bytes != job.size_bytes) {
        return fail_pass(ledger_, job, ErrorClass::RemoteRejected,
            fmt::format("{} changed size since the download began ({} -> {})",
                        job.object_key, job.size_bytes, info.size_bytes));
    }

    if (job.state != JobState::Streaming) {
        auto t = ledger_.transition(job.id, JobState::Streaming);
        if (t.is_err()) return Result<PassResult>::Err(t.error);
        job = t.value;
    }

    // ── Local file ──────────────────────────────────────────
    std::string part = partial_path(job.local_path);
    auto sink_r = FileSink::open(part);
    if (sink_r.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, sink_r.error);
    auto sink = std::move(sink_r.value);

    auto have = sink->size();
    if (have.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, have.error);
    if (have.value < job.cursor) {
        return fail_pass(ledger_, job, ErrorClass::LocalIOFailure,
            fmt::format("{} holds {} bytes but {} were checkpointed", part,
                        have.value, job.cursor));
    }
    // Bytes past the cursor were written but never checkpointed.
    auto tr = sink->truncate(job.cursor);
    if (tr.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, tr.error);

    auto digest = digests_();
    if (!digest->load_state(job.digest_state)) {
        return fail_pass(ledger_, job, ErrorClass::LocalIOFailure,
                         "unreadable digest state in checkpoint");
    }
    if (job.cursor > 0) {
        append_job_log(job.id, fmt::format("resuming download at {} of {}",
                                           format_bytes(job.cursor), format_bytes(job.size_bytes)));
    }

    // ── Chunks ──────────────────────────────────────────────
    while (job.cursor < job.size_bytes) {
        PassControl ctl = poll_control(control, job.id);
        if (ctl != PassControl::Continue) return stop_pass(ledger_, job, ctl, clock_.now());

        uint64_t n = std::min(options_.chunk_bytes, job.size_bytes - job.cursor);
        TimePoint now = clock_.now();

        auto adm = gate_.admit(n, Direction::Download, now);
        if (adm.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, adm.error);
        if (adm.value.kind == Admission::Kind::Deny) {
            return fail_pass(ledger_, job, adm.value.deny_class, adm.value.reason);
        }
        if (adm.value.kind == Admission::Kind::WaitUntil) {
            return wait_pass(ledger_, job, JobState::Paused, adm.value.resume_at, adm.value.reason);
        }
        AdmissionGuard hold(gate_, adm.value);

        auto got = store_.get_object_range(job.object_key, job.cursor, n);
        if (got.is_err()) {
            if (got.error.code == CODE_INVALID_OBJECT_STATE) {
                // The restored copy expired under us: go back through restore.
                auto inv = restore_.invalidate(job.object_key, got.error.describe());
                if (inv.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, inv.error);
                return wait_pass(ledger_, job, JobState::WaitingOnRestore, clock_.now(),
                                 "restored copy lapsed, requesting a new restore");
            }
            return store_failure_pass(ledger_, retry_, job, got.error, clock_.now());
        }
        if (got.value.size() != n) {
            StoreError short_read;
            short_read.kind = StoreFailure::Network;
            short_read.message = fmt::format("short read: {} of {} bytes at {}",
                                             got.value.size(), n, job.cursor);
            return store_failure_pass(ledger_, retry_, job, short_read, clock_.now());
        }

        auto w = sink->write_at(job.cursor, got.value.data(), got.value.size());
        if (w.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, w.error);
        auto s = sink->sync();
        if (s.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, s.error);

        digest->update(got.value.data(), got.value.size());
        auto cp = ledger_.checkpoint(job.id, job.cursor + n, digest->save_state());
        if (cp.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, cp.error);
        job = cp.value;

        auto usage = hold.commit(n, Direction::Download, clock_.now());
        if (usage.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, usage.error);

        auto ok = retry_.record_success(job);
        if (ok.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, ok.error);
        job = ok.value;

        if (progress) progress(job.id, job.cursor, job.size_bytes);
    }

    // ── Publish ─────────────────────────────────────────────
    sink.reset();
    auto mv = platform::rename_durable(part, job.local_path);
    if (mv.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, mv.error);

    return complete(job, digest->hex(), requires_restore(info.storage_class), progress);
}

Result<PassResult> DownloadPipeline::complete(const TransferJob& job, const std::string& digest_hex,
                                              bool release_ticket,
                                              const ProgressCallback& progress) {
    TransitionDetail done;
    done.final_digest = digest_hex;
    auto t = ledger_.transition(job.id, JobState::Completed, done);
    if (t.is_err()) return Result<PassResult>::Err(t.error);

    if (release_ticket) {
        auto rel = restore_.release(job.object_key);
        if (rel.is_err()) coldxfer_log(fmt::format("restore: releasing ticket for {}: {}",
                                                   job.object_key, rel.error));
    }

    if (job.size_bytes == 0 && progress) progress(job.id, 0, 0);

    PassResult r;
    r.kind = PassResult::Kind::Completed;
    r.job = t.value;
    return Result<PassResult>::Ok(r);
}
