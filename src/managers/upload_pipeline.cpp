#include "upload_pipeline.hpp"
#include "job_ledger.hpp"
#include <core/log.hpp>
#include <platform/byte_stream.hpp>
#include <fmt/format.h>
#include <algorithm>

UploadPipeline::UploadPipeline(ObjectStore& store, JobLedger& ledger, TransferGate& gate,
                               RetryController& retry, const Clock& clock,
                               DigestFactory digests, PipelineOptions options)
    : store_(store), ledger_(ledger), gate_(gate), retry_(retry), clock_(clock),
      digests_(std::move(digests)), options_(options) {}

Result<PassResult> UploadPipeline::upload(const TransferJob& initial, const ControlCheck& control) {
    TransferJob job = initial;

    // Objects are never split: refuse before a single byte goes out.
    if (job.size_bytes > options_.max_object_bytes) {
        return fail_pass(ledger_, job, ErrorClass::OversizedSource,
            fmt::format("{} is {}, larger than the {} single-object limit", job.local_path,
                        format_bytes(job.size_bytes), format_bytes(options_.max_object_bytes)));
    }

    auto src_r = FileSource::open(job.local_path);
    if (src_r.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, src_r.error);
    auto source = std::move(src_r.value);

    if (source->size() != job.size_bytes) {
        return fail_pass(ledger_, job, ErrorClass::LocalIOFailure,
            fmt::format("{} changed size since the upload began ({} -> {})", job.local_path,
                        job.size_bytes, source->size()));
    }

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
    if (job.cursor > 0) {
        append_job_log(job.id, fmt::format("resuming upload at {} of {}",
                                           format_bytes(job.cursor), format_bytes(job.size_bytes)));
    }

    // A zero-byte file still needs one (empty) put to create the object.
    bool empty_put = job.size_bytes == 0;
    std::string chunk;

    while (job.cursor < job.size_bytes || empty_put) {
        PassControl ctl = poll_control(control, job.id);
        if (ctl != PassControl::Continue) return stop_pass(ledger_, job, ctl, clock_.now());

        uint64_t n = std::min(options_.chunk_bytes, job.size_bytes - job.cursor);
        TimePoint now = clock_.now();

        auto adm = gate_.admit(n, Direction::Upload, now);
        if (adm.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, adm.error);
        if (adm.value.kind == Admission::Kind::Deny) {
            return fail_pass(ledger_, job, adm.value.deny_class, adm.value.reason);
        }
        if (adm.value.kind == Admission::Kind::WaitUntil) {
            return wait_pass(ledger_, job, JobState::Paused, adm.value.resume_at, adm.value.reason);
        }
        AdmissionGuard hold(gate_, adm.value);

        auto rd = source->read_exact(job.cursor, static_cast<size_t>(n), chunk);
        if (rd.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, rd.error);

        MemorySource body(chunk, job.cursor);
        auto ack = store_.put_object(job.object_key, body, job.cursor, n, job.size_bytes,
                                     job.storage_class);
        if (ack.is_err()) {
            return store_failure_pass(ledger_, retry_, job, ack.error, clock_.now());
        }

        digest->update(chunk.data(), chunk.size());
        auto cp = ledger_.checkpoint(job.id, job.cursor + n, digest->save_state());
        if (cp.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, cp.error);
        job = cp.value;

        auto usage = hold.commit(n, Direction::Upload, clock_.now());
        if (usage.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, usage.error);

        auto ok = retry_.record_success(job);
        if (ok.is_err()) return fail_pass(ledger_, job, ErrorClass::LocalIOFailure, ok.error);
        job = ok.value;

        empty_put = false;
    }

    TransitionDetail done;
    done.final_digest = digest->hex();
    auto t = ledger_.transition(job.id, JobState::Completed, done);
    if (t.is_err()) return Result<PassResult>::Err(t.error);

    PassResult r;
    r.kind = PassResult::Kind::Completed;
    r.job = t.value;
    return Result<PassResult>::Ok(r);
}
