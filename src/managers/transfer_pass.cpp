#include "transfer_pass.hpp"
#include "job_ledger.hpp"
#include <fmt/format.h>

Result<PassResult> fail_pass(JobLedger& ledger, const TransferJob& job, ErrorClass cls,
                             const std::string& error) {
    TransitionDetail detail;
    detail.failure = cls;
    detail.error = error;
    auto t = ledger.transition(job.id, JobState::Failed, detail);
    if (t.is_err()) {
        return Result<PassResult>::Err(fmt::format(
            "failing {} ({}: {}): {}", job.id, to_string(cls), error, t.error));
    }

    PassResult r;
    r.kind = cls == ErrorClass::Cancelled ? PassResult::Kind::Cancelled
                                          : PassResult::Kind::Failed;
    r.job = t.value;
    return Result<PassResult>::Ok(r);
}

Result<PassResult> wait_pass(JobLedger& ledger, const TransferJob& job, JobState state,
                             TimePoint resume_at, const std::string& reason) {
    TransitionDetail detail;
    detail.next_attempt_at = resume_at;
    detail.error = reason;
    auto t = ledger.transition(job.id, state, detail);
    if (t.is_err()) return Result<PassResult>::Err(t.error);

    PassResult r;
    r.kind = PassResult::Kind::Rescheduled;
    r.job = t.value;
    r.resume_at = resume_at;
    return Result<PassResult>::Ok(r);
}

Result<PassResult> store_failure_pass(JobLedger& ledger, RetryController& retry,
                                      const TransferJob& job, const StoreError& error,
                                      TimePoint now) {
    auto d = retry.record_failure(job, error, now);
    if (d.is_err()) return fail_pass(ledger, job, ErrorClass::LocalIOFailure, d.error);

    if (!d.value.retry) {
        return fail_pass(ledger, job, to_error_class(d.value.classification), error.describe());
    }
    return wait_pass(ledger, job, JobState::Retrying, d.value.next_attempt_at, error.describe());
}

PassControl poll_control(const ControlCheck& check, const std::string& job_id) {
    return check ? check(job_id) : PassControl::Continue;
}

Result<PassResult> stop_pass(JobLedger& ledger, const TransferJob& job, PassControl ctl,
                             TimePoint now) {
    if (ctl == PassControl::Cancel) {
        return fail_pass(ledger, job, ErrorClass::Cancelled, "cancelled by operator");
    }
    PassResult r;
    r.kind = PassResult::Kind::Rescheduled;
    r.job = job;
    r.resume_at = now;
    return Result<PassResult>::Ok(r);
}
