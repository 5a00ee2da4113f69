#include "retry_controller.hpp"
#include "job_ledger.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

std::string to_string(Classification c) {
    switch (c) {
        case Classification::Success:        return "success";
        case Classification::Transient:      return "transient";
        case Classification::RemoteRejected: return "remote_rejected";
        case Classification::LocalIOFailure: return "local_io_failure";
    }
    return "success";
}

ErrorClass to_error_class(Classification c) {
    switch (c) {
        case Classification::Success:        return ErrorClass::None;
        case Classification::Transient:      return ErrorClass::Transient;
        case Classification::RemoteRejected: return ErrorClass::RemoteRejected;
        case Classification::LocalIOFailure: return ErrorClass::LocalIOFailure;
    }
    return ErrorClass::None;
}

// Service codes that mean "slow down / try again" even on a 4xx status.
static bool is_throttling_code(const std::string& code) {
    static const char* codes[] = {
        "SlowDown", "Throttling", "ThrottlingException", "ThrottledException",
        "RequestThrottled", "RequestLimitExceeded", "TooManyRequestsException",
        "ProvisionedThroughputExceededException", "RequestTimeout",
        "RequestTimeoutException", "PriorRequestNotComplete",
    };
    for (const char* c : codes) {
        if (code == c) return true;
    }
    return false;
}

RetryController::RetryController(JobLedger& ledger, RetryPolicy policy)
    : ledger_(ledger), policy_(policy) {
    if (policy_.seed != 0) {
        rng_.seed(policy_.seed);
    } else {
        std::random_device rd;
        rng_.seed((static_cast<uint64_t>(rd()) << 32) ^ rd());
    }
}

Classification RetryController::classify(const StoreError& error) {
    switch (error.kind) {
        case StoreFailure::Network:
        case StoreFailure::Timeout:
            return Classification::Transient;
        case StoreFailure::Construction:
            return Classification::RemoteRejected;
        case StoreFailure::Service:
            break;
    }
    if (error.http_status >= 500 || error.http_status == 429 || error.http_status == 408) {
        return Classification::Transient;
    }
    if (is_throttling_code(error.code)) return Classification::Transient;
    // Service answered without a status we understand: treat like a dropped response.
    if (error.http_status == 0 && error.code.empty()) return Classification::Transient;
    return Classification::RemoteRejected;
}

std::chrono::milliseconds RetryController::backoff_for(int retry_count) {
    int64_t base = std::max<int64_t>(1, policy_.base.count());
    int64_t cap = std::max<int64_t>(base, policy_.cap.count());
    int exp = std::clamp(retry_count - 1, 0, 62);

    int64_t d = base;
    for (int i = 0; i < exp && d < cap; ++i) d *= 2;
    d = std::min(d, cap);

    int64_t half = d / 2;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<int64_t> dist(0, d - half);
    return std::chrono::milliseconds(half + dist(rng_));
}

Result<RetryDecision> RetryController::record_failure(const TransferJob& job, Classification c,
                                                      const std::string& error, TimePoint now) {
    RetryDecision d;
    d.classification = c;
    d.retry_count = job.retry_count;

    if (c != Classification::Transient) {
        append_job_log(job.id, fmt::format("fatal {} error: {}", to_string(c), error));
        return Result<RetryDecision>::Ok(d);
    }

    d.retry = true;
    d.retry_count = job.retry_count + 1;
    auto delay = backoff_for(d.retry_count);
    // The ledger keeps whole seconds; round up so a reload never resumes early.
    d.next_attempt_at = std::chrono::ceil<std::chrono::seconds>(now + delay);

    auto r = ledger_.set_retry(job.id, d.retry_count, d.next_attempt_at, error);
    if (r.is_err()) return Result<RetryDecision>::Err(r.error);

    append_job_log(job.id, fmt::format("transient error (attempt {}), retrying in {}: {}",
                                       d.retry_count,
                                       format_duration(std::chrono::duration_cast<std::chrono::seconds>(delay)),
                                       error));
    return Result<RetryDecision>::Ok(d);
}

Result<RetryDecision> RetryController::record_failure(const TransferJob& job,
                                                      const StoreError& error, TimePoint now) {
    return record_failure(job, classify(error), error.describe(), now);
}

Result<TransferJob> RetryController::record_success(const TransferJob& job) {
    if (job.retry_count == 0) return Result<TransferJob>::Ok(job);
    auto r = ledger_.set_retry(job.id, 0, TimePoint{}, job.last_error);
    if (r.is_ok()) {
        append_job_log(job.id, fmt::format("recovered after {} retries", job.retry_count));
    }
    return r;
}

Result<TransferJob> RetryController::defer(const TransferJob& job, TimePoint when,
                                           const std::string& reason) {
    return ledger_.set_retry(job.id, job.retry_count, when, reason);
}
