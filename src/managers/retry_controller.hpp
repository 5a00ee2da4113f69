#pragma once

#include <string>
#include <mutex>
#include <random>
#include <chrono>
#include <cstdint>
#include <core/types.hpp>
#include <core/time_utils.hpp>
#include <store/object_store.hpp>
#include "transfer_job.hpp"

class JobLedger;

enum class Classification {
    Success,
    Transient,          // network, timeout, 5xx, throttling
    RemoteRejected,     // any other refusal by the service
    LocalIOFailure,     // our side: unreadable source, full disk, bad digest
};

std::string to_string(Classification c);
ErrorClass to_error_class(Classification c);

struct RetryPolicy {
    std::chrono::milliseconds base{5000};
    std::chrono::milliseconds cap{900000};
    uint64_t seed = 0;      // 0 = seed from std::random_device
};

struct RetryDecision {
    Classification classification = Classification::Success;
    bool retry = false;             // true only for Transient
    int retry_count = 0;
    TimePoint next_attempt_at;
};

// Turns store outcomes into retry-or-fail decisions and owns the persisted
// retry_count / next_attempt_at of every job. Transient failures are retried
// forever at a capped interval; the operator stops a job by cancelling it.
class RetryController {
public:
    RetryController(JobLedger& ledger, RetryPolicy policy);

    static Classification classify(const StoreError& error);

    // Delay before attempt number `retry_count` (1-based):
    // min(cap, base * 2^(retry_count-1)), then jittered into [d/2, d].
    std::chrono::milliseconds backoff_for(int retry_count);

    // Persist the outcome of a failed store call. Transient: increments the
    // count and stores the next attempt time before returning. Fatal: nothing
    // is written here; the caller fails the job.
    Result<RetryDecision> record_failure(const TransferJob& job, Classification c,
                                         const std::string& error, TimePoint now);
    Result<RetryDecision> record_failure(const TransferJob& job, const StoreError& error,
                                         TimePoint now);

    // Reset the count after a successful store call.
    Result<TransferJob> record_success(const TransferJob& job);

    // Push the next attempt out to `when` without counting a failure (restore
    // still running, gate wait).
    Result<TransferJob> defer(const TransferJob& job, TimePoint when, const std::string& reason);

    const RetryPolicy& policy() const { return policy_; }

private:
    JobLedger& ledger_;
    RetryPolicy policy_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};
