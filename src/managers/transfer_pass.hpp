#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include "transfer_job.hpp"
#include "retry_controller.hpp"

class JobLedger;

// Outcome of one pass of a pipeline over a job. A pass never sleeps: anything
// that has to wait comes back as Rescheduled with the persisted resume time.
struct PassResult {
    enum class Kind { Completed, Rescheduled, Failed, Cancelled };

    Kind kind = Kind::Completed;
    TransferJob job;            // ledger record after the pass
    TimePoint resume_at;        // Rescheduled
};

struct PipelineOptions {
    uint64_t chunk_bytes = DEFAULT_CHUNK_BYTES;
    uint64_t max_object_bytes = MAX_SINGLE_OBJECT_BYTES;
};

// Polled before every chunk. Cancel fails the job; Suspend ends the pass
// leaving the job resumable from its last checkpoint (engine shutdown).
enum class PassControl { Continue, Cancel, Suspend };
using ControlCheck = std::function<PassControl(const std::string& job_id)>;

// Shared pass endings. Each writes the ledger before returning.
Result<PassResult> fail_pass(JobLedger& ledger, const TransferJob& job, ErrorClass cls,
                             const std::string& error);

Result<PassResult> wait_pass(JobLedger& ledger, const TransferJob& job, JobState state,
                             TimePoint resume_at, const std::string& reason);

// Apply a failed store call: Retrying with backoff, or Failed.
Result<PassResult> store_failure_pass(JobLedger& ledger, RetryController& retry,
                                      const TransferJob& job, const StoreError& error,
                                      TimePoint now);

PassControl poll_control(const ControlCheck& check, const std::string& job_id);

// End the pass for a Cancel or Suspend request.
Result<PassResult> stop_pass(JobLedger& ledger, const TransferJob& job, PassControl ctl,
                             TimePoint now);
