#pragma once

#include <core/clock.hpp>
#include <platform/digest.hpp>
#include <store/object_store.hpp>
#include "transfer_pass.hpp"
#include "transfer_gate.hpp"

class JobLedger;

// Streams one local file into one object, chunk by chunk from job.cursor.
// Per chunk: cancellation check, gate admission, local read, ranged put,
// classification, then checkpoint and quota usage.
class UploadPipeline {
public:
    UploadPipeline(ObjectStore& store, JobLedger& ledger, TransferGate& gate,
                   RetryController& retry, const Clock& clock, DigestFactory digests,
                   PipelineOptions options);

    Result<PassResult> upload(const TransferJob& job, const ControlCheck& control = {});

private:
    ObjectStore& store_;
    JobLedger& ledger_;
    TransferGate& gate_;
    RetryController& retry_;
    const Clock& clock_;
    DigestFactory digests_;
    PipelineOptions options_;
};
