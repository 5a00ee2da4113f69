#pragma once

#include <core/clock.hpp>
#include <platform/digest.hpp>
#include <store/object_store.hpp>
#include "transfer_pass.hpp"
#include "transfer_gate.hpp"
#include "restore_orchestrator.hpp"

class JobLedger;

// Partial download file kept next to the destination until the last byte lands.
std::string partial_path(const std::string& local_path);

// Streams one object into a local file with ranged reads from job.cursor.
// Archived objects go through the restore orchestrator first; while a restore
// runs the job sits in WaitingOnRestore with a persisted recheck time.
class DownloadPipeline {
public:
    DownloadPipeline(ObjectStore& store, JobLedger& ledger, TransferGate& gate,
                     RetryController& retry, RestoreOrchestrator& restore,
                     const Clock& clock, DigestFactory digests, PipelineOptions options);

    // `progress` is called after every durable chunk with (job id, done, total).
    Result<PassResult> download(const TransferJob& job, const ControlCheck& control = {},
                                const ProgressCallback& progress = {});

private:
    Result<PassResult> complete(const TransferJob& job, const std::string& digest_hex,
                                bool release_ticket, const ProgressCallback& progress);

    ObjectStore& store_;
    JobLedger& ledger_;
    TransferGate& gate_;
    RetryController& retry_;
    RestoreOrchestrator& restore_;
    const Clock& clock_;
    DigestFactory digests_;
    PipelineOptions options_;
};
