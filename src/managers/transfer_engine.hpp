#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <core/clock.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "job_ledger.hpp"
#include "upload_pipeline.hpp"
#include "download_pipeline.hpp"

struct EngineOptions {
    int concurrency = DEFAULT_CONCURRENCY;
    // Longest real-time wait before re-checking the queue.
    std::chrono::milliseconds idle_wait{ENGINE_MAX_IDLE_WAIT_MS};
};

enum class RunMode {
    UntilDone,  // return when no non-terminal job remains
    DueOnly,    // return once nothing is due now (waiting jobs stay queued)
};

// Schedules jobs onto a bounded pool of workers. Each worker takes the job with
// the earliest next_attempt_at that is due, runs one pipeline pass, and puts
// rescheduled jobs back at their persisted resume time.
class TransferEngine {
public:
    using PassCallback = std::function<void(const PassResult&)>;

    TransferEngine(JobLedger& ledger, UploadPipeline& uploads, DownloadPipeline& downloads,
                   const Clock& clock, EngineOptions options);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Create (or find) the job and queue it if it is still active.
    Result<CreateOutcome> submit_upload(const std::string& local_path,
                                        const std::string& object_key,
                                        StorageClass storage_class);
    Result<CreateOutcome> submit_download(const std::string& object_key,
                                          const std::string& local_path);

    // Queue every non-terminal job found in the ledger. Returns how many.
    Result<int> load_pending();

    void run(RunMode mode = RunMode::UntilDone);
    void stop();

    // Queued jobs fail immediately; a running job stops at its next chunk.
    Result<void> cancel(const std::string& job_id);

    Result<std::vector<TransferJob>> report();

    void set_progress_callback(ProgressCallback cb) { on_progress_ = std::move(cb); }
    void set_pass_callback(PassCallback cb) { on_pass_ = std::move(cb); }

    size_t queued_count();

private:
    void enqueue_locked(const TransferJob& job);
    void worker_loop(RunMode mode);
    // One pipeline pass; returns the job when it should be queued again.
    std::optional<TransferJob> run_pass(const std::string& job_id);
    PassControl control_for(const std::string& job_id);

    JobLedger& ledger_;
    UploadPipeline& uploads_;
    DownloadPipeline& downloads_;
    const Clock& clock_;
    EngineOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<TimePoint, std::string> queue_;   // next_attempt_at -> job id
    std::set<std::string> queued_;
    std::set<std::string> running_;
    std::set<std::string> cancel_requested_;
    std::atomic<bool> stopping_{false};

    std::vector<std::thread> workers_;
    ProgressCallback on_progress_;
    PassCallback on_pass_;
};
