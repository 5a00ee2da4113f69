#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/config.hpp>
#include <core/clock.hpp>
#include <store/fs_object_store.hpp>
#include "job_ledger.hpp"
#include "transfer_gate.hpp"
#include "retry_controller.hpp"
#include "restore_orchestrator.hpp"
#include "upload_pipeline.hpp"
#include "download_pipeline.hpp"
#include "transfer_engine.hpp"

// UI-ready row for one job.
struct JobSummary {
    std::string job_id;
    std::string direction;      // "upload" / "download"
    std::string source;
    std::string destination;
    std::string state;
    std::string progress;       // "1.2 GB / 4.0 GB (30%)"
    std::string resume;         // "in 2h 5m" for waiting jobs, else ""
    std::string error;          // "<class>: <last error>" for failed jobs
};

struct QuotaSummary {
    std::string month;
    uint64_t used = 0;
    uint64_t limit = 0;         // 0 = unlimited
    uint64_t uploaded = 0;
    uint64_t downloaded = 0;
};

// Headless service facade: owns the store, the ledger and every manager built
// on top of them. Any frontend (CLI, tests) drives transfers through it.
class ColdxferService {
public:
    // `clock` defaults to the system clock.
    explicit ColdxferService(Config config, const Clock* clock = nullptr);
    ~ColdxferService();

    // Build the managers. Fails when the store root is unset or unusable.
    Result<void> open();
    bool is_open() const { return engine_ != nullptr; }

    // ── Transfers ──────────────────────────────────────────────

    Result<CreateOutcome> submit_upload(const std::string& local_path, const std::string& key,
                                        std::optional<StorageClass> storage_class = std::nullopt);
    Result<CreateOutcome> submit_download(const std::string& key, const std::string& local_path);

    // Resume every persisted job and run until none is left (or stop()).
    Result<int> run(RunMode mode = RunMode::UntilDone);
    void stop();

    Result<void> cancel(const std::string& job_id);
    Result<void> forget(const std::string& job_id);

    // ── Reporting ──────────────────────────────────────────────

    Result<std::vector<JobSummary>> list_jobs();
    Result<QuotaSummary> quota();

    void set_progress_callback(ProgressCallback cb);
    void set_pass_callback(TransferEngine::PassCallback cb);

    const Config& config() const { return config_; }
    JobLedger* ledger() { return ledger_.get(); }
    FsObjectStore* store() { return store_.get(); }
    TransferEngine* engine() { return engine_.get(); }

private:
    Config config_;
    SystemClock system_clock_;
    const Clock& clock_;

    std::unique_ptr<FsObjectStore> store_;
    std::unique_ptr<JobLedger> ledger_;
    std::unique_ptr<TransferGate> gate_;
    std::unique_ptr<RetryController> retry_;
    std::unique_ptr<RestoreOrchestrator> restore_;
    std::unique_ptr<UploadPipeline> uploads_;
    std::unique_ptr<DownloadPipeline> downloads_;
    std::unique_ptr<TransferEngine> engine_;

    void clear_managers();
    JobSummary summarize(const TransferJob& job) const;
};
