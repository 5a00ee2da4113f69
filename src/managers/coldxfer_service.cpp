#include "coldxfer_service.hpp"
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

ColdxferService::ColdxferService(Config config, const Clock* clock)
    : config_(std::move(config)), clock_(clock ? *clock : system_clock_) {}

ColdxferService::~ColdxferService() {
    clear_managers();
}

// ── Lifecycle ─────────────────────────────────────────────────

Result<void> ColdxferService::open() {
    if (is_open()) return Result<void>::Ok();

    set_log_dir(config_.log_dir());

    const auto& store_cfg = config_.store();
    if (store_cfg.root.empty()) {
        return Result<void>::Err("store.root is not set in " + default_config_path().string());
    }
    std::error_code ec;
    fs::create_directories(store_cfg.root, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("store.root {}: {}", store_cfg.root, ec.message()));
    }
    fs::create_directories(config_.state_dir(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("state_dir {}: {}", config_.state_dir().string(),
                                             ec.message()));
    }

    store_ = std::make_unique<FsObjectStore>(store_cfg.root, clock_);
    ledger_ = std::make_unique<JobLedger>(config_.state_dir(), clock_);

    GatePolicy gate_policy;
    gate_policy.monthly_limit_bytes = config_.quota().monthly_limit_bytes;
    gate_policy.count_uploads = config_.quota().count_uploads;
    gate_policy.count_downloads = config_.quota().count_downloads;
    gate_policy.schedule = Schedule(config_.schedule().windows);
    gate_policy.throughput_bytes_per_sec = config_.schedule().throughput_bytes_per_sec;
    gate_ = std::make_unique<TransferGate>(*ledger_, gate_policy);

    RetryPolicy retry_policy;
    retry_policy.base = std::chrono::milliseconds(config_.retry().base_ms);
    retry_policy.cap = std::chrono::milliseconds(config_.retry().cap_ms);
    retry_policy.seed = config_.retry().seed;
    retry_ = std::make_unique<RetryController>(*ledger_, retry_policy);

    RestorePolicy restore_policy;
    restore_policy.tier = config_.restore().tier;
    restore_policy.days = config_.restore().days;
    restore_policy.poll = std::chrono::seconds(config_.restore().poll_secs);
    restore_ = std::make_unique<RestoreOrchestrator>(*store_, *ledger_, restore_policy);

    PipelineOptions pipeline;
    pipeline.chunk_bytes = config_.transfer().chunk_bytes;
    pipeline.max_object_bytes = store_cfg.max_object_bytes;
    uploads_ = std::make_unique<UploadPipeline>(*store_, *ledger_, *gate_, *retry_, clock_,
                                                sha256_factory(), pipeline);
    downloads_ = std::make_unique<DownloadPipeline>(*store_, *ledger_, *gate_, *retry_,
                                                    *restore_, clock_, sha256_factory(),
                                                    pipeline);

    EngineOptions engine;
    engine.concurrency = config_.transfer().concurrency;
    engine_ = std::make_unique<TransferEngine>(*ledger_, *uploads_, *downloads_, clock_, engine);

    coldxfer_log(fmt::format("service: store={} state={} chunk={} concurrency={}",
                             store_cfg.root, config_.state_dir().string(),
                             pipeline.chunk_bytes, engine.concurrency));
    return Result<void>::Ok();
}

void ColdxferService::clear_managers() {
    // Engine first: its workers reference everything below it.
    engine_.reset();
    downloads_.reset();
    uploads_.reset();
    restore_.reset();
    retry_.reset();
    gate_.reset();
    ledger_.reset();
    store_.reset();
}

// ── Transfers ─────────────────────────────────────────────────

Result<CreateOutcome> ColdxferService::submit_upload(const std::string& local_path,
                                                     const std::string& key,
                                                     std::optional<StorageClass> storage_class) {
    if (!engine_) return Result<CreateOutcome>::Err("Service not open");
    return engine_->submit_upload(local_path, key,
                                  storage_class.value_or(config_.store().storage_class));
}

Result<CreateOutcome> ColdxferService::submit_download(const std::string& key,
                                                       const std::string& local_path) {
    if (!engine_) return Result<CreateOutcome>::Err("Service not open");
    return engine_->submit_download(key, local_path);
}

Result<int> ColdxferService::run(RunMode mode) {
    if (!engine_) return Result<int>::Err("Service not open");
    auto loaded = engine_->load_pending();
    if (loaded.is_err()) return loaded;
    engine_->run(mode);
    return loaded;
}

void ColdxferService::stop() {
    if (engine_) engine_->stop();
}

Result<void> ColdxferService::cancel(const std::string& job_id) {
    if (!engine_) return Result<void>::Err("Service not open");
    return engine_->cancel(job_id);
}

Result<void> ColdxferService::forget(const std::string& job_id) {
    if (!ledger_) return Result<void>::Err("Service not open");
    return ledger_->forget(job_id);
}

void ColdxferService::set_progress_callback(ProgressCallback cb) {
    if (engine_) engine_->set_progress_callback(std::move(cb));
}

void ColdxferService::set_pass_callback(TransferEngine::PassCallback cb) {
    if (engine_) engine_->set_pass_callback(std::move(cb));
}

// ── Reporting ─────────────────────────────────────────────────

JobSummary ColdxferService::summarize(const TransferJob& job) const {
    JobSummary s;
    s.job_id = job.id;
    s.direction = to_string(job.direction);
    if (job.direction == Direction::Upload) {
        s.source = job.local_path;
        s.destination = job.object_key;
    } else {
        s.source = job.object_key;
        s.destination = job.local_path;
    }
    s.state = to_string(job.state);

    if (job.size_known) {
        int pct = job.size_bytes == 0
            ? 100
            : static_cast<int>(job.cursor * 100 / job.size_bytes);
        s.progress = fmt::format("{} / {} ({}%)", format_bytes(job.cursor),
                                 format_bytes(job.size_bytes), pct);
    } else {
        s.progress = format_bytes(job.cursor) + " / ?";
    }

    if (!is_terminal(job.state) && job.state != JobState::Streaming) {
        TimePoint now = clock_.now();
        if (job.next_attempt_at > now) s.resume = format_eta(job.next_attempt_at, now);
    }

    if (job.state == JobState::Failed) {
        s.error = to_string(job.failure);
        if (!job.last_error.empty()) s.error += ": " + job.last_error;
    } else if (!job.last_error.empty() && !is_terminal(job.state)) {
        s.error = job.last_error;
    }
    return s;
}

Result<std::vector<JobSummary>> ColdxferService::list_jobs() {
    if (!engine_) return Result<std::vector<JobSummary>>::Err("Service not open");
    auto jobs = engine_->report();
    if (jobs.is_err()) return Result<std::vector<JobSummary>>::Err(jobs.error);

    std::vector<JobSummary> out;
    out.reserve(jobs.value.size());
    for (const auto& job : jobs.value) out.push_back(summarize(job));
    return Result<std::vector<JobSummary>>::Ok(out);
}

Result<QuotaSummary> ColdxferService::quota() {
    if (!ledger_) return Result<QuotaSummary>::Err("Service not open");
    std::string month = month_key(clock_.now());
    auto rec = ledger_->load_quota(month);
    if (rec.is_err()) return Result<QuotaSummary>::Err(rec.error);

    QuotaSummary q;
    q.month = month;
    q.used = rec.value.bytes_used;
    q.limit = config_.quota().monthly_limit_bytes;
    q.uploaded = rec.value.upload_bytes;
    q.downloaded = rec.value.download_bytes;
    return Result<QuotaSummary>::Ok(q);
}
