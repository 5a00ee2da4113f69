#include "transfer_engine.hpp"
#include <core/log.hpp>
#include <platform/byte_stream.hpp>
#include <fmt/format.h>
#include <algorithm>

static constexpr std::chrono::seconds LEDGER_RETRY_DELAY{30};

// ── Construction / Destruction ──────────────────────────────

TransferEngine::TransferEngine(JobLedger& ledger, UploadPipeline& uploads,
                               DownloadPipeline& downloads, const Clock& clock,
                               EngineOptions options)
    : ledger_(ledger), uploads_(uploads), downloads_(downloads), clock_(clock),
      options_(options) {
    if (options_.concurrency < 1) options_.concurrency = 1;
}

TransferEngine::~TransferEngine() {
    stop();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

// ── Submission ──────────────────────────────────────────────

void TransferEngine::enqueue_locked(const TransferJob& job) {
    if (is_terminal(job.state)) return;
    if (queued_.count(job.id) || running_.count(job.id)) return;
    queue_.emplace(job.next_attempt_at, job.id);
    queued_.insert(job.id);
}

Result<CreateOutcome> TransferEngine::submit_upload(const std::string& local_path,
                                                    const std::string& object_key,
                                                    StorageClass storage_class) {
    std::error_code ec;
    std::string path = fs::absolute(local_path, ec).lexically_normal().string();
    if (ec) return Result<CreateOutcome>::Err(fmt::format("{}: {}", local_path, ec.message()));

    auto src = FileSource::open(path);
    if (src.is_err()) return Result<CreateOutcome>::Err(src.error);

    TransferJob job = make_upload_job(path, object_key, storage_class, src.value->size(),
                                      clock_.now());
    auto r = ledger_.create(job);
    if (r.is_err()) return r;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked(r.value.job);
    }
    cv_.notify_all();
    return r;
}

Result<CreateOutcome> TransferEngine::submit_download(const std::string& object_key,
                                                      const std::string& local_path) {
    std::error_code ec;
    std::string path = fs::absolute(local_path, ec).lexically_normal().string();
    if (ec) return Result<CreateOutcome>::Err(fmt::format("{}: {}", local_path, ec.message()));

    TransferJob job = make_download_job(object_key, path, clock_.now());
    auto r = ledger_.create(job);
    if (r.is_err()) return r;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked(r.value.job);
    }
    cv_.notify_all();
    return r;
}

Result<int> TransferEngine::load_pending() {
    auto pending = ledger_.load_pending();
    int count = 0;
    while (auto job = pending.next()) {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked(*job);
        ++count;
    }
    for (const auto& err : pending.errors()) {
        coldxfer_log("engine: skipped unreadable job record: " + err);
    }
    cv_.notify_all();
    if (!pending.errors().empty() && count == 0) {
        return Result<int>::Err(fmt::format("{} job record(s) could not be read: {}",
                                            pending.errors().size(), pending.errors().front()));
    }
    coldxfer_log(fmt::format("engine: loaded {} pending job(s)", count));
    return Result<int>::Ok(count);
}

// ── Run loop ────────────────────────────────────────────────

void TransferEngine::run(RunMode mode) {
    coldxfer_log(fmt::format("engine: starting {} worker(s)", options_.concurrency));
    for (int i = 0; i < options_.concurrency; ++i) {
        workers_.emplace_back(&TransferEngine::worker_loop, this, mode);
    }
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    coldxfer_log("engine: stopped");
}

void TransferEngine::stop() {
    stopping_ = true;
    cv_.notify_all();
}

void TransferEngine::worker_loop(RunMode mode) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        TimePoint now = clock_.now();
        bool due = !queue_.empty() && queue_.begin()->first <= now;

        if (!due) {
            bool idle = running_.empty();
            if (idle && (queue_.empty() || mode == RunMode::DueOnly)) {
                // Nothing can produce more work: let every worker exit.
                cv_.notify_all();
                return;
            }
            auto wait = options_.idle_wait;
            if (!queue_.empty()) {
                auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
                    queue_.begin()->first - now);
                wait = std::clamp(until, std::chrono::milliseconds(1), options_.idle_wait);
            }
            cv_.wait_for(lock, wait);
            continue;
        }

        std::string id = queue_.begin()->second;
        queue_.erase(queue_.begin());
        queued_.erase(id);
        running_.insert(id);

        lock.unlock();
        auto requeue = run_pass(id);
        lock.lock();

        // Requeue and clear the running mark together so no other worker can
        // pick the job up while it still looks like it is running here.
        bool cancelled = cancel_requested_.erase(id) > 0;
        running_.erase(id);
        if (requeue && !cancelled) enqueue_locked(*requeue);
        cv_.notify_all();

        if (requeue && cancelled) {
            // Cancel arrived after the last chunk check.
            lock.unlock();
            auto f = fail_pass(ledger_, *requeue, ErrorClass::Cancelled, "cancelled by operator");
            if (f.is_err()) coldxfer_log(fmt::format("engine: cancelling {}: {}", id, f.error));
            else if (on_pass_) on_pass_(f.value);
            lock.lock();
        }
    }
}

PassControl TransferEngine::control_for(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_requested_.count(job_id)) return PassControl::Cancel;
    if (stopping_) return PassControl::Suspend;
    return PassControl::Continue;
}

std::optional<TransferJob> TransferEngine::run_pass(const std::string& job_id) {
    auto found = ledger_.find(job_id);
    if (found.is_err()) {
        coldxfer_log(fmt::format("engine: {} vanished from the ledger: {}", job_id, found.error));
        return std::nullopt;
    }
    const TransferJob& job = found.value;
    if (is_terminal(job.state)) return std::nullopt;

    auto control = [this](const std::string& id) { return control_for(id); };
    auto r = job.direction == Direction::Upload
        ? uploads_.upload(job, control)
        : downloads_.download(job, control, on_progress_);

    if (r.is_err()) {
        // The ledger could not record the outcome. Unless the record has since
        // reached a terminal state elsewhere, try the job again later.
        coldxfer_log(fmt::format("engine: pass over {} failed: {}", job_id, r.error));
        auto again = ledger_.find(job_id);
        if (again.is_err() || is_terminal(again.value.state)) return std::nullopt;
        TransferJob retry_job = again.value;
        retry_job.next_attempt_at = clock_.now() + LEDGER_RETRY_DELAY;
        return retry_job;
    }

    const PassResult& pass = r.value;
    if (on_pass_) on_pass_(pass);

    if (pass.kind != PassResult::Kind::Rescheduled || stopping_) return std::nullopt;
    TransferJob next = pass.job;
    next.next_attempt_at = pass.resume_at;
    return next;
}

// ── Cancellation / reporting ────────────────────────────────

Result<void> TransferEngine::cancel(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.count(job_id)) {
            cancel_requested_.insert(job_id);
            append_job_log(job_id, "cancel requested, stopping at next checkpoint");
            return Result<void>::Ok();
        }
        if (queued_.count(job_id)) {
            for (auto it = queue_.begin(); it != queue_.end(); ++it) {
                if (it->second == job_id) {
                    queue_.erase(it);
                    break;
                }
            }
            queued_.erase(job_id);
        }
    }
    cv_.notify_all();

    auto found = ledger_.find(job_id);
    if (found.is_err()) return Result<void>::Err(found.error);
    if (is_terminal(found.value.state)) {
        return Result<void>::Err(fmt::format("job {} already {}", job_id,
                                             to_string(found.value.state)));
    }

    auto r = fail_pass(ledger_, found.value, ErrorClass::Cancelled, "cancelled by operator");
    if (r.is_err()) return Result<void>::Err(r.error);
    return Result<void>::Ok();
}

Result<std::vector<TransferJob>> TransferEngine::report() {
    return ledger_.list_all();
}

size_t TransferEngine::queued_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
