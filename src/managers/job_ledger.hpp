#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/types.hpp>
#include <core/clock.hpp>
#include <store/object_store.hpp>
#include "transfer_job.hpp"

namespace fs = std::filesystem;

struct QuotaRecord {
    std::string month_key;          // "2026-10"
    uint64_t bytes_used = 0;        // metered bytes, all enabled directions
    uint64_t bytes_limit = 0;       // 0 = unlimited
    uint64_t upload_bytes = 0;      // informational per-direction counters
    uint64_t download_bytes = 0;
};

enum class RestoreState {
    NotChecked,
    AlreadyAccessible,
    Archived,
    RestoreRequested,
    Restoring,
    Restored,
    RestoreFailed,
};

std::string to_string(RestoreState s);
bool parse_restore_state(const std::string& s, RestoreState& out);

struct RestoreTicket {
    std::string object_key;
    RestoreTier tier = RestoreTier::Bulk;
    RestoreState state = RestoreState::NotChecked;
    TimePoint requested_at;
    TimePoint expected_ready_by;
    TimePoint last_checked_at;
    int request_count = 0;          // restore_object calls that were accepted
    std::string last_error;
};

// Extra fields applied together with a state change.
struct TransitionDetail {
    std::optional<TimePoint> next_attempt_at;
    ErrorClass failure = ErrorClass::None;      // only for Failed
    std::string error;
    std::string final_digest;                   // only for Completed
};

struct CreateOutcome {
    TransferJob job;
    bool created = false;   // false: an equivalent active job already existed
};

class JobLedger;

// Lazy, restartable walk over the non-terminal jobs. Records are read one at a
// time; unreadable records are skipped and reported through errors().
class PendingJobs {
public:
    std::optional<TransferJob> next();
    void rewind();
    const std::vector<std::string>& errors() const { return errors_; }

private:
    friend class JobLedger;
    explicit PendingJobs(JobLedger& ledger) : ledger_(ledger) {}

    JobLedger& ledger_;
    std::vector<std::string> ids_;
    size_t pos_ = 0;
    bool listed_ = false;
    std::vector<std::string> errors_;
};

// Durable record of every transfer, quota month and restore ticket.
// Each record is its own file replaced atomically; every call that changes a
// record returns only after the change is on disk.
class JobLedger {
public:
    JobLedger(fs::path state_dir, const Clock& clock);

    const fs::path& state_dir() const { return state_dir_; }

    // ── Transfer jobs ───────────────────────────────────────
    Result<CreateOutcome> create(const TransferJob& job);
    // Active records first, then archived ones. Missing id is an error.
    Result<TransferJob> find(const std::string& job_id);
    bool exists(const std::string& job_id);

    PendingJobs load_pending();
    Result<std::vector<TransferJob>> list_all();

    // Advance cursor and digest state in one atomic write.
    Result<TransferJob> checkpoint(const std::string& job_id, uint64_t new_cursor,
                                   const std::string& digest_state);
    Result<TransferJob> transition(const std::string& job_id, JobState to,
                                   const TransitionDetail& detail = {});
    Result<TransferJob> set_retry(const std::string& job_id, int retry_count,
                                  TimePoint next_attempt_at, const std::string& last_error);
    // Downloads record the object size learned from the head probe.
    Result<TransferJob> set_size(const std::string& job_id, uint64_t size_bytes);

    // Drop a terminal job so the same transfer may be submitted again.
    Result<void> forget(const std::string& job_id);

    // ── Quota months ────────────────────────────────────────
    // A month with no record yet loads as zero usage.
    Result<QuotaRecord> load_quota(const std::string& month_key);
    Result<void> save_quota(const QuotaRecord& record);

    // ── Restore tickets ─────────────────────────────────────
    Result<std::optional<RestoreTicket>> find_ticket(const std::string& object_key);
    Result<void> save_ticket(const RestoreTicket& ticket);
    Result<void> remove_ticket(const std::string& object_key);

private:
    friend class PendingJobs;

    fs::path job_path(const std::string& job_id) const;
    fs::path archive_path(const std::string& job_id) const;
    fs::path quota_path(const std::string& month_key) const;
    fs::path ticket_path(const std::string& object_key) const;

    std::mutex& job_mutex(const std::string& job_id);

    Result<TransferJob> read_job(const fs::path& path) const;
    Result<void> write_job(const TransferJob& job);
    // Load the active record of `job_id`; terminal jobs cannot be modified.
    Result<TransferJob> load_active(const std::string& job_id);

    fs::path state_dir_;
    const Clock& clock_;

    std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> job_mutexes_;
    std::mutex quota_mutex_;
    std::mutex ticket_mutex_;
};
