#include "job_ledger.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/durable_file.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>

static const char* JOB_EXT = ".yaml";

std::string to_string(RestoreState s) {
    switch (s) {
        case RestoreState::NotChecked:        return "not_checked";
        case RestoreState::AlreadyAccessible: return "already_accessible";
        case RestoreState::Archived:          return "archived";
        case RestoreState::RestoreRequested:  return "restore_requested";
        case RestoreState::Restoring:         return "restoring";
        case RestoreState::Restored:          return "restored";
        case RestoreState::RestoreFailed:     return "restore_failed";
    }
    return "not_checked";
}

bool parse_restore_state(const std::string& s, RestoreState& out) {
    static const RestoreState all[] = {
        RestoreState::NotChecked, RestoreState::AlreadyAccessible, RestoreState::Archived,
        RestoreState::RestoreRequested, RestoreState::Restoring, RestoreState::Restored,
        RestoreState::RestoreFailed,
    };
    for (auto st : all) {
        if (to_string(st) == s) { out = st; return true; }
    }
    return false;
}

// ── YAML encoding ───────────────────────────────────────────

static TimePoint time_field(const YAML::Node& n, const char* key) {
    auto t = parse_iso_utc(n[key].as<std::string>(""));
    if (!t) throw std::runtime_error(fmt::format("bad time in field '{}'", key));
    return *t;
}

static std::string emit_job(const TransferJob& j) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << j.id;
    out << YAML::Key << "direction" << YAML::Value << to_string(j.direction);
    out << YAML::Key << "local_path" << YAML::Value << j.local_path;
    out << YAML::Key << "object_key" << YAML::Value << j.object_key;
    out << YAML::Key << "storage_class" << YAML::Value << to_string(j.storage_class);
    out << YAML::Key << "size_bytes" << YAML::Value << j.size_bytes;
    out << YAML::Key << "size_known" << YAML::Value << j.size_known;
    out << YAML::Key << "cursor" << YAML::Value << j.cursor;
    out << YAML::Key << "digest_state" << YAML::Value << j.digest_state;
    out << YAML::Key << "final_digest" << YAML::Value << j.final_digest;
    out << YAML::Key << "state" << YAML::Value << to_string(j.state);
    out << YAML::Key << "retry_count" << YAML::Value << j.retry_count;
    out << YAML::Key << "next_attempt_at" << YAML::Value << to_iso_utc(j.next_attempt_at);
    out << YAML::Key << "failure" << YAML::Value << to_string(j.failure);
    out << YAML::Key << "last_error" << YAML::Value << j.last_error;
    out << YAML::Key << "created_at" << YAML::Value << to_iso_utc(j.created_at);
    out << YAML::Key << "last_progress_at" << YAML::Value << to_iso_utc(j.last_progress_at);
    out << YAML::Key << "finished_at" << YAML::Value << to_iso_utc(j.finished_at);
    out << YAML::EndMap;
    return out.c_str();
}

static TransferJob parse_job(const YAML::Node& n) {
    TransferJob j;
    j.id = n["id"].as<std::string>("");
    if (j.id.empty()) throw std::runtime_error("missing id");
    j.direction = direction_from_string(n["direction"].as<std::string>("upload"));
    j.local_path = n["local_path"].as<std::string>("");
    j.object_key = n["object_key"].as<std::string>("");
    if (!parse_storage_class(n["storage_class"].as<std::string>("STANDARD"), j.storage_class)) {
        throw std::runtime_error("bad storage_class");
    }
    j.size_bytes = n["size_bytes"].as<uint64_t>(0);
    j.size_known = n["size_known"].as<bool>(false);
    j.cursor = n["cursor"].as<uint64_t>(0);
    j.digest_state = n["digest_state"].as<std::string>("");
    j.final_digest = n["final_digest"].as<std::string>("");
    if (!parse_job_state(n["state"].as<std::string>(""), j.state)) {
        throw std::runtime_error("bad state");
    }
    j.retry_count = n["retry_count"].as<int>(0);
    j.next_attempt_at = time_field(n, "next_attempt_at");
    j.failure = error_class_from_string(n["failure"].as<std::string>("none"));
    j.last_error = n["last_error"].as<std::string>("");
    j.created_at = time_field(n, "created_at");
    j.last_progress_at = time_field(n, "last_progress_at");
    j.finished_at = time_field(n, "finished_at");
    return j;
}

// ── PendingJobs ─────────────────────────────────────────────

std::optional<TransferJob> PendingJobs::next() {
    if (!listed_) {
        listed_ = true;
        std::error_code ec;
        fs::path dir = ledger_.state_dir_ / "jobs";
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& p = it->path();
            if (p.extension() != JOB_EXT) continue;
            ids_.push_back(p.stem().string());
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            errors_.push_back(fmt::format("listing {}: {}", dir.string(), ec.message()));
        }
        std::sort(ids_.begin(), ids_.end());
    }

    while (pos_ < ids_.size()) {
        const std::string& id = ids_[pos_++];

        // A crash between archiving and unlinking leaves both records; the
        // archived one is authoritative.
        if (fs::exists(ledger_.archive_path(id))) {
            auto rm = platform::remove_durable(ledger_.job_path(id));
            if (rm.is_err()) errors_.push_back(rm.error);
            continue;
        }

        auto r = ledger_.read_job(ledger_.job_path(id));
        if (r.is_err()) {
            // Vanished between listing and reading (forgotten or finished).
            if (!fs::exists(ledger_.job_path(id))) continue;
            errors_.push_back(r.error);
            continue;
        }
        if (is_terminal(r.value.state)) continue;
        return r.value;
    }
    return std::nullopt;
}

void PendingJobs::rewind() {
    ids_.clear();
    errors_.clear();
    pos_ = 0;
    listed_ = false;
}

// ── JobLedger ───────────────────────────────────────────────

JobLedger::JobLedger(fs::path state_dir, const Clock& clock)
    : state_dir_(std::move(state_dir)), clock_(clock) {}

fs::path JobLedger::job_path(const std::string& job_id) const {
    return state_dir_ / "jobs" / (job_id + JOB_EXT);
}

fs::path JobLedger::archive_path(const std::string& job_id) const {
    return state_dir_ / "archive" / (job_id + JOB_EXT);
}

fs::path JobLedger::quota_path(const std::string& month_key) const {
    return state_dir_ / "quota" / (month_key + ".yaml");
}

fs::path JobLedger::ticket_path(const std::string& object_key) const {
    return state_dir_ / "restore" / (escape_key(object_key) + ".yaml");
}

std::mutex& JobLedger::job_mutex(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = job_mutexes_[job_id];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

Result<TransferJob> JobLedger::read_job(const fs::path& path) const {
    auto content = platform::read_file(path);
    if (content.is_err()) return Result<TransferJob>::Err(content.error);
    try {
        return Result<TransferJob>::Ok(parse_job(YAML::Load(content.value)));
    } catch (const std::exception& e) {
        return Result<TransferJob>::Err(
            fmt::format("corrupt job record {}: {}", path.string(), e.what()));
    }
}

Result<void> JobLedger::write_job(const TransferJob& job) {
    if (!is_terminal(job.state)) {
        return platform::write_file_atomic(job_path(job.id), emit_job(job));
    }
    auto w = platform::write_file_atomic(archive_path(job.id), emit_job(job));
    if (w.is_err()) return w;
    return platform::remove_durable(job_path(job.id));
}

Result<TransferJob> JobLedger::load_active(const std::string& job_id) {
    if (fs::exists(archive_path(job_id))) {
        return Result<TransferJob>::Err(
            fmt::format("job {} has already finished", job_id));
    }
    if (!fs::exists(job_path(job_id))) {
        return Result<TransferJob>::Err(fmt::format("no such job: {}", job_id));
    }
    return read_job(job_path(job_id));
}

Result<CreateOutcome> JobLedger::create(const TransferJob& job) {
    if (job.id.empty()) return Result<CreateOutcome>::Err("job has no id");
    std::lock_guard<std::mutex> lock(job_mutex(job.id));

    for (const fs::path& p : {job_path(job.id), archive_path(job.id)}) {
        if (!fs::exists(p)) continue;
        auto existing = read_job(p);
        if (existing.is_err()) return Result<CreateOutcome>::Err(existing.error);
        return Result<CreateOutcome>::Ok(CreateOutcome{existing.value, false});
    }

    TransferJob fresh = job;
    fresh.state = JobState::Pending;
    if (fresh.created_at == TimePoint{}) fresh.created_at = clock_.now();
    auto w = write_job(fresh);
    if (w.is_err()) return Result<CreateOutcome>::Err(w.error);

    append_job_log(fresh.id, fmt::format("created: {} {} <-> {} ({})",
                                         to_string(fresh.direction), fresh.local_path,
                                         fresh.object_key,
                                         fresh.size_known ? format_bytes(fresh.size_bytes)
                                                          : "size unknown"));
    return Result<CreateOutcome>::Ok(CreateOutcome{fresh, true});
}

Result<TransferJob> JobLedger::find(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    if (fs::exists(archive_path(job_id))) return read_job(archive_path(job_id));
    if (fs::exists(job_path(job_id))) return read_job(job_path(job_id));
    return Result<TransferJob>::Err(fmt::format("no such job: {}", job_id));
}

bool JobLedger::exists(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    return fs::exists(job_path(job_id)) || fs::exists(archive_path(job_id));
}

PendingJobs JobLedger::load_pending() {
    return PendingJobs(*this);
}

Result<std::vector<TransferJob>> JobLedger::list_all() {
    std::vector<TransferJob> jobs;
    std::vector<std::string> seen;

    for (const char* sub : {"jobs", "archive"}) {
        std::error_code ec;
        fs::path dir = state_dir_ / sub;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& p = it->path();
            if (p.extension() != JOB_EXT) continue;
            std::string id = p.stem().string();
            if (std::find(seen.begin(), seen.end(), id) != seen.end()) continue;
            auto r = find(id);
            if (r.is_err()) return Result<std::vector<TransferJob>>::Err(r.error);
            seen.push_back(id);
            jobs.push_back(r.value);
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Result<std::vector<TransferJob>>::Err(
                fmt::format("listing {}: {}", dir.string(), ec.message()));
        }
    }

    std::sort(jobs.begin(), jobs.end(), [](const TransferJob& a, const TransferJob& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return Result<std::vector<TransferJob>>::Ok(std::move(jobs));
}

Result<TransferJob> JobLedger::checkpoint(const std::string& job_id, uint64_t new_cursor,
                                          const std::string& digest_state) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    auto r = load_active(job_id);
    if (r.is_err()) return r;
    TransferJob job = r.value;

    if (new_cursor < job.cursor) {
        return Result<TransferJob>::Err(fmt::format(
            "checkpoint for {} would move cursor back from {} to {}",
            job_id, job.cursor, new_cursor));
    }
    if (job.size_known && new_cursor > job.size_bytes) {
        return Result<TransferJob>::Err(fmt::format(
            "checkpoint for {} past end: {} > {}", job_id, new_cursor, job.size_bytes));
    }

    job.cursor = new_cursor;
    job.digest_state = digest_state;
    job.last_progress_at = clock_.now();
    auto w = write_job(job);
    if (w.is_err()) return Result<TransferJob>::Err(w.error);
    return Result<TransferJob>::Ok(job);
}

Result<TransferJob> JobLedger::transition(const std::string& job_id, JobState to,
                                          const TransitionDetail& detail) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    auto r = load_active(job_id);
    if (r.is_err()) return r;
    TransferJob job = r.value;

    if (!transition_allowed(job.direction, job.state, to)) {
        return Result<TransferJob>::Err(fmt::format(
            "illegal transition for {} job {}: {} -> {}", to_string(job.direction),
            job_id, to_string(job.state), to_string(to)));
    }

    JobState from = job.state;
    job.state = to;
    if (detail.next_attempt_at) job.next_attempt_at = *detail.next_attempt_at;
    if (!detail.error.empty()) job.last_error = detail.error;

    if (to == JobState::Completed) {
        job.final_digest = detail.final_digest;
        job.failure = ErrorClass::None;
        job.last_error.clear();
        job.next_attempt_at = TimePoint{};
        job.finished_at = clock_.now();
    } else if (to == JobState::Failed) {
        job.failure = detail.failure;
        job.next_attempt_at = TimePoint{};
        job.finished_at = clock_.now();
    }

    auto w = write_job(job);
    if (w.is_err()) return Result<TransferJob>::Err(w.error);

    if (from != to) {
        std::string msg = fmt::format("{} -> {}", to_string(from), to_string(to));
        if (to == JobState::Failed) {
            msg += fmt::format(" ({}: {})", to_string(job.failure), job.last_error);
        } else if (to == JobState::Completed && !job.final_digest.empty()) {
            msg += " sha256=" + job.final_digest;
        } else if (job.next_attempt_at != TimePoint{}) {
            msg += " until " + to_iso_utc(job.next_attempt_at);
        }
        append_job_log(job_id, msg);
    }
    return Result<TransferJob>::Ok(job);
}

Result<TransferJob> JobLedger::set_retry(const std::string& job_id, int retry_count,
                                         TimePoint next_attempt_at,
                                         const std::string& last_error) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    auto r = load_active(job_id);
    if (r.is_err()) return r;
    TransferJob job = r.value;

    job.retry_count = retry_count;
    job.next_attempt_at = next_attempt_at;
    job.last_error = last_error;
    auto w = write_job(job);
    if (w.is_err()) return Result<TransferJob>::Err(w.error);
    return Result<TransferJob>::Ok(job);
}

Result<TransferJob> JobLedger::set_size(const std::string& job_id, uint64_t size_bytes) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    auto r = load_active(job_id);
    if (r.is_err()) return r;
    TransferJob job = r.value;

    if (job.cursor > size_bytes) {
        return Result<TransferJob>::Err(fmt::format(
            "size {} for {} is below its cursor {}", size_bytes, job_id, job.cursor));
    }
    job.size_bytes = size_bytes;
    job.size_known = true;
    auto w = write_job(job);
    if (w.is_err()) return Result<TransferJob>::Err(w.error);
    return Result<TransferJob>::Ok(job);
}

Result<void> JobLedger::forget(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(job_mutex(job_id));
    if (fs::exists(job_path(job_id)) && !fs::exists(archive_path(job_id))) {
        return Result<void>::Err(fmt::format(
            "job {} is still active; cancel it before forgetting it", job_id));
    }
    if (!fs::exists(archive_path(job_id))) {
        return Result<void>::Err(fmt::format("no such job: {}", job_id));
    }

    auto job = read_job(archive_path(job_id));
    if (job.is_ok() && job.value.direction == Direction::Download) {
        auto t = remove_ticket(job.value.object_key);
        if (t.is_err()) return t;
    }
    auto rm = platform::remove_durable(archive_path(job_id));
    if (rm.is_err()) return rm;
    coldxfer_log(fmt::format("ledger: forgot {}", job_id));
    return Result<void>::Ok();
}

// ── Quota ───────────────────────────────────────────────────

Result<QuotaRecord> JobLedger::load_quota(const std::string& month_key) {
    std::lock_guard<std::mutex> lock(quota_mutex_);
    QuotaRecord rec;
    rec.month_key = month_key;

    fs::path p = quota_path(month_key);
    if (!fs::exists(p)) return Result<QuotaRecord>::Ok(rec);

    auto content = platform::read_file(p);
    if (content.is_err()) return Result<QuotaRecord>::Err(content.error);
    try {
        YAML::Node root = YAML::Load(content.value);
        rec.bytes_used = root["bytes_used"].as<uint64_t>(0);
        rec.bytes_limit = root["bytes_limit"].as<uint64_t>(0);
        rec.upload_bytes = root["upload_bytes"].as<uint64_t>(0);
        rec.download_bytes = root["download_bytes"].as<uint64_t>(0);
    } catch (const std::exception& e) {
        return Result<QuotaRecord>::Err(
            fmt::format("corrupt quota record {}: {}", p.string(), e.what()));
    }
    return Result<QuotaRecord>::Ok(rec);
}

Result<void> JobLedger::save_quota(const QuotaRecord& record) {
    std::lock_guard<std::mutex> lock(quota_mutex_);
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "month" << YAML::Value << record.month_key;
    out << YAML::Key << "bytes_used" << YAML::Value << record.bytes_used;
    out << YAML::Key << "bytes_limit" << YAML::Value << record.bytes_limit;
    out << YAML::Key << "upload_bytes" << YAML::Value << record.upload_bytes;
    out << YAML::Key << "download_bytes" << YAML::Value << record.download_bytes;
    out << YAML::EndMap;
    return platform::write_file_atomic(quota_path(record.month_key), out.c_str());
}

// ── Restore tickets ─────────────────────────────────────────

Result<std::optional<RestoreTicket>> JobLedger::find_ticket(const std::string& object_key) {
    std::lock_guard<std::mutex> lock(ticket_mutex_);
    using R = Result<std::optional<RestoreTicket>>;

    fs::path p = ticket_path(object_key);
    if (!fs::exists(p)) return R::Ok(std::nullopt);

    auto content = platform::read_file(p);
    if (content.is_err()) return R::Err(content.error);
    try {
        YAML::Node n = YAML::Load(content.value);
        RestoreTicket t;
        t.object_key = n["object_key"].as<std::string>(object_key);
        if (!parse_restore_tier(n["tier"].as<std::string>("Bulk"), t.tier)) {
            throw std::runtime_error("bad tier");
        }
        if (!parse_restore_state(n["state"].as<std::string>(""), t.state)) {
            throw std::runtime_error("bad state");
        }
        t.requested_at = time_field(n, "requested_at");
        t.expected_ready_by = time_field(n, "expected_ready_by");
        t.last_checked_at = time_field(n, "last_checked_at");
        t.request_count = n["request_count"].as<int>(0);
        t.last_error = n["last_error"].as<std::string>("");
        return R::Ok(t);
    } catch (const std::exception& e) {
        return R::Err(fmt::format("corrupt restore ticket {}: {}", p.string(), e.what()));
    }
}

Result<void> JobLedger::save_ticket(const RestoreTicket& t) {
    std::lock_guard<std::mutex> lock(ticket_mutex_);
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "object_key" << YAML::Value << t.object_key;
    out << YAML::Key << "tier" << YAML::Value << to_string(t.tier);
    out << YAML::Key << "state" << YAML::Value << to_string(t.state);
    out << YAML::Key << "requested_at" << YAML::Value << to_iso_utc(t.requested_at);
    out << YAML::Key << "expected_ready_by" << YAML::Value << to_iso_utc(t.expected_ready_by);
    out << YAML::Key << "last_checked_at" << YAML::Value << to_iso_utc(t.last_checked_at);
    out << YAML::Key << "request_count" << YAML::Value << t.request_count;
    out << YAML::Key << "last_error" << YAML::Value << t.last_error;
    out << YAML::EndMap;
    return platform::write_file_atomic(ticket_path(t.object_key), out.c_str());
}

Result<void> JobLedger::remove_ticket(const std::string& object_key) {
    std::lock_guard<std::mutex> lock(ticket_mutex_);
    return platform::remove_durable(ticket_path(object_key));
}
