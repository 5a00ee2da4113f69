#include "transfer_gate.hpp"
#include "job_ledger.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <algorithm>

TransferGate::TransferGate(JobLedger& ledger, GatePolicy policy)
    : ledger_(ledger), policy_(std::move(policy)) {}

bool TransferGate::metered(Direction direction) const {
    return direction == Direction::Upload ? policy_.count_uploads : policy_.count_downloads;
}

Result<Admission> TransferGate::admit(uint64_t n, Direction direction, TimePoint now) {
    uint64_t limit = policy_.monthly_limit_bytes;
    bool quota_applies = limit > 0 && metered(direction);

    if (quota_applies && n > limit) {
        return Result<Admission>::Ok(Admission::deny(ErrorClass::PermanentlyTooLarge,
            fmt::format("chunk of {} exceeds the monthly limit of {}",
                        format_bytes(n), format_bytes(limit))));
    }

    std::chrono::seconds needed{0};
    if (policy_.throughput_bytes_per_sec > 0) {
        uint64_t secs = (n + policy_.throughput_bytes_per_sec - 1) / policy_.throughput_bytes_per_sec;
        needed = std::chrono::seconds(static_cast<int64_t>(secs));
    }
    TimePoint start = policy_.schedule.start_for(now, needed);

    if (!quota_applies) {
        if (start > now) {
            return Result<Admission>::Ok(Admission::wait_until(start, "outside transfer window"));
        }
        return Result<Admission>::Ok(Admission::proceed());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string month = month_key(now);
    auto rec = ledger_.load_quota(month);
    if (rec.is_err()) return Result<Admission>::Err(rec.error);

    uint64_t used = rec.value.bytes_used;
    uint64_t held = held_[month];
    if (used + n > limit) {
        return Result<Admission>::Ok(Admission::wait_until(start_of_next_month(now),
            fmt::format("monthly quota reached ({} of {} used)",
                        format_bytes(used), format_bytes(limit))));
    }
    if (used + held + n > limit) {
        // Fits only if some in-flight chunk fails; look again once they settle.
        return Result<Admission>::Ok(Admission::wait_until(
            now + std::chrono::seconds(QUOTA_HOLD_RECHECK_SECS),
            fmt::format("{} of quota held by chunks in flight", format_bytes(held))));
    }
    if (start > now) {
        return Result<Admission>::Ok(Admission::wait_until(start, "outside transfer window"));
    }

    Admission a = Admission::proceed();
    a.held_bytes = n;
    a.held_month = month;
    held_[month] = held + n;
    return Result<Admission>::Ok(a);
}

void TransferGate::drop_hold_locked(const Admission& admission) {
    if (admission.held_bytes == 0) return;
    auto it = held_.find(admission.held_month);
    if (it == held_.end()) return;
    it->second -= std::min(it->second, admission.held_bytes);
    if (it->second == 0) held_.erase(it);
}

void TransferGate::release(const Admission& admission) {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_hold_locked(admission);
}

Result<void> TransferGate::commit(const Admission& admission, uint64_t n, Direction direction,
                                  TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto r = record_locked(n, direction, now);
    drop_hold_locked(admission);
    return r;
}

uint64_t TransferGate::held_bytes(const std::string& month_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(month_key);
    return it == held_.end() ? 0 : it->second;
}

Result<void> TransferGate::record_usage(uint64_t n, Direction direction, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return record_locked(n, direction, now);
}

Result<void> TransferGate::record_locked(uint64_t n, Direction direction, TimePoint now) {
    auto rec = ledger_.load_quota(month_key(now));
    if (rec.is_err()) return Result<void>::Err(rec.error);

    QuotaRecord q = rec.value;
    if (metered(direction)) q.bytes_used += n;
    if (direction == Direction::Upload) {
        q.upload_bytes += n;
    } else {
        q.download_bytes += n;
    }
    q.bytes_limit = policy_.monthly_limit_bytes;

    auto w = ledger_.save_quota(q);
    if (w.is_err()) return w;
    return Result<void>::Ok();
}
