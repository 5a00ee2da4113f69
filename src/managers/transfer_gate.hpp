#pragma once

#include <string>
#include <map>
#include <mutex>
#include <cstdint>
#include <core/types.hpp>
#include <core/time_utils.hpp>
#include "schedule.hpp"

class JobLedger;

struct GatePolicy {
    uint64_t monthly_limit_bytes = 0;       // 0 = unlimited
    bool count_uploads = true;
    bool count_downloads = true;
    Schedule schedule;
    uint64_t throughput_bytes_per_sec = 0;  // 0 = do not fit chunks to windows
};

struct Admission {
    enum class Kind { Proceed, WaitUntil, Deny };

    Kind kind = Kind::Proceed;
    TimePoint resume_at;                    // WaitUntil
    ErrorClass deny_class = ErrorClass::None;
    std::string reason;

    // Quota held for a Proceed until it is committed or released.
    uint64_t held_bytes = 0;
    std::string held_month;

    static Admission proceed() { return Admission{}; }
    static Admission wait_until(TimePoint t, std::string why) {
        Admission a;
        a.kind = Kind::WaitUntil;
        a.resume_at = t;
        a.reason = std::move(why);
        return a;
    }
    static Admission deny(ErrorClass c, std::string why) {
        Admission a;
        a.kind = Kind::Deny;
        a.deny_class = c;
        a.reason = std::move(why);
        return a;
    }
};

// Admits, delays or refuses each chunk against the monthly byte quota and the
// allowed time-of-day windows. One instance is shared by every worker; quota
// increments go through it one at a time.
class TransferGate {
public:
    TransferGate(JobLedger& ledger, GatePolicy policy);

    // Decide whether a chunk of `n` bytes may be transferred at `now`.
    // Never admits part of a chunk. A metered Proceed holds `n` bytes of the
    // month until commit() or release(), so workers racing near the limit
    // cannot both be admitted past it.
    Result<Admission> admit(uint64_t n, Direction direction, TimePoint now);

    // The admitted chunk is durable on the receiving side: drop the hold and
    // count its bytes against the month containing `now`.
    Result<void> commit(const Admission& admission, uint64_t n, Direction direction,
                        TimePoint now);

    // The admitted chunk was not transferred.
    void release(const Admission& admission);

    // Count `n` transferred bytes against the month containing `now`. Call
    // only after the chunk is durable on the receiving side.
    Result<void> record_usage(uint64_t n, Direction direction, TimePoint now);

    const GatePolicy& policy() const { return policy_; }
    bool metered(Direction direction) const;

    // Bytes admitted but not yet committed or released.
    uint64_t held_bytes(const std::string& month_key);

private:
    void drop_hold_locked(const Admission& admission);
    Result<void> record_locked(uint64_t n, Direction direction, TimePoint now);

    JobLedger& ledger_;
    GatePolicy policy_;
    std::mutex mutex_;
    std::map<std::string, uint64_t> held_;  // month key -> bytes in flight
};

// Releases an admitted chunk's quota hold when it goes out of scope without
// being committed (store failure, cancellation, local error).
class AdmissionGuard {
public:
    AdmissionGuard(TransferGate& gate, Admission admission)
        : gate_(gate), admission_(std::move(admission)) {}
    ~AdmissionGuard() {
        if (!settled_) gate_.release(admission_);
    }

    AdmissionGuard(const AdmissionGuard&) = delete;
    AdmissionGuard& operator=(const AdmissionGuard&) = delete;

    Result<void> commit(uint64_t n, Direction direction, TimePoint now) {
        settled_ = true;
        return gate_.commit(admission_, n, direction, now);
    }

private:
    TransferGate& gate_;
    Admission admission_;
    bool settled_ = false;
};
