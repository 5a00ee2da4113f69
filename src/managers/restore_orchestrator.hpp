#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <core/types.hpp>
#include <core/time_utils.hpp>
#include <store/object_store.hpp>
#include "job_ledger.hpp"

struct RestorePolicy {
    RestoreTier tier = RestoreTier::Bulk;
    int days = 1;                               // lifetime of the restored copy
    std::chrono::seconds poll{1800};            // head-probe interval while restoring
};

struct Accessibility {
    enum class Kind {
        Accessible,     // GET will work now
        NotYetReady,    // restore requested or running; probe again at recheck_after
        StoreFailure,   // head/restore call failed; classify store_error
        Rejected,       // restore refused by the service, ticket is RestoreFailed
    };

    Kind kind = Kind::Accessible;
    ObjectInfo info;
    TimePoint recheck_after;
    StoreError store_error;
    std::string message;
};

// Upper-bound time for a restore of `cls` at `tier` to become readable.
std::chrono::seconds estimated_restore_time(StorageClass cls, RestoreTier tier);

// Drives archive-tier objects through request -> wait -> readable. Never blocks
// on a running restore: callers get NotYetReady with a time to probe again and
// reschedule themselves. The ticket for each key is persisted in the ledger so
// a restart keeps polling instead of requesting a second restore.
class RestoreOrchestrator {
public:
    RestoreOrchestrator(ObjectStore& store, JobLedger& ledger, RestorePolicy policy);

    Result<Accessibility> ensure_accessible(const std::string& object_key, TimePoint now);

    // A read hit InvalidObjectState: the restored copy lapsed. The next
    // ensure_accessible() requests one new restore.
    Result<void> invalidate(const std::string& object_key, const std::string& reason);

    // Download finished; the ticket is no longer needed.
    Result<void> release(const std::string& object_key);

    const RestorePolicy& policy() const { return policy_; }

private:
    std::mutex& key_mutex(const std::string& object_key);

    // Tier actually requested for `cls` (deep archive has no expedited tier).
    RestoreTier tier_for(StorageClass cls) const;

    Result<Accessibility> request_restore(RestoreTicket& ticket, const ObjectInfo& info,
                                          TimePoint now);
    Accessibility not_yet_ready(const RestoreTicket& ticket, const ObjectInfo& info,
                                TimePoint now) const;

    ObjectStore& store_;
    JobLedger& ledger_;
    RestorePolicy policy_;

    std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> key_mutexes_;
};
