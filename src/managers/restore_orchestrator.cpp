#include "restore_orchestrator.hpp"
#include "retry_controller.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

seconds estimated_restore_time(StorageClass cls, RestoreTier tier) {
    if (cls == StorageClass::DeepArchive) {
        return tier == RestoreTier::Bulk ? seconds(hours(48)) : seconds(hours(12));
    }
    switch (tier) {
        case RestoreTier::Expedited: return seconds(minutes(5));
        case RestoreTier::Standard:  return seconds(hours(5));
        case RestoreTier::Bulk:      return seconds(hours(12));
    }
    return seconds(hours(12));
}

RestoreOrchestrator::RestoreOrchestrator(ObjectStore& store, JobLedger& ledger,
                                         RestorePolicy policy)
    : store_(store), ledger_(ledger), policy_(policy) {}

std::mutex& RestoreOrchestrator::key_mutex(const std::string& object_key) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = key_mutexes_[object_key];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

RestoreTier RestoreOrchestrator::tier_for(StorageClass cls) const {
    if (cls == StorageClass::DeepArchive && policy_.tier == RestoreTier::Expedited) {
        return RestoreTier::Standard;
    }
    return policy_.tier;
}

Accessibility RestoreOrchestrator::not_yet_ready(const RestoreTicket& ticket,
                                                 const ObjectInfo& info, TimePoint now) const {
    Accessibility a;
    a.kind = Accessibility::Kind::NotYetReady;
    a.info = info;
    a.recheck_after = now + policy_.poll;
    a.message = fmt::format("restore {} ({} tier), expected by {}",
                            to_string(ticket.state), to_string(ticket.tier),
                            to_iso_utc(ticket.expected_ready_by));
    return a;
}

Result<Accessibility> RestoreOrchestrator::request_restore(RestoreTicket& ticket,
                                                           const ObjectInfo& info,
                                                           TimePoint now) {
    ticket.tier = tier_for(info.storage_class);
    auto ack = store_.restore_object(ticket.object_key, ticket.tier, policy_.days);

    bool already = ack.is_err() && ack.error.code == CODE_RESTORE_IN_PROGRESS;
    if (ack.is_ok() || already) {
        ticket.state = RestoreState::RestoreRequested;
        ticket.requested_at = now;
        ticket.expected_ready_by = now + estimated_restore_time(info.storage_class, ticket.tier);
        ticket.last_checked_at = now;
        ticket.last_error.clear();
        ticket.request_count++;
        auto w = ledger_.save_ticket(ticket);
        if (w.is_err()) return Result<Accessibility>::Err(w.error);

        coldxfer_log(fmt::format("restore: requested {} ({}, {} day(s)){}",
                                 ticket.object_key, to_string(ticket.tier), policy_.days,
                                 already ? ", already in progress" : ""));
        return Result<Accessibility>::Ok(not_yet_ready(ticket, info, now));
    }

    Accessibility a;
    a.info = info;
    a.store_error = ack.error;
    ticket.last_checked_at = now;
    ticket.last_error = ack.error.describe();

    if (RetryController::classify(ack.error) == Classification::RemoteRejected) {
        ticket.state = RestoreState::RestoreFailed;
        a.kind = Accessibility::Kind::Rejected;
        a.message = "restore rejected: " + ticket.last_error;
    } else {
        ticket.state = RestoreState::Archived;
        a.kind = Accessibility::Kind::StoreFailure;
        a.message = ticket.last_error;
    }

    auto w = ledger_.save_ticket(ticket);
    if (w.is_err()) return Result<Accessibility>::Err(w.error);
    coldxfer_log(fmt::format("restore: request for {} failed: {}",
                             ticket.object_key, ticket.last_error));
    return Result<Accessibility>::Ok(a);
}

Result<Accessibility> RestoreOrchestrator::ensure_accessible(const std::string& object_key,
                                                             TimePoint now) {
    std::lock_guard<std::mutex> lock(key_mutex(object_key));

    auto found = ledger_.find_ticket(object_key);
    if (found.is_err()) return Result<Accessibility>::Err(found.error);

    if (found.value && found.value->state == RestoreState::RestoreFailed) {
        Accessibility a;
        a.kind = Accessibility::Kind::Rejected;
        a.message = "restore previously rejected: " + found.value->last_error;
        return Result<Accessibility>::Ok(a);
    }

    auto head = store_.head_object(object_key);
    if (head.is_err()) {
        Accessibility a;
        a.kind = Accessibility::Kind::StoreFailure;
        a.store_error = head.error;
        a.message = head.error.describe();
        return Result<Accessibility>::Ok(a);
    }
    const ObjectInfo& info = head.value;

    if (!requires_restore(info.storage_class)) {
        // Directly readable; a ticket left from an earlier class is stale.
        if (found.value) {
            auto rm = ledger_.remove_ticket(object_key);
            if (rm.is_err()) return Result<Accessibility>::Err(rm.error);
        }
        Accessibility a;
        a.kind = Accessibility::Kind::Accessible;
        a.info = info;
        return Result<Accessibility>::Ok(a);
    }

    RestoreTicket ticket;
    if (found.value) {
        ticket = *found.value;
    } else {
        ticket.object_key = object_key;
        ticket.tier = tier_for(info.storage_class);
        ticket.state = RestoreState::Archived;
    }
    RestoreState prev = ticket.state;
    ticket.last_checked_at = now;

    switch (info.restore_status) {
        case RestoreStatus::Restored: {
            ticket.state = RestoreState::Restored;
            auto w = ledger_.save_ticket(ticket);
            if (w.is_err()) return Result<Accessibility>::Err(w.error);
            if (prev != RestoreState::Restored) {
                coldxfer_log(fmt::format("restore: {} is readable until {}", object_key,
                                         info.restore_expiry.empty() ? "unknown"
                                                                     : info.restore_expiry));
            }
            Accessibility a;
            a.kind = Accessibility::Kind::Accessible;
            a.info = info;
            return Result<Accessibility>::Ok(a);
        }

        case RestoreStatus::Ongoing: {
            if (prev != RestoreState::RestoreRequested && prev != RestoreState::Restoring) {
                // Someone else asked for this restore; adopt it.
                ticket.requested_at = now;
                ticket.expected_ready_by =
                    now + estimated_restore_time(info.storage_class, ticket.tier);
            }
            ticket.state = RestoreState::Restoring;
            auto w = ledger_.save_ticket(ticket);
            if (w.is_err()) return Result<Accessibility>::Err(w.error);
            return Result<Accessibility>::Ok(not_yet_ready(ticket, info, now));
        }

        case RestoreStatus::None:
            break;
    }

    if (prev == RestoreState::RestoreRequested && now < ticket.expected_ready_by) {
        // Accepted but not yet visible in the head probe.
        auto w = ledger_.save_ticket(ticket);
        if (w.is_err()) return Result<Accessibility>::Err(w.error);
        return Result<Accessibility>::Ok(not_yet_ready(ticket, info, now));
    }

    if (prev == RestoreState::Restoring || prev == RestoreState::Restored ||
        prev == RestoreState::RestoreRequested) {
        coldxfer_log(fmt::format("restore: restored copy of {} lapsed ({}), requesting again",
                                 object_key, to_string(prev)));
    }
    return request_restore(ticket, info, now);
}

Result<void> RestoreOrchestrator::invalidate(const std::string& object_key,
                                             const std::string& reason) {
    std::lock_guard<std::mutex> lock(key_mutex(object_key));

    auto found = ledger_.find_ticket(object_key);
    if (found.is_err()) return Result<void>::Err(found.error);

    RestoreTicket ticket;
    if (found.value) {
        ticket = *found.value;
    } else {
        ticket.object_key = object_key;
        ticket.tier = policy_.tier;
    }
    if (ticket.state == RestoreState::RestoreFailed) return Result<void>::Ok();

    ticket.state = RestoreState::Archived;
    ticket.last_error = reason;
    coldxfer_log(fmt::format("restore: {} no longer readable: {}", object_key, reason));
    return ledger_.save_ticket(ticket);
}

Result<void> RestoreOrchestrator::release(const std::string& object_key) {
    std::lock_guard<std::mutex> lock(key_mutex(object_key));
    return ledger_.remove_ticket(object_key);
}
