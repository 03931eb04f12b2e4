#include "hsync/sync/coordinator.hpp"
#include "hsync/core/id.hpp"
#include "hsync/events/events.hpp"
#include "hsync/store/payload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hsync::sync {
namespace {

class RunningGuard {
public:
    explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningGuard() { flag_.store(false); }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

/// Run one entity's reconciliation; a throwing third-party call becomes an error.
template<typename Fn>
Result<void> per_entity(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return Err<void>(ErrorKind::Validation, e.what());
    }
}

bool same_state(const store::Record& a, const store::Record& b) {
    return a.is_deleted == b.is_deleted && store::payload_equal(a.payload, b.payload);
}

} // namespace

const char* outcome_name(SyncReport::Outcome outcome) {
    switch (outcome) {
        case SyncReport::Outcome::Completed: return "completed";
        case SyncReport::Outcome::Skipped: return "skipped";
        case SyncReport::Outcome::Cancelled: return "cancelled";
        case SyncReport::Outcome::Failed: return "failed";
    }
    return "failed";
}

SyncCoordinator::SyncCoordinator(core::SyncConfig config,
                                 const core::Clock& clock,
                                 store::EntityStore& store,
                                 outbox::Outbox& outbox,
                                 outbox::LocalWriter& writer,
                                 ConflictStore& conflicts,
                                 MetadataStore& metadata,
                                 Transport& transport,
                                 events::EventBus* bus)
    : config_(std::move(config)),
      clock_(clock),
      store_(store),
      outbox_(outbox),
      writer_(writer),
      conflicts_(conflicts),
      metadata_(metadata),
      transport_(transport),
      bus_(bus) {}

// ============================================================================
// Cycle
// ============================================================================

SyncReport SyncCoordinator::run_cycle() {
    SyncReport report;

    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        report.outcome = SyncReport::Outcome::Skipped;
        report.error = Error(ErrorKind::Busy, "a sync cycle is already running");
        spdlog::debug("[SyncCoordinator] Cycle requested while another is running, skipped");
        return report;
    }
    RunningGuard guard(running_);

    SyncCycle cycle(core::generate_id());
    report.cycle_id = cycle.cycle_id();
    if (auto started = cycle.start(); started.is_error()) {
        report.outcome = SyncReport::Outcome::Failed;
        report.error = started.error();
        return report;
    }

    // ── Gathering ───────────────────────────────────────────
    Gathered gathered = gather();
    report.changes_sent = gathered.request.pending_changes.size();
    cycle.set_changes_sent(report.changes_sent);
    emit(events::SyncStartedEvent(config_.device_id, report.changes_sent));

    // ── Exchanging ──────────────────────────────────────────
    (void)cycle.transition_to(CycleState::Exchanging);
    auto response = transport_.exchange(gathered.request, config_.cycle_timeout);

    if (response.is_ok() && cycle.elapsed() > config_.cycle_timeout) {
        response = Err<DeltaResponse>(ErrorKind::Timeout, "cycle deadline passed before reconciling");
    }

    if (response.is_error()) {
        const auto& error = response.error();
        if (core::is_cancellation(error)) {
            cycle.abandon(error.message);
            report.outcome = SyncReport::Outcome::Cancelled;
            report.error = error;
            report.duration = cycle.elapsed();
            spdlog::info("[SyncCoordinator] Cycle {} cancelled ({}): {}",
                        report.cycle_id, core::to_string(error.kind), error.message);
            emit(events::SyncFailedEvent(config_.device_id, error.message, true));
            return report;
        }
        finish_failed(cycle, report, gathered, error);
        return report;
    }

    std::lock_guard lock(apply_mutex_);

    // ── Reconciling ─────────────────────────────────────────
    (void)cycle.transition_to(CycleState::Reconciling);
    reconcile(response.value(), gathered, report);

    // ── Finalizing ──────────────────────────────────────────
    (void)cycle.transition_to(CycleState::Finalizing);
    std::set<EntityKey> unconfirmed;
    for (const auto& conflict : response.value().conflicts) {
        unconfirmed.emplace(conflict.collection, conflict.entity_id);
    }
    for (const auto& rejection : response.value().rejected) {
        unconfirmed.emplace(rejection.collection, rejection.entity_id);
    }
    finalize(response.value(), gathered, unconfirmed, report);

    (void)cycle.transition_to(CycleState::Idle);
    report.duration = cycle.elapsed();

    if (report.outcome == SyncReport::Outcome::Completed) {
        report.sync_timestamp = response.value().sync_timestamp;
        emit(events::SyncCompletedEvent(config_.device_id, report.changes_sent, report.server_changes,
                                        report.auto_resolved + report.manual_conflicts, report.duration));
    } else if (report.error) {
        emit(events::SyncFailedEvent(config_.device_id, report.error->message, false));
    }
    return report;
}

SyncCoordinator::Gathered SyncCoordinator::gather() {
    Gathered gathered;
    gathered.request.device_id = config_.device_id;

    std::set<EntityKey> dead_lettered;
    for (const auto& entry : outbox_.failed_entries()) {
        dead_lettered.emplace(entry.collection, entry.entity_id);
    }

    for (auto collection : store::all_collections()) {
        if (store_.is_halted(collection)) {
            spdlog::warn("[SyncCoordinator] Collection '{}' is halted, not syncing it",
                        store::collection_name(collection));
            continue;
        }
        gathered.collections.push_back(collection);

        if (auto at = metadata_.last_sync_at(collection)) {
            gathered.request.last_sync[collection] = *at;
        }

        // A dirty record must always have an outbox entry
        for (const auto& record : store_.dirty_records(collection)) {
            if (dead_lettered.count({collection, record.id}) || outbox_.find_pending(collection, record.id)) {
                continue;
            }
            auto op = record.is_deleted ? outbox::Operation::Delete
                    : record.version == 1 ? outbox::Operation::Create : outbox::Operation::Update;
            auto queued = outbox_.enqueue(record, op);
            if (queued.is_error()) {
                spdlog::error("[SyncCoordinator] Could not re-queue dirty record '{}': {}",
                             record.id, queued.error().message);
            } else {
                spdlog::warn("[SyncCoordinator] Re-queued dirty record '{}' that had no outbox entry", record.id);
            }
        }
    }

    for (const auto& entry : outbox_.eligible_entries(clock_.now())) {
        if (std::find(gathered.collections.begin(), gathered.collections.end(), entry.collection) ==
            gathered.collections.end()) {
            continue;
        }
        if (conflicts_.pending_for(entry.collection, entry.entity_id)) {
            continue;  // held until a reviewer decides
        }
        if (config_.max_changes_per_cycle != 0 &&
            gathered.request.pending_changes.size() >= config_.max_changes_per_cycle) {
            break;
        }

        EntityChange change;
        change.collection = entry.collection;
        change.op = entry.op;
        change.entity_id = entry.entity_id;
        change.version = entry.version;
        change.data = entry.snapshot;
        change.updated_at = entry.updated_at;
        gathered.request.pending_changes.push_back(std::move(change));
        gathered.sent.emplace(EntityKey{entry.collection, entry.entity_id}, entry);
    }
    return gathered;
}

void SyncCoordinator::finish_failed(SyncCycle& cycle, SyncReport& report, const Gathered& gathered,
                                    const Error& error) {
    cycle.abandon(error.message);
    report.outcome = SyncReport::Outcome::Failed;
    report.error = error;

    // A rejected request is a verdict on every change in it
    for (const auto& [key, entry] : gathered.sent) {
        if (error.kind == ErrorKind::PermanentRejection) {
            reject_entry(entry, error.message, report);
        } else {
            fail_entry(entry, error.message, report);
        }
    }
    for (auto collection : gathered.collections) {
        auto recorded = metadata_.record_failure(collection, error.message);
        if (recorded.is_error()) {
            spdlog::error("[SyncCoordinator] Could not record failed cycle: {}", recorded.error().message);
        }
    }

    report.duration = cycle.elapsed();
    spdlog::warn("[SyncCoordinator] Cycle {} failed ({}): {}",
                report.cycle_id, core::to_string(error.kind), error.message);
    emit(events::SyncFailedEvent(config_.device_id, error.message, false));
}

void SyncCoordinator::reconcile(const DeltaResponse& response, Gathered& gathered, SyncReport& report) {
    std::set<EntityKey> reported;
    for (const auto& conflict : response.conflicts) {
        reported.emplace(conflict.collection, conflict.entity_id);
    }

    auto participating = [&](store::Collection collection) {
        return std::find(gathered.collections.begin(), gathered.collections.end(), collection) !=
               gathered.collections.end();
    };

    // Errors are charged to the entity's entry, which then stays unconfirmed
    auto charge = [&](const EntityKey& key, const Error& error) {
        ++report.entity_errors;
        spdlog::error("[SyncCoordinator] {}/{}: {}", store::collection_name(key.first), key.second, error.message);
        auto sent = gathered.sent.find(key);
        if (sent != gathered.sent.end()) {
            fail_entry(sent->second, error.message, report);
            gathered.sent.erase(sent);
        }
    };

    for (const auto& change : response.server_changes) {
        ++report.server_changes;
        EntityKey key{change.collection, change.entity_id};
        if (reported.count(key) || !participating(change.collection)) {
            continue;
        }
        auto done = per_entity([&] { return reconcile_change(change, report); });
        if (done.is_error()) charge(key, done.error());
    }

    for (const auto& conflict : response.conflicts) {
        EntityKey key{conflict.collection, conflict.entity_id};
        if (!participating(conflict.collection)) {
            continue;
        }
        auto done = per_entity([&] { return reconcile_conflict(conflict, report); });
        if (done.is_error()) charge(key, done.error());
    }

    for (const auto& rejection : response.rejected) {
        EntityKey key{rejection.collection, rejection.entity_id};
        auto sent = gathered.sent.find(key);
        if (sent == gathered.sent.end()) {
            spdlog::warn("[SyncCoordinator] Rejection for unsent entity {}/{} ignored",
                        store::collection_name(rejection.collection), rejection.entity_id);
            continue;
        }
        ++report.rejected;

        if (rejection.permanent) {
            reject_entry(sent->second, rejection.reason, report);
        } else {
            fail_entry(sent->second, rejection.reason, report);
        }
    }
}

void SyncCoordinator::finalize(const DeltaResponse& response, const Gathered& gathered,
                               const std::set<EntityKey>& unconfirmed, SyncReport& report) {
    std::vector<outbox::Acknowledgement> acks;
    std::map<store::Collection, std::vector<store::VersionedId>> clean;

    for (const auto& [key, entry] : gathered.sent) {
        if (unconfirmed.count(key)) continue;
        acks.push_back({entry.entry_id, entry.revision});
        clean[key.first].push_back({entry.entity_id, entry.version});
        ++report.confirmed;
    }

    // Entries first: a crash in between leaves a dirty record that is simply re-queued
    auto cleared = outbox_.clear_acknowledged(acks);
    if (cleared.is_error()) {
        report.outcome = SyncReport::Outcome::Failed;
        report.error = cleared.error();
        spdlog::error("[SyncCoordinator] Could not clear acknowledged entries: {}", cleared.error().message);
        return;
    }

    for (const auto& [collection, ids] : clean) {
        auto marked = store_.mark_clean(collection, ids);
        if (marked.is_error()) {
            report.outcome = SyncReport::Outcome::Failed;
            report.error = marked.error();
            spdlog::error("[SyncCoordinator] Could not mark '{}' clean: {}",
                         store::collection_name(collection), marked.error().message);
            return;
        }
    }

    for (auto collection : gathered.collections) {
        auto recorded = metadata_.record_success(collection, response.sync_timestamp);
        if (recorded.is_error()) {
            report.outcome = SyncReport::Outcome::Failed;
            report.error = recorded.error();
            spdlog::error("[SyncCoordinator] Could not advance lastSyncAt: {}", recorded.error().message);
            return;
        }
    }

    spdlog::info("[SyncCoordinator] Cycle {} done: sent={} confirmed={} received={} applied={} "
                "auto_resolved={} manual={} rejected={}",
                report.cycle_id, report.changes_sent, report.confirmed, report.server_changes,
                report.applied, report.auto_resolved, report.manual_conflicts, report.rejected);
}

// ============================================================================
// Per-entity reconciliation
// ============================================================================

Result<void> SyncCoordinator::reconcile_change(const EntityChange& change, SyncReport& report) {
    auto server = record_from_wire(change.collection, change.entity_id, change.version, change.data,
                                   change.updated_at, change.op == outbox::Operation::Delete);
    if (server.is_error()) return Err<void>(server.error());

    if (store_.is_retired(change.collection, change.entity_id)) {
        spdlog::debug("[SyncCoordinator] Change for retired id '{}' ignored", change.entity_id);
        return Ok();
    }

    auto local = store_.get(change.collection, change.entity_id);

    // Held entities only refresh their conflict
    if (local && conflicts_.pending_for(change.collection, change.entity_id)) {
        auto kind = !local->is_dirty && server.value().version < local->version
                  ? ConflictKind::VersionRollback
                  : ConflictResolver::classify(*local, server.value());
        return park_conflict(*local, server.value(), kind, report);
    }

    if (!local || !local->is_dirty) {
        if (local && local->version > server.value().version) {
            if (same_state(*local, server.value())) {
                spdlog::debug("[SyncCoordinator] Older echo of '{}' (v{} < local v{}) ignored",
                             change.entity_id, server.value().version, local->version);
                return Ok();
            }
            spdlog::warn("[SyncCoordinator] Server sent '{}' at v{} below local v{}, held for review",
                        change.entity_id, server.value().version, local->version);
            return park_conflict(*local, server.value(), ConflictKind::VersionRollback, report);
        }

        store::RemoteState state;
        state.id = change.entity_id;
        state.payload = server.value().payload;
        state.version = server.value().version;
        state.updated_at = server.value().updated_at;
        state.is_deleted = server.value().is_deleted;
        state.modified_by = server.value().last_modified_by;
        state.expected_local_version = local ? local->version : 0;

        auto applied = store_.apply_remote(change.collection, state);
        if (applied.is_error()) {
            if (applied.error().kind == ErrorKind::Busy) {
                spdlog::debug("[SyncCoordinator] '{}' changed locally meanwhile, left for the next cycle",
                             change.entity_id);
                return Ok();
            }
            return Err<void>(applied.error());
        }
        ++report.applied;
        return Ok();
    }

    if (same_state(*local, server.value())) {
        return converge(*local, server.value(), report);
    }

    auto resolution = resolver_.resolve(*local, server.value());
    return apply_resolution(*local, server.value(), resolution,
                            ConflictResolver::classify(*local, server.value()), report);
}

Result<void> SyncCoordinator::reconcile_conflict(const ServerConflict& conflict, SyncReport& report) {
    auto server = record_from_wire(conflict.collection, conflict.entity_id, conflict.server_version,
                                   conflict.server_data);
    if (server.is_error()) return Err<void>(server.error());

    auto local = store_.get(conflict.collection, conflict.entity_id);
    if (!local) {
        return Err<void>(not_found("conflict reported for unknown entity '" + conflict.entity_id + "'"));
    }

    auto kind = conflict.kind.value_or(ConflictResolver::classify(*local, server.value()));

    if (conflicts_.pending_for(conflict.collection, conflict.entity_id)) {
        return park_conflict(*local, server.value(), kind, report);
    }
    if (same_state(*local, server.value())) {
        return converge(*local, server.value(), report);
    }

    auto resolution = resolver_.resolve(*local, server.value());
    return apply_resolution(*local, server.value(), resolution, kind, report);
}

Result<void> SyncCoordinator::converge(const store::Record& local, const store::Record& server,
                                       SyncReport& report) {
    store::RemoteState state;
    state.id = local.id;
    state.payload = server.payload;
    state.version = server.version;
    state.updated_at = std::max(local.updated_at, server.updated_at);
    state.is_deleted = server.is_deleted;
    state.modified_by = server.last_modified_by.empty() ? local.last_modified_by : server.last_modified_by;
    state.expected_local_version = local.version;

    auto applied = store_.apply_remote(local.collection, state);
    if (applied.is_error()) {
        if (applied.error().kind == ErrorKind::Busy) return Ok();
        return Err<void>(applied.error());
    }
    clear_pending_at(local.collection, local.id, local.version);
    ++report.applied;
    return Ok();
}

Result<void> SyncCoordinator::park_conflict(const store::Record& local, const store::Record& server,
                                            ConflictKind kind, SyncReport& report) {
    ConflictRecord conflict;
    conflict.collection = local.collection;
    conflict.entity_id = local.id;
    conflict.client_version = local.version;
    conflict.server_version = server.version;
    conflict.client = local;
    conflict.server = server;
    conflict.kind = kind;
    conflict.needs_manual_review = true;

    auto stored = conflicts_.record(std::move(conflict));
    if (stored.is_error()) return Err<void>(stored.error());

    ++report.manual_conflicts;
    emit(events::ConflictDetectedEvent{stored.value().conflict_id, local.collection, local.id,
                                       kind_name(kind), true});
    return Ok();
}

Result<void> SyncCoordinator::apply_resolution(const store::Record& local, const store::Record& server,
                                               const Resolution& resolution, ConflictKind kind,
                                               SyncReport& report) {
    if (resolution.needs_manual_review || !resolution.resolved_payload) {
        return park_conflict(local, server, kind, report);
    }

    const auto& winner = resolution.winner == Winner::Client ? local : server;

    store::RemoteState state;
    state.id = local.id;
    state.payload = *resolution.resolved_payload;
    state.version = server.version;
    state.updated_at = winner.updated_at;
    state.is_deleted = resolution.resolved_deleted;
    state.modified_by = winner.last_modified_by;
    state.expected_local_version = local.version;

    auto applied = store_.apply_remote(local.collection, state);
    if (applied.is_error()) {
        if (applied.error().kind == ErrorKind::Busy) {
            spdlog::debug("[SyncCoordinator] '{}' changed locally during resolution, retried next cycle", local.id);
            return Ok();
        }
        return Err<void>(applied.error());
    }
    clear_pending_at(local.collection, local.id, local.version);

    if (resolution.winner != Winner::Server) {
        auto requeued = writer_.republish(local.collection, local.id);
        if (requeued.is_error()) return Err<void>(requeued.error());
    }

    ConflictRecord audit;
    audit.collection = local.collection;
    audit.entity_id = local.id;
    audit.client_version = local.version;
    audit.server_version = server.version;
    audit.client = local;
    audit.server = server;
    audit.kind = kind;
    audit.resolution = resolution;
    auto stored = conflicts_.record(std::move(audit));
    if (stored.is_error()) return Err<void>(stored.error());

    ++report.auto_resolved;
    emit(events::ConflictResolvedEvent{std::string(), local.collection, local.id,
                                       strategy_name(resolution.strategy), winner_name(resolution.winner)});
    return Ok();
}

void SyncCoordinator::fail_entry(const outbox::OutboxEntry& entry, const std::string& reason, SyncReport& report) {
    auto moved = outbox_.record_failure(entry.entry_id, reason);
    if (moved.is_error()) {
        spdlog::warn("[SyncCoordinator] Could not record failure for '{}': {}", entry.entry_id,
                    moved.error().message);
        return;
    }
    if (moved.value()) {
        ++report.moved_to_failed;
        emit(events::OutboxEntryFailedEvent{entry.entry_id, entry.collection, entry.entity_id, reason, false});
    }
}

void SyncCoordinator::reject_entry(const outbox::OutboxEntry& entry, const std::string& reason,
                                   SyncReport& report) {
    auto rejected = outbox_.reject(entry.entry_id, reason);
    if (rejected.is_error()) {
        spdlog::error("[SyncCoordinator] Could not reject entry '{}': {}", entry.entry_id,
                     rejected.error().message);
        return;
    }
    ++report.moved_to_failed;
    emit(events::OutboxEntryFailedEvent{entry.entry_id, entry.collection, entry.entity_id, reason, true});
}

void SyncCoordinator::clear_pending_at(store::Collection collection, const std::string& id, std::uint64_t version) {
    auto pending = outbox_.find_pending(collection, id);
    if (!pending || pending->version != version) {
        return;
    }
    auto cleared = outbox_.clear_acknowledged({{pending->entry_id, pending->revision}});
    if (cleared.is_error()) {
        spdlog::error("[SyncCoordinator] Could not clear entry '{}': {}", pending->entry_id,
                     cleared.error().message);
    }
}

// ============================================================================
// Manual resolution and stats
// ============================================================================

Result<store::Record> SyncCoordinator::resolve_conflict(const std::string& conflict_id, ResolutionChoice choice,
                                                        const FieldPicks& picks) {
    std::lock_guard lock(apply_mutex_);

    auto conflict = conflicts_.find(conflict_id);
    if (!conflict) {
        return Err<store::Record>(not_found("conflict '" + conflict_id + "' not found"));
    }
    if (conflict->is_resolved()) {
        return Err<store::Record>(ErrorKind::InvalidState, "conflict '" + conflict_id + "' already resolved");
    }

    if (auto current = store_.get(conflict->collection, conflict->entity_id)) {
        conflict->client = *current;
        conflict->client_version = current->version;
    }

    auto decided = resolver_.choose(*conflict, choice, picks);
    if (decided.is_error()) return Err<store::Record>(decided.error());
    const Resolution& resolution = decided.value();

    const auto& winner = resolution.winner == Winner::Server ? conflict->server : conflict->client;

    store::RemoteState state;
    state.id = conflict->entity_id;
    state.payload = *resolution.resolved_payload;
    state.version = conflict->server_version;
    state.updated_at = resolution.winner == Winner::Merged ? clock_.now() : winner.updated_at;
    state.is_deleted = resolution.resolved_deleted;
    state.modified_by = winner.last_modified_by;
    state.authorize_rollback = conflict->kind == ConflictKind::VersionRollback && resolution.winner == Winner::Server;

    auto applied = store_.apply_remote(conflict->collection, state);
    if (applied.is_error()) return applied;

    // The held entry is superseded by the decision
    if (auto pending = outbox_.find_pending(conflict->collection, conflict->entity_id)) {
        auto cleared = outbox_.clear_entries({pending->entry_id});
        if (cleared.is_error()) return Err<store::Record>(cleared.error());
    }

    store::Record result = applied.value();
    if (resolution.winner != Winner::Server) {
        auto requeued = writer_.republish(conflict->collection, conflict->entity_id);
        if (requeued.is_error()) return requeued;
        result = requeued.value();
    }

    auto marked = conflicts_.mark_resolved(conflict_id, resolution);
    if (marked.is_error()) return Err<store::Record>(marked.error());

    spdlog::info("[SyncCoordinator] Conflict {} on '{}' resolved: {}", conflict_id, conflict->entity_id,
                strategy_name(resolution.strategy));
    emit(events::ConflictResolvedEvent{conflict_id, conflict->collection, conflict->entity_id,
                                       strategy_name(resolution.strategy), winner_name(resolution.winner)});
    return Ok(std::move(result));
}

Result<std::map<std::string, FieldDiff>> SyncCoordinator::conflict_diff(const std::string& conflict_id) const {
    auto conflict = conflicts_.find(conflict_id);
    if (!conflict) {
        return Err<std::map<std::string, FieldDiff>>(not_found("conflict '" + conflict_id + "' not found"));
    }
    return Ok(resolver_.get_diff(*conflict));
}

SyncStats SyncCoordinator::stats() const {
    SyncStats stats;
    stats.pending_operations = outbox_.pending_count();
    stats.failed_operations = outbox_.failed_count();
    stats.pending_conflicts = conflicts_.pending_count();
    for (auto collection : store::all_collections()) {
        stats.dirty_records += store_.dirty_count(collection);
    }
    stats.is_syncing = running_.load();
    return stats;
}

Result<std::size_t> SyncCoordinator::prune_resolved_conflicts() {
    return conflicts_.prune_resolved(clock_.now() - config_.resolved_conflict_retention);
}

} // namespace hsync::sync
