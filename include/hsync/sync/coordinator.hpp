#pragma once

/**
 * @file coordinator.hpp
 * @brief Runs delta sync cycles and applies every write a resolution implies
 *
 * WHAT IT DOES:
 * One cycle is Idle -> Gathering -> Exchanging -> Reconciling -> Finalizing -> Idle.
 *
 * - Gathering:   eligible outbox entries (backoff elapsed, no pending
 *                conflict for the entity, collection not halted), plus
 *                re-queueing of dirty records that lost their entry
 * - Exchanging:  one Transport round trip, bounded by cycle_timeout
 * - Reconciling: server changes applied or routed to the resolver,
 *                reported conflicts resolved or parked for review,
 *                rejections routed to the failed partition or retry budget
 * - Finalizing:  confirmed entries cleared, records marked clean at the
 *                version that was sent, lastSyncAt advanced
 *
 * A timeout or loss of connectivity abandons the cycle with local state
 * untouched. Per-entity errors are recorded against that entity's outbox
 * entry and never stop the rest of the cycle.
 *
 * CONCURRENCY:
 * One cycle at a time; a second run_cycle() while one is in flight returns
 * immediately with Outcome::Skipped. Local writes are never blocked by a
 * cycle. resolve_conflict() waits for an in-flight reconcile to finish.
 */

#include "hsync/core/clock.hpp"
#include "hsync/core/config.hpp"
#include "hsync/core/result.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/outbox/local_writer.hpp"
#include "hsync/outbox/outbox.hpp"
#include "hsync/store/entity_store.hpp"
#include "hsync/sync/conflict.hpp"
#include "hsync/sync/conflict_store.hpp"
#include "hsync/sync/metadata.hpp"
#include "hsync/sync/protocol.hpp"
#include "hsync/sync/session.hpp"
#include "hsync/sync/transport.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hsync::sync {

struct SyncReport {
    enum class Outcome {
        Completed,
        Skipped,     ///< Another cycle was running
        Cancelled,   ///< Timeout or offline, nothing applied
        Failed       ///< Transport or storage failure, failures recorded
    };

    Outcome outcome = Outcome::Completed;
    std::string cycle_id;
    std::size_t changes_sent = 0;
    std::size_t confirmed = 0;
    std::size_t server_changes = 0;
    std::size_t applied = 0;
    std::size_t auto_resolved = 0;
    std::size_t manual_conflicts = 0;
    std::size_t rejected = 0;
    std::size_t moved_to_failed = 0;
    std::size_t entity_errors = 0;
    std::optional<Error> error;
    std::optional<Timestamp> sync_timestamp;
    std::chrono::milliseconds duration{0};

    bool ok() const { return outcome == Outcome::Completed; }
};

const char* outcome_name(SyncReport::Outcome outcome);

/// Counts a UI can poll to decide whether to alert the user.
struct SyncStats {
    std::size_t pending_operations = 0;
    std::size_t failed_operations = 0;
    std::size_t pending_conflicts = 0;
    std::size_t dirty_records = 0;
    bool is_syncing = false;

    bool needs_attention() const { return failed_operations > 0 || pending_conflicts > 0; }
};

class SyncCoordinator {
public:
    SyncCoordinator(core::SyncConfig config,
                    const core::Clock& clock,
                    store::EntityStore& store,
                    outbox::Outbox& outbox,
                    outbox::LocalWriter& writer,
                    ConflictStore& conflicts,
                    MetadataStore& metadata,
                    Transport& transport,
                    events::EventBus* bus = nullptr);

    SyncCoordinator(const SyncCoordinator&) = delete;
    SyncCoordinator& operator=(const SyncCoordinator&) = delete;

    SyncReport run_cycle();

    /**
     * @brief Apply a reviewer's decision to a pending conflict
     *
     * The client side is the record as it is now, so edits made while the
     * conflict was pending are kept by KeepClient and Merge. When the client
     * or a merge wins, the result is re-queued for upload.
     */
    Result<store::Record> resolve_conflict(const std::string& conflict_id, ResolutionChoice choice,
                                           const FieldPicks& picks = {});

    Result<std::map<std::string, FieldDiff>> conflict_diff(const std::string& conflict_id) const;

    SyncStats stats() const;

    /// Drop resolved conflicts older than the configured retention.
    Result<std::size_t> prune_resolved_conflicts();

    bool is_syncing() const noexcept { return running_.load(); }
    const ConflictResolver& resolver() const noexcept { return resolver_; }

private:
    using EntityKey = std::pair<store::Collection, std::string>;

    struct Gathered {
        DeltaRequest request;
        std::map<EntityKey, outbox::OutboxEntry> sent;
        std::vector<store::Collection> collections;
    };

    Gathered gather();
    void reconcile(const DeltaResponse& response, Gathered& gathered, SyncReport& report);
    void finalize(const DeltaResponse& response, const Gathered& gathered,
                  const std::set<EntityKey>& unconfirmed, SyncReport& report);

    Result<void> reconcile_change(const EntityChange& change, SyncReport& report);
    Result<void> reconcile_conflict(const ServerConflict& conflict, SyncReport& report);
    Result<void> apply_resolution(const store::Record& local, const store::Record& server,
                                  const Resolution& resolution, ConflictKind kind, SyncReport& report);
    Result<void> park_conflict(const store::Record& local, const store::Record& server,
                               ConflictKind kind, SyncReport& report);
    Result<void> converge(const store::Record& local, const store::Record& server, SyncReport& report);

    void fail_entry(const outbox::OutboxEntry& entry, const std::string& reason, SyncReport& report);
    void reject_entry(const outbox::OutboxEntry& entry, const std::string& reason, SyncReport& report);
    void clear_pending_at(store::Collection collection, const std::string& id, std::uint64_t version);
    void finish_failed(SyncCycle& cycle, SyncReport& report, const Gathered& gathered, const Error& error);

    template<typename Event>
    void emit(const Event& event) {
        if (bus_) bus_->emit(event);
    }

    core::SyncConfig config_;
    const core::Clock& clock_;
    store::EntityStore& store_;
    outbox::Outbox& outbox_;
    outbox::LocalWriter& writer_;
    ConflictStore& conflicts_;
    MetadataStore& metadata_;
    Transport& transport_;
    events::EventBus* bus_;
    ConflictResolver resolver_;

    std::atomic<bool> running_{false};
    mutable std::mutex apply_mutex_;
};

} // namespace hsync::sync
