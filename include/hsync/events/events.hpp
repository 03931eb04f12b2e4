/**
 * @file events.hpp
 * @brief Event types emitted by the sync core
 *
 * NAMING CONVENTION:
 * Events are past-tense: RecordWrittenEvent, SyncCompletedEvent
 */

#pragma once

#include "hsync/store/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hsync::events {

// ════════════════════════════════════════════════════════
// Record Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a local write is committed and queued
 *
 * WHO EMITS: LocalWriter (put, remove, republish)
 * WHO SUBSCRIBES: Logger, metrics, UI list refresh
 */
struct RecordWrittenEvent {
    store::Collection collection;
    std::string id;
    std::uint64_t version;
    std::string operation;  // "create", "update", "delete"
    std::chrono::system_clock::time_point timestamp;

    RecordWrittenEvent(store::Collection c, std::string record_id, std::uint64_t v, std::string op)
        : collection(c),
          id(std::move(record_id)),
          version(v),
          operation(std::move(op)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when an outbox entry lands in the failed partition
 *
 * WHO EMITS: SyncCoordinator
 * WHO SUBSCRIBES: Logger, metrics, UI "needs attention" badge
 */
struct OutboxEntryFailedEvent {
    std::string entry_id;
    store::Collection collection;
    std::string entity_id;
    std::string reason;
    bool permanent;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

struct ConflictDetectedEvent {
    std::string conflict_id;
    store::Collection collection;
    std::string entity_id;
    std::string kind;        // "status", "delete_update", ...
    bool needs_manual_review;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ConflictResolvedEvent {
    std::string conflict_id;  // empty when resolved automatically inside a cycle
    store::Collection collection;
    std::string entity_id;
    std::string strategy;     // "deleteWins", "statusPriority", "lastWriteWins", "merge", "manual"
    std::string winner;       // "client", "server", "merged"
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    std::string device_id;
    size_t change_count;
    std::chrono::system_clock::time_point timestamp;

    SyncStartedEvent(std::string id, size_t count)
        : device_id(std::move(id)),
          change_count(count),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct SyncCompletedEvent {
    std::string device_id;
    size_t changes_sent;
    size_t changes_received;
    size_t conflicts;
    std::chrono::milliseconds duration;
    std::chrono::system_clock::time_point timestamp;

    SyncCompletedEvent(std::string id, size_t sent, size_t received, size_t conflict_count,
                       std::chrono::milliseconds dur)
        : device_id(std::move(id)),
          changes_sent(sent),
          changes_received(received),
          conflicts(conflict_count),
          duration(dur),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted when a cycle ends without reconciling
 *
 * `cancelled` is true for timeouts and offline transitions, where local
 * state was left exactly as it was.
 */
struct SyncFailedEvent {
    std::string device_id;
    std::string error_message;
    bool cancelled;
    std::chrono::system_clock::time_point timestamp;

    SyncFailedEvent(std::string id, std::string err, bool was_cancelled)
        : device_id(std::move(id)),
          error_message(std::move(err)),
          cancelled(was_cancelled),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Device connectivity transition
 *
 * WHO EMITS: platform glue (network reachability callback)
 * WHO SUBSCRIBES: SyncScheduler, which starts a cycle on the way online
 */
struct ConnectivityChangedEvent {
    bool online;
    std::chrono::system_clock::time_point timestamp;

    explicit ConnectivityChangedEvent(bool is_online)
        : online(is_online),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace hsync::events
