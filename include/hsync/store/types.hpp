#pragma once

/**
 * @file types.hpp
 * @brief Record and payload types for the offline entity store
 *
 * Every entity the household app edits offline (tasks, calendar events,
 * point-ledger entries) is held locally as a Record: a versioned envelope
 * around a collection-specific payload.
 *
 * Payloads are a closed set of shapes (std::variant). Fields the server adds
 * that this build does not know about survive in `extra`, so a round trip
 * through an older client never strips them.
 */

#include "hsync/core/clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hsync::store {

using core::Timestamp;

enum class Collection {
    Tasks,
    Events,
    PointsLedger
};

/**
 * @brief Task workflow status
 *
 * Ordered for conflict resolution: Done > PendingApproval > Open.
 * The enumerator values ARE the priority, compare them directly.
 */
enum class TaskStatus {
    Open = 1,
    PendingApproval = 2,
    Done = 3
};

struct TaskPayload {
    std::string title;
    std::string description;
    std::string category;
    std::optional<std::string> due;          ///< ISO 8601, validated
    TaskStatus status = TaskStatus::Open;
    std::vector<std::string> assignees;      ///< Set semantics, merged by union
    std::int64_t points = 0;                 ///< Merged by max
    std::int64_t priority = 0;
    std::optional<std::string> claimed_by;
    nlohmann::json extra = nlohmann::json::object();
};

struct EventPayload {
    std::string title;
    std::string description;
    std::string start;                       ///< ISO 8601, required
    std::optional<std::string> end;
    bool all_day = false;
    std::vector<std::string> attendees;
    std::string color;
    std::string category;
    nlohmann::json extra = nlohmann::json::object();
};

struct LedgerEntryPayload {
    std::string user_id;
    std::int64_t delta = 0;
    std::string reason;
    std::optional<std::string> task_id;
    nlohmann::json extra = nlohmann::json::object();
};

using Payload = std::variant<TaskPayload, EventPayload, LedgerEntryPayload>;

/**
 * @brief One locally stored entity
 *
 * `version` never decreases for an id on this device, except through an
 * explicitly authorised rollback in apply_remote().
 */
struct Record {
    std::string id;
    Collection collection = Collection::Tasks;
    std::uint64_t version = 0;
    Timestamp updated_at{};
    bool is_dirty = false;
    bool is_deleted = false;
    std::string last_modified_by;
    Payload payload;
};

/// Record id paired with the version a peer acknowledged.
struct VersionedId {
    std::string id;
    std::uint64_t version = 0;
};

enum class SortKey {
    UpdatedAt,
    Version,
    Id
};

struct QueryOptions {
    std::size_t limit = 0;   ///< 0 means unlimited
    std::size_t offset = 0;
    SortKey sort = SortKey::UpdatedAt;
    bool descending = false;
    bool include_deleted = false;
};

} // namespace hsync::store
