#pragma once

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/sync/conflict.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hsync::sync {

/**
 * @brief Durable conflict log, partitioned into pending and resolved
 *
 * An entity has at most one pending conflict. Recording a newer divergence
 * for it refreshes the snapshots of the existing record, keeping its id.
 * Pending conflicts are never dropped; only resolved ones can be pruned.
 */
class ConflictStore {
public:
    ConflictStore(const core::Clock& clock, persistence::StorageBackend& backend);

    ConflictStore(const ConflictStore&) = delete;
    ConflictStore& operator=(const ConflictStore&) = delete;

    Result<void> open();

    /// Insert, or refresh the pending conflict of the same entity. Returns the stored record.
    Result<ConflictRecord> record(ConflictRecord conflict);

    Result<ConflictRecord> mark_resolved(const std::string& conflict_id, Resolution resolution);

    std::optional<ConflictRecord> find(const std::string& conflict_id) const;
    std::optional<ConflictRecord> pending_for(store::Collection collection, const std::string& entity_id) const;

    /// Pending conflicts, oldest first.
    std::vector<ConflictRecord> pending() const;
    /// Resolved conflicts, most recently resolved first.
    std::vector<ConflictRecord> resolved() const;

    std::size_t pending_count() const;
    std::size_t resolved_count() const;

    /// Delete resolved conflicts resolved before `cutoff`. @return number removed
    Result<std::size_t> prune_resolved(Timestamp cutoff);

private:
    static constexpr const char* kTable = "conflicts";

    const core::Clock& clock_;
    persistence::StorageBackend& backend_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConflictRecord> conflicts_;
};

} // namespace hsync::sync
