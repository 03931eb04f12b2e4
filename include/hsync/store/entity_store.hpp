#pragma once

/**
 * @file entity_store.hpp
 * @brief Versioned, per-collection record table with tombstones
 *
 * WHAT IT DOES:
 * Holds every Record this device knows about and is the only component that
 * creates, versions or deletes them. Local writes from the UI lane are
 * synchronous and never touch the network.
 *
 * CONCURRENCY MODEL:
 * One std::shared_mutex per collection:
 * - get / query / dirty_records take a shared lock
 * - put / remove / apply_remote / mark_clean / purge take a unique lock
 * Writers to the same collection are serialised, so two writers can never
 * mint the same version for one id, and a reader never sees a version
 * paired with the wrong payload. Collections do not block each other.
 *
 * WRITE HOOKS:
 * put / remove / republish accept a hook that runs while the collection lock
 * is held, after the row is persisted but before it becomes visible. The
 * LocalWriter uses it to enqueue the matching outbox entry; if the hook
 * fails, the persisted row is rolled back and nothing is committed.
 */

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/types.hpp"

#include <array>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hsync::store {

/// Server-authoritative state for one id, as handed to apply_remote().
struct RemoteState {
    std::string id;
    Payload payload;
    std::uint64_t version = 0;
    Timestamp updated_at{};
    bool is_deleted = false;
    std::string modified_by;
    bool authorize_rollback = false;                 ///< Allow version to drop below local
    std::optional<std::uint64_t> expected_local_version; ///< Refuse if local moved on meanwhile
};

class EntityStore {
public:
    using WriteHook = std::function<Result<void>(const Record&)>;
    using Predicate = std::function<bool(const Record&)>;

    EntityStore(const core::Clock& clock, persistence::StorageBackend& backend, std::string actor_id);

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    /**
     * @brief Load every collection from the backend
     *
     * A collection whose rows cannot be decoded is halted (see halt_reason())
     * and the first such error is returned; healthy collections still load.
     */
    Result<void> open();

    std::optional<Record> get(Collection collection, const std::string& id) const;

    /// Replace the payload of `id` (or create it at version 1).
    Result<Record> put(Collection collection, const std::string& id, Payload payload,
                       const WriteHook& hook = {});

    /// Overlay `fields` onto the current payload (or create from them), then validate.
    Result<Record> put(Collection collection, const std::string& id, const nlohmann::json& fields,
                       const WriteHook& hook = {});

    /// Logical delete: tombstone retained, version bumped, marked dirty.
    Result<Record> remove(Collection collection, const std::string& id, const WriteHook& hook = {});

    /// Re-dirty the current state under a new version so it is pushed again.
    Result<Record> republish(Collection collection, const std::string& id, const WriteHook& hook = {});

    std::vector<Record> query(Collection collection, const Predicate& predicate,
                              const QueryOptions& options = {}) const;

    std::vector<Record> by_status(Collection collection, TaskStatus status, const QueryOptions& options = {}) const;
    std::vector<Record> by_assignee(Collection collection, const std::string& person,
                                    const QueryOptions& options = {}) const;
    std::vector<Record> due_before(Collection collection, Timestamp cutoff, const QueryOptions& options = {}) const;

    /// All records with is_dirty set, tombstones included, oldest change first.
    std::vector<Record> dirty_records(Collection collection) const;

    /**
     * @brief Write server-authoritative state
     *
     * Clears is_dirty. The resulting version is max(local, remote) unless the
     * state authorises a rollback. Re-applying identical state is a no-op:
     * the stored record (version included) is returned unchanged.
     */
    Result<Record> apply_remote(Collection collection, const RemoteState& state);

    Result<void> mark_clean(Collection collection, const std::vector<std::string>& ids);

    /// Clear is_dirty only where the stored version still equals the acknowledged one.
    Result<void> mark_clean(Collection collection, const std::vector<VersionedId>& acknowledged);

    /**
     * @brief Physically remove an acknowledged tombstone and retire its id
     *
     * Only clean tombstones can be purged. A retired id is never reusable:
     * recreating the entity means minting a new id.
     */
    Result<void> purge(Collection collection, const std::string& id);

    bool is_retired(Collection collection, const std::string& id) const;

    bool is_halted(Collection collection) const;
    std::optional<Error> halt_reason(Collection collection) const;

    std::size_t size(Collection collection) const;
    std::size_t dirty_count(Collection collection) const;

    /// Compact the persisted history of every collection.
    Result<void> checkpoint();

private:
    struct Partition {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, Record> records;
        std::unordered_set<std::string> retired;
        std::optional<Error> halted;
    };

    Partition& partition(Collection collection);
    const Partition& partition(Collection collection) const;

    static std::string records_table(Collection collection);
    static std::string retired_table(Collection collection);

    Result<void> load_partition(Collection collection, Partition& part);

    /// Persist `next`, run the hook, commit. Caller holds the unique lock.
    Result<Record> commit_local(Partition& part, Record next, const WriteHook& hook);

    /// Validate and write a full payload. Caller holds the unique lock.
    Result<Record> put_locked(Partition& part, Collection collection, const std::string& id,
                              Payload payload, const WriteHook& hook);

    Result<void> writable(const Partition& part, Collection collection, const std::string& id) const;

    Result<void> persist(const Record& record);

    const core::Clock& clock_;
    persistence::StorageBackend& backend_;
    std::string actor_id_;
    std::array<Partition, 3> partitions_;
};

} // namespace hsync::store
