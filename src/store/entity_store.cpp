#include "hsync/store/entity_store.hpp"
#include "hsync/store/payload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace hsync::store {

namespace {

bool records_equivalent(const Record& a, const Record& b) {
    return a.version == b.version &&
           a.updated_at == b.updated_at &&
           a.is_dirty == b.is_dirty &&
           a.is_deleted == b.is_deleted &&
           a.last_modified_by == b.last_modified_by &&
           payload_equal(a.payload, b.payload);
}

void sort_and_page(std::vector<Record>& out, const QueryOptions& options) {
    auto less = [&](const Record& a, const Record& b) {
        switch (options.sort) {
            case SortKey::UpdatedAt:
                if (a.updated_at != b.updated_at) return a.updated_at < b.updated_at;
                break;
            case SortKey::Version:
                if (a.version != b.version) return a.version < b.version;
                break;
            case SortKey::Id:
                break;
        }
        return a.id < b.id;
    };

    if (options.descending) {
        std::sort(out.begin(), out.end(), [&](const Record& a, const Record& b) { return less(b, a); });
    } else {
        std::sort(out.begin(), out.end(), less);
    }

    if (options.offset >= out.size()) {
        out.clear();
        return;
    }
    out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(options.offset));
    if (options.limit != 0 && out.size() > options.limit) {
        out.resize(options.limit);
    }
}

} // namespace

EntityStore::EntityStore(const core::Clock& clock, persistence::StorageBackend& backend, std::string actor_id)
    : clock_(clock), backend_(backend), actor_id_(std::move(actor_id)) {}

EntityStore::Partition& EntityStore::partition(Collection collection) {
    return partitions_[static_cast<std::size_t>(collection)];
}

const EntityStore::Partition& EntityStore::partition(Collection collection) const {
    return partitions_[static_cast<std::size_t>(collection)];
}

std::string EntityStore::records_table(Collection collection) {
    return std::string("records.") + collection_name(collection);
}

std::string EntityStore::retired_table(Collection collection) {
    return std::string("retired.") + collection_name(collection);
}

// ============================================================================
// Loading
// ============================================================================

Result<void> EntityStore::open() {
    std::optional<Error> first_error;

    for (Collection collection : all_collections()) {
        auto& part = partition(collection);
        std::unique_lock lock(part.mutex);
        part.records.clear();
        part.retired.clear();
        part.halted.reset();

        auto loaded = load_partition(collection, part);
        if (loaded.is_error()) {
            part.records.clear();
            part.halted = loaded.error();
            spdlog::error("[EntityStore] Collection '{}' halted: {}",
                         collection_name(collection), loaded.error().message);
            if (!first_error) first_error = loaded.error();
            continue;
        }
        spdlog::debug("[EntityStore] Loaded {} record(s) into '{}'",
                     part.records.size(), collection_name(collection));
    }

    if (first_error) return Err<void>(*first_error);
    return Ok();
}

Result<void> EntityStore::load_partition(Collection collection, Partition& part) {
    auto rows = backend_.load(records_table(collection));
    if (rows.is_error()) return Err<void>(rows.error());

    for (const auto& [key, row] : rows.value()) {
        auto record = record_from_json(row);
        if (record.is_error()) {
            return Err<void>(storage_corruption(
                "record '" + key + "' in " + records_table(collection) + ": " + record.error().message));
        }
        if (record.value().id != key || record.value().collection != collection) {
            return Err<void>(storage_corruption(
                "record '" + key + "' is filed under the wrong key or collection"));
        }
        part.records.emplace(key, std::move(record.value()));
    }

    auto retired = backend_.load(retired_table(collection));
    if (retired.is_error()) return Err<void>(retired.error());
    for (const auto& entry : retired.value()) {
        part.retired.insert(entry.first);
    }
    return Ok();
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Record> EntityStore::get(Collection collection, const std::string& id) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    auto it = part.records.find(id);
    if (it == part.records.end()) return std::nullopt;
    return it->second;
}

std::vector<Record> EntityStore::query(Collection collection, const Predicate& predicate,
                                       const QueryOptions& options) const {
    std::vector<Record> out;
    {
        const auto& part = partition(collection);
        std::shared_lock lock(part.mutex);
        for (const auto& [id, record] : part.records) {
            if (record.is_deleted && !options.include_deleted) continue;
            if (predicate && !predicate(record)) continue;
            out.push_back(record);
        }
    }
    sort_and_page(out, options);
    return out;
}

std::vector<Record> EntityStore::by_status(Collection collection, TaskStatus status,
                                           const QueryOptions& options) const {
    return query(collection, [status](const Record& r) {
        auto s = status_of(r.payload);
        return s && *s == status;
    }, options);
}

std::vector<Record> EntityStore::by_assignee(Collection collection, const std::string& person,
                                             const QueryOptions& options) const {
    return query(collection, [&person](const Record& r) {
        auto people = people_of(r.payload);
        return std::find(people.begin(), people.end(), person) != people.end();
    }, options);
}

std::vector<Record> EntityStore::due_before(Collection collection, Timestamp cutoff,
                                            const QueryOptions& options) const {
    return query(collection, [cutoff](const Record& r) {
        auto due = due_of(r.payload);
        if (!due) return false;
        auto parsed = core::parse_iso8601(*due);
        return parsed.is_ok() && parsed.value() < cutoff;
    }, options);
}

std::vector<Record> EntityStore::dirty_records(Collection collection) const {
    QueryOptions options;
    options.include_deleted = true;
    return query(collection, [](const Record& r) { return r.is_dirty; }, options);
}

bool EntityStore::is_retired(Collection collection, const std::string& id) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    return part.retired.count(id) > 0;
}

bool EntityStore::is_halted(Collection collection) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    return part.halted.has_value();
}

std::optional<Error> EntityStore::halt_reason(Collection collection) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    return part.halted;
}

std::size_t EntityStore::size(Collection collection) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    return part.records.size();
}

std::size_t EntityStore::dirty_count(Collection collection) const {
    const auto& part = partition(collection);
    std::shared_lock lock(part.mutex);
    return static_cast<std::size_t>(std::count_if(part.records.begin(), part.records.end(),
        [](const auto& entry) { return entry.second.is_dirty; }));
}

// ============================================================================
// Local writes
// ============================================================================

Result<void> EntityStore::writable(const Partition& part, Collection collection, const std::string& id) const {
    if (part.halted) {
        return Err<void>(ErrorKind::StorageCorruption,
                         std::string("collection '") + collection_name(collection) + "' is halted: " +
                         part.halted->message);
    }
    if (id.empty()) {
        return Err<void>(validation_error("record id must not be empty"));
    }
    if (part.retired.count(id)) {
        return Err<void>(validation_error("id '" + id + "' was purged; create a new id instead"));
    }
    return Ok();
}

Result<void> EntityStore::persist(const Record& record) {
    return backend_.upsert(records_table(record.collection), record.id, record_to_json(record));
}

Result<Record> EntityStore::commit_local(Partition& part, Record next, const WriteHook& hook) {
    auto previous = part.records.find(next.id);

    auto written = persist(next);
    if (written.is_error()) return Err<Record>(written.error());

    if (hook) {
        auto hooked = hook(next);
        if (hooked.is_error()) {
            // Put the persisted row back the way it was
            auto undo = previous != part.records.end()
                ? persist(previous->second)
                : backend_.erase(records_table(next.collection), next.id);
            if (undo.is_error()) {
                spdlog::error("[EntityStore] Rollback of '{}' failed: {}", next.id, undo.error().message);
            }
            return Err<Record>(hooked.error());
        }
    }

    part.records[next.id] = next;
    return Ok(std::move(next));
}

Result<Record> EntityStore::put_locked(Partition& part, Collection collection, const std::string& id,
                                       Payload payload, const WriteHook& hook) {
    if (collection_of(payload) != collection) {
        return Err<Record>(validation_error(
            std::string("payload does not belong to collection '") + collection_name(collection) + "'"));
    }
    auto valid = validate_payload(payload);
    if (valid.is_error()) return Err<Record>(valid.error());

    auto ok = writable(part, collection, id);
    if (ok.is_error()) return Err<Record>(ok.error());

    Record next;
    auto it = part.records.find(id);
    if (it != part.records.end()) {
        if (it->second.is_deleted) {
            return Err<Record>(validation_error("record '" + id + "' is deleted; create a new id instead"));
        }
        next = it->second;
        next.version += 1;
    } else {
        next.id = id;
        next.collection = collection;
        next.version = 1;
    }
    next.payload = std::move(payload);
    next.updated_at = clock_.now();
    next.is_dirty = true;
    next.is_deleted = false;
    next.last_modified_by = actor_id_;

    return commit_local(part, std::move(next), hook);
}

Result<Record> EntityStore::put(Collection collection, const std::string& id, Payload payload,
                                const WriteHook& hook) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);
    return put_locked(part, collection, id, std::move(payload), hook);
}

Result<Record> EntityStore::put(Collection collection, const std::string& id, const nlohmann::json& fields,
                                const WriteHook& hook) {
    if (!fields.is_object()) {
        return Err<Record>(validation_error("payload must be a JSON object"));
    }

    // The overlay base must be the version this write replaces
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    nlohmann::json merged = fields;
    auto it = part.records.find(id);
    if (it != part.records.end() && !it->second.is_deleted) {
        merged = payload_to_json(it->second.payload);
        for (const auto& [key, value] : fields.items()) {
            merged[key] = value;
        }
    }

    auto payload = payload_from_json(collection, merged);
    if (payload.is_error()) return Err<Record>(payload.error());
    return put_locked(part, collection, id, std::move(payload.value()), hook);
}

Result<Record> EntityStore::remove(Collection collection, const std::string& id, const WriteHook& hook) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    auto ok = writable(part, collection, id);
    if (ok.is_error()) return Err<Record>(ok.error());

    auto it = part.records.find(id);
    if (it == part.records.end()) {
        return Err<Record>(not_found("record '" + id + "' not found"));
    }
    if (it->second.is_deleted) {
        // Already a tombstone; deleting twice is not a new change
        return Ok(it->second);
    }

    Record next = it->second;
    next.version += 1;
    next.updated_at = clock_.now();
    next.is_dirty = true;
    next.is_deleted = true;
    next.last_modified_by = actor_id_;

    return commit_local(part, std::move(next), hook);
}

Result<Record> EntityStore::republish(Collection collection, const std::string& id, const WriteHook& hook) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    if (part.halted) {
        return Err<Record>(ErrorKind::StorageCorruption,
                           std::string("collection '") + collection_name(collection) + "' is halted");
    }
    auto it = part.records.find(id);
    if (it == part.records.end()) {
        return Err<Record>(not_found("record '" + id + "' not found"));
    }

    Record next = it->second;
    next.version += 1;
    next.updated_at = clock_.now();
    next.is_dirty = true;
    next.last_modified_by = actor_id_;

    return commit_local(part, std::move(next), hook);
}

// ============================================================================
// Sync-side writes
// ============================================================================

Result<Record> EntityStore::apply_remote(Collection collection, const RemoteState& state) {
    if (collection_of(state.payload) != collection) {
        return Err<Record>(validation_error("remote payload does not belong to collection '" +
                                            std::string(collection_name(collection)) + "'"));
    }

    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    if (part.halted) {
        return Err<Record>(ErrorKind::StorageCorruption,
                           std::string("collection '") + collection_name(collection) + "' is halted");
    }
    if (part.retired.count(state.id)) {
        return Err<Record>(ErrorKind::InvalidState, "id '" + state.id + "' is retired");
    }

    auto it = part.records.find(state.id);
    const Record* existing = it != part.records.end() ? &it->second : nullptr;

    if (state.expected_local_version) {
        std::uint64_t local = existing ? existing->version : 0;
        if (local != *state.expected_local_version) {
            return Err<Record>(ErrorKind::Busy,
                               "record '" + state.id + "' changed locally while the cycle was running");
        }
    }

    Record next;
    next.id = state.id;
    next.collection = collection;
    next.payload = state.payload;
    next.updated_at = state.updated_at;
    next.is_dirty = false;
    next.is_deleted = state.is_deleted;
    next.last_modified_by = state.modified_by;

    std::uint64_t remote = std::max<std::uint64_t>(state.version, 1);
    if (existing) {
        next.version = (state.authorize_rollback || remote >= existing->version) ? remote : existing->version;
        if (next.version < existing->version) {
            spdlog::warn("[EntityStore] Authorised rollback of '{}' from v{} to v{}",
                        state.id, existing->version, next.version);
        }
        if (records_equivalent(*existing, next)) {
            return Ok(*existing);
        }
    } else {
        next.version = remote;
    }

    auto written = persist(next);
    if (written.is_error()) return Err<Record>(written.error());

    part.records[next.id] = next;
    return Ok(std::move(next));
}

Result<void> EntityStore::mark_clean(Collection collection, const std::vector<std::string>& ids) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    for (const auto& id : ids) {
        auto it = part.records.find(id);
        if (it == part.records.end() || !it->second.is_dirty) continue;

        Record next = it->second;
        next.is_dirty = false;
        auto written = persist(next);
        if (written.is_error()) return written;
        it->second = std::move(next);
    }
    return Ok();
}

Result<void> EntityStore::mark_clean(Collection collection, const std::vector<VersionedId>& acknowledged) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    for (const auto& ack : acknowledged) {
        auto it = part.records.find(ack.id);
        if (it == part.records.end() || !it->second.is_dirty) continue;
        if (it->second.version != ack.version) {
            spdlog::debug("[EntityStore] '{}' moved to v{} after v{} was sent, staying dirty",
                         ack.id, it->second.version, ack.version);
            continue;
        }

        Record next = it->second;
        next.is_dirty = false;
        auto written = persist(next);
        if (written.is_error()) return written;
        it->second = std::move(next);
    }
    return Ok();
}

Result<void> EntityStore::purge(Collection collection, const std::string& id) {
    auto& part = partition(collection);
    std::unique_lock lock(part.mutex);

    auto it = part.records.find(id);
    if (it == part.records.end()) {
        return Err<void>(not_found("record '" + id + "' not found"));
    }
    if (!it->second.is_deleted || it->second.is_dirty) {
        return Err<void>(ErrorKind::InvalidState,
                         "only acknowledged tombstones can be purged ('" + id + "')");
    }

    auto retired = backend_.upsert(retired_table(collection), id,
                                   nlohmann::json{{"retiredAt", core::to_iso8601(clock_.now())}});
    if (retired.is_error()) return retired;

    auto erased = backend_.erase(records_table(collection), id);
    if (erased.is_error()) return erased;

    part.records.erase(it);
    part.retired.insert(id);
    spdlog::info("[EntityStore] Purged tombstone '{}' from '{}'", id, collection_name(collection));
    return Ok();
}

Result<void> EntityStore::checkpoint() {
    for (Collection collection : all_collections()) {
        auto& part = partition(collection);
        std::unique_lock lock(part.mutex);
        if (part.halted) continue;

        auto records = backend_.compact(records_table(collection));
        if (records.is_error()) return records;
        auto retired = backend_.compact(retired_table(collection));
        if (retired.is_error()) return retired;
    }
    return Ok();
}

} // namespace hsync::store
