#include "hsync/sync/metadata.hpp"
#include "hsync/store/payload.hpp"

namespace hsync::sync {

using json = nlohmann::json;

MetadataStore::MetadataStore(persistence::StorageBackend& backend) : backend_(backend) {
    for (auto collection : store::all_collections()) {
        entries_[static_cast<std::size_t>(collection)].collection = collection;
    }
}

Result<void> MetadataStore::open() {
    std::lock_guard lock(mutex_);

    auto rows = backend_.load(kTable);
    if (rows.is_error()) return Err<void>(rows.error());

    for (const auto& [key, row] : rows.value()) {
        auto collection = store::parse_collection(key);
        if (collection.is_error()) {
            return Err<void>(storage_corruption("sync metadata for unknown collection '" + key + "'"));
        }

        SyncMetadata metadata;
        metadata.collection = collection.value();
        try {
            if (row.contains("lastSyncAt") && row["lastSyncAt"].is_string()) {
                auto at = core::parse_iso8601(row["lastSyncAt"].get<std::string>());
                if (at.is_error()) {
                    return Err<void>(storage_corruption("sync metadata '" + key + "': " + at.error().message));
                }
                metadata.last_sync_at = at.value();
            }
            metadata.successful_syncs = row.value("successfulSyncs", std::uint64_t{0});
            metadata.failed_syncs = row.value("failedSyncs", std::uint64_t{0});
            metadata.last_error = row.value("lastError", std::string());
        } catch (const json::exception& e) {
            return Err<void>(storage_corruption("sync metadata '" + key + "': " + e.what()));
        }
        entries_[static_cast<std::size_t>(metadata.collection)] = std::move(metadata);
    }
    return Ok();
}

SyncMetadata MetadataStore::get(store::Collection collection) const {
    std::lock_guard lock(mutex_);
    return entries_[static_cast<std::size_t>(collection)];
}

std::optional<Timestamp> MetadataStore::last_sync_at(store::Collection collection) const {
    std::lock_guard lock(mutex_);
    return entries_[static_cast<std::size_t>(collection)].last_sync_at;
}

Result<void> MetadataStore::record_success(store::Collection collection, Timestamp sync_timestamp) {
    std::lock_guard lock(mutex_);
    SyncMetadata next = entries_[static_cast<std::size_t>(collection)];
    next.last_sync_at = sync_timestamp;
    next.successful_syncs += 1;
    next.last_error.clear();

    auto written = persist(next);
    if (written.is_error()) return written;
    entries_[static_cast<std::size_t>(collection)] = std::move(next);
    return Ok();
}

Result<void> MetadataStore::record_failure(store::Collection collection, const std::string& error) {
    std::lock_guard lock(mutex_);
    SyncMetadata next = entries_[static_cast<std::size_t>(collection)];
    next.failed_syncs += 1;
    next.last_error = error;

    auto written = persist(next);
    if (written.is_error()) return written;
    entries_[static_cast<std::size_t>(collection)] = std::move(next);
    return Ok();
}

Result<void> MetadataStore::persist(const SyncMetadata& metadata) {
    json row = {
        {"successfulSyncs", metadata.successful_syncs},
        {"failedSyncs", metadata.failed_syncs},
        {"lastError", metadata.last_error},
    };
    row["lastSyncAt"] = metadata.last_sync_at ? json(core::to_iso8601(*metadata.last_sync_at)) : json(nullptr);
    return backend_.upsert(kTable, store::collection_name(metadata.collection), row);
}

} // namespace hsync::sync
