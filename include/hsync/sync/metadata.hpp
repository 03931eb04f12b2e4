#pragma once

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/types.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace hsync::sync {

using core::Timestamp;

/// Per-collection delta window and cycle counters.
struct SyncMetadata {
    store::Collection collection = store::Collection::Tasks;
    std::optional<Timestamp> last_sync_at;   ///< Server syncTimestamp of the last completed cycle
    std::uint64_t successful_syncs = 0;
    std::uint64_t failed_syncs = 0;
    std::string last_error;
};

class MetadataStore {
public:
    explicit MetadataStore(persistence::StorageBackend& backend);

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    Result<void> open();

    SyncMetadata get(store::Collection collection) const;
    std::optional<Timestamp> last_sync_at(store::Collection collection) const;

    /// Advance the window to the server's syncTimestamp and count the success.
    Result<void> record_success(store::Collection collection, Timestamp sync_timestamp);

    /// Count a failed cycle; the window stays where it was.
    Result<void> record_failure(store::Collection collection, const std::string& error);

private:
    static constexpr const char* kTable = "sync_metadata";

    Result<void> persist(const SyncMetadata& metadata);

    persistence::StorageBackend& backend_;
    mutable std::mutex mutex_;
    std::array<SyncMetadata, 3> entries_;
};

} // namespace hsync::sync
