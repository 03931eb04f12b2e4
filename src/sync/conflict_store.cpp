#include "hsync/sync/conflict_store.hpp"
#include "hsync/core/id.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hsync::sync {

ConflictStore::ConflictStore(const core::Clock& clock, persistence::StorageBackend& backend)
    : clock_(clock), backend_(backend) {}

Result<void> ConflictStore::open() {
    std::lock_guard lock(mutex_);
    conflicts_.clear();

    auto rows = backend_.load(kTable);
    if (rows.is_error()) return Err<void>(rows.error());

    for (const auto& [key, row] : rows.value()) {
        auto conflict = conflict_from_json(row);
        if (conflict.is_error()) {
            return Err<void>(storage_corruption("conflict '" + key + "': " + conflict.error().message));
        }
        conflicts_.emplace(key, std::move(conflict.value()));
    }
    return Ok();
}

Result<ConflictRecord> ConflictStore::record(ConflictRecord conflict) {
    std::lock_guard lock(mutex_);

    auto existing = std::find_if(conflicts_.begin(), conflicts_.end(), [&](const auto& entry) {
        const auto& c = entry.second;
        return !c.is_resolved() && c.collection == conflict.collection && c.entity_id == conflict.entity_id;
    });

    if (existing != conflicts_.end()) {
        conflict.conflict_id = existing->first;
        conflict.detected_at = existing->second.detected_at;
    } else {
        if (conflict.conflict_id.empty()) {
            conflict.conflict_id = core::generate_id();
        }
        if (conflict.detected_at == Timestamp{}) {
            conflict.detected_at = clock_.now();
        }
    }
    if (conflict.resolution && !conflict.resolved_at) {
        conflict.resolved_at = clock_.now();
    }

    auto written = backend_.upsert(kTable, conflict.conflict_id, conflict_to_json(conflict));
    if (written.is_error()) return Err<ConflictRecord>(written.error());

    conflicts_[conflict.conflict_id] = conflict;
    return Ok(std::move(conflict));
}

Result<ConflictRecord> ConflictStore::mark_resolved(const std::string& conflict_id, Resolution resolution) {
    std::lock_guard lock(mutex_);

    auto it = conflicts_.find(conflict_id);
    if (it == conflicts_.end()) {
        return Err<ConflictRecord>(not_found("conflict '" + conflict_id + "' not found"));
    }
    if (it->second.is_resolved()) {
        return Err<ConflictRecord>(ErrorKind::InvalidState, "conflict '" + conflict_id + "' already resolved");
    }

    ConflictRecord next = it->second;
    next.resolution = std::move(resolution);
    next.needs_manual_review = false;
    next.resolved_at = clock_.now();

    auto written = backend_.upsert(kTable, conflict_id, conflict_to_json(next));
    if (written.is_error()) return Err<ConflictRecord>(written.error());

    it->second = next;
    return Ok(std::move(next));
}

std::optional<ConflictRecord> ConflictStore::find(const std::string& conflict_id) const {
    std::lock_guard lock(mutex_);
    auto it = conflicts_.find(conflict_id);
    if (it == conflicts_.end()) return std::nullopt;
    return it->second;
}

std::optional<ConflictRecord> ConflictStore::pending_for(store::Collection collection,
                                                         const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, conflict] : conflicts_) {
        if (!conflict.is_resolved() && conflict.collection == collection && conflict.entity_id == entity_id) {
            return conflict;
        }
    }
    return std::nullopt;
}

std::vector<ConflictRecord> ConflictStore::pending() const {
    std::vector<ConflictRecord> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& entry : conflicts_) {
            if (!entry.second.is_resolved()) out.push_back(entry.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const ConflictRecord& a, const ConflictRecord& b) {
        if (a.detected_at != b.detected_at) return a.detected_at < b.detected_at;
        return a.conflict_id < b.conflict_id;
    });
    return out;
}

std::vector<ConflictRecord> ConflictStore::resolved() const {
    std::vector<ConflictRecord> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& entry : conflicts_) {
            if (entry.second.is_resolved()) out.push_back(entry.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const ConflictRecord& a, const ConflictRecord& b) {
        return a.resolved_at > b.resolved_at;
    });
    return out;
}

std::size_t ConflictStore::pending_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(conflicts_.begin(), conflicts_.end(),
        [](const auto& entry) { return !entry.second.is_resolved(); }));
}

std::size_t ConflictStore::resolved_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(conflicts_.begin(), conflicts_.end(),
        [](const auto& entry) { return entry.second.is_resolved(); }));
}

Result<std::size_t> ConflictStore::prune_resolved(Timestamp cutoff) {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;

    for (auto it = conflicts_.begin(); it != conflicts_.end();) {
        const auto& conflict = it->second;
        if (conflict.is_resolved() && conflict.resolved_at && *conflict.resolved_at < cutoff) {
            auto erased = backend_.erase(kTable, it->first);
            if (erased.is_error()) return Err<std::size_t>(erased.error());
            it = conflicts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::info("[ConflictStore] Pruned {} resolved conflict(s)", removed);
    }
    return Ok(removed);
}

} // namespace hsync::sync
