#include "hsync/outbox/outbox.hpp"
#include "hsync/core/id.hpp"
#include "hsync/store/payload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace hsync::outbox {

using json = nlohmann::json;

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "update";
}

std::optional<Operation> parse_operation(const std::string& name) {
    if (name == "create") return Operation::Create;
    if (name == "update") return Operation::Update;
    if (name == "delete") return Operation::Delete;
    return std::nullopt;
}

// ============================================================================
// Row codec
// ============================================================================

json entry_to_json(const OutboxEntry& entry) {
    json doc = {
        {"entryId", entry.entry_id},
        {"collection", store::collection_name(entry.collection)},
        {"entityId", entry.entity_id},
        {"op", operation_name(entry.op)},
        {"snapshot", entry.snapshot},
        {"version", entry.version},
        {"updatedAt", core::to_iso8601(entry.updated_at)},
        {"queuedAt", core::to_iso8601(entry.queued_at)},
        {"sequence", entry.sequence},
        {"retryCount", entry.retry_count},
        {"revision", entry.revision},
        {"permanentlyRejected", entry.permanently_rejected},
        {"lastError", entry.last_error},
    };
    doc["lastAttemptAt"] = entry.last_attempt_at ? json(core::to_iso8601(*entry.last_attempt_at)) : json(nullptr);
    return doc;
}

Result<OutboxEntry> entry_from_json(const json& doc) {
    try {
        OutboxEntry entry;
        entry.entry_id = doc.at("entryId").get<std::string>();

        auto collection = store::parse_collection(doc.at("collection").get<std::string>());
        if (collection.is_error()) return Err<OutboxEntry>(collection.error());
        entry.collection = collection.value();

        entry.entity_id = doc.at("entityId").get<std::string>();

        auto op = parse_operation(doc.at("op").get<std::string>());
        if (!op) return Err<OutboxEntry>(ErrorKind::Validation, "unknown outbox operation");
        entry.op = *op;

        entry.snapshot = doc.value("snapshot", json::object());
        entry.version = doc.at("version").get<std::uint64_t>();
        entry.sequence = doc.at("sequence").get<std::uint64_t>();
        entry.retry_count = doc.value("retryCount", 0u);
        entry.revision = doc.value("revision", std::uint64_t{0});
        entry.permanently_rejected = doc.value("permanentlyRejected", false);
        entry.last_error = doc.value("lastError", std::string());

        auto updated = core::parse_iso8601(doc.at("updatedAt").get<std::string>());
        if (updated.is_error()) return Err<OutboxEntry>(updated.error());
        entry.updated_at = updated.value();

        auto queued = core::parse_iso8601(doc.at("queuedAt").get<std::string>());
        if (queued.is_error()) return Err<OutboxEntry>(queued.error());
        entry.queued_at = queued.value();

        if (doc.contains("lastAttemptAt") && doc["lastAttemptAt"].is_string()) {
            auto attempted = core::parse_iso8601(doc["lastAttemptAt"].get<std::string>());
            if (attempted.is_error()) return Err<OutboxEntry>(attempted.error());
            entry.last_attempt_at = attempted.value();
        }
        return Ok(std::move(entry));
    } catch (const json::exception& e) {
        return Err<OutboxEntry>(ErrorKind::Validation, std::string("malformed outbox entry: ") + e.what());
    }
}

// ============================================================================
// Outbox
// ============================================================================

Outbox::Outbox(const core::Clock& clock, persistence::StorageBackend& backend, std::uint32_t max_retries)
    : clock_(clock), backend_(backend), max_retries_(max_retries == 0 ? 1 : max_retries) {}

Result<void> Outbox::open() {
    std::lock_guard lock(mutex_);
    pending_.clear();
    failed_.clear();
    next_sequence_ = 1;

    auto load_into = [this](const char* table, Partition& partition) -> Result<void> {
        auto rows = backend_.load(table);
        if (rows.is_error()) return Err<void>(rows.error());
        for (const auto& [key, row] : rows.value()) {
            auto entry = entry_from_json(row);
            if (entry.is_error()) {
                return Err<void>(storage_corruption(
                    std::string(table) + " row '" + key + "': " + entry.error().message));
            }
            next_sequence_ = std::max(next_sequence_, entry.value().sequence + 1);
            partition.emplace(key, std::move(entry.value()));
        }
        return Ok();
    };

    auto pending = load_into(kPendingTable, pending_);
    if (pending.is_error()) return pending;
    auto failed = load_into(kFailedTable, failed_);
    if (failed.is_error()) return failed;

    spdlog::debug("[Outbox] Loaded {} pending, {} failed", pending_.size(), failed_.size());
    return Ok();
}

std::optional<std::string> Outbox::pending_for(store::Collection collection, const std::string& entity_id) const {
    for (const auto& [id, entry] : pending_) {
        if (entry.collection == collection && entry.entity_id == entity_id) {
            return id;
        }
    }
    return std::nullopt;
}

std::vector<OutboxEntry> Outbox::in_order(const Partition& partition) {
    std::vector<OutboxEntry> out;
    out.reserve(partition.size());
    for (const auto& entry : partition) {
        out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(), [](const OutboxEntry& a, const OutboxEntry& b) {
        return a.sequence < b.sequence;
    });
    return out;
}

Result<OutboxEntry> Outbox::enqueue(const store::Record& record, Operation op) {
    std::lock_guard lock(mutex_);

    OutboxEntry next;
    auto existing = pending_for(record.collection, record.id);
    if (existing) {
        next = pending_.at(*existing);
        if (op == Operation::Delete) {
            next.op = Operation::Delete;
        } else if (next.op == Operation::Delete) {
            next.op = op;
        }
        // create + update stays a create
        next.revision += 1;
    } else {
        next.entry_id = core::generate_id();
        next.collection = record.collection;
        next.entity_id = record.id;
        next.op = op;
        next.queued_at = clock_.now();
        next.sequence = next_sequence_++;
    }
    next.snapshot = store::payload_to_json(record.payload);
    next.version = record.version;
    next.updated_at = record.updated_at;

    auto written = backend_.upsert(kPendingTable, next.entry_id, entry_to_json(next));
    if (written.is_error()) return Err<OutboxEntry>(written.error());

    pending_[next.entry_id] = next;
    spdlog::debug("[Outbox] {} {} '{}' v{} ({})", existing ? "Coalesced" : "Queued",
                 operation_name(next.op), record.id, record.version, next.entry_id);
    return Ok(std::move(next));
}

std::vector<OutboxEntry> Outbox::pending_entries() const {
    std::lock_guard lock(mutex_);
    return in_order(pending_);
}

std::vector<OutboxEntry> Outbox::eligible_entries(Timestamp now) const {
    std::lock_guard lock(mutex_);
    auto ordered = in_order(pending_);
    ordered.erase(std::remove_if(ordered.begin(), ordered.end(),
                                 [now](const OutboxEntry& e) { return !is_eligible(e, now); }),
                  ordered.end());
    return ordered;
}

std::optional<OutboxEntry> Outbox::find_pending(store::Collection collection, const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto id = pending_for(collection, entity_id);
    if (!id) return std::nullopt;
    return pending_.at(*id);
}

Result<void> Outbox::clear_entries(const std::vector<std::string>& entry_ids) {
    std::lock_guard lock(mutex_);
    for (const auto& id : entry_ids) {
        if (!pending_.count(id)) continue;
        auto erased = backend_.erase(kPendingTable, id);
        if (erased.is_error()) return erased;
        pending_.erase(id);
    }
    return Ok();
}

Result<void> Outbox::clear_acknowledged(const std::vector<Acknowledgement>& acks) {
    std::lock_guard lock(mutex_);
    for (const auto& ack : acks) {
        auto it = pending_.find(ack.entry_id);
        if (it == pending_.end()) continue;

        if (it->second.revision == ack.revision) {
            auto erased = backend_.erase(kPendingTable, ack.entry_id);
            if (erased.is_error()) return erased;
            pending_.erase(it);
            continue;
        }

        if (it->second.op == Operation::Create) {
            OutboxEntry next = it->second;
            next.op = Operation::Update;
            auto written = backend_.upsert(kPendingTable, next.entry_id, entry_to_json(next));
            if (written.is_error()) return written;
            it->second = std::move(next);
        }
        spdlog::debug("[Outbox] '{}' changed while in flight, kept for the next cycle", it->second.entity_id);
    }
    return Ok();
}

Result<bool> Outbox::record_failure(const std::string& entry_id, const std::string& error) {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(entry_id);
    if (it == pending_.end()) {
        return Err<bool>(not_found("outbox entry '" + entry_id + "' not pending"));
    }

    OutboxEntry next = it->second;
    next.retry_count += 1;
    next.last_attempt_at = clock_.now();
    next.last_error = error;

    if (next.retry_count >= max_retries_) {
        auto moved = backend_.upsert(kFailedTable, entry_id, entry_to_json(next));
        if (moved.is_error()) return Err<bool>(moved.error());
        auto erased = backend_.erase(kPendingTable, entry_id);
        if (erased.is_error()) return Err<bool>(erased.error());

        pending_.erase(it);
        failed_[entry_id] = std::move(next);
        spdlog::warn("[Outbox] Entry '{}' failed after {} attempts: {}", entry_id, max_retries_, error);
        return Ok(true);
    }

    auto written = backend_.upsert(kPendingTable, entry_id, entry_to_json(next));
    if (written.is_error()) return Err<bool>(written.error());
    it->second = std::move(next);
    return Ok(false);
}

Result<void> Outbox::reject(const std::string& entry_id, const std::string& reason) {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(entry_id);
    if (it == pending_.end()) {
        return Err<void>(not_found("outbox entry '" + entry_id + "' not pending"));
    }

    OutboxEntry next = it->second;
    next.permanently_rejected = true;
    next.last_attempt_at = clock_.now();
    next.last_error = reason;

    auto moved = backend_.upsert(kFailedTable, entry_id, entry_to_json(next));
    if (moved.is_error()) return moved;
    auto erased = backend_.erase(kPendingTable, entry_id);
    if (erased.is_error()) return erased;

    pending_.erase(it);
    failed_[entry_id] = std::move(next);
    spdlog::warn("[Outbox] Entry '{}' rejected: {}", entry_id, reason);
    return Ok();
}

std::vector<OutboxEntry> Outbox::failed_entries() const {
    std::lock_guard lock(mutex_);
    return in_order(failed_);
}

Result<std::size_t> Outbox::retry_all_failed() {
    std::lock_guard lock(mutex_);
    std::size_t moved = 0;

    for (const auto& failed : in_order(failed_)) {
        auto erased = backend_.erase(kFailedTable, failed.entry_id);
        if (erased.is_error()) return Err<std::size_t>(erased.error());
        failed_.erase(failed.entry_id);

        if (pending_for(failed.collection, failed.entity_id)) {
            spdlog::debug("[Outbox] Dropped failed entry '{}', newer change already pending", failed.entry_id);
            continue;
        }

        OutboxEntry next = failed;
        next.retry_count = 0;
        next.last_attempt_at.reset();
        next.last_error.clear();
        next.permanently_rejected = false;

        auto written = backend_.upsert(kPendingTable, next.entry_id, entry_to_json(next));
        if (written.is_error()) return Err<std::size_t>(written.error());
        pending_[next.entry_id] = std::move(next);
        ++moved;
    }

    if (moved > 0) {
        spdlog::info("[Outbox] Re-queued {} failed entr{}", moved, moved == 1 ? "y" : "ies");
    }
    return Ok(moved);
}

Result<std::size_t> Outbox::clear_failed() {
    std::lock_guard lock(mutex_);
    std::size_t count = failed_.size();
    for (const auto& entry : failed_) {
        auto erased = backend_.erase(kFailedTable, entry.first);
        if (erased.is_error()) return Err<std::size_t>(erased.error());
    }
    failed_.clear();
    return Ok(count);
}

std::size_t Outbox::pending_count() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

std::size_t Outbox::failed_count() const {
    std::lock_guard lock(mutex_);
    return failed_.size();
}

std::chrono::seconds Outbox::backoff_delay(std::uint32_t retry_count) {
    if (retry_count >= 4) {
        return std::chrono::seconds{16};
    }
    return std::chrono::seconds{1LL << retry_count};
}

bool Outbox::is_eligible(const OutboxEntry& entry, Timestamp now) {
    if (!entry.last_attempt_at) {
        return true;
    }
    return now >= *entry.last_attempt_at + backoff_delay(entry.retry_count);
}

} // namespace hsync::outbox
