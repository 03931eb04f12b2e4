#pragma once

/**
 * @file outbox.hpp
 * @brief Durable queue of local changes waiting for the server
 *
 * Two partitions:
 * - pending: eligible for the next cycle once their backoff window passed
 * - failed:  exhausted retries or permanently rejected, kept for the user
 *
 * At most one pending entry exists per (collection, entity). A newer local
 * change coalesces into it:
 *
 *   existing  + new     -> result
 *   create    + update  -> create, newest snapshot
 *   update    + update  -> update, newest snapshot
 *   any       + delete  -> delete
 *
 * The entry keeps its queue position and its revision counter is bumped, so
 * an acknowledgement for the revision that was on the wire does not clear
 * the newer content.
 */

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hsync::outbox {

using core::Timestamp;

enum class Operation {
    Create,
    Update,
    Delete
};

const char* operation_name(Operation op);
std::optional<Operation> parse_operation(const std::string& name);

struct OutboxEntry {
    std::string entry_id;
    store::Collection collection = store::Collection::Tasks;
    std::string entity_id;
    Operation op = Operation::Create;
    nlohmann::json snapshot = nlohmann::json::object(); ///< Payload fields at enqueue time
    std::uint64_t version = 0;                          ///< Record version the snapshot belongs to
    Timestamp updated_at{};
    Timestamp queued_at{};
    std::uint64_t sequence = 0;                         ///< FIFO position
    std::uint32_t retry_count = 0;
    std::optional<Timestamp> last_attempt_at;
    std::string last_error;
    std::uint64_t revision = 0;
    bool permanently_rejected = false;
};

/// Identifies exactly the content that was sent.
struct Acknowledgement {
    std::string entry_id;
    std::uint64_t revision = 0;
};

class Outbox {
public:
    static constexpr std::uint32_t kDefaultMaxRetries = 5;

    Outbox(const core::Clock& clock, persistence::StorageBackend& backend,
           std::uint32_t max_retries = kDefaultMaxRetries);

    Outbox(const Outbox&) = delete;
    Outbox& operator=(const Outbox&) = delete;

    /// Reload both partitions from the backend.
    Result<void> open();

    /// Queue `record` (already committed or about to be) as `op`, coalescing as described above.
    Result<OutboxEntry> enqueue(const store::Record& record, Operation op);

    /// Pending entries in FIFO order.
    std::vector<OutboxEntry> pending_entries() const;

    /// Pending entries whose backoff window has elapsed at `now`, FIFO order.
    std::vector<OutboxEntry> eligible_entries(Timestamp now) const;

    std::optional<OutboxEntry> find_pending(store::Collection collection, const std::string& entity_id) const;

    /// Drop pending entries unconditionally.
    Result<void> clear_entries(const std::vector<std::string>& entry_ids);

    /**
     * @brief Drop pending entries whose revision still matches
     *
     * An entry coalesced after it was sent survives. If it was a create, it
     * becomes an update: the server now knows the entity.
     */
    Result<void> clear_acknowledged(const std::vector<Acknowledgement>& acks);

    /**
     * @brief Count a transient failure against a pending entry
     * @return true if the entry reached max_retries and moved to failed
     */
    Result<bool> record_failure(const std::string& entry_id, const std::string& error);

    /// Move straight to failed without touching the retry count.
    Result<void> reject(const std::string& entry_id, const std::string& reason);

    std::vector<OutboxEntry> failed_entries() const;

    /**
     * @brief Move every failed entry back to pending with retry_count = 0
     *
     * A failed entry whose entity already has a newer pending entry is
     * dropped: the pending one carries the latest state.
     * @return number of entries moved back
     */
    Result<std::size_t> retry_all_failed();

    /// Discard the failed partition. @return number discarded
    Result<std::size_t> clear_failed();

    std::size_t pending_count() const;
    std::size_t failed_count() const;
    std::uint32_t max_retries() const { return max_retries_; }

    /// min(2^retry_count, 16) seconds.
    static std::chrono::seconds backoff_delay(std::uint32_t retry_count);

    static bool is_eligible(const OutboxEntry& entry, Timestamp now);

private:
    static constexpr const char* kPendingTable = "outbox.pending";
    static constexpr const char* kFailedTable = "outbox.failed";

    using Partition = std::map<std::string, OutboxEntry>;  // by entry_id

    std::optional<std::string> pending_for(store::Collection collection, const std::string& entity_id) const;
    static std::vector<OutboxEntry> in_order(const Partition& partition);

    const core::Clock& clock_;
    persistence::StorageBackend& backend_;
    std::uint32_t max_retries_;

    mutable std::mutex mutex_;
    Partition pending_;
    Partition failed_;
    std::uint64_t next_sequence_ = 1;
};

nlohmann::json entry_to_json(const OutboxEntry& entry);
Result<OutboxEntry> entry_from_json(const nlohmann::json& doc);

} // namespace hsync::outbox
