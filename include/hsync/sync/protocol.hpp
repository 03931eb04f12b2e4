#pragma once

/**
 * @file protocol.hpp
 * @brief Delta sync wire messages and their JSON codec
 *
 * Request (client -> authority):
 * {
 *   "deviceId": "...",
 *   "lastSyncTimestamps": { "<collection>": "<ISO 8601>" },
 *   "pendingChanges": [ { entityType, operation, entityId, version, data, updatedAt } ]
 * }
 *
 * Response (authority -> client):
 * {
 *   "serverChanges": [ { entityType, operation, entityId, version, data, updatedAt } ],
 *   "conflicts":     [ { entityType, entityId, clientVersion, serverVersion,
 *                        clientData, serverData, conflictType } ],
 *   "rejected":      [ { entityType, entityId, reason, permanent } ],
 *   "syncTimestamp": "<ISO 8601>"
 * }
 *
 * `rejected` is optional. Collections are named "tasks", "events",
 * "points_ledger"; the singular aliases are accepted on input.
 */

#include "hsync/core/clock.hpp"
#include "hsync/core/result.hpp"
#include "hsync/outbox/outbox.hpp"
#include "hsync/store/types.hpp"
#include "hsync/sync/conflict.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hsync::sync {

struct EntityChange {
    store::Collection collection = store::Collection::Tasks;
    outbox::Operation op = outbox::Operation::Update;
    std::string entity_id;
    std::uint64_t version = 0;
    nlohmann::json data = nlohmann::json::object();
    Timestamp updated_at{};
};

struct ServerConflict {
    store::Collection collection = store::Collection::Tasks;
    std::string entity_id;
    std::uint64_t client_version = 0;
    std::uint64_t server_version = 0;
    nlohmann::json client_data = nlohmann::json::object();
    nlohmann::json server_data = nlohmann::json::object();
    std::optional<ConflictKind> kind;   ///< Absent when the authority sent an unknown type
};

struct Rejection {
    store::Collection collection = store::Collection::Tasks;
    std::string entity_id;
    std::string reason;
    bool permanent = false;
};

struct DeltaRequest {
    std::string device_id;
    std::map<store::Collection, Timestamp> last_sync;
    std::vector<EntityChange> pending_changes;
};

struct DeltaResponse {
    std::vector<EntityChange> server_changes;
    std::vector<ServerConflict> conflicts;
    std::vector<Rejection> rejected;
    Timestamp sync_timestamp{};
};

nlohmann::json encode_change(const EntityChange& change);
Result<EntityChange> decode_change(const nlohmann::json& doc);

nlohmann::json encode_request(const DeltaRequest& request);
Result<DeltaRequest> decode_request(const nlohmann::json& doc);

nlohmann::json encode_response(const DeltaResponse& response);
Result<DeltaResponse> decode_response(const nlohmann::json& doc);

/**
 * @brief The server's view of an entity as a Record
 *
 * `data` may carry isDeleted / updatedAt / lastModifiedBy envelope keys;
 * explicit arguments take their place where given.
 */
Result<store::Record> record_from_wire(store::Collection collection, const std::string& entity_id,
                                       std::uint64_t version, const nlohmann::json& data,
                                       std::optional<Timestamp> updated_at = std::nullopt,
                                       std::optional<bool> is_deleted = std::nullopt);

} // namespace hsync::sync
