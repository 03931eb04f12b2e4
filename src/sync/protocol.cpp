#include "hsync/sync/protocol.hpp"
#include "hsync/store/payload.hpp"

namespace hsync::sync {

using json = nlohmann::json;

namespace {

Result<store::Collection> read_collection(const json& doc) {
    return store::parse_collection(doc.at("entityType").get<std::string>());
}

Result<Timestamp> read_time(const json& doc, const char* key) {
    return core::parse_iso8601(doc.at(key).get<std::string>());
}

} // namespace

// ============================================================================
// Changes
// ============================================================================

json encode_change(const EntityChange& change) {
    return json{
        {"entityType", store::collection_name(change.collection)},
        {"operation", outbox::operation_name(change.op)},
        {"entityId", change.entity_id},
        {"version", change.version},
        {"data", change.data},
        {"updatedAt", core::to_iso8601(change.updated_at)},
    };
}

Result<EntityChange> decode_change(const json& doc) {
    try {
        EntityChange change;
        auto collection = read_collection(doc);
        if (collection.is_error()) return Err<EntityChange>(collection.error());
        change.collection = collection.value();

        auto op = outbox::parse_operation(doc.at("operation").get<std::string>());
        if (!op) return Err<EntityChange>(ErrorKind::Validation, "unknown change operation");
        change.op = *op;

        change.entity_id = doc.at("entityId").get<std::string>();
        change.version = doc.value("version", std::uint64_t{0});
        change.data = doc.value("data", json::object());
        if (!change.data.is_object()) {
            return Err<EntityChange>(ErrorKind::Validation, "change data must be an object");
        }

        auto updated = read_time(doc, "updatedAt");
        if (updated.is_error()) return Err<EntityChange>(updated.error());
        change.updated_at = updated.value();
        return Ok(std::move(change));
    } catch (const json::exception& e) {
        return Err<EntityChange>(ErrorKind::Validation, std::string("malformed change: ") + e.what());
    }
}

// ============================================================================
// Request
// ============================================================================

json encode_request(const DeltaRequest& request) {
    json last_sync = json::object();
    for (const auto& [collection, at] : request.last_sync) {
        last_sync[store::collection_name(collection)] = core::to_iso8601(at);
    }

    json changes = json::array();
    for (const auto& change : request.pending_changes) {
        changes.push_back(encode_change(change));
    }

    return json{
        {"deviceId", request.device_id},
        {"lastSyncTimestamps", last_sync},
        {"pendingChanges", changes},
    };
}

Result<DeltaRequest> decode_request(const json& doc) {
    try {
        DeltaRequest request;
        request.device_id = doc.value("deviceId", std::string());

        const json last_sync = doc.value("lastSyncTimestamps", json::object());
        for (const auto& [name, value] : last_sync.items()) {
            auto collection = store::parse_collection(name);
            if (collection.is_error()) return Err<DeltaRequest>(collection.error());
            auto at = core::parse_iso8601(value.get<std::string>());
            if (at.is_error()) return Err<DeltaRequest>(at.error());
            request.last_sync[collection.value()] = at.value();
        }

        for (const auto& item : doc.value("pendingChanges", json::array())) {
            auto change = decode_change(item);
            if (change.is_error()) return Err<DeltaRequest>(change.error());
            request.pending_changes.push_back(std::move(change.value()));
        }
        return Ok(std::move(request));
    } catch (const json::exception& e) {
        return Err<DeltaRequest>(ErrorKind::Validation, std::string("malformed delta request: ") + e.what());
    }
}

// ============================================================================
// Response
// ============================================================================

json encode_response(const DeltaResponse& response) {
    json changes = json::array();
    for (const auto& change : response.server_changes) {
        changes.push_back(encode_change(change));
    }

    json conflicts = json::array();
    for (const auto& conflict : response.conflicts) {
        conflicts.push_back(json{
            {"entityType", store::collection_name(conflict.collection)},
            {"entityId", conflict.entity_id},
            {"clientVersion", conflict.client_version},
            {"serverVersion", conflict.server_version},
            {"clientData", conflict.client_data},
            {"serverData", conflict.server_data},
            {"conflictType", conflict.kind ? kind_name(*conflict.kind) : "concurrent_update"},
        });
    }

    json rejected = json::array();
    for (const auto& rejection : response.rejected) {
        rejected.push_back(json{
            {"entityType", store::collection_name(rejection.collection)},
            {"entityId", rejection.entity_id},
            {"reason", rejection.reason},
            {"permanent", rejection.permanent},
        });
    }

    return json{
        {"serverChanges", changes},
        {"conflicts", conflicts},
        {"rejected", rejected},
        {"syncTimestamp", core::to_iso8601(response.sync_timestamp)},
    };
}

Result<DeltaResponse> decode_response(const json& doc) {
    try {
        if (!doc.is_object()) {
            return Err<DeltaResponse>(ErrorKind::Validation, "delta response must be an object");
        }

        DeltaResponse response;
        for (const auto& item : doc.value("serverChanges", json::array())) {
            auto change = decode_change(item);
            if (change.is_error()) return Err<DeltaResponse>(change.error());
            response.server_changes.push_back(std::move(change.value()));
        }

        for (const auto& item : doc.value("conflicts", json::array())) {
            ServerConflict conflict;
            auto collection = read_collection(item);
            if (collection.is_error()) return Err<DeltaResponse>(collection.error());
            conflict.collection = collection.value();
            conflict.entity_id = item.at("entityId").get<std::string>();
            conflict.client_version = item.value("clientVersion", std::uint64_t{0});
            conflict.server_version = item.value("serverVersion", std::uint64_t{0});
            conflict.client_data = item.value("clientData", json::object());
            conflict.server_data = item.value("serverData", json::object());
            conflict.kind = parse_kind(item.value("conflictType", std::string()));
            response.conflicts.push_back(std::move(conflict));
        }

        for (const auto& item : doc.value("rejected", json::array())) {
            Rejection rejection;
            auto collection = read_collection(item);
            if (collection.is_error()) return Err<DeltaResponse>(collection.error());
            rejection.collection = collection.value();
            rejection.entity_id = item.at("entityId").get<std::string>();
            rejection.reason = item.value("reason", std::string());
            rejection.permanent = item.value("permanent", false);
            response.rejected.push_back(std::move(rejection));
        }

        auto at = read_time(doc, "syncTimestamp");
        if (at.is_error()) return Err<DeltaResponse>(at.error());
        response.sync_timestamp = at.value();
        return Ok(std::move(response));
    } catch (const json::exception& e) {
        return Err<DeltaResponse>(ErrorKind::Validation, std::string("malformed delta response: ") + e.what());
    }
}

Result<store::Record> record_from_wire(store::Collection collection, const std::string& entity_id,
                                       std::uint64_t version, const json& data,
                                       std::optional<Timestamp> updated_at, std::optional<bool> is_deleted) {
    try {
        store::Record record;
        record.id = entity_id;
        record.collection = collection;
        record.version = version;
        record.is_dirty = false;
        record.is_deleted = is_deleted.value_or(data.value("isDeleted", false));
        record.last_modified_by = data.value("lastModifiedBy", std::string());

        if (updated_at) {
            record.updated_at = *updated_at;
        } else if (data.contains("updatedAt") && data["updatedAt"].is_string()) {
            auto at = core::parse_iso8601(data["updatedAt"].get<std::string>());
            if (at.is_error()) return Err<store::Record>(at.error());
            record.updated_at = at.value();
        }

        // Tombstones carry whatever the server still had, so only type-check them
        auto payload = store::payload_from_json(collection, data, !record.is_deleted);
        if (payload.is_error()) return Err<store::Record>(payload.error());
        record.payload = std::move(payload.value());
        return Ok(std::move(record));
    } catch (const json::exception& e) {
        return Err<store::Record>(ErrorKind::Validation, std::string("malformed entity data: ") + e.what());
    }
}

} // namespace hsync::sync
