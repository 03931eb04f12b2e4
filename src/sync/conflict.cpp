#include "hsync/sync/conflict.hpp"
#include "hsync/store/payload.hpp"

#include <algorithm>
#include <set>

namespace hsync::sync {
namespace {

using json = nlohmann::json;

const store::Record& newer_of(const store::Record& client, const store::Record& server) {
    return client.updated_at > server.updated_at ? client : server;
}

json union_of(const json& client, const json& server) {
    json merged = client;
    for (const auto& item : server) {
        if (std::find(merged.begin(), merged.end(), item) == merged.end()) {
            merged.push_back(item);
        }
    }
    return merged;
}

json max_of(const json& client, const json& server) {
    if (client.is_number_integer() && server.is_number_integer()) {
        return std::max(client.get<std::int64_t>(), server.get<std::int64_t>());
    }
    return std::max(client.get<double>(), server.get<double>());
}

Resolution take_side(const store::Record& side, Strategy strategy, Winner winner, std::string explanation) {
    Resolution resolution;
    resolution.strategy = strategy;
    resolution.resolved_payload = side.payload;
    resolution.resolved_deleted = side.is_deleted;
    resolution.winner = winner;
    resolution.explanation = std::move(explanation);
    return resolution;
}

} // namespace

const char* kind_name(ConflictKind kind) {
    switch (kind) {
        case ConflictKind::Status: return "status";
        case ConflictKind::DeleteUpdate: return "delete_update";
        case ConflictKind::ConcurrentUpdate: return "concurrent_update";
        case ConflictKind::VersionRollback: return "version_rollback";
    }
    return "concurrent_update";
}

std::optional<ConflictKind> parse_kind(const std::string& name) {
    if (name == "status") return ConflictKind::Status;
    if (name == "delete_update") return ConflictKind::DeleteUpdate;
    if (name == "concurrent_update" || name == "version_mismatch") return ConflictKind::ConcurrentUpdate;
    if (name == "version_rollback") return ConflictKind::VersionRollback;
    return std::nullopt;
}

const char* strategy_name(Strategy strategy) {
    switch (strategy) {
        case Strategy::DeleteWins: return "deleteWins";
        case Strategy::StatusPriority: return "statusPriority";
        case Strategy::LastWriteWins: return "lastWriteWins";
        case Strategy::Merge: return "merge";
        case Strategy::KeepClient: return "keepClient";
        case Strategy::KeepServer: return "keepServer";
        case Strategy::Manual: return "manual";
    }
    return "manual";
}

std::optional<Strategy> parse_strategy(const std::string& name) {
    for (Strategy s : {Strategy::DeleteWins, Strategy::StatusPriority, Strategy::LastWriteWins,
                       Strategy::Merge, Strategy::KeepClient, Strategy::KeepServer, Strategy::Manual}) {
        if (name == strategy_name(s)) return s;
    }
    return std::nullopt;
}

const char* winner_name(Winner winner) {
    switch (winner) {
        case Winner::None: return "none";
        case Winner::Client: return "client";
        case Winner::Server: return "server";
        case Winner::Merged: return "merged";
    }
    return "none";
}

std::optional<Winner> parse_winner(const std::string& name) {
    for (Winner w : {Winner::None, Winner::Client, Winner::Server, Winner::Merged}) {
        if (name == winner_name(w)) return w;
    }
    return std::nullopt;
}

std::optional<ResolutionChoice> parse_choice(const std::string& name) {
    if (name == "client" || name == "keep-client" || name == "keepClient") return ResolutionChoice::KeepClient;
    if (name == "server" || name == "keep-server" || name == "keepServer") return ResolutionChoice::KeepServer;
    if (name == "merge") return ResolutionChoice::Merge;
    return std::nullopt;
}

// ============================================================================
// Serialization
// ============================================================================

json resolution_to_json(const Resolution& resolution, store::Collection) {
    json doc = {
        {"strategy", strategy_name(resolution.strategy)},
        {"winner", winner_name(resolution.winner)},
        {"resolvedDeleted", resolution.resolved_deleted},
        {"needsManualReview", resolution.needs_manual_review},
        {"unresolvedFields", resolution.unresolved_fields},
        {"explanation", resolution.explanation},
    };
    doc["resolvedPayload"] = resolution.resolved_payload
        ? store::payload_to_json(*resolution.resolved_payload)
        : json(nullptr);
    return doc;
}

Result<Resolution> resolution_from_json(const json& doc, store::Collection collection) {
    try {
        Resolution resolution;
        auto strategy = parse_strategy(doc.at("strategy").get<std::string>());
        auto winner = parse_winner(doc.value("winner", std::string("none")));
        if (!strategy || !winner) {
            return Err<Resolution>(ErrorKind::Validation, "unknown resolution strategy or winner");
        }
        resolution.strategy = *strategy;
        resolution.winner = *winner;
        resolution.resolved_deleted = doc.value("resolvedDeleted", false);
        resolution.needs_manual_review = doc.value("needsManualReview", false);
        resolution.unresolved_fields = doc.value("unresolvedFields", std::vector<std::string>{});
        resolution.explanation = doc.value("explanation", std::string());

        if (doc.contains("resolvedPayload") && !doc["resolvedPayload"].is_null()) {
            auto payload = store::payload_from_json(collection, doc["resolvedPayload"], false);
            if (payload.is_error()) return Err<Resolution>(payload.error());
            resolution.resolved_payload = std::move(payload.value());
        }
        return Ok(std::move(resolution));
    } catch (const json::exception& e) {
        return Err<Resolution>(ErrorKind::Validation, std::string("malformed resolution: ") + e.what());
    }
}

json conflict_to_json(const ConflictRecord& conflict) {
    json doc = {
        {"conflictId", conflict.conflict_id},
        {"collection", store::collection_name(conflict.collection)},
        {"entityId", conflict.entity_id},
        {"clientVersion", conflict.client_version},
        {"serverVersion", conflict.server_version},
        {"clientSnapshot", store::record_to_json(conflict.client)},
        {"serverSnapshot", store::record_to_json(conflict.server)},
        {"kind", kind_name(conflict.kind)},
        {"needsManualReview", conflict.needs_manual_review},
        {"detectedAt", core::to_iso8601(conflict.detected_at)},
    };
    doc["resolution"] = conflict.resolution
        ? resolution_to_json(*conflict.resolution, conflict.collection)
        : json(nullptr);
    doc["resolvedAt"] = conflict.resolved_at ? json(core::to_iso8601(*conflict.resolved_at)) : json(nullptr);
    return doc;
}

Result<ConflictRecord> conflict_from_json(const json& doc) {
    try {
        ConflictRecord conflict;
        conflict.conflict_id = doc.at("conflictId").get<std::string>();

        auto collection = store::parse_collection(doc.at("collection").get<std::string>());
        if (collection.is_error()) return Err<ConflictRecord>(collection.error());
        conflict.collection = collection.value();

        conflict.entity_id = doc.at("entityId").get<std::string>();
        conflict.client_version = doc.at("clientVersion").get<std::uint64_t>();
        conflict.server_version = doc.at("serverVersion").get<std::uint64_t>();

        auto client = store::record_from_json(doc.at("clientSnapshot"));
        if (client.is_error()) return Err<ConflictRecord>(client.error());
        conflict.client = std::move(client.value());

        auto server = store::record_from_json(doc.at("serverSnapshot"));
        if (server.is_error()) return Err<ConflictRecord>(server.error());
        conflict.server = std::move(server.value());

        auto kind = parse_kind(doc.at("kind").get<std::string>());
        if (!kind) return Err<ConflictRecord>(ErrorKind::Validation, "unknown conflict kind");
        conflict.kind = *kind;

        conflict.needs_manual_review = doc.value("needsManualReview", false);

        auto detected = core::parse_iso8601(doc.at("detectedAt").get<std::string>());
        if (detected.is_error()) return Err<ConflictRecord>(detected.error());
        conflict.detected_at = detected.value();

        if (doc.contains("resolution") && !doc["resolution"].is_null()) {
            auto resolution = resolution_from_json(doc["resolution"], conflict.collection);
            if (resolution.is_error()) return Err<ConflictRecord>(resolution.error());
            conflict.resolution = std::move(resolution.value());
        }
        if (doc.contains("resolvedAt") && doc["resolvedAt"].is_string()) {
            auto resolved = core::parse_iso8601(doc["resolvedAt"].get<std::string>());
            if (resolved.is_error()) return Err<ConflictRecord>(resolved.error());
            conflict.resolved_at = resolved.value();
        }
        return Ok(std::move(conflict));
    } catch (const json::exception& e) {
        return Err<ConflictRecord>(ErrorKind::Validation, std::string("malformed conflict: ") + e.what());
    }
}

// ============================================================================
// ConflictResolver
// ============================================================================

ConflictKind ConflictResolver::classify(const store::Record& client, const store::Record& server) {
    if (client.is_deleted != server.is_deleted) {
        return ConflictKind::DeleteUpdate;
    }
    auto client_status = store::status_of(client.payload);
    auto server_status = store::status_of(server.payload);
    if (client_status && server_status && *client_status != *server_status) {
        return ConflictKind::Status;
    }
    if (server.version < client.version) {
        return ConflictKind::VersionRollback;
    }
    return ConflictKind::ConcurrentUpdate;
}

Resolution ConflictResolver::resolve(const store::Record& client, const store::Record& server) const {
    // 1. Delete wins
    if (client.is_deleted || server.is_deleted) {
        if (server.is_deleted) {
            return take_side(server, Strategy::DeleteWins, Winner::Server, "server side is deleted");
        }
        return take_side(client, Strategy::DeleteWins, Winner::Client, "client side is deleted");
    }

    // 2. Status priority
    if (client.collection == store::Collection::Tasks) {
        auto client_status = store::status_of(client.payload);
        auto server_status = store::status_of(server.payload);
        if (client_status && server_status && *client_status != *server_status) {
            bool client_ahead = *client_status > *server_status;
            const auto& winner = client_ahead ? client : server;
            return take_side(winner, Strategy::StatusPriority,
                             client_ahead ? Winner::Client : Winner::Server,
                             std::string("status '") +
                             store::status_name(client_ahead ? *client_status : *server_status) +
                             "' outranks '" +
                             store::status_name(client_ahead ? *server_status : *client_status) + "'");
        }
    }

    // 3. Last writer wins, strictly
    if (client.updated_at != server.updated_at) {
        const auto& winner = newer_of(client, server);
        bool client_newer = &winner == &client;
        return take_side(winner, Strategy::LastWriteWins,
                         client_newer ? Winner::Client : Winner::Server,
                         std::string(client_newer ? "client" : "server") + " change is newer");
    }

    // 4. Manual
    Resolution resolution;
    resolution.strategy = Strategy::Manual;
    resolution.needs_manual_review = true;
    resolution.explanation = "equal timestamps, no rule decides";
    return resolution;
}

bool ConflictResolver::can_merge(const ConflictRecord& conflict) const {
    return !conflict.client.is_deleted && !conflict.server.is_deleted;
}

Result<Resolution> ConflictResolver::merge(const ConflictRecord& conflict, const FieldPicks& picks) const {
    if (!can_merge(conflict)) {
        return Err<Resolution>(ErrorKind::InvalidState, "a deletion cannot be merged with other changes");
    }

    const json client = store::payload_to_json(conflict.client.payload);
    const json server = store::payload_to_json(conflict.server.payload);

    std::set<std::string> keys;
    for (const auto& item : client.items()) keys.insert(item.key());
    for (const auto& item : server.items()) keys.insert(item.key());

    json merged = json::object();
    Resolution resolution;
    resolution.strategy = Strategy::Merge;
    resolution.winner = Winner::Merged;

    for (const auto& key : keys) {
        auto c = client.find(key);
        auto s = server.find(key);

        if (c == client.end()) { merged[key] = *s; continue; }
        if (s == server.end()) { merged[key] = *c; continue; }
        if (*c == *s) { merged[key] = *c; continue; }

        if (auto pick = picks.find(key); pick != picks.end()) {
            merged[key] = pick->second == Side::Client ? *c : *s;
        } else if (c->is_array() && s->is_array()) {
            merged[key] = union_of(*c, *s);
        } else if (c->is_number() && s->is_number()) {
            merged[key] = max_of(*c, *s);
        } else if (key == "status" && conflict.collection == store::Collection::Tasks &&
                   c->is_string() && s->is_string() &&
                   store::parse_status(c->get<std::string>()) && store::parse_status(s->get<std::string>())) {
            merged[key] = *store::parse_status(c->get<std::string>()) > *store::parse_status(s->get<std::string>())
                ? *c : *s;
        } else if (c->is_null()) {
            merged[key] = *s;
        } else if (s->is_null()) {
            merged[key] = *c;
        } else {
            resolution.unresolved_fields.push_back(key);
        }
    }

    if (!resolution.unresolved_fields.empty()) {
        resolution.strategy = Strategy::Manual;
        resolution.winner = Winner::None;
        resolution.needs_manual_review = true;
        resolution.explanation = "fields need an explicit pick";
        return Ok(std::move(resolution));
    }

    auto payload = store::payload_from_json(conflict.collection, merged);
    if (payload.is_error()) return Err<Resolution>(payload.error());

    resolution.resolved_payload = std::move(payload.value());
    resolution.explanation = "merged client and server changes";
    return Ok(std::move(resolution));
}

std::map<std::string, FieldDiff> ConflictResolver::get_diff(const ConflictRecord& conflict) const {
    const json client = store::payload_to_json(conflict.client.payload);
    const json server = store::payload_to_json(conflict.server.payload);

    std::map<std::string, FieldDiff> diff;
    for (const auto& [key, value] : client.items()) {
        diff[key].client_value = value;
    }
    for (const auto& [key, value] : server.items()) {
        diff[key].server_value = value;
    }
    for (auto& [key, field] : diff) {
        field.has_conflict = field.client_value != field.server_value;
    }
    if (conflict.client.is_deleted != conflict.server.is_deleted) {
        diff["isDeleted"] = FieldDiff{conflict.client.is_deleted, conflict.server.is_deleted, true};
    }
    return diff;
}

Result<Resolution> ConflictResolver::choose(const ConflictRecord& conflict, ResolutionChoice choice,
                                            const FieldPicks& picks) const {
    switch (choice) {
        case ResolutionChoice::KeepClient:
            return Ok(take_side(conflict.client, Strategy::KeepClient, Winner::Client, "reviewer kept client"));
        case ResolutionChoice::KeepServer:
            return Ok(take_side(conflict.server, Strategy::KeepServer, Winner::Server, "reviewer kept server"));
        case ResolutionChoice::Merge: {
            auto merged = merge(conflict, picks);
            if (merged.is_error()) return merged;
            if (merged.value().needs_manual_review) {
                std::string fields;
                for (const auto& f : merged.value().unresolved_fields) {
                    fields += fields.empty() ? f : ", " + f;
                }
                return Err<Resolution>(validation_error("merge needs a pick for: " + fields));
            }
            return merged;
        }
    }
    return Err<Resolution>(ErrorKind::InvalidState, "unknown resolution choice");
}

} // namespace hsync::sync
