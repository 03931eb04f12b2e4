#pragma once

#include "hsync/core/result.hpp"
#include "hsync/store/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace hsync::store {

const char* collection_name(Collection collection);

/// Accepts "tasks", "events", "points_ledger" and the singular wire aliases.
Result<Collection> parse_collection(const std::string& name);

const std::vector<Collection>& all_collections();

const char* status_name(TaskStatus status);
std::optional<TaskStatus> parse_status(const std::string& name);

Collection collection_of(const Payload& payload);

/**
 * @brief Decode and validate a payload for a collection
 *
 * Known fields are type-checked and validated against the collection's
 * rules; unknown fields are kept in `extra`. Record envelope keys
 * (id, version, updatedAt, isDirty, isDeleted, lastModifiedBy) are ignored.
 * With `validate == false` only field types are checked, which is what
 * tombstones need: a delete carries whatever the server still had.
 */
Result<Payload> payload_from_json(Collection collection, const nlohmann::json& doc, bool validate = true);

/// Flat field view of a payload, `extra` merged in. Inverse of payload_from_json.
nlohmann::json payload_to_json(const Payload& payload);

/// Re-run collection rules on an already typed payload.
Result<void> validate_payload(const Payload& payload);

/// Status for task-like payloads, nullopt for every other collection.
std::optional<TaskStatus> status_of(const Payload& payload);

/// Assignees of a task or attendees of an event.
std::vector<std::string> people_of(const Payload& payload);

std::optional<std::string> due_of(const Payload& payload);

bool payload_equal(const Payload& lhs, const Payload& rhs);

/// Record envelope plus payload fields, the shape used for conflict snapshots.
nlohmann::json record_to_json(const Record& record);
Result<Record> record_from_json(const nlohmann::json& doc);

} // namespace hsync::store
