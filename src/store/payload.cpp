#include "hsync/store/payload.hpp"

#include <algorithm>
#include <array>
#include <type_traits>

namespace hsync::store {
namespace {

using json = nlohmann::json;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const std::array<const char*, 8> kEnvelopeKeys{
    "id", "collection", "entityType", "version", "updatedAt", "isDirty", "isDeleted", "lastModifiedBy"};

bool is_envelope_key(const std::string& key) {
    return std::find(kEnvelopeKeys.begin(), kEnvelopeKeys.end(), key) != kEnvelopeKeys.end();
}

/**
 * Pulls typed fields out of a JSON object, remembering which keys were
 * consumed so the remainder can be kept as `extra`.
 */
class FieldReader {
public:
    explicit FieldReader(const json& doc) : doc_(doc) {}

    bool string(const char* key, std::string& out) {
        consumed_.emplace_back(key);
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return true;
        }
        if (!it->is_string()) {
            return fail(key, "string");
        }
        out = it->get<std::string>();
        return true;
    }

    bool optional_string(const char* key, std::optional<std::string>& out) {
        consumed_.emplace_back(key);
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            out.reset();
            return true;
        }
        if (!it->is_string()) {
            return fail(key, "string");
        }
        out = it->get<std::string>();
        return true;
    }

    bool integer(const char* key, std::int64_t& out) {
        consumed_.emplace_back(key);
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return true;
        }
        if (!it->is_number_integer()) {
            return fail(key, "integer");
        }
        out = it->get<std::int64_t>();
        return true;
    }

    bool boolean(const char* key, bool& out) {
        consumed_.emplace_back(key);
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return true;
        }
        if (!it->is_boolean()) {
            return fail(key, "boolean");
        }
        out = it->get<bool>();
        return true;
    }

    bool string_set(const char* key, std::vector<std::string>& out) {
        consumed_.emplace_back(key);
        auto it = doc_.find(key);
        if (it == doc_.end() || it->is_null()) {
            return true;
        }
        if (!it->is_array()) {
            return fail(key, "array of strings");
        }
        out.clear();
        for (const auto& item : *it) {
            if (!item.is_string()) {
                return fail(key, "array of strings");
            }
            auto value = item.get<std::string>();
            if (std::find(out.begin(), out.end(), value) == out.end()) {
                out.push_back(std::move(value));
            }
        }
        return true;
    }

    json leftovers() const {
        json extra = json::object();
        for (auto it = doc_.begin(); it != doc_.end(); ++it) {
            if (is_envelope_key(it.key())) {
                continue;
            }
            if (std::find(consumed_.begin(), consumed_.end(), it.key()) != consumed_.end()) {
                continue;
            }
            extra[it.key()] = it.value();
        }
        return extra;
    }

    const std::string& error() const { return error_; }

private:
    bool fail(const char* key, const char* expected) {
        error_ = std::string("field '") + key + "' must be " + expected;
        return false;
    }

    const json& doc_;
    std::vector<std::string> consumed_;
    std::string error_;
};

Result<Payload> read_task(const json& doc) {
    FieldReader reader(doc);
    TaskPayload task;
    std::string status = status_name(TaskStatus::Open);
    const bool ok = reader.string("title", task.title) &&
                    reader.string("desc", task.description) &&
                    reader.string("category", task.category) &&
                    reader.optional_string("due", task.due) &&
                    reader.string("status", status) &&
                    reader.string_set("assignees", task.assignees) &&
                    reader.integer("points", task.points) &&
                    reader.integer("priority", task.priority) &&
                    reader.optional_string("claimedBy", task.claimed_by);
    if (!ok) {
        return Err<Payload>(ErrorKind::Validation, "task: " + reader.error());
    }
    auto parsed_status = parse_status(status);
    if (!parsed_status) {
        return Err<Payload>(ErrorKind::Validation, "task: unknown status '" + status + "'");
    }
    task.status = *parsed_status;
    task.extra = reader.leftovers();
    return Ok(Payload{std::move(task)});
}

Result<Payload> read_event(const json& doc) {
    FieldReader reader(doc);
    EventPayload event;
    const bool ok = reader.string("title", event.title) &&
                    reader.string("description", event.description) &&
                    reader.string("start", event.start) &&
                    reader.optional_string("end", event.end) &&
                    reader.boolean("allDay", event.all_day) &&
                    reader.string_set("attendees", event.attendees) &&
                    reader.string("color", event.color) &&
                    reader.string("category", event.category);
    if (!ok) {
        return Err<Payload>(ErrorKind::Validation, "event: " + reader.error());
    }
    event.extra = reader.leftovers();
    return Ok(Payload{std::move(event)});
}

Result<Payload> read_ledger_entry(const json& doc) {
    FieldReader reader(doc);
    LedgerEntryPayload entry;
    const bool ok = reader.string("userId", entry.user_id) &&
                    reader.integer("delta", entry.delta) &&
                    reader.string("reason", entry.reason) &&
                    reader.optional_string("taskId", entry.task_id);
    if (!ok) {
        return Err<Payload>(ErrorKind::Validation, "points_ledger: " + reader.error());
    }
    entry.extra = reader.leftovers();
    return Ok(Payload{std::move(entry)});
}

void put_optional(json& doc, const char* key, const std::optional<std::string>& value) {
    doc[key] = value ? json(*value) : json(nullptr);
}

void merge_extra(json& doc, const json& extra) {
    if (!extra.is_object()) {
        return;
    }
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        if (!doc.contains(it.key())) {
            doc[it.key()] = it.value();
        }
    }
}

Result<void> validate_task(const TaskPayload& task) {
    if (task.title.empty()) {
        return Err<void>(core::validation_error("task: title must not be empty"));
    }
    if (task.points < 0) {
        return Err<void>(core::validation_error("task: points must be >= 0"));
    }
    if (task.due) {
        auto due = core::parse_iso8601(*task.due);
        if (due.is_error()) {
            return Err<void>(core::validation_error("task: " + due.error().message));
        }
    }
    return Ok();
}

Result<void> validate_event(const EventPayload& event) {
    if (event.title.empty()) {
        return Err<void>(core::validation_error("event: title must not be empty"));
    }
    if (event.start.empty()) {
        return Err<void>(core::validation_error("event: start is required"));
    }
    auto start = core::parse_iso8601(event.start);
    if (start.is_error()) {
        return Err<void>(core::validation_error("event: " + start.error().message));
    }
    if (event.end) {
        auto end = core::parse_iso8601(*event.end);
        if (end.is_error()) {
            return Err<void>(core::validation_error("event: " + end.error().message));
        }
        if (end.value() < start.value()) {
            return Err<void>(core::validation_error("event: end precedes start"));
        }
    }
    return Ok();
}

Result<void> validate_ledger_entry(const LedgerEntryPayload& entry) {
    if (entry.user_id.empty()) {
        return Err<void>(core::validation_error("points_ledger: userId must not be empty"));
    }
    if (entry.delta == 0) {
        return Err<void>(core::validation_error("points_ledger: delta must not be zero"));
    }
    return Ok();
}

} // namespace

const char* collection_name(Collection collection) {
    switch (collection) {
        case Collection::Tasks: return "tasks";
        case Collection::Events: return "events";
        case Collection::PointsLedger: return "points_ledger";
    }
    return "unknown";
}

Result<Collection> parse_collection(const std::string& name) {
    if (name == "tasks" || name == "task") return Ok(Collection::Tasks);
    if (name == "events" || name == "event") return Ok(Collection::Events);
    if (name == "points_ledger" || name == "points" || name == "ledger") return Ok(Collection::PointsLedger);
    return Err<Collection>(ErrorKind::Validation, "unknown collection '" + name + "'");
}

const std::vector<Collection>& all_collections() {
    static const std::vector<Collection> collections{
        Collection::Tasks, Collection::Events, Collection::PointsLedger};
    return collections;
}

const char* status_name(TaskStatus status) {
    switch (status) {
        case TaskStatus::Open: return "open";
        case TaskStatus::PendingApproval: return "pendingApproval";
        case TaskStatus::Done: return "done";
    }
    return "open";
}

std::optional<TaskStatus> parse_status(const std::string& name) {
    if (name == "open") return TaskStatus::Open;
    if (name == "pendingApproval") return TaskStatus::PendingApproval;
    if (name == "done") return TaskStatus::Done;
    return std::nullopt;
}

Collection collection_of(const Payload& payload) {
    return std::visit(overloaded{
        [](const TaskPayload&) { return Collection::Tasks; },
        [](const EventPayload&) { return Collection::Events; },
        [](const LedgerEntryPayload&) { return Collection::PointsLedger; },
    }, payload);
}

Result<Payload> payload_from_json(Collection collection, const json& doc, bool validate) {
    if (!doc.is_object()) {
        return Err<Payload>(ErrorKind::Validation,
                            std::string(collection_name(collection)) + ": payload must be a JSON object");
    }

    Result<Payload> decoded = [&]() -> Result<Payload> {
        switch (collection) {
            case Collection::Tasks: return read_task(doc);
            case Collection::Events: return read_event(doc);
            case Collection::PointsLedger: return read_ledger_entry(doc);
        }
        return Err<Payload>(ErrorKind::Validation, "unknown collection");
    }();

    if (decoded.is_error() || !validate) {
        return decoded;
    }
    auto valid = validate_payload(decoded.value());
    if (valid.is_error()) {
        return Err<Payload>(valid.error());
    }
    return decoded;
}

json payload_to_json(const Payload& payload) {
    return std::visit(overloaded{
        [](const TaskPayload& task) {
            json doc;
            doc["title"] = task.title;
            doc["desc"] = task.description;
            doc["category"] = task.category;
            put_optional(doc, "due", task.due);
            doc["status"] = status_name(task.status);
            doc["assignees"] = task.assignees;
            doc["points"] = task.points;
            doc["priority"] = task.priority;
            put_optional(doc, "claimedBy", task.claimed_by);
            merge_extra(doc, task.extra);
            return doc;
        },
        [](const EventPayload& event) {
            json doc;
            doc["title"] = event.title;
            doc["description"] = event.description;
            doc["start"] = event.start;
            put_optional(doc, "end", event.end);
            doc["allDay"] = event.all_day;
            doc["attendees"] = event.attendees;
            doc["color"] = event.color;
            doc["category"] = event.category;
            merge_extra(doc, event.extra);
            return doc;
        },
        [](const LedgerEntryPayload& entry) {
            json doc;
            doc["userId"] = entry.user_id;
            doc["delta"] = entry.delta;
            doc["reason"] = entry.reason;
            put_optional(doc, "taskId", entry.task_id);
            merge_extra(doc, entry.extra);
            return doc;
        },
    }, payload);
}

Result<void> validate_payload(const Payload& payload) {
    return std::visit(overloaded{
        [](const TaskPayload& task) { return validate_task(task); },
        [](const EventPayload& event) { return validate_event(event); },
        [](const LedgerEntryPayload& entry) { return validate_ledger_entry(entry); },
    }, payload);
}

std::optional<TaskStatus> status_of(const Payload& payload) {
    if (const auto* task = std::get_if<TaskPayload>(&payload)) {
        return task->status;
    }
    return std::nullopt;
}

std::vector<std::string> people_of(const Payload& payload) {
    if (const auto* task = std::get_if<TaskPayload>(&payload)) {
        return task->assignees;
    }
    if (const auto* event = std::get_if<EventPayload>(&payload)) {
        return event->attendees;
    }
    return {};
}

std::optional<std::string> due_of(const Payload& payload) {
    if (const auto* task = std::get_if<TaskPayload>(&payload)) {
        return task->due;
    }
    if (const auto* event = std::get_if<EventPayload>(&payload)) {
        return event->start;
    }
    return std::nullopt;
}

bool payload_equal(const Payload& lhs, const Payload& rhs) {
    return lhs.index() == rhs.index() && payload_to_json(lhs) == payload_to_json(rhs);
}

json record_to_json(const Record& record) {
    json doc;
    doc["id"] = record.id;
    doc["collection"] = collection_name(record.collection);
    doc["version"] = record.version;
    doc["updatedAt"] = core::to_iso8601(record.updated_at);
    doc["isDirty"] = record.is_dirty;
    doc["isDeleted"] = record.is_deleted;
    doc["lastModifiedBy"] = record.last_modified_by;
    doc["payload"] = payload_to_json(record.payload);
    return doc;
}

Result<Record> record_from_json(const json& doc) {
    if (!doc.is_object() || !doc.contains("id") || !doc.at("id").is_string() ||
        !doc.contains("collection") || !doc.at("collection").is_string() ||
        !doc.contains("version") || !doc.at("version").is_number_unsigned() ||
        !doc.contains("updatedAt") || !doc.at("updatedAt").is_string() ||
        !doc.contains("payload")) {
        return Err<Record>(ErrorKind::Validation, "record envelope is incomplete");
    }

    auto collection = parse_collection(doc.at("collection").get<std::string>());
    if (collection.is_error()) {
        return Err<Record>(collection.error());
    }
    auto updated_at = core::parse_iso8601(doc.at("updatedAt").get<std::string>());
    if (updated_at.is_error()) {
        return Err<Record>(updated_at.error());
    }
    auto payload = payload_from_json(collection.value(), doc.at("payload"), false);
    if (payload.is_error()) {
        return Err<Record>(payload.error());
    }

    Record record;
    record.id = doc.at("id").get<std::string>();
    record.collection = collection.value();
    record.version = doc.at("version").get<std::uint64_t>();
    record.updated_at = updated_at.value();
    record.is_dirty = doc.value("isDirty", false);
    record.is_deleted = doc.value("isDeleted", false);
    record.last_modified_by = doc.value("lastModifiedBy", std::string{});
    record.payload = std::move(payload.value());
    return Ok(record);
}

} // namespace hsync::store
