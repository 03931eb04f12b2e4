#pragma once

/**
 * @file local_writer.hpp
 * @brief The UI lane's write path: store mutation and outbox entry as one unit
 *
 * Every mutation goes through EntityStore's write hook, so the record and its
 * outbox entry are committed together or not at all. No local write is ever
 * without a matching pending entry.
 *
 * Lock order is always store collection lock, then outbox lock.
 */

#include "hsync/events/event_bus.hpp"
#include "hsync/outbox/outbox.hpp"
#include "hsync/store/entity_store.hpp"

namespace hsync::outbox {

class LocalWriter {
public:
    LocalWriter(store::EntityStore& store, Outbox& outbox, events::EventBus* bus = nullptr);

    Result<store::Record> put(store::Collection collection, const std::string& id, store::Payload payload);
    Result<store::Record> put(store::Collection collection, const std::string& id, const nlohmann::json& fields);

    /// Mint a fresh id and create the record from `fields`.
    Result<store::Record> create(store::Collection collection, const nlohmann::json& fields);

    Result<store::Record> remove(store::Collection collection, const std::string& id);

    /// Queue the current local state again under a new version (used after client-wins resolutions).
    Result<store::Record> republish(store::Collection collection, const std::string& id);

private:
    store::EntityStore::WriteHook hook_for(std::optional<Operation> forced);
    void announce(const store::Record& record, Operation op);

    store::EntityStore& store_;
    Outbox& outbox_;
    events::EventBus* bus_;
};

} // namespace hsync::outbox
