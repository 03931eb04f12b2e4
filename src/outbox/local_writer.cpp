#include "hsync/outbox/local_writer.hpp"
#include "hsync/core/id.hpp"
#include "hsync/events/events.hpp"

namespace hsync::outbox {

namespace {

Operation operation_for(const store::Record& record) {
    if (record.is_deleted) return Operation::Delete;
    return record.version == 1 ? Operation::Create : Operation::Update;
}

} // namespace

LocalWriter::LocalWriter(store::EntityStore& store, Outbox& outbox, events::EventBus* bus)
    : store_(store), outbox_(outbox), bus_(bus) {}

store::EntityStore::WriteHook LocalWriter::hook_for(std::optional<Operation> forced) {
    return [this, forced](const store::Record& record) -> Result<void> {
        auto queued = outbox_.enqueue(record, forced.value_or(operation_for(record)));
        if (queued.is_error()) return Err<void>(queued.error());
        return Ok();
    };
}

void LocalWriter::announce(const store::Record& record, Operation op) {
    if (bus_) {
        bus_->emit(events::RecordWrittenEvent(record.collection, record.id, record.version, operation_name(op)));
    }
}

Result<store::Record> LocalWriter::put(store::Collection collection, const std::string& id, store::Payload payload) {
    auto written = store_.put(collection, id, std::move(payload), hook_for(std::nullopt));
    if (written.is_ok()) announce(written.value(), operation_for(written.value()));
    return written;
}

Result<store::Record> LocalWriter::put(store::Collection collection, const std::string& id,
                                       const nlohmann::json& fields) {
    auto written = store_.put(collection, id, fields, hook_for(std::nullopt));
    if (written.is_ok()) announce(written.value(), operation_for(written.value()));
    return written;
}

Result<store::Record> LocalWriter::create(store::Collection collection, const nlohmann::json& fields) {
    return put(collection, core::generate_id(), fields);
}

Result<store::Record> LocalWriter::remove(store::Collection collection, const std::string& id) {
    auto before = store_.get(collection, id);
    if (before && before->is_deleted) {
        return Ok(*before);
    }
    auto written = store_.remove(collection, id, hook_for(Operation::Delete));
    if (written.is_ok()) announce(written.value(), Operation::Delete);
    return written;
}

Result<store::Record> LocalWriter::republish(store::Collection collection, const std::string& id) {
    auto written = store_.republish(collection, id, [this](const store::Record& record) -> Result<void> {
        auto queued = outbox_.enqueue(record, record.is_deleted ? Operation::Delete : Operation::Update);
        if (queued.is_error()) return Err<void>(queued.error());
        return Ok();
    });
    if (written.is_ok()) {
        announce(written.value(), written.value().is_deleted ? Operation::Delete : Operation::Update);
    }
    return written;
}

} // namespace hsync::outbox
