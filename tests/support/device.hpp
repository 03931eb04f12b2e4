#pragma once

#include "fake_authority.hpp"

#include "hsync/core/clock.hpp"
#include "hsync/core/config.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/outbox/local_writer.hpp"
#include "hsync/outbox/outbox.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/entity_store.hpp"
#include "hsync/sync/conflict_store.hpp"
#include "hsync/sync/coordinator.hpp"
#include "hsync/sync/metadata.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace hsync::testing {

inline nlohmann::json task_fields(const std::string& title, const std::string& status = "open") {
    return {{"title", title}, {"status", status}};
}

inline core::SyncConfig device_config(const std::string& device_id) {
    core::SyncConfig config;
    config.device_id = device_id;
    config.actor_id = device_id + "-user";
    config.cycle_timeout = std::chrono::milliseconds(5000);
    return config;
}

/**
 * @brief One device's complete sync stack over an in-memory backend
 */
struct Device {
    Device(core::ManualClock& clock, sync::Transport& transport, core::SyncConfig cfg)
        : config(std::move(cfg)),
          clock(clock),
          store(clock, backend, config.actor_id),
          outbox(clock, backend, static_cast<std::uint32_t>(config.max_retries)),
          conflicts(clock, backend),
          metadata(backend),
          writer(store, outbox, &bus),
          coordinator(config, clock, store, outbox, writer, conflicts, metadata, transport, &bus) {
        EXPECT_TRUE(store.open().is_ok());
        EXPECT_TRUE(outbox.open().is_ok());
        EXPECT_TRUE(conflicts.open().is_ok());
        EXPECT_TRUE(metadata.open().is_ok());
    }

    Device(core::ManualClock& clock, sync::Transport& transport, const std::string& device_id)
        : Device(clock, transport, device_config(device_id)) {}

    store::Record put_task(const std::string& id, const nlohmann::json& fields) {
        auto written = writer.put(store::Collection::Tasks, id, fields);
        EXPECT_TRUE(written.is_ok()) << (written.is_error() ? written.error().message : "");
        return written.is_ok() ? written.value() : store::Record{};
    }

    std::optional<store::Record> task(const std::string& id) const {
        return store.get(store::Collection::Tasks, id);
    }

    core::SyncConfig config;
    core::ManualClock& clock;
    persistence::MemoryBackend backend;
    events::EventBus bus;
    store::EntityStore store;
    outbox::Outbox outbox;
    sync::ConflictStore conflicts;
    sync::MetadataStore metadata;
    outbox::LocalWriter writer;
    sync::SyncCoordinator coordinator;
};

} // namespace hsync::testing
