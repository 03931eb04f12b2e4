#include "hsync/core/clock.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/payload.hpp"
#include "hsync/sync/conflict_store.hpp"
#include "hsync/sync/metadata.hpp"

#include <gtest/gtest.h>

using hsync::ErrorKind;
using hsync::core::ManualClock;
using hsync::persistence::MemoryBackend;
using hsync::store::Collection;
using hsync::store::Record;
using hsync::store::TaskPayload;
using hsync::sync::ConflictKind;
using hsync::sync::ConflictRecord;
using hsync::sync::ConflictStore;
using hsync::sync::MetadataStore;
using hsync::sync::Resolution;
using hsync::sync::Strategy;
using hsync::sync::Winner;

namespace {

ConflictRecord pending_conflict(const std::string& entity_id, const std::string& server_title) {
    Record client;
    client.id = entity_id;
    client.version = 2;
    TaskPayload client_task;
    client_task.title = "client";
    client.payload = client_task;

    Record server = client;
    TaskPayload server_task;
    server_task.title = server_title;
    server.payload = server_task;
    server.version = 3;

    ConflictRecord conflict;
    conflict.collection = Collection::Tasks;
    conflict.entity_id = entity_id;
    conflict.client_version = 2;
    conflict.server_version = 3;
    conflict.client = client;
    conflict.server = server;
    conflict.kind = ConflictKind::ConcurrentUpdate;
    conflict.needs_manual_review = true;
    return conflict;
}

Resolution kept_server(const ConflictRecord& conflict) {
    Resolution resolution;
    resolution.strategy = Strategy::KeepServer;
    resolution.winner = Winner::Server;
    resolution.resolved_payload = conflict.server.payload;
    return resolution;
}

} // namespace

TEST(ConflictStoreTest, OnePendingConflictPerEntity) {
    ManualClock clock;
    MemoryBackend backend;
    ConflictStore store(clock, backend);
    ASSERT_TRUE(store.open().is_ok());

    auto first = store.record(pending_conflict("t1", "v3"));
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().conflict_id.empty());
    EXPECT_EQ(first.value().detected_at, clock.now());

    clock.advance(std::chrono::minutes(5));
    auto refreshed = store.record(pending_conflict("t1", "v4"));
    ASSERT_TRUE(refreshed.is_ok());
    EXPECT_EQ(refreshed.value().conflict_id, first.value().conflict_id);
    EXPECT_EQ(refreshed.value().detected_at, first.value().detected_at);

    EXPECT_EQ(store.pending_count(), 1u);
    auto current = store.pending_for(Collection::Tasks, "t1");
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(std::get<TaskPayload>(current->server.payload).title, "v4");
}

TEST(ConflictStoreTest, ResolvingMovesToHistory) {
    ManualClock clock;
    MemoryBackend backend;
    ConflictStore store(clock, backend);
    ASSERT_TRUE(store.open().is_ok());

    auto conflict = store.record(pending_conflict("t1", "server")).value();
    clock.advance(std::chrono::seconds(30));

    auto resolved = store.mark_resolved(conflict.conflict_id, kept_server(conflict));
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_TRUE(resolved.value().is_resolved());
    EXPECT_FALSE(resolved.value().needs_manual_review);
    EXPECT_EQ(*resolved.value().resolved_at, clock.now());

    EXPECT_EQ(store.pending_count(), 0u);
    EXPECT_EQ(store.resolved_count(), 1u);
    EXPECT_FALSE(store.pending_for(Collection::Tasks, "t1").has_value());

    auto twice = store.mark_resolved(conflict.conflict_id, kept_server(conflict));
    ASSERT_TRUE(twice.is_error());
    EXPECT_EQ(twice.error().kind, ErrorKind::InvalidState);

    auto missing = store.mark_resolved("nope", kept_server(conflict));
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    // A fresh divergence after resolution opens a new conflict
    auto again = store.record(pending_conflict("t1", "later"));
    ASSERT_TRUE(again.is_ok());
    EXPECT_NE(again.value().conflict_id, conflict.conflict_id);
}

TEST(ConflictStoreTest, PersistsAndPrunes) {
    ManualClock clock;
    MemoryBackend backend;
    std::string pending_id;
    {
        ConflictStore store(clock, backend);
        ASSERT_TRUE(store.open().is_ok());
        auto old = store.record(pending_conflict("t1", "a")).value();
        ASSERT_TRUE(store.mark_resolved(old.conflict_id, kept_server(old)).is_ok());
        pending_id = store.record(pending_conflict("t2", "b")).value().conflict_id;
    }

    clock.advance(std::chrono::hours(24 * 8));

    ConflictStore reopened(clock, backend);
    ASSERT_TRUE(reopened.open().is_ok());
    EXPECT_EQ(reopened.pending_count(), 1u);
    EXPECT_EQ(reopened.resolved_count(), 1u);

    auto conflict = reopened.find(pending_id);
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->kind, ConflictKind::ConcurrentUpdate);
    EXPECT_EQ(std::get<TaskPayload>(conflict->client.payload).title, "client");

    auto pruned = reopened.prune_resolved(clock.now() - std::chrono::hours(24 * 7));
    ASSERT_TRUE(pruned.is_ok());
    EXPECT_EQ(pruned.value(), 1u);
    EXPECT_EQ(reopened.resolved_count(), 0u);
    EXPECT_EQ(reopened.pending_count(), 1u);
}

TEST(MetadataStoreTest, TracksLastSyncPerCollection) {
    MemoryBackend backend;
    ManualClock clock;
    {
        MetadataStore metadata(backend);
        ASSERT_TRUE(metadata.open().is_ok());
        EXPECT_FALSE(metadata.last_sync_at(Collection::Tasks).has_value());

        ASSERT_TRUE(metadata.record_success(Collection::Tasks, clock.now()).is_ok());
        ASSERT_TRUE(metadata.record_failure(Collection::Events, "HTTP 500").is_ok());
    }

    MetadataStore reopened(backend);
    ASSERT_TRUE(reopened.open().is_ok());
    EXPECT_EQ(reopened.last_sync_at(Collection::Tasks), clock.now());
    EXPECT_FALSE(reopened.last_sync_at(Collection::Events).has_value());

    auto tasks = reopened.get(Collection::Tasks);
    EXPECT_EQ(tasks.successful_syncs, 1u);
    auto events = reopened.get(Collection::Events);
    EXPECT_EQ(events.failed_syncs, 1u);
    EXPECT_EQ(events.last_error, "HTTP 500");
}
