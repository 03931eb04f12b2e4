#include "hsync/core/clock.hpp"
#include "hsync/persistence/backend.hpp"
#include "hsync/store/entity_store.hpp"
#include "hsync/store/payload.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using hsync::ErrorKind;
using hsync::Ok;
using hsync::Result;
using hsync::core::ManualClock;
using hsync::persistence::MemoryBackend;
using hsync::store::Collection;
using hsync::store::EntityStore;
using hsync::store::QueryOptions;
using hsync::store::Record;
using hsync::store::RemoteState;
using hsync::store::TaskPayload;
using hsync::store::TaskStatus;
using json = nlohmann::json;

namespace {

class EntityStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store.open().is_ok());
    }

    Record put(const std::string& id, const json& fields) {
        auto written = store.put(Collection::Tasks, id, fields);
        EXPECT_TRUE(written.is_ok()) << (written.is_error() ? written.error().message : "");
        return written.is_ok() ? written.value() : Record{};
    }

    RemoteState remote(const std::string& id, std::uint64_t version, const std::string& title) {
        RemoteState state;
        state.id = id;
        TaskPayload task;
        task.title = title;
        state.payload = task;
        state.version = version;
        state.updated_at = clock.now();
        state.modified_by = "server";
        return state;
    }

    ManualClock clock;
    MemoryBackend backend;
    EntityStore store{clock, backend, "parent-1"};
};

} // namespace

TEST_F(EntityStoreTest, CreateStartsAtVersionOneAndDirty) {
    auto record = put("t1", {{"title", "Dishes"}});

    EXPECT_EQ(record.version, 1u);
    EXPECT_TRUE(record.is_dirty);
    EXPECT_FALSE(record.is_deleted);
    EXPECT_EQ(record.last_modified_by, "parent-1");
    EXPECT_EQ(record.updated_at, clock.now());
    EXPECT_EQ(store.dirty_count(Collection::Tasks), 1u);
}

TEST_F(EntityStoreTest, UpdatesBumpVersionAndOverlayFields) {
    put("t1", {{"title", "Dishes"}, {"points", 5}});
    clock.advance(std::chrono::seconds(1));
    auto updated = put("t1", {{"status", "done"}});

    EXPECT_EQ(updated.version, 2u);
    auto task = std::get<TaskPayload>(updated.payload);
    EXPECT_EQ(task.title, "Dishes");
    EXPECT_EQ(task.points, 5);
    EXPECT_EQ(task.status, TaskStatus::Done);
}

TEST_F(EntityStoreTest, InvalidPayloadIsRejectedWithoutSideEffects) {
    auto bad = store.put(Collection::Tasks, "t1", json{{"title", ""}});
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::Validation);
    EXPECT_FALSE(store.get(Collection::Tasks, "t1").has_value());

    auto wrong_type = store.put(Collection::Tasks, "t1", json{{"title", "ok"}, {"points", "many"}});
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Validation);
}

TEST_F(EntityStoreTest, RemoveLeavesDirtyTombstone) {
    put("t1", {{"title", "Dishes"}});
    auto removed = store.remove(Collection::Tasks, "t1");

    ASSERT_TRUE(removed.is_ok());
    EXPECT_TRUE(removed.value().is_deleted);
    EXPECT_TRUE(removed.value().is_dirty);
    EXPECT_EQ(removed.value().version, 2u);

    // Tombstones are hidden from queries unless asked for
    EXPECT_TRUE(store.query(Collection::Tasks, nullptr).empty());
    QueryOptions with_deleted;
    with_deleted.include_deleted = true;
    EXPECT_EQ(store.query(Collection::Tasks, nullptr, with_deleted).size(), 1u);

    auto again = store.put(Collection::Tasks, "t1", json{{"title", "Back"}});
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::Validation);

    auto missing = store.remove(Collection::Tasks, "nope");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(EntityStoreTest, FailingHookRollsBackTheWrite) {
    put("t1", {{"title", "Dishes"}});

    auto failing = [](const Record&) -> Result<void> {
        return hsync::Err<void>(ErrorKind::StorageCorruption, "outbox unavailable");
    };
    auto written = store.put(Collection::Tasks, "t1", json{{"title", "Laundry"}}, failing);
    ASSERT_TRUE(written.is_error());

    auto current = store.get(Collection::Tasks, "t1");
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->version, 1u);
    EXPECT_EQ(std::get<TaskPayload>(current->payload).title, "Dishes");

    // The backend agrees after a reload
    EntityStore reopened(clock, backend, "parent-1");
    ASSERT_TRUE(reopened.open().is_ok());
    EXPECT_EQ(std::get<TaskPayload>(reopened.get(Collection::Tasks, "t1")->payload).title, "Dishes");

    auto fresh = store.put(Collection::Tasks, "t2", json{{"title", "Trash"}}, failing);
    ASSERT_TRUE(fresh.is_error());
    EXPECT_FALSE(store.get(Collection::Tasks, "t2").has_value());
}

TEST_F(EntityStoreTest, ApplyRemoteNeverLowersVersion) {
    put("t1", {{"title", "Dishes"}});
    put("t1", {{"title", "Dishes!"}});
    put("t1", {{"title", "Dishes!!"}});

    auto applied = store.apply_remote(Collection::Tasks, remote("t1", 2, "Server dishes"));
    ASSERT_TRUE(applied.is_ok());
    EXPECT_EQ(applied.value().version, 3u);
    EXPECT_FALSE(applied.value().is_dirty);
    EXPECT_EQ(std::get<TaskPayload>(applied.value().payload).title, "Server dishes");

    auto state = remote("t1", 1, "Rolled back");
    state.authorize_rollback = true;
    auto rolled = store.apply_remote(Collection::Tasks, state);
    ASSERT_TRUE(rolled.is_ok());
    EXPECT_EQ(rolled.value().version, 1u);
}

TEST_F(EntityStoreTest, ApplyRemoteIsIdempotent) {
    auto state = remote("t1", 4, "From server");

    auto first = store.apply_remote(Collection::Tasks, state);
    clock.advance(std::chrono::seconds(5));
    auto second = store.apply_remote(Collection::Tasks, state);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().version, 4u);
    EXPECT_EQ(second.value().version, 4u);
    EXPECT_EQ(second.value().updated_at, first.value().updated_at);
    EXPECT_EQ(store.size(Collection::Tasks), 1u);
}

TEST_F(EntityStoreTest, ApplyRemoteRefusesWhenLocalMovedOn) {
    put("t1", {{"title", "Dishes"}});
    auto state = remote("t1", 1, "Server");
    state.expected_local_version = 0;

    auto refused = store.apply_remote(Collection::Tasks, state);
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ErrorKind::Busy);
    EXPECT_TRUE(store.get(Collection::Tasks, "t1")->is_dirty);
}

TEST_F(EntityStoreTest, MarkCleanOnlyAtAcknowledgedVersion) {
    put("t1", {{"title", "a"}});
    put("t2", {{"title", "b"}});
    put("t2", {{"title", "b2"}});

    ASSERT_TRUE(store.mark_clean(Collection::Tasks, std::vector<hsync::store::VersionedId>{{"t1", 1}, {"t2", 1}}).is_ok());

    EXPECT_FALSE(store.get(Collection::Tasks, "t1")->is_dirty);
    EXPECT_TRUE(store.get(Collection::Tasks, "t2")->is_dirty);
}

TEST_F(EntityStoreTest, QueryHelpers) {
    put("t1", {{"title", "Dishes"}, {"status", "done"}, {"assignees", {"kid-1"}},
               {"due", "2023-11-10T10:00:00Z"}});
    clock.advance(std::chrono::seconds(1));
    put("t2", {{"title", "Laundry"}, {"assignees", {"kid-1", "kid-2"}}, {"due", "2023-12-01T10:00:00Z"}});
    clock.advance(std::chrono::seconds(1));
    put("t3", {{"title", "Trash"}, {"status", "done"}});

    auto done = store.by_status(Collection::Tasks, TaskStatus::Done);
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done[0].id, "t1");
    EXPECT_EQ(done[1].id, "t3");

    auto kid2 = store.by_assignee(Collection::Tasks, "kid-2");
    ASSERT_EQ(kid2.size(), 1u);
    EXPECT_EQ(kid2[0].id, "t2");

    auto overdue = store.due_before(Collection::Tasks, clock.now());
    ASSERT_EQ(overdue.size(), 1u);
    EXPECT_EQ(overdue[0].id, "t1");

    QueryOptions page;
    page.descending = true;
    page.limit = 2;
    page.offset = 1;
    auto paged = store.query(Collection::Tasks, nullptr, page);
    ASSERT_EQ(paged.size(), 2u);
    EXPECT_EQ(paged[0].id, "t2");
    EXPECT_EQ(paged[1].id, "t1");
}

TEST_F(EntityStoreTest, PurgeRetiresAcknowledgedTombstone) {
    put("t1", {{"title", "Dishes"}});
    ASSERT_TRUE(store.remove(Collection::Tasks, "t1").is_ok());

    auto early = store.purge(Collection::Tasks, "t1");
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().kind, ErrorKind::InvalidState);

    ASSERT_TRUE(store.mark_clean(Collection::Tasks, std::vector<std::string>{"t1"}).is_ok());
    ASSERT_TRUE(store.purge(Collection::Tasks, "t1").is_ok());

    EXPECT_FALSE(store.get(Collection::Tasks, "t1").has_value());
    EXPECT_TRUE(store.is_retired(Collection::Tasks, "t1"));

    auto reuse = store.put(Collection::Tasks, "t1", json{{"title", "Again"}});
    ASSERT_TRUE(reuse.is_error());
    EXPECT_EQ(reuse.error().kind, ErrorKind::Validation);

    EntityStore reopened(clock, backend, "parent-1");
    ASSERT_TRUE(reopened.open().is_ok());
    EXPECT_TRUE(reopened.is_retired(Collection::Tasks, "t1"));
}

TEST_F(EntityStoreTest, CorruptCollectionIsHaltedOthersStayUsable) {
    MemoryBackend damaged;
    ASSERT_TRUE(damaged.upsert("records.tasks", "t1", json{{"garbage", true}}).is_ok());

    EntityStore halted(clock, damaged, "parent-1");
    auto opened = halted.open();
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::StorageCorruption);
    EXPECT_TRUE(halted.is_halted(Collection::Tasks));
    EXPECT_FALSE(halted.is_halted(Collection::Events));

    auto write = halted.put(Collection::Tasks, "t2", json{{"title", "x"}});
    ASSERT_TRUE(write.is_error());
    EXPECT_EQ(write.error().kind, ErrorKind::StorageCorruption);

    auto event = halted.put(Collection::Events, "e1", json{{"title", "Dentist"}, {"start", "2024-01-01T09:00:00Z"}});
    EXPECT_TRUE(event.is_ok());
}

TEST_F(EntityStoreTest, ConcurrentWritersMintDistinctVersions) {
    put("t1", {{"title", "Counter"}});

    std::vector<std::thread> threads;
    std::mutex seen_mutex;
    std::set<std::uint64_t> seen;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            for (int j = 0; j < 25; ++j) {
                auto written = store.put(Collection::Tasks, "t1", json{{"points", i * 100 + j}});
                ASSERT_TRUE(written.is_ok());
                std::lock_guard lock(seen_mutex);
                seen.insert(written.value().version);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(seen.size(), 200u);
    EXPECT_EQ(store.get(Collection::Tasks, "t1")->version, 201u);
}

TEST_F(EntityStoreTest, ConcurrentOverlaysKeepBothFields) {
    constexpr int kTasks = 500;
    for (int i = 0; i < kTasks; ++i) {
        put("t" + std::to_string(i), {{"title", "Chore"}});
    }

    std::atomic<bool> go{false};
    auto writer = [&](const char* field, const char* value) {
        while (!go) std::this_thread::yield();
        for (int i = 0; i < kTasks; ++i) {
            auto written = store.put(Collection::Tasks, "t" + std::to_string(i), json{{field, value}});
            ASSERT_TRUE(written.is_ok());
        }
    };
    std::thread first(writer, "category", "kitchen");
    std::thread second(writer, "desc", "after dinner");
    go = true;
    first.join();
    second.join();

    for (int i = 0; i < kTasks; ++i) {
        auto record = store.get(Collection::Tasks, "t" + std::to_string(i));
        ASSERT_TRUE(record.has_value());
        const auto& task = std::get<TaskPayload>(record->payload);
        EXPECT_EQ(task.category, "kitchen") << record->id;
        EXPECT_EQ(task.description, "after dinner") << record->id;
        EXPECT_EQ(record->version, 3u);
    }
}
