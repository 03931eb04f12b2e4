#include "hsync/core/clock.hpp"
#include "hsync/events/event_bus.hpp"
#include "hsync/events/events.hpp"
#include "hsync/outbox/local_writer.hpp"
#include "hsync/persistence/backend.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using hsync::ErrorKind;
using hsync::Result;
using hsync::core::ManualClock;
using hsync::events::EventBus;
using hsync::events::RecordWrittenEvent;
using hsync::outbox::LocalWriter;
using hsync::outbox::Operation;
using hsync::outbox::Outbox;
using hsync::persistence::MemoryBackend;
using hsync::store::Collection;
using hsync::store::EntityStore;
using json = nlohmann::json;

namespace {

/// Memory backend whose outbox table can be switched to fail.
class FlakyBackend : public MemoryBackend {
public:
    Result<void> upsert(const std::string& table, const std::string& key, const json& row) override {
        if (fail_outbox && table.rfind("outbox.", 0) == 0) {
            return hsync::Err<void>(ErrorKind::StorageCorruption, "disk full");
        }
        return MemoryBackend::upsert(table, key, row);
    }

    std::atomic<bool> fail_outbox{false};
};

class LocalWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(store.open().is_ok());
        ASSERT_TRUE(outbox.open().is_ok());
    }

    ManualClock clock;
    FlakyBackend backend;
    EventBus bus;
    EntityStore store{clock, backend, "parent-1"};
    Outbox outbox{clock, backend};
    LocalWriter writer{store, outbox, &bus};
};

} // namespace

TEST_F(LocalWriterTest, EveryWriteHasAPendingEntry) {
    auto created = writer.create(Collection::Tasks, json{{"title", "Dishes"}});
    ASSERT_TRUE(created.is_ok());

    auto entry = outbox.find_pending(Collection::Tasks, created.value().id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->op, Operation::Create);
    EXPECT_EQ(entry->version, 1u);
    EXPECT_EQ(entry->snapshot["title"], "Dishes");

    ASSERT_TRUE(writer.put(Collection::Tasks, created.value().id, json{{"points", 10}}).is_ok());
    entry = outbox.find_pending(Collection::Tasks, created.value().id);
    EXPECT_EQ(entry->op, Operation::Create);
    EXPECT_EQ(entry->version, 2u);
    EXPECT_EQ(entry->snapshot["points"], 10);

    ASSERT_TRUE(writer.remove(Collection::Tasks, created.value().id).is_ok());
    entry = outbox.find_pending(Collection::Tasks, created.value().id);
    EXPECT_EQ(entry->op, Operation::Delete);
    EXPECT_EQ(outbox.pending_count(), 1u);
}

TEST_F(LocalWriterTest, ValidationFailureQueuesNothing) {
    auto bad = writer.put(Collection::Events, "e1", json{{"title", "No start"}});
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::Validation);
    EXPECT_EQ(outbox.pending_count(), 0u);
    EXPECT_FALSE(store.get(Collection::Events, "e1").has_value());
}

TEST_F(LocalWriterTest, OutboxFailureUndoesTheWrite) {
    ASSERT_TRUE(writer.put(Collection::Tasks, "t1", json{{"title", "Dishes"}}).is_ok());

    backend.fail_outbox = true;
    auto failed = writer.put(Collection::Tasks, "t1", json{{"title", "Laundry"}});
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().kind, ErrorKind::StorageCorruption);

    auto record = store.get(Collection::Tasks, "t1");
    EXPECT_EQ(record->version, 1u);
    EXPECT_EQ(outbox.find_pending(Collection::Tasks, "t1")->version, 1u);

    auto removed = writer.remove(Collection::Tasks, "t1");
    ASSERT_TRUE(removed.is_error());
    EXPECT_FALSE(store.get(Collection::Tasks, "t1")->is_deleted);
}

TEST_F(LocalWriterTest, RepublishQueuesAnUpdate) {
    ASSERT_TRUE(writer.put(Collection::Tasks, "t1", json{{"title", "Dishes"}}).is_ok());
    auto entry = outbox.find_pending(Collection::Tasks, "t1");
    ASSERT_TRUE(outbox.clear_acknowledged({{entry->entry_id, entry->revision}}).is_ok());

    auto republished = writer.republish(Collection::Tasks, "t1");
    ASSERT_TRUE(republished.is_ok());
    EXPECT_EQ(republished.value().version, 2u);
    EXPECT_TRUE(republished.value().is_dirty);

    entry = outbox.find_pending(Collection::Tasks, "t1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->op, Operation::Update);
}

TEST_F(LocalWriterTest, AnnouncesWrites) {
    std::vector<std::string> ops;
    bus.subscribe<RecordWrittenEvent>([&](const RecordWrittenEvent& e) { ops.push_back(e.operation); });

    ASSERT_TRUE(writer.put(Collection::Tasks, "t1", json{{"title", "Dishes"}}).is_ok());
    ASSERT_TRUE(writer.put(Collection::Tasks, "t1", json{{"status", "done"}}).is_ok());
    ASSERT_TRUE(writer.remove(Collection::Tasks, "t1").is_ok());
    // Deleting a tombstone again is not a new write
    ASSERT_TRUE(writer.remove(Collection::Tasks, "t1").is_ok());

    EXPECT_EQ(ops, (std::vector<std::string>{"create", "update", "delete"}));
}

TEST_F(LocalWriterTest, ConcurrentWritersAcrossCollections) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, i]() {
            for (int j = 0; j < 50; ++j) {
                auto collection = i % 2 == 0 ? Collection::Tasks : Collection::PointsLedger;
                json fields = collection == Collection::Tasks
                    ? json{{"title", "task"}}
                    : json{{"userId", "kid"}, {"delta", 1}};
                EXPECT_TRUE(writer.create(collection, fields).is_ok());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store.size(Collection::Tasks), 100u);
    EXPECT_EQ(store.size(Collection::PointsLedger), 100u);
    EXPECT_EQ(outbox.pending_count(), 200u);
}
