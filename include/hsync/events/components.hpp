/**
 * @file components.hpp
 * @brief Reusable event-driven components
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Components react to sync events from here on
 */

#pragma once

#include "hsync/events/event_bus.hpp"
#include "hsync/events/events.hpp"
#include "hsync/store/payload.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <vector>

namespace hsync::events {

/**
 * @brief Logger component - logs every sync event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.listen<RecordWrittenEvent>([](const RecordWrittenEvent& e) {
            spdlog::debug("[RecordWritten] {}/{} v{} op={}",
                         store::collection_name(e.collection), e.id, e.version, e.operation);
        }));

        subscriptions_.push_back(bus.listen<OutboxEntryFailedEvent>([](const OutboxEntryFailedEvent& e) {
            spdlog::warn("[OutboxEntryFailed] entry={} {}/{} permanent={} reason={}",
                        e.entry_id, store::collection_name(e.collection), e.entity_id, e.permanent, e.reason);
        }));

        subscriptions_.push_back(bus.listen<ConflictDetectedEvent>([](const ConflictDetectedEvent& e) {
            spdlog::warn("[ConflictDetected] {}/{} kind={} manual={}",
                        store::collection_name(e.collection), e.entity_id, e.kind, e.needs_manual_review);
        }));

        subscriptions_.push_back(bus.listen<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] {}/{} strategy={} winner={}",
                        store::collection_name(e.collection), e.entity_id, e.strategy, e.winner);
        }));

        subscriptions_.push_back(bus.listen<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] device={} changes={}", e.device_id, e.change_count);
        }));

        subscriptions_.push_back(bus.listen<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            spdlog::info("[SyncCompleted] device={} sent={} received={} conflicts={} duration={}ms",
                        e.device_id, e.changes_sent, e.changes_received, e.conflicts, e.duration.count());
        }));

        subscriptions_.push_back(bus.listen<SyncFailedEvent>([](const SyncFailedEvent& e) {
            if (e.cancelled) {
                spdlog::info("[SyncCancelled] device={} reason={}", e.device_id, e.error_message);
            } else {
                spdlog::error("[SyncFailed] device={} error={}", e.device_id, e.error_message);
            }
        }));

        subscriptions_.push_back(bus.listen<ConnectivityChangedEvent>([](const ConnectivityChangedEvent& e) {
            spdlog::info("[Connectivity] {}", e.online ? "online" : "offline");
        }));
    }


    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Metrics component - counts sync activity
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Cycles: {}", stats.cycles_completed.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> records_written{0};
        std::atomic<uint64_t> records_deleted{0};
        std::atomic<uint64_t> cycles_started{0};
        std::atomic<uint64_t> cycles_completed{0};
        std::atomic<uint64_t> cycles_failed{0};
        std::atomic<uint64_t> cycles_cancelled{0};
        std::atomic<uint64_t> changes_sent{0};
        std::atomic<uint64_t> changes_received{0};
        std::atomic<uint64_t> entries_failed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        subscriptions_.push_back(bus.listen<RecordWrittenEvent>([this](const RecordWrittenEvent& e) {
            stats_.records_written++;
            if (e.operation == "delete") {
                stats_.records_deleted++;
            }
        }));

        subscriptions_.push_back(bus.listen<SyncStartedEvent>([this](const SyncStartedEvent&) {
            stats_.cycles_started++;
        }));

        subscriptions_.push_back(bus.listen<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.cycles_completed++;
            stats_.changes_sent += e.changes_sent;
            stats_.changes_received += e.changes_received;
        }));

        subscriptions_.push_back(bus.listen<SyncFailedEvent>([this](const SyncFailedEvent& e) {
            if (e.cancelled) {
                stats_.cycles_cancelled++;
            } else {
                stats_.cycles_failed++;
            }
        }));

        subscriptions_.push_back(bus.listen<OutboxEntryFailedEvent>([this](const OutboxEntryFailedEvent&) {
            stats_.entries_failed++;
        }));

        subscriptions_.push_back(bus.listen<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) {
            stats_.conflicts_detected++;
        }));

        subscriptions_.push_back(bus.listen<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) {
            stats_.conflicts_resolved++;
        }));
    }


    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Records written:   {}", stats_.records_written.load());
        spdlog::info("  Records deleted:   {}", stats_.records_deleted.load());
        spdlog::info("  Cycles completed:  {}", stats_.cycles_completed.load());
        spdlog::info("  Cycles failed:     {}", stats_.cycles_failed.load());
        spdlog::info("  Cycles cancelled:  {}", stats_.cycles_cancelled.load());
        spdlog::info("  Changes sent:      {}", stats_.changes_sent.load());
        spdlog::info("  Changes received:  {}", stats_.changes_received.load());
        spdlog::info("  Entries failed:    {}", stats_.entries_failed.load());
        spdlog::info("  Conflicts det.:    {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:    {}", stats_.conflicts_resolved.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    std::vector<Subscription> subscriptions_;   // released before stats_
};

} // namespace hsync::events
