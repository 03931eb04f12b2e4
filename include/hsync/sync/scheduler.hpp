#pragma once

/**
 * @file scheduler.hpp
 * @brief Background lane that posts sync cycles onto a single worker
 *
 * Cycle requests come from three places:
 * - request_sync()               explicit, e.g. pull-to-refresh
 * - the periodic interval        only while online
 * - a transition to online       via set_online() or ConnectivityChangedEvent
 *
 * All of them land in one queue drained by one worker thread, so cycles
 * never overlap. stop() is the only way to end the worker.
 */

#include "hsync/events/event_bus.hpp"
#include "hsync/events/event_queue.hpp"
#include "hsync/sync/coordinator.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace hsync::sync {

class SyncScheduler {
public:
    using CycleRunner = std::function<SyncReport()>;

    enum class Trigger {
        Manual,
        Periodic,
        Connectivity
    };

    SyncScheduler(CycleRunner runner, std::chrono::milliseconds interval, events::EventBus* bus = nullptr);
    SyncScheduler(SyncCoordinator& coordinator, std::chrono::milliseconds interval,
                  events::EventBus* bus = nullptr);
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    void start();

    /// Signal the worker, wait for the cycle in progress, join.
    void stop();

    /// Queue a manual cycle; a request already waiting absorbs this one.
    void request_sync();

    /// Record connectivity; going from offline to online requests a cycle.
    void set_online(bool online);

    bool is_running() const noexcept { return running_.load(); }
    bool is_online() const noexcept { return online_.load(); }
    std::size_t cycles_run() const noexcept { return cycles_run_.load(); }
    std::optional<SyncReport> last_report() const;

private:
    void worker_loop();
    void run(Trigger trigger);

    CycleRunner runner_;
    std::chrono::milliseconds interval_;
    events::WakeQueue<Trigger> queue_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> online_{true};
    std::atomic<std::size_t> cycles_run_{0};

    mutable std::mutex report_mutex_;
    std::optional<SyncReport> last_report_;

    events::Subscription connectivity_;
};

} // namespace hsync::sync
