#include "hsync/sync/scheduler.hpp"
#include "hsync/events/events.hpp"

#include <spdlog/spdlog.h>

namespace hsync::sync {
namespace {

const char* trigger_name(SyncScheduler::Trigger trigger) {
    switch (trigger) {
        case SyncScheduler::Trigger::Manual: return "manual";
        case SyncScheduler::Trigger::Periodic: return "periodic";
        case SyncScheduler::Trigger::Connectivity: return "connectivity";
    }
    return "manual";
}

} // namespace

SyncScheduler::SyncScheduler(CycleRunner runner, std::chrono::milliseconds interval, events::EventBus* bus)
    : runner_(std::move(runner)), interval_(interval) {
    if (bus) {
        connectivity_ = bus->listen<events::ConnectivityChangedEvent>(
            [this](const events::ConnectivityChangedEvent& e) { set_online(e.online); });
    }
}

SyncScheduler::SyncScheduler(SyncCoordinator& coordinator, std::chrono::milliseconds interval,
                             events::EventBus* bus)
    : SyncScheduler([&coordinator] { return coordinator.run_cycle(); }, interval, bus) {}

SyncScheduler::~SyncScheduler() {
    connectivity_.reset();
    stop();
}

void SyncScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    queue_.reset();
    worker_ = std::thread([this] { worker_loop(); });
    spdlog::info("[SyncScheduler] Started, interval={}ms", interval_.count());
}

void SyncScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }
    queue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("[SyncScheduler] Stopped after {} cycle(s)", cycles_run_.load());
}

void SyncScheduler::request_sync() {
    if (!queue_.push_unique(Trigger::Manual)) {
        spdlog::debug("[SyncScheduler] Sync already requested, coalesced");
    }
}

void SyncScheduler::set_online(bool online) {
    bool was_online = online_.exchange(online);
    if (online && !was_online) {
        queue_.push_unique(Trigger::Connectivity);
    }
}

std::optional<SyncReport> SyncScheduler::last_report() const {
    std::lock_guard lock(report_mutex_);
    return last_report_;
}

void SyncScheduler::worker_loop() {
    while (running_.load()) {
        auto trigger = queue_.pop_for(interval_);
        if (queue_.is_shutdown()) {
            break;
        }
        if (!trigger) {
            if (online_.load()) {
                run(Trigger::Periodic);
            }
            continue;
        }
        run(*trigger);
    }
}

void SyncScheduler::run(Trigger trigger) {
    spdlog::debug("[SyncScheduler] Running cycle ({})", trigger_name(trigger));
    SyncReport report = runner_();
    {
        std::lock_guard lock(report_mutex_);
        last_report_ = std::move(report);
    }
    cycles_run_++;
}

} // namespace hsync::sync
