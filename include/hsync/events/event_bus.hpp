/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for decoupled component communication
 *
 * WHY THIS FILE EXISTS:
 * The sync core reports what it did (records written, cycles finished,
 * conflicts parked for the user) without knowing who listens. The UI,
 * the logger and the metrics collector subscribe without knowing who emits.
 *
 * EXAMPLE:
 * EventBus bus;
 * Subscription sub = bus.listen<SyncCompletedEvent>([](const SyncCompletedEvent& e) { ... });
 * bus.emit(SyncCompletedEvent{...});
 * // handler is removed when `sub` goes out of scope
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hsync::events {

class EventBus;

/**
 * @brief Move-only handle that unsubscribes on destruction
 *
 * Must not outlive the bus it came from.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(EventBus* bus, size_t id) : bus_(bus), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = other.id_;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    inline void reset();
    bool active() const noexcept { return bus_ != nullptr; }
    size_t id() const noexcept { return id_; }

private:
    EventBus* bus_ = nullptr;
    size_t id_ = 0;
};

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - Multiple threads can emit and subscribe concurrently
 * - Handlers are called synchronously in the emitting thread
 * - Handlers run without the bus lock held, so they may subscribe or emit
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto type_id = std::type_index(typeid(EventType));
        size_t handler_id = next_handler_id_++;
        handlers_[type_id].push_back({handler_id, std::make_shared<HandlerImpl<EventType>>(std::move(handler))});
        owners_.emplace(handler_id, type_id);
        return handler_id;
    }

    /// Same as subscribe(), scoped to the returned handle.
    template<typename EventType>
    [[nodiscard]] Subscription listen(std::function<void(const EventType&)> handler) {
        return Subscription(this, subscribe<EventType>(std::move(handler)));
    }

    /// Unknown or already removed ids are ignored.
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto owner = owners_.find(handler_id);
        if (owner == owners_.end()) {
            return;
        }
        auto& handler_list = handlers_[owner->second];
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) { return pair.first == handler_id; }),
            handler_list.end());
        owners_.erase(owner);
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * A handler that throws std::exception is logged and skipped; the
     * remaining handlers still run. The emitter never sees the exception.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& entry : it->second) {
                handlers_copy.push_back(entry.second);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] Handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }

        std::function<void(const EventType&)> func;
    };

    using HandlerList = std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>;

    std::unordered_map<std::type_index, HandlerList> handlers_;
    std::unordered_map<size_t, std::type_index> owners_;   // handler id -> event type
    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

inline void Subscription::reset() {
    if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
    }
}

} // namespace hsync::events
