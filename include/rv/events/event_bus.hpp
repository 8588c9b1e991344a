/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe registry behind the notification hub
 *
 * WHY THIS FILE EXISTS:
 * Workers and the restore poller must not know who is watching them. They
 * publish typed events, observers subscribe by event type, and neither side
 * holds a reference to the other.
 *
 * DELIVERY:
 * emit() runs every handler of the event's type on the calling thread, in
 * subscription order. NotificationHub calls it from its dispatcher thread
 * only, so producers never run observer code.
 *
 * A handler that throws is logged and counted in failed_deliveries(); the
 * remaining handlers still run and the exception never reaches the emitter.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<Notification>([](const Notification& n) { ... });
 * bus.emit(Notification{...});
 * bus.unsubscribe<Notification>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace rv::events {

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for one event type
     *
     * RETURNS:
     * Subscription id, unique across all event types of this bus
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        // Erase the event type; emit() only passes EventType under this key
        auto erased = std::make_shared<const Thunk>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const EventType*>(event)); });

        std::unique_lock lock(mutex_);
        const auto id = ++last_id_;
        routes_[key_of<EventType>()].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    /// true if id was registered for EventType.
    template<typename EventType>
    bool unsubscribe(std::size_t id) {
        std::unique_lock lock(mutex_);
        auto route = routes_.find(key_of<EventType>());
        if (route == routes_.end()) {
            return false;
        }

        auto& subs = route->second;
        auto it = std::find_if(subs.begin(), subs.end(), [id](const Subscription& s) { return s.id == id; });
        if (it == subs.end()) {
            return false;
        }
        subs.erase(it);
        if (subs.empty()) {
            routes_.erase(route);
        }
        return true;
    }

    /**
     * @brief Deliver event to every handler of its type
     *
     * The handler list is copied under the lock and called without it, so a
     * handler may subscribe or unsubscribe (itself included).
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<Subscription> targets;
        {
            std::shared_lock lock(mutex_);
            auto route = routes_.find(key_of<EventType>());
            if (route == routes_.end()) {
                return;
            }
            targets = route->second;
        }

        for (const auto& sub : targets) {
            try {
                (*sub.call)(&event);
            } catch (const std::exception& e) {
                failed_deliveries_.fetch_add(1, std::memory_order_relaxed);
                spdlog::error("[EventBus] Subscriber {} failed on {}: {}", sub.id, typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto route = routes_.find(key_of<EventType>());
        return route != routes_.end() ? route->second.size() : 0;
    }

    /// Handler invocations that ended in an exception.
    std::size_t failed_deliveries() const noexcept {
        return failed_deliveries_.load(std::memory_order_relaxed);
    }

    void clear() {
        std::unique_lock lock(mutex_);
        routes_.clear();
    }

private:
    using Thunk = std::function<void(const void*)>;

    struct Subscription {
        std::size_t id;
        std::shared_ptr<const Thunk> call;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Subscription>> routes_;
    std::size_t last_id_ = 0;
    mutable std::atomic<std::size_t> failed_deliveries_{0};
};

} // namespace rv::events
