/**
 * @file notification_hub.hpp
 * @brief Asynchronous fan-out of job events to observers
 *
 * WHY THIS FILE EXISTS:
 * Upload workers and the restore poller must never block on, or be broken
 * by, an observer. The hub turns publish() into a queue push; a single
 * dispatcher thread delivers queued events through the EventBus.
 *
 * ORDERING:
 * One dispatcher thread, one FIFO queue: events are delivered in publish
 * order. A producer that publishes progress for a job in increasing order is
 * therefore observed in increasing order.
 *
 * EXAMPLE:
 * NotificationHub hub;
 * hub.subscribe<Notification>([](const Notification& n) { ... });
 * hub.publish(Notification{id, NotificationKind::Upload, "completed", ""});
 * hub.flush();   // wait until observers have seen everything published so far
 */

#pragma once

#include "rv/events/event_bus.hpp"
#include "rv/events/event_queue.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <typeinfo>

namespace rv::events {

class NotificationHub {
public:
    NotificationHub();
    ~NotificationHub();

    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        return bus_.subscribe<EventType>(std::move(handler));
    }

    template<typename EventType>
    bool unsubscribe(std::size_t handler_id) {
        return bus_.unsubscribe<EventType>(handler_id);
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        return bus_.subscriber_count<EventType>();
    }

    /**
     * @brief Queue an event for delivery; never blocks on observers
     *
     * Events published after shutdown() are dropped.
     */
    template<typename EventType>
    void publish(EventType event) {
        if (!queue_.push([this, ev = std::move(event)]() { bus_.emit(ev); })) {
            spdlog::debug("[NotificationHub] Dropped {} after shutdown", typeid(EventType).name());
        }
    }

    /**
     * @brief Block until every event published before the call is delivered
     *
     * Calling it from inside a handler returns immediately.
     */
    void flush();

    /// Deliver what is queued, then stop the dispatcher. Idempotent.
    void shutdown();

    std::size_t pending() const;

private:
    void dispatch_loop();

    EventBus bus_;
    DispatchQueue<std::function<void()>> queue_;

    std::mutex shutdown_mutex_;
    std::thread dispatcher_;
};

} // namespace rv::events
