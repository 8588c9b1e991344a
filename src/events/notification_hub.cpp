#include "rv/events/notification_hub.hpp"

namespace rv::events {

NotificationHub::NotificationHub()
    : dispatcher_([this]() { dispatch_loop(); }) {}

NotificationHub::~NotificationHub() {
    shutdown();
}

void NotificationHub::dispatch_loop() {
    while (auto task = queue_.pop()) {
        (*task)();
        queue_.task_done();
    }
}

void NotificationHub::flush() {
    if (std::this_thread::get_id() == dispatcher_.get_id()) {
        return;
    }
    queue_.wait_drained();
}

void NotificationHub::shutdown() {
    std::lock_guard lock(shutdown_mutex_);
    queue_.shutdown();
    if (dispatcher_.joinable() && std::this_thread::get_id() != dispatcher_.get_id()) {
        dispatcher_.join();
    }
}

std::size_t NotificationHub::pending() const {
    return queue_.outstanding();
}

} // namespace rv::events
