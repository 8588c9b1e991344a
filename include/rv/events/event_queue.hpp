/**
 * @file event_queue.hpp
 * @brief FIFO of pending deliveries for the notification dispatcher
 *
 * Producers (upload workers, the restore poller, download tasks) push; one
 * consumer pops and reports each item back with task_done(). An item counts as
 * outstanding from push() until task_done(), so wait_drained() returns only
 * after the consumer has finished with everything pushed before the call.
 *
 * After shutdown() pushes are refused, while pop() keeps handing out what was
 * already queued and returns nullopt once empty.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace rv::events {

template<typename T>
class DispatchQueue {
public:
    DispatchQueue() = default;

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    /// false after shutdown(); the item is dropped and not counted.
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
            ++outstanding_;
        }
        ready_cv_.notify_one();
        return true;
    }

    /// Blocks for the next item. nullopt only when shut down and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_cv_.wait(lock, [this]() { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    /// The consumer is finished with one popped item.
    void task_done() {
        bool drained = false;
        {
            std::lock_guard lock(mutex_);
            if (outstanding_ > 0) {
                --outstanding_;
            }
            drained = outstanding_ == 0;
        }
        if (drained) {
            drained_cv_.notify_all();
        }
    }

    void wait_drained() {
        std::unique_lock lock(mutex_);
        drained_cv_.wait(lock, [this]() { return outstanding_ == 0; });
    }

    /// Items pushed but not yet reported with task_done().
    std::size_t outstanding() const {
        std::lock_guard lock(mutex_);
        return outstanding_;
    }

    /// Items waiting to be popped.
    std::size_t queued() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    // Caller holds mutex_
    T take_front() {
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::condition_variable drained_cv_;
    std::deque<T> items_;
    std::size_t outstanding_ = 0;
    bool closed_ = false;
};

} // namespace rv::events
