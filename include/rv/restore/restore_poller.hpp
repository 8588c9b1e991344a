#pragma once

/**
 * @file restore_poller.hpp
 * @brief Periodic status refresh for InProgress restores
 *
 * Runs its own io_context on one thread. Each tick checks every InProgress
 * record through RestoreJobTracker::refresh(); terminal records are never
 * queried again. The first tick fires immediately on start(), which picks up
 * records recovered from a snapshot.
 *
 * A failed query for one key is logged and retried on the next tick. It never
 * marks the record Failed.
 */

#include "rv/jobs/job_store.hpp"
#include "rv/restore/restore_tracker.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <thread>

namespace rv::restore {

class RestorePoller {
public:
    RestorePoller(RestoreJobTracker& tracker, jobs::JobStore& store, std::chrono::milliseconds interval);
    ~RestorePoller();

    RestorePoller(const RestorePoller&) = delete;
    RestorePoller& operator=(const RestorePoller&) = delete;

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    /// One pass over InProgress records. Returns how many became terminal.
    std::size_t poll_once();

    std::uint64_t ticks() const noexcept { return ticks_.load(); }

private:
    void schedule(std::chrono::milliseconds delay);
    void on_tick(const boost::system::error_code& ec);

    RestoreJobTracker& tracker_;
    jobs::JobStore& store_;
    std::chrono::milliseconds interval_;

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    std::thread thread_;
    std::mutex lifecycle_mutex_;
    std::mutex poll_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> ticks_{0};
};

} // namespace rv::restore
