#include "rv/restore/restore_poller.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace rv::restore {
namespace asio = boost::asio;

RestorePoller::RestorePoller(RestoreJobTracker& tracker, jobs::JobStore& store, std::chrono::milliseconds interval)
    : tracker_(tracker), store_(store), interval_(interval), timer_(io_) {}

RestorePoller::~RestorePoller() {
    stop();
}

void RestorePoller::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (running_) {
        return;
    }

    running_ = true;
    io_.restart();
    schedule(std::chrono::milliseconds::zero());
    thread_ = std::thread([this]() { io_.run(); });
    spdlog::info("[RestorePoller] Started, interval {}ms", interval_.count());
}

void RestorePoller::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    // Cancel on the io thread; the aborted handler does not reschedule
    asio::post(io_, [this]() { timer_.cancel(); });
    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("[RestorePoller] Stopped after {} tick(s)", ticks_.load());
}

void RestorePoller::schedule(std::chrono::milliseconds delay) {
    timer_.expires_after(delay);
    timer_.async_wait([this](const boost::system::error_code& ec) { on_tick(ec); });
}

void RestorePoller::on_tick(const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || !running_) {
        return;
    }

    poll_once();
    ++ticks_;

    if (running_) {
        schedule(interval_);
    }
}

std::size_t RestorePoller::poll_once() {
    std::lock_guard lock(poll_mutex_);

    std::size_t finished = 0;
    for (const auto& job : store_.restores_with_status(jobs::RestoreStatus::InProgress)) {
        auto refreshed = tracker_.refresh(job);
        if (refreshed.is_error()) {
            spdlog::warn("[RestorePoller] Status check for {} failed: {}; retrying next tick",
                         job.key, refreshed.error().message);
            continue;
        }
        if (jobs::is_terminal(refreshed.value().status)) {
            ++finished;
        }
    }
    return finished;
}

} // namespace rv::restore
