/**
 * @file components.hpp
 * @brief Ready-made observers for the notification hub
 *
 * WHY THIS FILE EXISTS:
 * Most front ends want the same three things: a log line per transition,
 * counters, and a history of terminal notifications to show later. Each
 * component subscribes in its constructor and unsubscribes in its destructor.
 *
 * EXAMPLE:
 * NotificationHub hub;
 * LoggerComponent logger(hub);
 * MetricsComponent metrics(hub);
 * NotificationLog restores(hub, NotificationKind::Restore);
 */

#pragma once

#include "rv/events/events.hpp"
#include "rv/events/notification_hub.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace rv::events {

/**
 * @brief Logs every event type
 *
 * Progress ticks at debug, failures at warn, other transitions at info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(NotificationHub& hub) : hub_(hub) {
        notification_id_ = hub_.subscribe<Notification>([](const Notification& n) {
            on_notification(n);
        });

        upload_progress_id_ = hub_.subscribe<UploadProgress>([](const UploadProgress& p) {
            spdlog::debug("[UploadProgress] job={} bytes={}/{} ({:.1f}%) speed={:.0f}B/s",
                          p.job_id, p.uploaded_bytes, p.total_bytes, p.percentage, p.speed_bps);
        });

        download_progress_id_ = hub_.subscribe<DownloadProgress>([](const DownloadProgress& p) {
            spdlog::debug("[DownloadProgress] key={} bytes={}/{} ({:.1f}%) status={}",
                          p.key, p.downloaded_bytes, p.total_bytes, p.percentage, jobs::to_string(p.status));
        });

        started_id_ = hub_.subscribe<ProcessingStartedEvent>([](const ProcessingStartedEvent& e) {
            spdlog::info("[UploadQueue] Processing started with {} workers", e.workers);
        });

        stopped_id_ = hub_.subscribe<ProcessingStoppedEvent>([](const ProcessingStoppedEvent& e) {
            spdlog::info("[UploadQueue] Processing stopped: {}", e.reason);
        });
    }

    ~LoggerComponent() {
        hub_.unsubscribe<Notification>(notification_id_);
        hub_.unsubscribe<UploadProgress>(upload_progress_id_);
        hub_.unsubscribe<DownloadProgress>(download_progress_id_);
        hub_.unsubscribe<ProcessingStartedEvent>(started_id_);
        hub_.unsubscribe<ProcessingStoppedEvent>(stopped_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    static void on_notification(const Notification& n) {
        if (n.status == "failed") {
            spdlog::warn("[{}] {} failed: {}", to_string(n.kind), n.subject, n.message);
        } else {
            spdlog::info("[{}] {} {}{}{}", to_string(n.kind), n.subject, n.status,
                         n.message.empty() ? "" : ": ", n.message);
        }
    }

    NotificationHub& hub_;
    std::size_t notification_id_ = 0;
    std::size_t upload_progress_id_ = 0;
    std::size_t download_progress_id_ = 0;
    std::size_t started_id_ = 0;
    std::size_t stopped_id_ = 0;
};

/**
 * @brief Counters of terminal transitions and progress ticks
 *
 * USAGE:
 * MetricsComponent metrics(hub);
 * ...
 * hub.flush();
 * metrics.get_stats().uploads_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> uploads_completed{0};
        std::atomic<std::uint64_t> uploads_failed{0};
        std::atomic<std::uint64_t> uploads_cancelled{0};
        std::atomic<std::uint64_t> restores_completed{0};
        std::atomic<std::uint64_t> restores_failed{0};
        std::atomic<std::uint64_t> restores_cancelled{0};
        std::atomic<std::uint64_t> downloads_completed{0};
        std::atomic<std::uint64_t> downloads_failed{0};
        std::atomic<std::uint64_t> upload_progress_ticks{0};
        std::atomic<std::uint64_t> download_progress_ticks{0};
    };

    explicit MetricsComponent(NotificationHub& hub) : hub_(hub) {
        notification_id_ = hub_.subscribe<Notification>([this](const Notification& n) {
            on_notification(n);
        });
        upload_progress_id_ = hub_.subscribe<UploadProgress>([this](const UploadProgress&) {
            stats_.upload_progress_ticks++;
        });
        download_progress_id_ = hub_.subscribe<DownloadProgress>([this](const DownloadProgress&) {
            stats_.download_progress_ticks++;
        });
    }

    ~MetricsComponent() {
        hub_.unsubscribe<Notification>(notification_id_);
        hub_.unsubscribe<UploadProgress>(upload_progress_id_);
        hub_.unsubscribe<DownloadProgress>(download_progress_id_);
    }

    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer statistics:");
        spdlog::info("  Uploads completed:   {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:      {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled:   {}", stats_.uploads_cancelled.load());
        spdlog::info("  Restores completed:  {}", stats_.restores_completed.load());
        spdlog::info("  Restores failed:     {}", stats_.restores_failed.load());
        spdlog::info("  Restores cancelled:  {}", stats_.restores_cancelled.load());
        spdlog::info("  Downloads completed: {}", stats_.downloads_completed.load());
        spdlog::info("  Downloads failed:    {}", stats_.downloads_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_notification(const Notification& n) {
        switch (n.kind) {
            case NotificationKind::Upload:
                count(n.status, stats_.uploads_completed, stats_.uploads_failed, &stats_.uploads_cancelled);
                break;
            case NotificationKind::Restore:
                count(n.status, stats_.restores_completed, stats_.restores_failed, &stats_.restores_cancelled);
                break;
            case NotificationKind::Download:
                count(n.status, stats_.downloads_completed, stats_.downloads_failed, nullptr);
                break;
        }
    }

    static void count(const std::string& status,
                      std::atomic<std::uint64_t>& completed,
                      std::atomic<std::uint64_t>& failed,
                      std::atomic<std::uint64_t>* cancelled) {
        if (status == "completed") {
            completed++;
        } else if (status == "failed") {
            failed++;
        } else if (status == "cancelled" && cancelled != nullptr) {
            (*cancelled)++;
        }
    }

    NotificationHub& hub_;
    Stats stats_;
    std::size_t notification_id_ = 0;
    std::size_t upload_progress_id_ = 0;
    std::size_t download_progress_id_ = 0;
};

/**
 * @brief History of notifications, optionally restricted to one kind
 *
 * Backs RestoreJobTracker::notifications() for front ends that poll
 * instead of subscribing.
 */
class NotificationLog {
public:
    explicit NotificationLog(NotificationHub& hub, std::optional<NotificationKind> kind = std::nullopt)
        : hub_(hub), kind_(kind) {
        subscription_id_ = hub_.subscribe<Notification>([this](const Notification& n) {
            if (kind_ && n.kind != *kind_) {
                return;
            }
            std::lock_guard lock(mutex_);
            entries_.push_back(n);
        });
    }

    ~NotificationLog() {
        hub_.unsubscribe<Notification>(subscription_id_);
    }

    NotificationLog(const NotificationLog&) = delete;
    NotificationLog& operator=(const NotificationLog&) = delete;

    std::vector<Notification> entries() const {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

private:
    NotificationHub& hub_;
    std::optional<NotificationKind> kind_;
    mutable std::mutex mutex_;
    std::vector<Notification> entries_;
    std::size_t subscription_id_ = 0;
};

} // namespace rv::events
