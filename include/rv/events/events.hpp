/**
 * @file events.hpp
 * @brief Event types published through the notification hub
 *
 * WHY THIS FILE EXISTS:
 * Workers and the restore poller report what happened as immutable values.
 * Observers (UI, log, metrics) subscribe to the types they care about.
 *
 * NAMING CONVENTION:
 * - Notification: a terminal or noteworthy transition of one job
 * - UploadProgress / DownloadProgress: byte-level progress ticks
 * - Processing*Event: queue-wide lifecycle
 */

#pragma once

#include "rv/jobs/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rv::events {

enum class NotificationKind {
    Upload,
    Restore,
    Download
};

inline const char* to_string(NotificationKind kind) noexcept {
    switch (kind) {
        case NotificationKind::Upload: return "upload";
        case NotificationKind::Restore: return "restore";
        case NotificationKind::Download: return "download";
    }
    return "unknown";
}

// ════════════════════════════════════════════════════════
// Terminal / noteworthy transitions
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per terminal transition of a job
 *
 * WHO EMITS:
 * - UploadWorker (completed, failed, cancelled)
 * - UploadQueueManager (cancel of a job that no worker holds)
 * - RestoreJobTracker / RestorePoller (completed, failed, cancelled)
 * - Download tasks (completed, failed)
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent
 * - MetricsComponent
 * - NotificationLog (history for UIs that poll)
 *
 * subject is the upload job id, or the object key for restores and downloads.
 * status is the lowercase terminal status: "completed", "failed", "cancelled".
 */
struct Notification {
    std::string subject;
    NotificationKind kind = NotificationKind::Upload;
    std::string status;
    std::string message;
    std::chrono::system_clock::time_point timestamp;

    Notification(std::string subj, NotificationKind k, std::string st, std::string msg)
        : subject(std::move(subj)),
          kind(k),
          status(std::move(st)),
          message(std::move(msg)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Progress ticks
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted by UploadWorker after each confirmed part
 *
 * ORDERING:
 * For one job_id, uploaded_bytes never decreases between two ticks of the
 * same run. Ticks of different jobs may interleave arbitrarily.
 */
struct UploadProgress {
    std::string job_id;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double percentage = 0.0;
    double speed_bps = 0.0;
    std::optional<std::uint64_t> eta_seconds;
    jobs::UploadStatus status = jobs::UploadStatus::InProgress;
};

/// Emitted by download tasks as bytes arrive, and once at the end.
using DownloadProgress = jobs::DownloadProgress;

// ════════════════════════════════════════════════════════
// Queue lifecycle
// ════════════════════════════════════════════════════════

struct ProcessingStartedEvent {
    std::size_t workers;
    std::chrono::system_clock::time_point timestamp;

    explicit ProcessingStartedEvent(std::size_t w)
        : workers(w), timestamp(std::chrono::system_clock::now()) {}
};

struct ProcessingStoppedEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ProcessingStoppedEvent(std::string r)
        : reason(std::move(r)), timestamp(std::chrono::system_clock::now()) {}
};

} // namespace rv::events
