#pragma once

/**
 * @file types.hpp
 * @brief Job records for the upload queue and the restore tracker
 *
 * WHY THIS FILE EXISTS:
 * Every long-running transfer is represented by a durable record. Workers,
 * the poller and the façades never talk to each other directly; they read and
 * mutate these records through the JobStore.
 *
 * WHAT IT CONTAINS:
 * - UploadJob: one per file submitted for archival
 * - RestoreJob: one per object key requested for retrieval
 * - DownloadProgress: ephemeral state of a post-restore download
 * - UploadStatistics: aggregate view derived from the upload records
 */

#include "rv/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rv::jobs {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ════════════════════════════════════════════════════════
// Upload records
// ════════════════════════════════════════════════════════

/**
 * @brief Upload state machine
 *
 * STATE TRANSITIONS:
 * Pending → InProgress → Completed | Failed
 * Failed → Pending              (retry, bounded by the retry budget)
 * Pending | InProgress → Paused → Pending
 * any non-terminal → Cancelled  (terminal)
 */
enum class UploadStatus {
    Pending,
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled
};

/**
 * @brief One file submitted for archival
 *
 * IMMUTABLE AFTER SUBMISSION:
 * id, source_path, file_name, file_size, object_key, submitted_at
 *
 * MUTABLE:
 * everything else, only through JobStore::modify_upload / transition_upload
 *
 * INVARIANT:
 * uploaded_bytes <= file_size, retry_count <= configured retry_attempts
 */
struct UploadJob {
    std::string id;
    std::string source_path;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string object_key;
    TimePoint submitted_at{};

    UploadStatus status = UploadStatus::Pending;
    std::uint64_t uploaded_bytes = 0;
    double speed_bps = 0.0;                     ///< Bytes per second of the current run
    std::optional<std::uint64_t> eta_seconds;
    std::uint32_t retry_count = 0;
    std::optional<std::string> last_error;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    std::string upload_id;                      ///< Multipart session kept for resume, empty if none
    std::uint64_t enqueue_seq = 0;              ///< Dispatch order among Pending jobs

    double percentage() const noexcept {
        if (file_size == 0) {
            return status == UploadStatus::Completed ? 100.0 : 0.0;
        }
        return static_cast<double>(uploaded_bytes) * 100.0 / static_cast<double>(file_size);
    }
};

/**
 * @brief Aggregate queue view, always derived by reading the records
 */
struct UploadStatistics {
    std::uint64_t total_files = 0;
    std::uint64_t pending_files = 0;
    std::uint64_t in_progress_files = 0;
    std::uint64_t paused_files = 0;
    std::uint64_t completed_files = 0;
    std::uint64_t failed_files = 0;
    std::uint64_t cancelled_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t uploaded_bytes = 0;
    double average_speed_bps = 0.0;
    std::optional<std::uint64_t> eta_seconds;
};

// ════════════════════════════════════════════════════════
// Restore records
// ════════════════════════════════════════════════════════

/**
 * @brief Restore state
 *
 * InProgress is the only non-terminal state. NotFound is never stored; it is
 * the answer to a status query for a key that was never requested.
 */
enum class RestoreStatus {
    InProgress,
    Completed,
    Failed,
    Cancelled,
    NotFound
};

/**
 * @brief Retrieval speed/cost option of the archive tier
 */
enum class RestoreTier {
    Expedited,
    Standard,
    Bulk
};

/**
 * @brief One restore request for an object key
 *
 * At most one InProgress record exists per key. A request made after the
 * previous record became terminal creates a new record with a new job_id.
 */
struct RestoreJob {
    std::string job_id;
    std::string key;
    RestoreTier tier = RestoreTier::Standard;
    RestoreStatus status = RestoreStatus::InProgress;
    TimePoint requested_at{};
    std::optional<TimePoint> completed_at;
    std::optional<TimePoint> expires_at;
    std::optional<std::string> last_error;
};

struct RestoreStatusResult {
    std::string key;
    RestoreStatus status = RestoreStatus::NotFound;
    std::optional<RestoreJob> job;
};

struct RestoreTierInfo {
    std::string name;
    std::string estimated_time;
    std::string cost;
};

// ════════════════════════════════════════════════════════
// Download of restored objects
// ════════════════════════════════════════════════════════

enum class DownloadStatus {
    InProgress,
    Completed,
    Failed
};

struct DownloadProgress {
    std::string key;
    std::string local_path;
    std::uint64_t downloaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double percentage = 0.0;
    DownloadStatus status = DownloadStatus::InProgress;
    std::string error;
};

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

const char* to_string(UploadStatus status) noexcept;
const char* to_string(RestoreStatus status) noexcept;
const char* to_string(RestoreTier tier) noexcept;
const char* to_string(DownloadStatus status) noexcept;

Result<UploadStatus> parse_upload_status(const std::string& text);
Result<RestoreStatus> parse_restore_status(const std::string& text);
Result<RestoreTier> parse_restore_tier(const std::string& text);

bool is_terminal(UploadStatus status) noexcept;
bool is_terminal(RestoreStatus status) noexcept;

/// Whether the upload state machine allows current → target.
bool can_transition(UploadStatus current, UploadStatus target) noexcept;

/// Whether the restore state machine allows current → target.
bool can_transition(RestoreStatus current, RestoreStatus target) noexcept;

RestoreTierInfo restore_tier_info(RestoreTier tier);

} // namespace rv::jobs
