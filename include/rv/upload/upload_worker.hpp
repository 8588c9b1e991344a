#pragma once

/**
 * @file upload_worker.hpp
 * @brief Executes one claimed UploadJob as a multipart upload
 *
 * WHY THIS FILE EXISTS:
 * The queue manager decides which job runs; the worker decides how. It owns
 * the per-job lifecycle: credentials, part plan, multipart session (new or
 * resumed), bounded parallel part transfer, retry with backoff, and the final
 * transition of the job record.
 *
 * CONTROL:
 * The queue signals a running job through its JobControl. The worker checks
 * it between parts and during backoff waits; a part already on the wire is
 * always allowed to finish.
 *
 * OUTCOMES (checked in this order once parts stop):
 * Cancel     → session aborted, job Cancelled
 * fatal error → job Failed, message recorded verbatim
 * Pause      → job Paused
 * Stop       → job Paused, then Pending with its queue position kept
 * otherwise  → session completed, job Completed
 */

#include "rv/jobs/config.hpp"
#include "rv/jobs/job_store.hpp"
#include "rv/events/notification_hub.hpp"
#include "rv/storage/object_store.hpp"
#include "rv/upload/part_planner.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace rv::upload {

/// Ordered by precedence: a stronger request replaces a weaker one.
enum class Interrupt {
    None = 0,
    Stop = 1,
    Pause = 2,
    Cancel = 3
};

class JobControl {
public:
    void request(Interrupt kind);
    Interrupt requested() const noexcept { return static_cast<Interrupt>(state_.load()); }
    bool interrupted() const noexcept { return requested() != Interrupt::None; }

    /**
     * Sleep for up to delay.
     *
     * RETURNS:
     * true if an interrupt arrived before the delay elapsed
     */
    bool wait_for(std::chrono::milliseconds delay);

private:
    std::atomic<int> state_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
};

/// retry_base_delay * 2^(attempt - 1), capped at 30 seconds.
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, std::uint32_t attempt);

class UploadWorker {
public:
    UploadWorker(jobs::JobStore& store,
                 storage::ObjectStore& objects,
                 storage::CredentialProvider& credentials,
                 events::NotificationHub& hub,
                 jobs::UploadConfig config);

    /**
     * Run a job that the caller has already claimed (status InProgress).
     *
     * RETURNS:
     * The status the job was left in
     */
    jobs::UploadStatus run(const jobs::UploadJob& job, JobControl& control);

private:
    struct Session {
        std::string upload_id;
        std::map<std::uint32_t, storage::CompletedPart> completed;
    };

    struct RunState;

    Result<Session> open_session(const jobs::UploadJob& job,
                                 const storage::Credentials& creds,
                                 const PartPlan& plan,
                                 JobControl& control);

    Result<std::string> create_session(const jobs::UploadJob& job,
                                       const storage::Credentials& creds,
                                       JobControl& control);

    Result<std::string> upload_part_with_retry(const jobs::UploadJob& job,
                                               const storage::Credentials& creds,
                                               const std::string& upload_id,
                                               const PartRange& part,
                                               JobControl& control);

    Result<void> complete_with_retry(const jobs::UploadJob& job,
                                     const storage::Credentials& creds,
                                     const std::string& upload_id,
                                     const std::map<std::uint32_t, storage::CompletedPart>& parts,
                                     JobControl& control);

    /**
     * Charge one retry to the job.
     *
     * RETURNS:
     * the new retry count, or nullopt when the budget was already spent
     */
    std::optional<std::uint32_t> consume_retry(const std::string& job_id, const std::string& message);

    void run_lane(RunState& state,
                  const jobs::UploadJob& job,
                  const storage::Credentials& creds,
                  JobControl& control);

    void record_part(RunState& state, const jobs::UploadJob& job, const PartRange& part, const std::string& etag);
    void throttle(RunState& state, JobControl& control);

    void release_session(const jobs::UploadJob& job,
                         const storage::Credentials& creds,
                         const std::string& upload_id);

    jobs::UploadStatus finish_failed(const jobs::UploadJob& job, const std::string& message,
                                     const std::optional<storage::Credentials>& creds,
                                     const std::string& upload_id);
    jobs::UploadStatus finish_cancelled(const jobs::UploadJob& job, const storage::Credentials& creds,
                                        const std::string& upload_id);
    jobs::UploadStatus finish_interrupted(const jobs::UploadJob& job, Interrupt kind,
                                          const storage::Credentials& creds, const std::string& upload_id);
    jobs::UploadStatus finish_completed(const jobs::UploadJob& job, RunState& state);

    storage::RequestOptions request_options() const { return storage::RequestOptions{config_.timeout}; }

    jobs::JobStore& store_;
    storage::ObjectStore& objects_;
    storage::CredentialProvider& credentials_;
    events::NotificationHub& hub_;
    jobs::UploadConfig config_;
};

} // namespace rv::upload
