#pragma once

/**
 * @file upload_queue.hpp
 * @brief Façade for archival uploads: submission, dispatch, control, statistics
 *
 * WHY THIS FILE EXISTS:
 * Callers (UI, CLI) need one object to hand files to and to steer the
 * transfer pool. Every call here only reads or mutates the JobStore, or
 * signals a running worker, and returns immediately.
 *
 * DISPATCH:
 * start() launches a dispatcher thread and a boost::asio::thread_pool of
 * max_concurrent_uploads threads. The dispatcher claims the oldest Pending
 * job whenever fewer than max_concurrent_uploads workers are busy.
 *
 * STOP:
 * stop() halts dispatch and asks running workers to stop after their current
 * part. Those jobs return to Pending, ahead of newer jobs. stop() does not
 * wait; wait_for_workers() does.
 *
 * EXAMPLE USAGE:
 * UploadQueueManager queue(store, objects, creds, hub);
 * queue.initialize(UploadConfig::for_tier(UploadTier::Premium));
 * auto report = queue.submit({"/media/a.mov", "/media/b.mov"});
 * queue.start();
 */

#include "rv/core/result.hpp"
#include "rv/events/notification_hub.hpp"
#include "rv/jobs/config.hpp"
#include "rv/jobs/job_store.hpp"
#include "rv/storage/object_store.hpp"
#include "rv/upload/object_key.hpp"
#include "rv/upload/upload_worker.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rv::upload {

struct SubmitReport {
    std::vector<std::string> accepted;                       ///< New job ids, in path order
    std::vector<std::pair<std::string, Error>> rejected;     ///< (path, reason)
};

class UploadQueueManager {
public:
    UploadQueueManager(jobs::JobStore& store,
                       storage::ObjectStore& objects,
                       storage::CredentialProvider& credentials,
                       events::NotificationHub& hub,
                       jobs::UploadConfig config = jobs::UploadConfig::for_tier(jobs::UploadTier::Free));
    ~UploadQueueManager();

    UploadQueueManager(const UploadQueueManager&) = delete;
    UploadQueueManager& operator=(const UploadQueueManager&) = delete;

    /// Validate and apply a config. Rejected while processing.
    Result<void> initialize(const jobs::UploadConfig& config);
    jobs::UploadConfig config() const;

    /**
     * Create one Pending job per path.
     *
     * Paths already queued (Pending, InProgress or Paused) are rejected as
     * duplicates. On the Free tier, nothing is accepted while any job is
     * Pending or InProgress; of two concurrent batches at most one gets in.
     */
    SubmitReport submit(const std::vector<std::string>& paths, const KeyOptions& options = {});

    /// Remove a job that is not InProgress, aborting any multipart session it kept.
    Result<void> remove(const std::string& id);

    /// Pending → Paused now; InProgress → Paused after the current part.
    Result<jobs::UploadJob> pause(const std::string& id);

    /// Paused → Pending.
    Result<jobs::UploadJob> resume(const std::string& id);

    /// Any non-terminal job → Cancelled; a running one after its current part.
    Result<jobs::UploadJob> cancel(const std::string& id);

    /// Failed → Pending with a fresh retry budget, at the back of the queue.
    Result<jobs::UploadJob> retry(const std::string& id);

    Result<void> start();
    void stop();
    bool is_processing() const;

    /// Remove every job that is not InProgress and abort their kept sessions. Returns the number removed.
    std::size_t clear();

    jobs::UploadStatistics statistics() const;
    std::vector<jobs::UploadJob> jobs() const;
    Result<jobs::UploadJob> job(const std::string& id) const;

    /// Number of workers currently running a job.
    std::size_t active_workers() const;

    /**
     * Wait until no job is Pending or running.
     *
     * RETURNS:
     * false on timeout
     */
    bool wait_until_idle(std::chrono::milliseconds timeout);

    /// Wait for every running worker, including those of a stopped run.
    void wait_for_workers();

private:
    void dispatch_loop(std::uint64_t generation, boost::asio::thread_pool& pool);
    void execute(const jobs::UploadJob& job, const std::shared_ptr<JobControl>& control, jobs::UploadConfig config);
    void reap_retired();
    void abort_session(const std::string& object_key, const std::string& session, const std::string& job_id);

    jobs::JobStore& store_;
    storage::ObjectStore& objects_;
    storage::CredentialProvider& credentials_;
    events::NotificationHub& hub_;

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    std::condition_variable idle_cv_;

    jobs::UploadConfig config_;
    bool processing_ = false;
    std::uint64_t generation_ = 0;
    std::size_t active_workers_ = 0;
    std::unordered_map<std::string, std::shared_ptr<JobControl>> controls_;

    std::thread dispatcher_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::vector<std::unique_ptr<boost::asio::thread_pool>> retired_pools_;
};

} // namespace rv::upload
