#pragma once

/**
 * @file restore_tracker.hpp
 * @brief Façade for archive retrieval: request, status, cancel, history, download
 *
 * WHY THIS FILE EXISTS:
 * Objects in the deep archive tier cannot be read directly. A restore must be
 * requested, waited on (hours), and then downloaded before the restored copy
 * expires. The tracker keeps one record per request in the JobStore and
 * applies every status change exactly once.
 *
 * INVARIANTS:
 * - At most one InProgress record per key; a repeated request returns it
 * - A terminal record never changes; a later request creates a new record
 * - Each terminal transition publishes exactly one Notification
 *
 * RestorePoller drives refresh() on a timer; check_status() drives it on
 * demand. Both end in the same transition, so whichever comes first wins and
 * the other sees a terminal record.
 */

#include "rv/core/result.hpp"
#include "rv/events/components.hpp"
#include "rv/events/notification_hub.hpp"
#include "rv/jobs/config.hpp"
#include "rv/jobs/job_store.hpp"
#include "rv/storage/object_store.hpp"

#include <boost/asio/thread_pool.hpp>

#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rv::restore {

class RestoreJobTracker {
public:
    RestoreJobTracker(jobs::JobStore& store,
                      storage::ObjectStore& objects,
                      storage::CredentialProvider& credentials,
                      events::NotificationHub& hub,
                      jobs::RestoreConfig config = {});
    ~RestoreJobTracker();

    RestoreJobTracker(const RestoreJobTracker&) = delete;
    RestoreJobTracker& operator=(const RestoreJobTracker&) = delete;

    /**
     * Ask the store to restore key at tier (default tier when omitted).
     *
     * Concurrent requests for the same key are serialized; requests for
     * different keys never wait on each other.
     *
     * RETURNS:
     * The active record for key: the existing one if a restore is already in
     * progress, otherwise a new one. A store rejection creates no record.
     */
    Result<jobs::RestoreJob> request_restore(const std::string& key,
                                             std::optional<jobs::RestoreTier> tier = std::nullopt);

    /// NotFound status (not an error) for a key that was never requested.
    Result<jobs::RestoreStatusResult> check_status(const std::string& key);

    /**
     * Query the store for one InProgress record and apply a terminal answer.
     *
     * RETURNS:
     * The record after the query; unchanged while the store reports progress
     */
    Result<jobs::RestoreJob> refresh(const jobs::RestoreJob& job);

    std::vector<jobs::RestoreJob> list_jobs() const;

    /// true only if an InProgress record was cancelled.
    bool cancel(const std::string& key);

    /**
     * Remove terminal records. Returns the number removed.
     *
     * Finished downloads (Completed or Failed) are forgotten as well, so
     * download_progress() returns nullopt for them afterwards.
     */
    std::size_t clear_history();

    /// Restore notifications published so far, oldest first.
    std::vector<events::Notification> notifications() const;

    /**
     * Download a restored object to local_path in the background.
     *
     * The restore is re-verified against the store first: a copy that has
     * expired or is no longer Completed is rejected with Precondition.
     */
    Result<void> download(const std::string& key, const std::filesystem::path& local_path);

    std::optional<jobs::DownloadProgress> download_progress(const std::string& key) const;
    void wait_for_downloads();

    /// Objects under prefix that sit in an archive storage class.
    Result<std::vector<storage::ObjectSummary>> archived_objects(const std::string& prefix) const;

    const jobs::RestoreConfig& config() const noexcept { return config_; }

private:
    class KeyLease;

    Result<jobs::RestoreJob> apply_terminal(const jobs::RestoreJob& job,
                                            jobs::RestoreStatus status,
                                            const storage::RestoreState& remote);

    void run_download(const std::string& key, const std::filesystem::path& local_path,
                      const storage::Credentials& creds);
    void update_download(const std::string& key, const std::function<void(jobs::DownloadProgress&)>& change,
                         bool publish);

    storage::RequestOptions request_options() const { return storage::RequestOptions{config_.timeout}; }

    jobs::JobStore& store_;
    storage::ObjectStore& objects_;
    storage::CredentialProvider& credentials_;
    events::NotificationHub& hub_;
    jobs::RestoreConfig config_;

    // Keys with a request_restore call between lookup and insert
    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    std::set<std::string> inflight_keys_;

    events::NotificationLog restore_log_;

    mutable std::mutex downloads_mutex_;
    std::condition_variable downloads_cv_;
    std::map<std::string, jobs::DownloadProgress> downloads_;
    std::size_t active_downloads_ = 0;
    boost::asio::thread_pool download_pool_;
};

} // namespace rv::restore
