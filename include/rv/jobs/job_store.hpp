#pragma once

/**
 * @file job_store.hpp
 * @brief Single source of truth for upload and restore job records
 *
 * WHY THIS FILE EXISTS:
 * Workers, the restore poller and the façades all need a consistent view of
 * job state. Instead of sharing job objects between threads, every record
 * lives in one table owned by this store, and every mutation goes through it.
 *
 * THREAD SAFETY PATTERN:
 * - Reads (upload, uploads, statistics inputs) take a shared lock
 * - Mutations take a unique lock, so two callers never mutate a record at once
 * - Callers receive copies; no reference into the table escapes the lock
 *
 * PERSISTENCE:
 * save_snapshot / load_snapshot write and read one JSON record per job.
 * Loading reconciles interrupted work: uploads left InProgress go back to
 * Pending, restores left InProgress are reported so they get re-polled.
 *
 * EXAMPLE USAGE:
 * JobStore store;
 * store.add_upload(job);
 * auto next = store.claim_next_pending();        // Pending → InProgress, FIFO
 * store.transition_upload(next->id, UploadStatus::Completed);
 */

#include "rv/core/result.hpp"
#include "rv/jobs/types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rv::jobs {

/**
 * @brief Outcome of loading a snapshot
 */
struct SnapshotReport {
    std::size_t uploads_loaded = 0;
    std::size_t restores_loaded = 0;
    std::size_t uploads_requeued = 0;              ///< InProgress → Pending on load
    std::vector<std::string> restores_to_repoll;   ///< Keys left InProgress
};

class JobStore {
public:
    using UploadMutator = std::function<Result<void>(UploadJob&)>;
    using RestoreMutator = std::function<Result<void>(RestoreJob&)>;

    JobStore() = default;

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    // ════════════════════════════════════════════════════════
    // Uploads
    // ════════════════════════════════════════════════════════

    /**
     * Insert a new Pending upload and give it the next dispatch sequence.
     *
     * Rejected with Precondition when another job for the same source path is
     * Pending, InProgress or Paused, and when the id is already present.
     */
    Result<UploadJob> add_upload(UploadJob job);

    /**
     * add_upload, but only while no job is Pending or InProgress.
     *
     * The check and the insert happen under one lock, so of two racing
     * callers at most one gets in.
     */
    Result<UploadJob> add_upload_if_idle(UploadJob job);

    Result<UploadJob> upload(const std::string& id) const;

    /// All uploads in submission order.
    std::vector<UploadJob> uploads() const;

    /**
     * Apply an arbitrary mutation under the store lock.
     *
     * The mutator must not change status; use transition_upload for that.
     * Byte counters are clamped so uploaded_bytes never exceeds file_size.
     */
    Result<UploadJob> modify_upload(const std::string& id, const UploadMutator& mutate);

    /**
     * Move a job along the upload state machine.
     *
     * Illegal edges are rejected with Precondition and leave the record
     * untouched. The optional mutator runs after the status change, still
     * under the lock, and may veto the whole transition by returning an error.
     */
    Result<UploadJob> transition_upload(const std::string& id,
                                        UploadStatus next,
                                        const UploadMutator& mutate = nullptr);

    /**
     * Atomically take the oldest Pending job (lowest enqueue_seq) and mark it
     * InProgress. Returns nullopt when nothing is Pending.
     */
    std::optional<UploadJob> claim_next_pending();

    bool has_pending_upload() const;
    std::size_t count_uploads(UploadStatus status) const;

    /// Remove a job that is not InProgress. Returns the removed record.
    Result<UploadJob> remove_upload(const std::string& id);

    /// Remove every job that is not InProgress. Returns the removed records in submission order.
    std::vector<UploadJob> clear_uploads();

    /// Fresh dispatch sequence, used when a job goes to the back of the queue.
    std::uint64_t next_sequence() noexcept { return next_seq_.fetch_add(1) + 1; }

    // ════════════════════════════════════════════════════════
    // Restores
    // ════════════════════════════════════════════════════════

    /**
     * Insert a restore record unless the key already has an InProgress one.
     *
     * RETURNS:
     * {record, true} when inserted, {existing InProgress record, false} otherwise
     */
    std::pair<RestoreJob, bool> add_restore_if_absent(RestoreJob job);

    /// The InProgress record for a key, if any.
    std::optional<RestoreJob> active_restore(const std::string& key) const;

    /// The most recent record for a key, whatever its status.
    std::optional<RestoreJob> latest_restore(const std::string& key) const;

    /// All restore records in request order.
    std::vector<RestoreJob> restores() const;
    std::vector<RestoreJob> restores_with_status(RestoreStatus status) const;

    /**
     * Move a restore record along its state machine. Terminal records never
     * change: the call fails with Precondition and nothing is modified.
     */
    Result<RestoreJob> transition_restore(const std::string& job_id,
                                          RestoreStatus next,
                                          const RestoreMutator& mutate = nullptr);

    /// Remove every terminal restore record. Returns the number removed.
    std::size_t clear_terminal_restores();

    // ════════════════════════════════════════════════════════
    // Persistence
    // ════════════════════════════════════════════════════════

    Result<void> save_snapshot(const std::filesystem::path& path) const;

    /// Replace the current contents with the snapshot and reconcile.
    Result<SnapshotReport> load_snapshot(const std::filesystem::path& path);

private:
    static bool blocks_duplicate(UploadStatus status) noexcept;
    static void clamp_progress(UploadJob& job) noexcept;

    // Caller holds mutex_ exclusively
    Result<UploadJob> insert_upload(UploadJob job);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, UploadJob> uploads_;
    std::vector<std::string> upload_order_;
    std::vector<RestoreJob> restores_;
    std::atomic<std::uint64_t> next_seq_{0};
};

} // namespace rv::jobs
