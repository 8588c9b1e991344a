#include "rv/upload/upload_queue.hpp"
#include "rv/core/uuid.hpp"
#include "rv/events/events.hpp"
#include "rv/storage/file_io.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace rv::upload {
namespace asio = boost::asio;
namespace fs = std::filesystem;
using jobs::UploadJob;
using jobs::UploadStatus;

namespace {

// Safety net for wake-ups the dispatcher could miss
constexpr std::chrono::milliseconds kDispatchTick{200};

std::string normalize_path(const std::string& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    if (ec) {
        return fs::path(path).lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

Result<void> quiesce(UploadJob& record) {
    record.speed_bps = 0.0;
    record.eta_seconds.reset();
    return Ok();
}

} // namespace

UploadQueueManager::UploadQueueManager(jobs::JobStore& store,
                                       storage::ObjectStore& objects,
                                       storage::CredentialProvider& credentials,
                                       events::NotificationHub& hub,
                                       jobs::UploadConfig config)
    : store_(store),
      objects_(objects),
      credentials_(credentials),
      hub_(hub),
      config_(std::move(config)) {}

UploadQueueManager::~UploadQueueManager() {
    stop();
    wait_for_workers();

    std::lock_guard lock(mutex_);
    if (pool_) {
        pool_->join();
        pool_.reset();
    }
}

// ──────────────────────────────────────────────────────────
// Configuration
// ──────────────────────────────────────────────────────────

Result<void> UploadQueueManager::initialize(const jobs::UploadConfig& config) {
    if (auto valid = config.validate(); valid.is_error()) {
        return valid;
    }

    std::lock_guard lock(mutex_);
    if (processing_) {
        return Err<void>(Error::precondition("Stop processing before changing the upload config"));
    }
    config_ = config;
    spdlog::info("[UploadQueue] Initialized: tier={} uploads={} parts={} chunk={}MB adaptive={} retries={}",
                 jobs::to_string(config_.tier), config_.max_concurrent_uploads, config_.max_concurrent_parts,
                 config_.chunk_size / jobs::kMiB, config_.adaptive_chunk_size, config_.retry_attempts);
    return Ok();
}

jobs::UploadConfig UploadQueueManager::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

// ──────────────────────────────────────────────────────────
// Submission and job control
// ──────────────────────────────────────────────────────────

SubmitReport UploadQueueManager::submit(const std::vector<std::string>& paths, const KeyOptions& options) {
    SubmitReport report;
    const auto tier = config().tier;

    // Fast path; add_upload_if_idle below is the authoritative check
    if (tier == jobs::UploadTier::Free && !paths.empty()) {
        const auto busy = store_.count_uploads(UploadStatus::Pending) + store_.count_uploads(UploadStatus::InProgress);
        if (busy > 0) {
            const auto reason = Error::precondition(
                "Free tier uploads one file at a time; " + std::to_string(busy) +
                " file(s) still queued or uploading");
            for (const auto& path : paths) {
                report.rejected.emplace_back(path, reason);
            }
            spdlog::warn("[UploadQueue] Rejected {} file(s): {}", paths.size(), reason.message);
            return report;
        }
    }

    const auto now = jobs::Clock::now();
    for (const auto& raw_path : paths) {
        const auto path = normalize_path(raw_path);

        auto size = storage::file_size(path);
        if (size.is_error()) {
            report.rejected.emplace_back(raw_path, size.error());
            continue;
        }

        auto key = generate_object_key(path, options, now);
        if (key.is_error()) {
            report.rejected.emplace_back(raw_path, key.error());
            continue;
        }

        UploadJob job;
        job.id = generate_uuid();
        job.source_path = path;
        job.file_name = fs::path(path).filename().string();
        job.file_size = size.value();
        job.object_key = key.value();
        job.submitted_at = now;

        // The first Free-tier insert claims the idle queue for this batch
        const bool claim_idle = tier == jobs::UploadTier::Free && report.accepted.empty();
        auto added = claim_idle ? store_.add_upload_if_idle(std::move(job)) : store_.add_upload(std::move(job));
        if (added.is_error()) {
            report.rejected.emplace_back(raw_path, added.error());
            continue;
        }

        spdlog::info("[UploadQueue] Queued {} ({} bytes) as {}",
                     added.value().file_name, added.value().file_size, added.value().object_key);
        report.accepted.push_back(added.value().id);
    }

    if (!report.accepted.empty()) {
        dispatch_cv_.notify_all();
    }
    return report;
}

Result<void> UploadQueueManager::remove(const std::string& id) {
    auto removed = store_.remove_upload(id);
    if (removed.is_error()) {
        return Err<void>(removed.error());
    }

    abort_session(removed.value().object_key, removed.value().upload_id, id);
    spdlog::info("[UploadQueue] Removed {}", id);
    return Ok();
}

Result<UploadJob> UploadQueueManager::pause(const std::string& id) {
    std::lock_guard lock(mutex_);

    auto control = controls_.find(id);
    if (control != controls_.end()) {
        auto current = store_.upload(id);
        if (current.is_ok() && current.value().status == UploadStatus::InProgress) {
            control->second->request(Interrupt::Pause);
            spdlog::info("[UploadQueue] Pause requested for {}", id);
            return current;
        }
    }

    auto paused = store_.transition_upload(id, UploadStatus::Paused, quiesce);
    if (paused.is_ok()) {
        spdlog::info("[UploadQueue] Paused {}", id);
    }
    return paused;
}

Result<UploadJob> UploadQueueManager::resume(const std::string& id) {
    auto resumed = store_.transition_upload(id, UploadStatus::Pending);
    if (resumed.is_ok()) {
        spdlog::info("[UploadQueue] Resumed {}", id);
        dispatch_cv_.notify_all();
    }
    return resumed;
}

Result<UploadJob> UploadQueueManager::cancel(const std::string& id) {
    std::string stale_session;
    Result<UploadJob> cancelled = Err<UploadJob>(Error::not_found("Upload job not found: " + id));
    {
        std::lock_guard lock(mutex_);

        auto control = controls_.find(id);
        if (control != controls_.end()) {
            auto current = store_.upload(id);
            if (current.is_ok() && current.value().status == UploadStatus::InProgress) {
                control->second->request(Interrupt::Cancel);
                spdlog::info("[UploadQueue] Cancel requested for {}", id);
                return current;
            }
        }

        cancelled = store_.transition_upload(id, UploadStatus::Cancelled, [&](UploadJob& record) -> Result<void> {
            stale_session = record.upload_id;
            record.upload_id.clear();
            return quiesce(record);
        });
    }

    if (cancelled.is_error()) {
        return cancelled;
    }

    abort_session(cancelled.value().object_key, stale_session, id);

    spdlog::info("[UploadQueue] Cancelled {}", id);
    hub_.publish(events::Notification(id, events::NotificationKind::Upload, "cancelled", "Cancelled by user"));
    return cancelled;
}

Result<UploadJob> UploadQueueManager::retry(const std::string& id) {
    auto retried = store_.transition_upload(id, UploadStatus::Pending, [this](UploadJob& record) -> Result<void> {
        record.retry_count = 0;
        record.last_error.reset();
        record.uploaded_bytes = 0;
        record.started_at.reset();
        record.completed_at.reset();
        record.enqueue_seq = store_.next_sequence();
        return quiesce(record);
    });

    if (retried.is_ok()) {
        spdlog::info("[UploadQueue] Retry scheduled for {}", id);
        dispatch_cv_.notify_all();
    }
    return retried;
}

// ──────────────────────────────────────────────────────────
// Processing
// ──────────────────────────────────────────────────────────

Result<void> UploadQueueManager::start() {
    std::size_t workers = 0;
    {
        std::lock_guard lock(mutex_);
        if (processing_) {
            return Err<void>(Error::precondition("Upload processing is already running"));
        }

        if (pool_) {
            retired_pools_.push_back(std::move(pool_));
        }
        reap_retired();

        workers = config_.max_concurrent_uploads;
        pool_ = std::make_unique<asio::thread_pool>(workers);
        processing_ = true;
        ++generation_;

        dispatcher_ = std::thread([this, generation = generation_, pool = pool_.get()]() {
            dispatch_loop(generation, *pool);
        });
    }

    spdlog::info("[UploadQueue] Processing started with {} workers", workers);
    hub_.publish(events::ProcessingStartedEvent(workers));
    return Ok();
}

void UploadQueueManager::stop() {
    std::thread dispatcher;
    std::size_t signalled = 0;
    {
        std::lock_guard lock(mutex_);
        if (!processing_) {
            return;
        }
        processing_ = false;
        for (auto& [id, control] : controls_) {
            control->request(Interrupt::Stop);
            ++signalled;
        }
        dispatcher = std::move(dispatcher_);
    }

    dispatch_cv_.notify_all();
    if (dispatcher.joinable()) {
        dispatcher.join();
    }

    spdlog::info("[UploadQueue] Processing stopped, {} running job(s) will stop after their current part", signalled);
    hub_.publish(events::ProcessingStoppedEvent("stop requested"));
}

bool UploadQueueManager::is_processing() const {
    std::lock_guard lock(mutex_);
    return processing_;
}

void UploadQueueManager::dispatch_loop(std::uint64_t generation, asio::thread_pool& pool) {
    std::unique_lock lock(mutex_);
    while (processing_ && generation_ == generation) {
        if (active_workers_ < config_.max_concurrent_uploads) {
            if (auto claimed = store_.claim_next_pending()) {
                auto control = std::make_shared<JobControl>();
                controls_[claimed->id] = control;
                ++active_workers_;

                spdlog::debug("[UploadQueue] Dispatching {} ({} active)", claimed->file_name, active_workers_);
                asio::post(pool, [this, job = *claimed, control, config = config_]() {
                    execute(job, control, config);
                });
                continue;
            }
        }
        dispatch_cv_.wait_for(lock, kDispatchTick);
    }
}

void UploadQueueManager::execute(const UploadJob& job,
                                 const std::shared_ptr<JobControl>& control,
                                 jobs::UploadConfig config) {
    UploadWorker worker(store_, objects_, credentials_, hub_, std::move(config));
    const auto status = worker.run(job, *control);
    spdlog::debug("[UploadQueue] Worker for {} finished: {}", job.file_name, jobs::to_string(status));

    {
        std::lock_guard lock(mutex_);
        auto it = controls_.find(job.id);
        if (it != controls_.end() && it->second == control) {
            controls_.erase(it);
        }
        --active_workers_;
    }
    dispatch_cv_.notify_all();
    idle_cv_.notify_all();
}

// Caller holds mutex_
void UploadQueueManager::reap_retired() {
    if (active_workers_ != 0) {
        return;
    }
    for (auto& pool : retired_pools_) {
        pool->join();
    }
    retired_pools_.clear();
}

// Paused, Pending and Failed resumable jobs may still own a multipart session
// that nothing else would close once the job is cancelled or removed.
void UploadQueueManager::abort_session(const std::string& object_key,
                                       const std::string& session,
                                       const std::string& job_id) {
    if (session.empty()) {
        return;
    }

    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        spdlog::warn("[UploadQueue] Session {} of {} left open: {}", session, job_id, creds.error().message);
        return;
    }

    auto aborted = objects_.abort_multipart_upload(creds.value(), object_key, session,
                                                   storage::RequestOptions{config().timeout});
    if (aborted.is_error()) {
        if (aborted.error().kind != ErrorKind::NotFound) {
            spdlog::warn("[UploadQueue] Failed to abort session {} of {}: {}", session, job_id, aborted.error().message);
        }
        return;
    }
    spdlog::debug("[UploadQueue] Aborted session {} of {}", session, job_id);
}

// ──────────────────────────────────────────────────────────
// Queries
// ──────────────────────────────────────────────────────────

std::size_t UploadQueueManager::clear() {
    const auto removed = store_.clear_uploads();
    for (const auto& job : removed) {
        abort_session(job.object_key, job.upload_id, job.id);
    }
    spdlog::info("[UploadQueue] Cleared {} job(s)", removed.size());
    return removed.size();
}

jobs::UploadStatistics UploadQueueManager::statistics() const {
    jobs::UploadStatistics stats;
    double speed_sum = 0.0;
    std::uint64_t running = 0;
    std::uint64_t remaining = 0;

    for (const auto& job : store_.uploads()) {
        ++stats.total_files;
        stats.total_bytes += job.file_size;
        stats.uploaded_bytes += job.uploaded_bytes;

        switch (job.status) {
            case UploadStatus::Pending: ++stats.pending_files; break;
            case UploadStatus::InProgress:
                ++stats.in_progress_files;
                ++running;
                speed_sum += job.speed_bps;
                break;
            case UploadStatus::Paused: ++stats.paused_files; break;
            case UploadStatus::Completed: ++stats.completed_files; break;
            case UploadStatus::Failed: ++stats.failed_files; break;
            case UploadStatus::Cancelled: ++stats.cancelled_files; break;
        }

        if (job.status == UploadStatus::Pending || job.status == UploadStatus::InProgress ||
            job.status == UploadStatus::Paused) {
            remaining += job.file_size - job.uploaded_bytes;
        }
    }

    stats.average_speed_bps = running > 0 ? speed_sum / static_cast<double>(running) : 0.0;
    if (stats.average_speed_bps > 0.0) {
        stats.eta_seconds = static_cast<std::uint64_t>(static_cast<double>(remaining) / stats.average_speed_bps);
    }
    return stats;
}

std::vector<UploadJob> UploadQueueManager::jobs() const {
    return store_.uploads();
}

Result<UploadJob> UploadQueueManager::job(const std::string& id) const {
    return store_.upload(id);
}

std::size_t UploadQueueManager::active_workers() const {
    std::lock_guard lock(mutex_);
    return active_workers_;
}

bool UploadQueueManager::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return active_workers_ == 0 && !store_.has_pending_upload();
    });
}

void UploadQueueManager::wait_for_workers() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this]() { return active_workers_ == 0; });
    reap_retired();
}

} // namespace rv::upload
