#include "rv/restore/restore_tracker.hpp"
#include "rv/core/uuid.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace rv::restore {
namespace asio = boost::asio;
namespace fs = std::filesystem;
using jobs::RestoreJob;
using jobs::RestoreStatus;

namespace {

constexpr std::chrono::seconds kDownloadBackoffCap{30};

bool is_archive_class(const std::string& storage_class) {
    return storage_class == "DEEP_ARCHIVE" || storage_class == "GLACIER";
}

} // namespace

RestoreJobTracker::RestoreJobTracker(jobs::JobStore& store,
                                     storage::ObjectStore& objects,
                                     storage::CredentialProvider& credentials,
                                     events::NotificationHub& hub,
                                     jobs::RestoreConfig config)
    : store_(store),
      objects_(objects),
      credentials_(credentials),
      hub_(hub),
      config_(std::move(config)),
      restore_log_(hub, events::NotificationKind::Restore),
      download_pool_(std::max<std::size_t>(config_.download_workers, 1)) {}

RestoreJobTracker::~RestoreJobTracker() {
    wait_for_downloads();
    download_pool_.join();
}

// ──────────────────────────────────────────────────────────
// Restore requests
// ──────────────────────────────────────────────────────────

// Holds one key in inflight_keys_ for its lifetime
class RestoreJobTracker::KeyLease {
public:
    KeyLease(RestoreJobTracker& owner, const std::string& key) : owner_(owner), key_(key) {
        std::unique_lock lock(owner_.inflight_mutex_);
        owner_.inflight_cv_.wait(lock, [this]() { return owner_.inflight_keys_.count(key_) == 0; });
        owner_.inflight_keys_.insert(key_);
    }

    ~KeyLease() {
        {
            std::lock_guard lock(owner_.inflight_mutex_);
            owner_.inflight_keys_.erase(key_);
        }
        owner_.inflight_cv_.notify_all();
    }

    KeyLease(const KeyLease&) = delete;
    KeyLease& operator=(const KeyLease&) = delete;

private:
    RestoreJobTracker& owner_;
    std::string key_;
};

Result<RestoreJob> RestoreJobTracker::request_restore(const std::string& key,
                                                      std::optional<jobs::RestoreTier> tier) {
    if (key.empty()) {
        return Err<RestoreJob>(Error::invalid_argument("Object key must not be empty"));
    }

    KeyLease lease(*this, key);

    if (auto active = store_.active_restore(key)) {
        spdlog::info("[RestoreTracker] Restore of {} already in progress ({})", key, active->job_id);
        return Ok(*active);
    }

    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        return Err<RestoreJob>(Error::permanent(creds.error().message));
    }

    const auto chosen = tier.value_or(config_.default_tier);
    auto requested = objects_.request_restore(creds.value(), key, chosen, config_.restore_days, request_options());
    if (requested.is_error()) {
        spdlog::error("[RestoreTracker] Restore request for {} rejected: {}", key, requested.error().message);
        return Err<RestoreJob>(requested.error());
    }

    RestoreJob job;
    job.job_id = generate_uuid();
    job.key = key;
    job.tier = chosen;
    job.status = RestoreStatus::InProgress;
    job.requested_at = jobs::Clock::now();

    auto [record, inserted] = store_.add_restore_if_absent(std::move(job));
    if (inserted) {
        spdlog::info("[RestoreTracker] Requested {} restore of {} for {} days ({})",
                     jobs::to_string(chosen), key, config_.restore_days, record.job_id);
    }
    return Ok(std::move(record));
}

Result<jobs::RestoreStatusResult> RestoreJobTracker::check_status(const std::string& key) {
    jobs::RestoreStatusResult result;
    result.key = key;

    auto latest = store_.latest_restore(key);
    if (!latest) {
        result.status = RestoreStatus::NotFound;
        return Ok(std::move(result));
    }

    if (latest->status == RestoreStatus::InProgress) {
        auto refreshed = refresh(*latest);
        if (refreshed.is_error()) {
            return Err<jobs::RestoreStatusResult>(refreshed.error());
        }
        latest = refreshed.value();
    }

    result.status = latest->status;
    result.job = std::move(latest);
    return Ok(std::move(result));
}

Result<RestoreJob> RestoreJobTracker::refresh(const RestoreJob& job) {
    if (job.status != RestoreStatus::InProgress) {
        return Ok(job);
    }

    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        return Err<RestoreJob>(creds.error());
    }

    auto remote = objects_.restore_status(creds.value(), job.key, request_options());
    if (remote.is_error()) {
        return Err<RestoreJob>(remote.error());
    }

    switch (remote.value().state) {
        case storage::RemoteRestoreState::InProgress:
            return Ok(job);
        case storage::RemoteRestoreState::Completed:
            return apply_terminal(job, RestoreStatus::Completed, remote.value());
        case storage::RemoteRestoreState::Failed:
            return apply_terminal(job, RestoreStatus::Failed, remote.value());
        case storage::RemoteRestoreState::NotFound:
            break;
    }

    // Not a failure report from the store; the next query may see the request
    return Err<RestoreJob>(Error::not_found(
        "Store has no restore for " + job.key + (remote.value().message.empty() ? "" : ": " + remote.value().message)));
}

Result<RestoreJob> RestoreJobTracker::apply_terminal(const RestoreJob& job,
                                                     RestoreStatus status,
                                                     const storage::RestoreState& remote) {
    auto applied = store_.transition_restore(job.job_id, status, [&](RestoreJob& record) -> Result<void> {
        record.completed_at = jobs::Clock::now();
        if (status == RestoreStatus::Completed) {
            record.expires_at = remote.expires_at;
        } else {
            record.last_error = remote.message.empty() ? "Restore failed" : remote.message;
        }
        return Ok();
    });

    if (applied.is_error()) {
        // Someone else already moved it to a terminal state
        auto latest = store_.latest_restore(job.key);
        if (latest && latest->job_id == job.job_id) {
            return Ok(*latest);
        }
        return Err<RestoreJob>(applied.error());
    }

    const auto& record = applied.value();
    if (status == RestoreStatus::Completed) {
        spdlog::info("[RestoreTracker] Restore of {} completed", record.key);
        hub_.publish(events::Notification(record.key, events::NotificationKind::Restore, "completed",
                                          "Restored copy available"));
    } else {
        spdlog::warn("[RestoreTracker] Restore of {} failed: {}", record.key, record.last_error.value_or(""));
        hub_.publish(events::Notification(record.key, events::NotificationKind::Restore, "failed",
                                          record.last_error.value_or("")));
    }
    return applied;
}

std::vector<RestoreJob> RestoreJobTracker::list_jobs() const {
    return store_.restores();
}

bool RestoreJobTracker::cancel(const std::string& key) {
    auto active = store_.active_restore(key);
    if (!active) {
        return false;
    }

    auto cancelled = store_.transition_restore(active->job_id, RestoreStatus::Cancelled,
                                               [](RestoreJob& record) -> Result<void> {
                                                   record.completed_at = jobs::Clock::now();
                                                   return Ok();
                                               });
    if (cancelled.is_error()) {
        return false;
    }

    spdlog::info("[RestoreTracker] Restore of {} cancelled", key);
    hub_.publish(events::Notification(key, events::NotificationKind::Restore, "cancelled", "Cancelled by user"));
    return true;
}

std::size_t RestoreJobTracker::clear_history() {
    const auto removed = store_.clear_terminal_restores();

    std::size_t forgotten = 0;
    {
        std::lock_guard lock(downloads_mutex_);
        for (auto it = downloads_.begin(); it != downloads_.end();) {
            if (it->second.status == jobs::DownloadStatus::InProgress) {
                ++it;
                continue;
            }
            it = downloads_.erase(it);
            ++forgotten;
        }
    }

    spdlog::info("[RestoreTracker] Cleared {} finished restore job(s) and {} download(s)", removed, forgotten);
    return removed;
}

std::vector<events::Notification> RestoreJobTracker::notifications() const {
    hub_.flush();
    return restore_log_.entries();
}

Result<std::vector<storage::ObjectSummary>> RestoreJobTracker::archived_objects(const std::string& prefix) const {
    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        return Err<std::vector<storage::ObjectSummary>>(creds.error());
    }

    auto listed = objects_.list_objects(creds.value(), prefix, request_options());
    if (listed.is_error()) {
        return listed;
    }

    auto objects = std::move(listed.value());
    objects.erase(std::remove_if(objects.begin(), objects.end(),
                                 [](const storage::ObjectSummary& o) { return !is_archive_class(o.storage_class); }),
                  objects.end());
    return Ok(std::move(objects));
}

// ──────────────────────────────────────────────────────────
// Download
// ──────────────────────────────────────────────────────────

Result<void> RestoreJobTracker::download(const std::string& key, const fs::path& local_path) {
    auto latest = store_.latest_restore(key);
    if (!latest || latest->status != RestoreStatus::Completed) {
        return Err<void>(Error::precondition("No completed restore for " + key));
    }

    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        return Err<void>(Error::permanent(creds.error().message));
    }

    // The restored copy may have expired since the record was written
    auto remote = objects_.restore_status(creds.value(), key, request_options());
    if (remote.is_error()) {
        return Err<void>(remote.error());
    }
    const auto& state = remote.value();
    if (state.state != storage::RemoteRestoreState::Completed) {
        return Err<void>(Error::precondition("Restored copy of " + key + " is no longer available"));
    }
    if (state.expires_at && *state.expires_at <= jobs::Clock::now()) {
        return Err<void>(Error::precondition("Restored copy of " + key + " has expired"));
    }

    {
        std::lock_guard lock(downloads_mutex_);
        auto existing = downloads_.find(key);
        if (existing != downloads_.end() && existing->second.status == jobs::DownloadStatus::InProgress) {
            return Err<void>(Error::precondition("Download of " + key + " already running"));
        }

        jobs::DownloadProgress progress;
        progress.key = key;
        progress.local_path = local_path.string();
        downloads_[key] = progress;
        ++active_downloads_;
    }

    spdlog::info("[RestoreTracker] Downloading {} to {}", key, local_path.string());
    asio::post(download_pool_, [this, key, local_path, creds = creds.value()]() {
        run_download(key, local_path, creds);
    });
    return Ok();
}

void RestoreJobTracker::run_download(const std::string& key,
                                     const fs::path& local_path,
                                     const storage::Credentials& creds) {
    double last_published = -1.0;
    auto on_progress = [&](std::uint64_t done, std::uint64_t total) {
        const double percentage = total > 0 ? static_cast<double>(done) * 100.0 / static_cast<double>(total) : 100.0;
        // At most one tick per whole percent
        const bool publish = std::floor(percentage) > std::floor(last_published);
        if (publish) {
            last_published = percentage;
        }
        update_download(key, [&](jobs::DownloadProgress& p) {
            p.downloaded_bytes = std::max(p.downloaded_bytes, done);
            p.total_bytes = total;
            p.percentage = percentage;
        }, publish);
    };

    std::uint32_t attempt = 0;
    for (;;) {
        auto fetched = objects_.download_object(creds, key, local_path, on_progress, request_options());
        if (fetched.is_ok()) {
            const auto bytes = fetched.value();
            update_download(key, [bytes](jobs::DownloadProgress& p) {
                p.downloaded_bytes = bytes;
                p.total_bytes = bytes;
                p.percentage = 100.0;
                p.status = jobs::DownloadStatus::Completed;
            }, true);
            spdlog::info("[RestoreTracker] Downloaded {} ({} bytes)", key, bytes);
            hub_.publish(events::Notification(key, events::NotificationKind::Download, "completed",
                                              local_path.string()));
            break;
        }

        const auto& error = fetched.error();
        if (error.is_transient() && attempt < config_.download_retry_attempts) {
            ++attempt;
            const auto delay = std::min<std::chrono::seconds>(std::chrono::seconds(1LL << std::min<std::uint32_t>(attempt - 1, 5)),
                                                              kDownloadBackoffCap);
            spdlog::warn("[RestoreTracker] Download of {} failed ({}), retry {}/{}",
                         key, error.message, attempt, config_.download_retry_attempts);
            std::this_thread::sleep_for(delay);
            continue;
        }

        update_download(key, [&error](jobs::DownloadProgress& p) {
            p.status = jobs::DownloadStatus::Failed;
            p.error = error.message;
        }, true);
        spdlog::error("[RestoreTracker] Download of {} failed: {}", key, error.message);
        hub_.publish(events::Notification(key, events::NotificationKind::Download, "failed", error.message));
        break;
    }

    {
        std::lock_guard lock(downloads_mutex_);
        --active_downloads_;
    }
    downloads_cv_.notify_all();
}

void RestoreJobTracker::update_download(const std::string& key,
                                        const std::function<void(jobs::DownloadProgress&)>& change,
                                        bool publish) {
    jobs::DownloadProgress snapshot;
    {
        std::lock_guard lock(downloads_mutex_);
        auto& progress = downloads_[key];
        change(progress);
        snapshot = progress;
    }
    if (publish) {
        hub_.publish(snapshot);
    }
}

std::optional<jobs::DownloadProgress> RestoreJobTracker::download_progress(const std::string& key) const {
    std::lock_guard lock(downloads_mutex_);
    auto it = downloads_.find(key);
    if (it == downloads_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void RestoreJobTracker::wait_for_downloads() {
    std::unique_lock lock(downloads_mutex_);
    downloads_cv_.wait(lock, [this]() { return active_downloads_ == 0; });
}

} // namespace rv::restore
