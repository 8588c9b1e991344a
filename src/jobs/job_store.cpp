#include "rv/jobs/job_store.hpp"
#include "rv/jobs/codec.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>

namespace rv::jobs {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr int kSnapshotVersion = 1;

std::string illegal_transition(const char* what, const char* from, const char* to) {
    return std::string("Illegal ") + what + " transition " + from + " -> " + to;
}

} // namespace

bool JobStore::blocks_duplicate(UploadStatus status) noexcept {
    return status == UploadStatus::Pending ||
           status == UploadStatus::InProgress ||
           status == UploadStatus::Paused;
}

void JobStore::clamp_progress(UploadJob& job) noexcept {
    if (job.uploaded_bytes > job.file_size) {
        job.uploaded_bytes = job.file_size;
    }
}

// ──────────────────────────────────────────────────────────
// Uploads
// ──────────────────────────────────────────────────────────

Result<UploadJob> JobStore::add_upload(UploadJob job) {
    std::unique_lock lock(mutex_);
    return insert_upload(std::move(job));
}

Result<UploadJob> JobStore::add_upload_if_idle(UploadJob job) {
    std::unique_lock lock(mutex_);

    const auto busy = std::count_if(uploads_.begin(), uploads_.end(), [](const auto& entry) {
        return entry.second.status == UploadStatus::Pending || entry.second.status == UploadStatus::InProgress;
    });
    if (busy > 0) {
        return Err<UploadJob>(Error::precondition(
            "Free tier uploads one file at a time; " + std::to_string(busy) + " file(s) still queued or uploading"));
    }
    return insert_upload(std::move(job));
}

Result<UploadJob> JobStore::insert_upload(UploadJob job) {
    if (uploads_.count(job.id) > 0) {
        return Err<UploadJob>(Error::precondition("Upload job already exists: " + job.id));
    }

    for (const auto& [id, existing] : uploads_) {
        if (existing.source_path == job.source_path && blocks_duplicate(existing.status)) {
            return Err<UploadJob>(Error::precondition(
                "Duplicate submission: " + job.source_path + " is already queued as " + id));
        }
    }

    job.status = UploadStatus::Pending;
    job.enqueue_seq = next_sequence();
    clamp_progress(job);

    upload_order_.push_back(job.id);
    uploads_.emplace(job.id, job);
    return Ok(std::move(job));
}

Result<UploadJob> JobStore::upload(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = uploads_.find(id);
    if (it == uploads_.end()) {
        return Err<UploadJob>(Error::not_found("Upload job not found: " + id));
    }
    return Ok(it->second);
}

std::vector<UploadJob> JobStore::uploads() const {
    std::shared_lock lock(mutex_);
    std::vector<UploadJob> result;
    result.reserve(upload_order_.size());
    for (const auto& id : upload_order_) {
        result.push_back(uploads_.at(id));
    }
    return result;
}

Result<UploadJob> JobStore::modify_upload(const std::string& id, const UploadMutator& mutate) {
    std::unique_lock lock(mutex_);
    auto it = uploads_.find(id);
    if (it == uploads_.end()) {
        return Err<UploadJob>(Error::not_found("Upload job not found: " + id));
    }

    UploadJob updated = it->second;
    if (auto res = mutate(updated); res.is_error()) {
        return Err<UploadJob>(res.error());
    }
    updated.status = it->second.status;
    clamp_progress(updated);
    it->second = updated;
    return Ok(std::move(updated));
}

Result<UploadJob> JobStore::transition_upload(const std::string& id,
                                              UploadStatus next,
                                              const UploadMutator& mutate) {
    std::unique_lock lock(mutex_);
    auto it = uploads_.find(id);
    if (it == uploads_.end()) {
        return Err<UploadJob>(Error::not_found("Upload job not found: " + id));
    }

    const auto current = it->second.status;
    if (!can_transition(current, next)) {
        return Err<UploadJob>(Error::precondition(
            illegal_transition("upload", to_string(current), to_string(next))));
    }

    UploadJob updated = it->second;
    updated.status = next;
    if (mutate) {
        if (auto res = mutate(updated); res.is_error()) {
            return Err<UploadJob>(res.error());
        }
        updated.status = next;
    }
    clamp_progress(updated);
    it->second = updated;
    return Ok(std::move(updated));
}

std::optional<UploadJob> JobStore::claim_next_pending() {
    std::unique_lock lock(mutex_);

    UploadJob* oldest = nullptr;
    for (auto& [id, job] : uploads_) {
        if (job.status != UploadStatus::Pending) {
            continue;
        }
        if (oldest == nullptr || job.enqueue_seq < oldest->enqueue_seq) {
            oldest = &job;
        }
    }

    if (oldest == nullptr) {
        return std::nullopt;
    }

    oldest->status = UploadStatus::InProgress;
    oldest->started_at = Clock::now();
    oldest->speed_bps = 0.0;
    oldest->eta_seconds.reset();
    return *oldest;
}

bool JobStore::has_pending_upload() const {
    std::shared_lock lock(mutex_);
    return std::any_of(uploads_.begin(), uploads_.end(), [](const auto& entry) {
        return entry.second.status == UploadStatus::Pending;
    });
}

std::size_t JobStore::count_uploads(UploadStatus status) const {
    std::shared_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(uploads_.begin(), uploads_.end(), [status](const auto& entry) {
        return entry.second.status == status;
    }));
}

Result<UploadJob> JobStore::remove_upload(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = uploads_.find(id);
    if (it == uploads_.end()) {
        return Err<UploadJob>(Error::not_found("Upload job not found: " + id));
    }
    if (it->second.status == UploadStatus::InProgress) {
        return Err<UploadJob>(Error::precondition("Upload job is in progress, cancel it first: " + id));
    }

    auto removed = std::move(it->second);
    uploads_.erase(it);
    upload_order_.erase(std::remove(upload_order_.begin(), upload_order_.end(), id), upload_order_.end());
    return Ok(std::move(removed));
}

std::vector<UploadJob> JobStore::clear_uploads() {
    std::unique_lock lock(mutex_);
    std::vector<UploadJob> removed;
    std::vector<std::string> kept;
    for (const auto& id : upload_order_) {
        auto it = uploads_.find(id);
        if (it->second.status == UploadStatus::InProgress) {
            kept.push_back(id);
            continue;
        }
        removed.push_back(std::move(it->second));
        uploads_.erase(it);
    }
    upload_order_ = std::move(kept);
    return removed;
}

// ──────────────────────────────────────────────────────────
// Restores
// ──────────────────────────────────────────────────────────

std::pair<RestoreJob, bool> JobStore::add_restore_if_absent(RestoreJob job) {
    std::unique_lock lock(mutex_);
    for (const auto& existing : restores_) {
        if (existing.key == job.key && existing.status == RestoreStatus::InProgress) {
            return {existing, false};
        }
    }
    job.status = RestoreStatus::InProgress;
    restores_.push_back(job);
    return {std::move(job), true};
}

std::optional<RestoreJob> JobStore::active_restore(const std::string& key) const {
    std::shared_lock lock(mutex_);
    for (const auto& job : restores_) {
        if (job.key == key && job.status == RestoreStatus::InProgress) {
            return job;
        }
    }
    return std::nullopt;
}

std::optional<RestoreJob> JobStore::latest_restore(const std::string& key) const {
    std::shared_lock lock(mutex_);
    for (auto it = restores_.rbegin(); it != restores_.rend(); ++it) {
        if (it->key == key) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<RestoreJob> JobStore::restores() const {
    std::shared_lock lock(mutex_);
    return restores_;
}

std::vector<RestoreJob> JobStore::restores_with_status(RestoreStatus status) const {
    std::shared_lock lock(mutex_);
    std::vector<RestoreJob> result;
    std::copy_if(restores_.begin(), restores_.end(), std::back_inserter(result),
                 [status](const RestoreJob& job) { return job.status == status; });
    return result;
}

Result<RestoreJob> JobStore::transition_restore(const std::string& job_id,
                                                RestoreStatus next,
                                                const RestoreMutator& mutate) {
    std::unique_lock lock(mutex_);
    auto it = std::find_if(restores_.begin(), restores_.end(),
                           [&job_id](const RestoreJob& job) { return job.job_id == job_id; });
    if (it == restores_.end()) {
        return Err<RestoreJob>(Error::not_found("Restore job not found: " + job_id));
    }

    if (!can_transition(it->status, next)) {
        return Err<RestoreJob>(Error::precondition(
            illegal_transition("restore", to_string(it->status), to_string(next))));
    }

    RestoreJob updated = *it;
    updated.status = next;
    if (mutate) {
        if (auto res = mutate(updated); res.is_error()) {
            return Err<RestoreJob>(res.error());
        }
        updated.status = next;
    }
    *it = updated;
    return Ok(std::move(updated));
}

std::size_t JobStore::clear_terminal_restores() {
    std::unique_lock lock(mutex_);
    const auto before = restores_.size();
    restores_.erase(std::remove_if(restores_.begin(), restores_.end(),
                                   [](const RestoreJob& job) { return is_terminal(job.status); }),
                    restores_.end());
    return before - restores_.size();
}

// ──────────────────────────────────────────────────────────
// Persistence
// ──────────────────────────────────────────────────────────

Result<void> JobStore::save_snapshot(const fs::path& path) const {
    json document;
    {
        std::shared_lock lock(mutex_);
        document["version"] = kSnapshotVersion;
        document["uploads"] = json::array();
        for (const auto& id : upload_order_) {
            document["uploads"].push_back(uploads_.at(id));
        }
        document["restores"] = restores_;
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(Error::permanent("Failed to create directory: " + path.parent_path().string()));
        }
    }

    // Write beside the target and rename so a crash never leaves half a file
    const fs::path temp = path.string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(Error::permanent("Failed to open snapshot for writing: " + temp.string()));
        }
        out << document.dump(2);
        if (!out) {
            return Err<void>(Error::permanent("Failed to write snapshot: " + temp.string()));
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        return Err<void>(Error::permanent("Failed to move snapshot into place: " + path.string()));
    }
    return Ok();
}

Result<SnapshotReport> JobStore::load_snapshot(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SnapshotReport>(Error::not_found("Snapshot not found: " + path.string()));
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<SnapshotReport>(Error::invalid_argument("Invalid snapshot JSON: " + path.string()));
    }

    std::vector<UploadJob> uploads;
    std::vector<RestoreJob> restores;
    try {
        uploads = document.value("uploads", json::array()).get<std::vector<UploadJob>>();
        restores = document.value("restores", json::array()).get<std::vector<RestoreJob>>();
    } catch (const json::exception& e) {
        return Err<SnapshotReport>(Error::invalid_argument(std::string("Malformed snapshot record: ") + e.what()));
    } catch (const std::invalid_argument& e) {
        return Err<SnapshotReport>(Error::invalid_argument(std::string("Malformed snapshot record: ") + e.what()));
    }

    SnapshotReport report;
    std::uint64_t max_seq = 0;

    std::unique_lock lock(mutex_);
    uploads_.clear();
    upload_order_.clear();
    for (auto& job : uploads) {
        if (job.status == UploadStatus::InProgress) {
            // Interrupted by the restart: back to the queue, keeping its place
            job.status = UploadStatus::Pending;
            job.speed_bps = 0.0;
            job.eta_seconds.reset();
            ++report.uploads_requeued;
        }
        clamp_progress(job);
        max_seq = std::max(max_seq, job.enqueue_seq);
        upload_order_.push_back(job.id);
        uploads_[job.id] = std::move(job);
    }

    restores_ = std::move(restores);
    for (const auto& job : restores_) {
        if (job.status == RestoreStatus::InProgress) {
            report.restores_to_repoll.push_back(job.key);
        }
    }

    next_seq_.store(max_seq);
    report.uploads_loaded = uploads_.size();
    report.restores_loaded = restores_.size();

    spdlog::info("[JobStore] Loaded snapshot {}: {} uploads ({} requeued), {} restores ({} to re-poll)",
                 path.string(), report.uploads_loaded, report.uploads_requeued,
                 report.restores_loaded, report.restores_to_repoll.size());
    return Ok(std::move(report));
}

} // namespace rv::jobs
