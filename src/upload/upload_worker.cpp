#include "rv/upload/upload_worker.hpp"
#include "rv/events/events.hpp"
#include "rv/storage/file_io.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace rv::upload {
namespace asio = boost::asio;
using jobs::UploadJob;
using jobs::UploadStatus;

namespace {

constexpr std::chrono::milliseconds kMaxBackoff{std::chrono::seconds(30)};

std::uint64_t confirmed_bytes(const std::map<std::uint32_t, storage::CompletedPart>& parts) {
    std::uint64_t total = 0;
    for (const auto& [number, part] : parts) {
        total += part.size;
    }
    return total;
}

double percentage_of(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100.0;
    }
    return static_cast<double>(done) * 100.0 / static_cast<double>(total);
}

UploadStatus status_after(const Result<UploadJob>& res, const jobs::JobStore& store, const std::string& id) {
    if (res.is_ok()) {
        return res.value().status;
    }
    spdlog::error("[UploadWorker] Could not record outcome of {}: {}", id, res.error().message);
    auto current = store.upload(id);
    return current.is_ok() ? current.value().status : UploadStatus::Failed;
}

} // namespace

// ──────────────────────────────────────────────────────────
// JobControl
// ──────────────────────────────────────────────────────────

void JobControl::request(Interrupt kind) {
    const int desired = static_cast<int>(kind);
    int current = state_.load();
    while (current < desired && !state_.compare_exchange_weak(current, desired)) {
    }

    {
        std::lock_guard lock(mutex_);
    }
    cv_.notify_all();
}

bool JobControl::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, delay, [this]() { return interrupted(); });
}

std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base, std::uint32_t attempt) {
    const std::uint32_t shift = attempt > 0 ? std::min<std::uint32_t>(attempt - 1, 20) : 0;
    const auto delay = base * (1LL << shift);
    return std::min<std::chrono::milliseconds>(delay, kMaxBackoff);
}

// ──────────────────────────────────────────────────────────
// UploadWorker
// ──────────────────────────────────────────────────────────

struct UploadWorker::RunState {
    std::mutex mutex;
    std::string upload_id;
    std::map<std::uint32_t, storage::CompletedPart> completed;
    std::vector<PartRange> pending;
    std::size_t next = 0;
    std::uint64_t run_bytes = 0;
    std::optional<Error> fatal;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();

    double elapsed_seconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    }
};

UploadWorker::UploadWorker(jobs::JobStore& store,
                           storage::ObjectStore& objects,
                           storage::CredentialProvider& credentials,
                           events::NotificationHub& hub,
                           jobs::UploadConfig config)
    : store_(store),
      objects_(objects),
      credentials_(credentials),
      hub_(hub),
      config_(std::move(config)) {}

UploadStatus UploadWorker::run(const UploadJob& job, JobControl& control) {
    spdlog::info("[UploadWorker] Starting {} ({} bytes) -> {}", job.file_name, job.file_size, job.object_key);

    auto creds = credentials_.active_credentials();
    if (creds.is_error()) {
        return finish_failed(job, creds.error().message, std::nullopt, job.upload_id);
    }

    auto size = storage::file_size(job.source_path);
    if (size.is_error()) {
        return finish_failed(job, size.error().message, creds.value(), job.upload_id);
    }
    if (size.value() != job.file_size) {
        return finish_failed(job,
                             "Source changed since submission: " + job.source_path + " is now " +
                                 std::to_string(size.value()) + " bytes, expected " + std::to_string(job.file_size),
                             creds.value(), job.upload_id);
    }

    auto plan = plan_parts(job.file_size, config_);
    if (plan.is_error()) {
        return finish_failed(job, plan.error().message, creds.value(), job.upload_id);
    }

    if (control.requested() == Interrupt::Cancel) {
        return finish_cancelled(job, creds.value(), job.upload_id);
    }

    auto session = open_session(job, creds.value(), plan.value(), control);
    if (session.is_error()) {
        if (session.error().is_transient() && control.interrupted()) {
            return control.requested() == Interrupt::Cancel
                       ? finish_cancelled(job, creds.value(), "")
                       : finish_interrupted(job, control.requested(), creds.value(), "");
        }
        return finish_failed(job, session.error().message, creds.value(), "");
    }

    RunState state;
    state.upload_id = session.value().upload_id;
    state.completed = session.value().completed;
    for (const auto& part : plan.value().parts) {
        if (state.completed.count(part.number) == 0) {
            state.pending.push_back(part);
        }
    }

    const auto confirmed = confirmed_bytes(state.completed);
    auto recorded = store_.modify_upload(job.id, [&](UploadJob& record) -> Result<void> {
        record.upload_id = state.upload_id;
        record.uploaded_bytes = confirmed;
        record.speed_bps = 0.0;
        record.eta_seconds.reset();
        return Ok();
    });
    if (recorded.is_error()) {
        spdlog::error("[UploadWorker] Lost record of {}: {}", job.id, recorded.error().message);
    }

    spdlog::debug("[UploadWorker] {}: {} parts of {} bytes, {} already stored",
                  job.file_name, plan.value().parts.size(), plan.value().chunk_size, state.completed.size());

    if (!state.pending.empty()) {
        const auto lanes = std::min(config_.max_concurrent_parts, state.pending.size());
        asio::thread_pool part_pool(lanes);
        for (std::size_t i = 0; i < lanes; ++i) {
            asio::post(part_pool, [this, &state, &job, &creds, &control]() {
                run_lane(state, job, creds.value(), control);
            });
        }
        part_pool.join();
    }

    const auto interrupt = control.requested();
    if (interrupt == Interrupt::Cancel) {
        return finish_cancelled(job, creds.value(), state.upload_id);
    }
    if (state.fatal) {
        return finish_failed(job, state.fatal->message, creds.value(), state.upload_id);
    }
    if (interrupt != Interrupt::None && state.completed.size() < plan.value().parts.size()) {
        return finish_interrupted(job, interrupt, creds.value(), state.upload_id);
    }

    auto completed = complete_with_retry(job, creds.value(), state.upload_id, state.completed, control);
    if (completed.is_error()) {
        if (completed.error().is_transient() && control.interrupted()) {
            return control.requested() == Interrupt::Cancel
                       ? finish_cancelled(job, creds.value(), state.upload_id)
                       : finish_interrupted(job, control.requested(), creds.value(), state.upload_id);
        }
        return finish_failed(job, completed.error().message, creds.value(), state.upload_id);
    }
    return finish_completed(job, state);
}

void UploadWorker::run_lane(RunState& state,
                            const UploadJob& job,
                            const storage::Credentials& creds,
                            JobControl& control) {
    for (;;) {
        PartRange part;
        {
            std::lock_guard lock(state.mutex);
            if (state.fatal || control.interrupted() || state.next >= state.pending.size()) {
                return;
            }
            part = state.pending[state.next++];
        }

        auto etag = upload_part_with_retry(job, creds, state.upload_id, part, control);
        if (etag.is_error()) {
            std::lock_guard lock(state.mutex);
            // A transient error cut short by an interrupt is not a failure
            const bool interrupted_retry = etag.error().is_transient() && control.interrupted();
            if (!interrupted_retry && !state.fatal) {
                state.fatal = etag.error();
            }
            return;
        }

        record_part(state, job, part, etag.value());
        throttle(state, control);
    }
}

// ──────────────────────────────────────────────────────────
// Session handling
// ──────────────────────────────────────────────────────────

Result<UploadWorker::Session> UploadWorker::open_session(const UploadJob& job,
                                                         const storage::Credentials& creds,
                                                         const PartPlan& plan,
                                                         JobControl& control) {
    if (!job.upload_id.empty()) {
        if (config_.enable_resume) {
            auto listed = objects_.list_parts(creds, job.object_key, job.upload_id, request_options());
            if (listed.is_ok()) {
                Session session;
                session.upload_id = job.upload_id;
                for (const auto& stored : listed.value()) {
                    // Keep only parts that match the re-derived plan byte for byte
                    const bool in_plan = stored.part_number >= 1 && stored.part_number <= plan.parts.size() &&
                                         plan.parts[stored.part_number - 1].length == stored.size;
                    if (in_plan) {
                        session.completed[stored.part_number] = stored;
                    }
                }
                spdlog::info("[UploadWorker] Resuming {}: {}/{} parts already stored",
                             job.file_name, session.completed.size(), plan.parts.size());
                return Ok(std::move(session));
            }
            spdlog::warn("[UploadWorker] Cannot list stored parts of {} ({}), restarting from zero",
                         job.file_name, listed.error().message);
        }
        release_session(job, creds, job.upload_id);
    }

    auto upload_id = create_session(job, creds, control);
    if (upload_id.is_error()) {
        return Err<Session>(upload_id.error());
    }

    Session session;
    session.upload_id = upload_id.value();
    return Ok(std::move(session));
}

Result<std::string> UploadWorker::create_session(const UploadJob& job,
                                                 const storage::Credentials& creds,
                                                 JobControl& control) {
    for (;;) {
        auto created = objects_.create_multipart_upload(creds, job.object_key, request_options());
        if (created.is_ok() || !created.error().is_transient()) {
            return created;
        }

        const auto attempt = consume_retry(job.id, created.error().message);
        if (!attempt) {
            return created;
        }
        spdlog::warn("[UploadWorker] Opening session for {} failed ({}), retry {}/{}",
                     job.file_name, created.error().message, *attempt, config_.retry_attempts);
        if (control.wait_for(backoff_delay(config_.retry_base_delay, *attempt))) {
            return created;
        }
    }
}

Result<std::string> UploadWorker::upload_part_with_retry(const UploadJob& job,
                                                         const storage::Credentials& creds,
                                                         const std::string& upload_id,
                                                         const PartRange& part,
                                                         JobControl& control) {
    for (;;) {
        auto data = storage::read_range(job.source_path, part.offset, part.length);
        if (data.is_error()) {
            return Err<std::string>(data.error());
        }

        auto etag = objects_.upload_part(creds, job.object_key, upload_id, part.number, data.value(),
                                         request_options());
        if (etag.is_ok() || !etag.error().is_transient()) {
            return etag;
        }

        const auto attempt = consume_retry(job.id, etag.error().message);
        if (!attempt) {
            spdlog::warn("[UploadWorker] {} part {} failed, retry budget spent: {}",
                         job.file_name, part.number, etag.error().message);
            return etag;
        }

        const auto delay = backoff_delay(config_.retry_base_delay, *attempt);
        spdlog::warn("[UploadWorker] {} part {} failed ({}), retry {}/{} in {}ms",
                     job.file_name, part.number, etag.error().message, *attempt, config_.retry_attempts,
                     delay.count());
        if (control.wait_for(delay)) {
            return etag;
        }
    }
}

Result<void> UploadWorker::complete_with_retry(const UploadJob& job,
                                               const storage::Credentials& creds,
                                               const std::string& upload_id,
                                               const std::map<std::uint32_t, storage::CompletedPart>& parts,
                                               JobControl& control) {
    std::vector<storage::CompletedPart> ordered;
    ordered.reserve(parts.size());
    for (const auto& [number, part] : parts) {
        ordered.push_back(part);
    }

    for (;;) {
        auto done = objects_.complete_multipart_upload(creds, job.object_key, upload_id, ordered, request_options());
        if (done.is_ok() || !done.error().is_transient()) {
            return done;
        }

        const auto attempt = consume_retry(job.id, done.error().message);
        if (!attempt) {
            return done;
        }
        spdlog::warn("[UploadWorker] Completing {} failed ({}), retry {}/{}",
                     job.file_name, done.error().message, *attempt, config_.retry_attempts);
        if (control.wait_for(backoff_delay(config_.retry_base_delay, *attempt))) {
            return done;
        }
    }
}

std::optional<std::uint32_t> UploadWorker::consume_retry(const std::string& job_id, const std::string& message) {
    bool exhausted = false;
    std::uint32_t count = 0;

    auto res = store_.modify_upload(job_id, [&](UploadJob& record) -> Result<void> {
        record.last_error = message;
        if (record.retry_count >= config_.retry_attempts) {
            exhausted = true;
            return Ok();
        }
        count = ++record.retry_count;
        return Ok();
    });

    if (res.is_error()) {
        spdlog::error("[UploadWorker] Cannot charge retry to {}: {}", job_id, res.error().message);
        return std::nullopt;
    }
    if (exhausted) {
        return std::nullopt;
    }
    return count;
}

void UploadWorker::release_session(const UploadJob& job,
                                   const storage::Credentials& creds,
                                   const std::string& upload_id) {
    if (upload_id.empty()) {
        return;
    }

    auto aborted = objects_.abort_multipart_upload(creds, job.object_key, upload_id, request_options());
    if (aborted.is_error() && aborted.error().kind != ErrorKind::NotFound) {
        spdlog::warn("[UploadWorker] Failed to abort session {} of {}: {}",
                     upload_id, job.file_name, aborted.error().message);
    }
}

// ──────────────────────────────────────────────────────────
// Progress
// ──────────────────────────────────────────────────────────

void UploadWorker::record_part(RunState& state,
                               const UploadJob& job,
                               const PartRange& part,
                               const std::string& etag) {
    // Held across the store update and the publish so ticks leave in order
    std::lock_guard lock(state.mutex);

    state.completed[part.number] = storage::CompletedPart{part.number, part.length, etag};
    state.run_bytes += part.length;

    const auto uploaded = std::min(confirmed_bytes(state.completed), job.file_size);
    const auto elapsed = state.elapsed_seconds();
    const double speed = elapsed > 0.0 ? static_cast<double>(state.run_bytes) / elapsed : 0.0;

    std::optional<std::uint64_t> eta;
    if (speed > 0.0) {
        eta = static_cast<std::uint64_t>(static_cast<double>(job.file_size - uploaded) / speed);
    }

    std::uint64_t reported = uploaded;
    auto updated = store_.modify_upload(job.id, [&](UploadJob& record) -> Result<void> {
        record.uploaded_bytes = std::max(record.uploaded_bytes, uploaded);
        record.speed_bps = speed;
        record.eta_seconds = eta;
        reported = record.uploaded_bytes;
        return Ok();
    });
    if (updated.is_error()) {
        spdlog::error("[UploadWorker] Progress for {} not recorded: {}", job.id, updated.error().message);
    }

    events::UploadProgress progress;
    progress.job_id = job.id;
    progress.uploaded_bytes = reported;
    progress.total_bytes = job.file_size;
    progress.percentage = percentage_of(reported, job.file_size);
    progress.speed_bps = speed;
    progress.eta_seconds = eta;
    progress.status = UploadStatus::InProgress;
    hub_.publish(progress);
}

void UploadWorker::throttle(RunState& state, JobControl& control) {
    if (!config_.bandwidth_limit_bps) {
        return;
    }

    double sent = 0.0;
    double elapsed = 0.0;
    {
        std::lock_guard lock(state.mutex);
        sent = static_cast<double>(state.run_bytes);
        elapsed = state.elapsed_seconds();
    }

    const double target = sent / *config_.bandwidth_limit_bps;
    if (target > elapsed) {
        control.wait_for(std::chrono::milliseconds(static_cast<std::int64_t>((target - elapsed) * 1000.0)));
    }
}

// ──────────────────────────────────────────────────────────
// Outcomes
// ──────────────────────────────────────────────────────────

UploadStatus UploadWorker::finish_failed(const UploadJob& job,
                                         const std::string& message,
                                         const std::optional<storage::Credentials>& creds,
                                         const std::string& upload_id) {
    std::string kept = upload_id;
    if (!config_.enable_resume && creds) {
        release_session(job, *creds, upload_id);
        kept.clear();
    }

    auto res = store_.transition_upload(job.id, UploadStatus::Failed, [&](UploadJob& record) -> Result<void> {
        record.last_error = message;
        record.speed_bps = 0.0;
        record.eta_seconds.reset();
        record.upload_id = kept;
        return Ok();
    });

    spdlog::error("[UploadWorker] {} failed: {}", job.file_name, message);
    hub_.publish(events::Notification(job.id, events::NotificationKind::Upload, "failed", message));
    return status_after(res, store_, job.id);
}

UploadStatus UploadWorker::finish_cancelled(const UploadJob& job,
                                            const storage::Credentials& creds,
                                            const std::string& upload_id) {
    release_session(job, creds, upload_id);

    auto res = store_.transition_upload(job.id, UploadStatus::Cancelled, [](UploadJob& record) -> Result<void> {
        record.speed_bps = 0.0;
        record.eta_seconds.reset();
        record.upload_id.clear();
        return Ok();
    });

    spdlog::info("[UploadWorker] {} cancelled", job.file_name);
    hub_.publish(events::Notification(job.id, events::NotificationKind::Upload, "cancelled", "Cancelled by user"));
    return status_after(res, store_, job.id);
}

UploadStatus UploadWorker::finish_interrupted(const UploadJob& job,
                                              Interrupt kind,
                                              const storage::Credentials& creds,
                                              const std::string& upload_id) {
    std::string kept = upload_id;
    if (!config_.enable_resume) {
        release_session(job, creds, upload_id);
        kept.clear();
    }

    auto res = store_.transition_upload(job.id, UploadStatus::Paused, [&](UploadJob& record) -> Result<void> {
        record.speed_bps = 0.0;
        record.eta_seconds.reset();
        record.upload_id = kept;
        return Ok();
    });

    if (res.is_ok() && kind == Interrupt::Stop) {
        // Back to the queue with its original enqueue_seq
        res = store_.transition_upload(job.id, UploadStatus::Pending);
    }

    const auto status = status_after(res, store_, job.id);
    spdlog::info("[UploadWorker] {} interrupted, now {}", job.file_name, jobs::to_string(status));

    if (res.is_ok()) {
        events::UploadProgress progress;
        progress.job_id = job.id;
        progress.uploaded_bytes = res.value().uploaded_bytes;
        progress.total_bytes = job.file_size;
        progress.percentage = percentage_of(res.value().uploaded_bytes, job.file_size);
        progress.status = status;
        hub_.publish(progress);
    }
    return status;
}

UploadStatus UploadWorker::finish_completed(const UploadJob& job, RunState& state) {
    const auto elapsed = state.elapsed_seconds();
    const double speed = elapsed > 0.0 ? static_cast<double>(state.run_bytes) / elapsed : 0.0;

    auto res = store_.transition_upload(job.id, UploadStatus::Completed, [&](UploadJob& record) -> Result<void> {
        record.uploaded_bytes = record.file_size;
        record.speed_bps = speed;
        record.eta_seconds = 0;
        record.completed_at = jobs::Clock::now();
        record.upload_id.clear();
        return Ok();
    });

    spdlog::info("[UploadWorker] {} completed: {} bytes in {:.2f}s", job.file_name, job.file_size, elapsed);

    events::UploadProgress progress;
    progress.job_id = job.id;
    progress.uploaded_bytes = job.file_size;
    progress.total_bytes = job.file_size;
    progress.percentage = 100.0;
    progress.speed_bps = speed;
    progress.eta_seconds = 0;
    progress.status = UploadStatus::Completed;
    hub_.publish(progress);
    hub_.publish(events::Notification(job.id, events::NotificationKind::Upload, "completed", job.object_key));

    return status_after(res, store_, job.id);
}

} // namespace rv::upload
