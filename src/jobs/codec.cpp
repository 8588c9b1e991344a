#include "rv/jobs/codec.hpp"

#include <stdexcept>

namespace rv::jobs {
namespace {

using json = nlohmann::json;

json optional_time(const std::optional<TimePoint>& tp) {
    return tp ? json(to_epoch_ms(*tp)) : json(nullptr);
}

std::optional<TimePoint> read_optional_time(const json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return std::nullopt;
    }
    return from_epoch_ms(j.at(field).get<std::int64_t>());
}

std::optional<std::string> read_optional_string(const json& j, const char* field) {
    if (!j.contains(field) || j.at(field).is_null()) {
        return std::nullopt;
    }
    return j.at(field).get<std::string>();
}

template<typename T>
T unwrap(Result<T> result) {
    if (result.is_error()) {
        throw std::invalid_argument(result.error().message);
    }
    return result.value();
}

} // namespace

std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

void to_json(json& j, const UploadJob& job) {
    j = json{
        {"id", job.id},
        {"source_path", job.source_path},
        {"file_name", job.file_name},
        {"file_size", job.file_size},
        {"object_key", job.object_key},
        {"submitted_at", to_epoch_ms(job.submitted_at)},
        {"status", to_string(job.status)},
        {"uploaded_bytes", job.uploaded_bytes},
        {"speed_bps", job.speed_bps},
        {"eta_seconds", job.eta_seconds ? json(*job.eta_seconds) : json(nullptr)},
        {"retry_count", job.retry_count},
        {"last_error", job.last_error ? json(*job.last_error) : json(nullptr)},
        {"started_at", optional_time(job.started_at)},
        {"completed_at", optional_time(job.completed_at)},
        {"upload_id", job.upload_id},
        {"enqueue_seq", job.enqueue_seq},
    };
}

void from_json(const json& j, UploadJob& job) {
    job.id = j.at("id").get<std::string>();
    job.source_path = j.at("source_path").get<std::string>();
    job.file_name = j.value("file_name", "");
    job.file_size = j.at("file_size").get<std::uint64_t>();
    job.object_key = j.at("object_key").get<std::string>();
    job.submitted_at = from_epoch_ms(j.at("submitted_at").get<std::int64_t>());
    job.status = unwrap(parse_upload_status(j.at("status").get<std::string>()));
    job.uploaded_bytes = j.value("uploaded_bytes", std::uint64_t{0});
    job.speed_bps = j.value("speed_bps", 0.0);
    if (j.contains("eta_seconds") && !j.at("eta_seconds").is_null()) {
        job.eta_seconds = j.at("eta_seconds").get<std::uint64_t>();
    }
    job.retry_count = j.value("retry_count", std::uint32_t{0});
    job.last_error = read_optional_string(j, "last_error");
    job.started_at = read_optional_time(j, "started_at");
    job.completed_at = read_optional_time(j, "completed_at");
    job.upload_id = j.value("upload_id", "");
    job.enqueue_seq = j.value("enqueue_seq", std::uint64_t{0});
}

void to_json(json& j, const RestoreJob& job) {
    j = json{
        {"job_id", job.job_id},
        {"key", job.key},
        {"tier", to_string(job.tier)},
        {"status", to_string(job.status)},
        {"requested_at", to_epoch_ms(job.requested_at)},
        {"completed_at", optional_time(job.completed_at)},
        {"expires_at", optional_time(job.expires_at)},
        {"last_error", job.last_error ? json(*job.last_error) : json(nullptr)},
    };
}

void from_json(const json& j, RestoreJob& job) {
    job.job_id = j.at("job_id").get<std::string>();
    job.key = j.at("key").get<std::string>();
    job.tier = unwrap(parse_restore_tier(j.at("tier").get<std::string>()));
    job.status = unwrap(parse_restore_status(j.at("status").get<std::string>()));
    job.requested_at = from_epoch_ms(j.at("requested_at").get<std::int64_t>());
    job.completed_at = read_optional_time(j, "completed_at");
    job.expires_at = read_optional_time(j, "expires_at");
    job.last_error = read_optional_string(j, "last_error");
}

void to_json(json& j, const UploadStatistics& stats) {
    j = json{
        {"total_files", stats.total_files},
        {"pending_files", stats.pending_files},
        {"in_progress_files", stats.in_progress_files},
        {"paused_files", stats.paused_files},
        {"completed_files", stats.completed_files},
        {"failed_files", stats.failed_files},
        {"cancelled_files", stats.cancelled_files},
        {"total_bytes", stats.total_bytes},
        {"uploaded_bytes", stats.uploaded_bytes},
        {"average_speed_bps", stats.average_speed_bps},
        {"eta_seconds", stats.eta_seconds ? json(*stats.eta_seconds) : json(nullptr)},
    };
}

void to_json(json& j, const DownloadProgress& progress) {
    j = json{
        {"key", progress.key},
        {"local_path", progress.local_path},
        {"downloaded_bytes", progress.downloaded_bytes},
        {"total_bytes", progress.total_bytes},
        {"percentage", progress.percentage},
        {"status", to_string(progress.status)},
        {"error", progress.error},
    };
}

} // namespace rv::jobs
