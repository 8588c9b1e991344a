#pragma once

#include "rv/jobs/types.hpp"

#include <nlohmann/json.hpp>

namespace rv::jobs {

// nlohmann ADL hooks; timestamps are stored as milliseconds since epoch.
// from_json throws nlohmann::json::exception on malformed input and
// std::invalid_argument on unknown enum names.
void to_json(nlohmann::json& j, const UploadJob& job);
void from_json(const nlohmann::json& j, UploadJob& job);

void to_json(nlohmann::json& j, const RestoreJob& job);
void from_json(const nlohmann::json& j, RestoreJob& job);

void to_json(nlohmann::json& j, const UploadStatistics& stats);
void to_json(nlohmann::json& j, const DownloadProgress& progress);

std::int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(std::int64_t ms);

} // namespace rv::jobs
