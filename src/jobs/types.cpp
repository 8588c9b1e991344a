#include "rv/jobs/types.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace rv::jobs {
namespace {

bool upload_edge_allowed(UploadStatus current, UploadStatus target) {
    static const std::unordered_map<UploadStatus, std::vector<UploadStatus>> transitions {
        {UploadStatus::Pending, {UploadStatus::InProgress, UploadStatus::Paused, UploadStatus::Cancelled}},
        {UploadStatus::InProgress, {UploadStatus::Completed, UploadStatus::Failed,
                                    UploadStatus::Paused, UploadStatus::Cancelled}},
        {UploadStatus::Paused, {UploadStatus::Pending, UploadStatus::Cancelled}},
        {UploadStatus::Failed, {UploadStatus::Pending, UploadStatus::Cancelled}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Pending: return "pending";
        case UploadStatus::InProgress: return "in-progress";
        case UploadStatus::Paused: return "paused";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(RestoreStatus status) noexcept {
    switch (status) {
        case RestoreStatus::InProgress: return "in-progress";
        case RestoreStatus::Completed: return "completed";
        case RestoreStatus::Failed: return "failed";
        case RestoreStatus::Cancelled: return "cancelled";
        case RestoreStatus::NotFound: return "not-found";
    }
    return "unknown";
}

const char* to_string(RestoreTier tier) noexcept {
    switch (tier) {
        case RestoreTier::Expedited: return "Expedited";
        case RestoreTier::Standard: return "Standard";
        case RestoreTier::Bulk: return "Bulk";
    }
    return "unknown";
}

const char* to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::InProgress: return "in-progress";
        case DownloadStatus::Completed: return "completed";
        case DownloadStatus::Failed: return "failed";
    }
    return "unknown";
}

Result<UploadStatus> parse_upload_status(const std::string& text) {
    for (auto status : {UploadStatus::Pending, UploadStatus::InProgress, UploadStatus::Paused,
                        UploadStatus::Completed, UploadStatus::Failed, UploadStatus::Cancelled}) {
        if (text == to_string(status)) {
            return Ok(status);
        }
    }
    return Err<UploadStatus>(Error::invalid_argument("Unknown upload status: " + text));
}

Result<RestoreStatus> parse_restore_status(const std::string& text) {
    for (auto status : {RestoreStatus::InProgress, RestoreStatus::Completed, RestoreStatus::Failed,
                        RestoreStatus::Cancelled, RestoreStatus::NotFound}) {
        if (text == to_string(status)) {
            return Ok(status);
        }
    }
    return Err<RestoreStatus>(Error::invalid_argument("Unknown restore status: " + text));
}

Result<RestoreTier> parse_restore_tier(const std::string& text) {
    for (auto tier : {RestoreTier::Expedited, RestoreTier::Standard, RestoreTier::Bulk}) {
        if (text == to_string(tier)) {
            return Ok(tier);
        }
    }
    return Err<RestoreTier>(Error::invalid_argument(
        "Invalid restore tier: " + text + ". Must be Standard, Expedited, or Bulk"));
}

bool is_terminal(UploadStatus status) noexcept {
    return status == UploadStatus::Completed || status == UploadStatus::Cancelled;
}

bool is_terminal(RestoreStatus status) noexcept {
    return status != RestoreStatus::InProgress;
}

bool can_transition(UploadStatus current, UploadStatus target) noexcept {
    if (current == target) {
        return false;
    }
    return upload_edge_allowed(current, target);
}

bool can_transition(RestoreStatus current, RestoreStatus target) noexcept {
    return current == RestoreStatus::InProgress &&
           (target == RestoreStatus::Completed ||
            target == RestoreStatus::Failed ||
            target == RestoreStatus::Cancelled);
}

RestoreTierInfo restore_tier_info(RestoreTier tier) {
    switch (tier) {
        case RestoreTier::Expedited: return {"Expedited", "1-5 minutes", "high"};
        case RestoreTier::Standard: return {"Standard", "3-5 hours", "medium"};
        case RestoreTier::Bulk: return {"Bulk", "5-12 hours", "low"};
    }
    return {"Unknown", "unknown", "unknown"};
}

} // namespace rv::jobs
