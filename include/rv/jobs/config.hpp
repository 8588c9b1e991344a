#pragma once

#include "rv/core/logging.hpp"
#include "rv/core/result.hpp"
#include "rv/jobs/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rv::jobs {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;

enum class UploadTier {
    Free,
    Premium
};

const char* to_string(UploadTier tier) noexcept;
Result<UploadTier> parse_upload_tier(const std::string& text);

/**
 * @brief Upload queue settings, applied when the queue is initialized
 *
 * for_tier() gives the preset values; a JSON document may override any field.
 */
struct UploadConfig {
    UploadTier tier = UploadTier::Free;
    std::size_t max_concurrent_uploads = 1;
    std::size_t max_concurrent_parts = 1;
    std::uint64_t chunk_size = 5 * kMiB;
    std::uint64_t min_chunk_size = 5 * kMiB;
    std::uint64_t max_chunk_size = 5 * kMiB;
    bool adaptive_chunk_size = false;
    std::uint32_t retry_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds timeout{std::chrono::seconds(600)};
    std::optional<double> bandwidth_limit_bps;
    bool enable_resume = false;

    static UploadConfig for_tier(UploadTier tier);

    /// Consistency checks, plus the preset limits when tier == Free.
    Result<void> validate() const;
};

struct RestoreConfig {
    RestoreTier default_tier = RestoreTier::Standard;
    std::chrono::milliseconds poll_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    int restore_days = 7;
    std::size_t download_workers = 2;
    std::uint32_t download_retry_attempts = 3;
};

struct AppConfig {
    std::string bucket;
    UploadConfig upload = UploadConfig::for_tier(UploadTier::Free);
    RestoreConfig restore;
    LoggingConfig logging;
    std::optional<std::filesystem::path> state_file;
};

Result<AppConfig> parse_app_config(const nlohmann::json& document);
Result<AppConfig> load_app_config(const std::filesystem::path& path);

nlohmann::json to_json(const UploadConfig& config);

} // namespace rv::jobs
