#include "rv/jobs/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace rv::jobs {
namespace {

using json = nlohmann::json;

Result<void> apply_upload_section(const json& section, UploadConfig& config) {
    if (section.contains("tier")) {
        auto tier = parse_upload_tier(section.at("tier").get<std::string>());
        if (tier.is_error()) {
            return Err<void>(tier.error());
        }
        // Tier presets first, explicit fields below override them
        config = UploadConfig::for_tier(tier.value());
    }

    config.max_concurrent_uploads = section.value("max_concurrent_uploads", config.max_concurrent_uploads);
    config.max_concurrent_parts = section.value("max_concurrent_parts", config.max_concurrent_parts);
    config.chunk_size = section.value("chunk_size_mb", config.chunk_size / kMiB) * kMiB;
    config.min_chunk_size = section.value("min_chunk_size_mb", config.min_chunk_size / kMiB) * kMiB;
    config.max_chunk_size = section.value("max_chunk_size_mb", config.max_chunk_size / kMiB) * kMiB;
    config.adaptive_chunk_size = section.value("adaptive_chunk_size", config.adaptive_chunk_size);
    config.retry_attempts = section.value("retry_attempts", config.retry_attempts);
    config.retry_base_delay = std::chrono::milliseconds(
        section.value("retry_base_delay_ms", static_cast<std::int64_t>(config.retry_base_delay.count())));
    config.timeout = std::chrono::seconds(
        section.value("timeout_seconds",
                      std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count()));
    config.enable_resume = section.value("enable_resume", config.enable_resume);

    if (section.contains("bandwidth_limit_mbps") && !section.at("bandwidth_limit_mbps").is_null()) {
        config.bandwidth_limit_bps = section.at("bandwidth_limit_mbps").get<double>() * static_cast<double>(kMiB);
    }
    return Ok();
}

Result<void> apply_restore_section(const json& section, RestoreConfig& config) {
    if (section.contains("default_tier")) {
        auto tier = parse_restore_tier(section.at("default_tier").get<std::string>());
        if (tier.is_error()) {
            return Err<void>(tier.error());
        }
        config.default_tier = tier.value();
    }

    config.poll_interval = std::chrono::seconds(
        section.value("poll_interval_seconds",
                      std::chrono::duration_cast<std::chrono::seconds>(config.poll_interval).count()));
    config.timeout = std::chrono::seconds(
        section.value("timeout_seconds",
                      std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count()));
    config.restore_days = section.value("restore_days", config.restore_days);
    config.download_workers = section.value("download_workers", config.download_workers);
    config.download_retry_attempts = section.value("download_retry_attempts", config.download_retry_attempts);

    if (config.poll_interval.count() <= 0) {
        return Err<void>(Error::invalid_argument("restore.poll_interval_seconds must be > 0"));
    }
    if (config.restore_days <= 0) {
        return Err<void>(Error::invalid_argument("restore.restore_days must be > 0"));
    }
    if (config.download_workers == 0) {
        return Err<void>(Error::invalid_argument("restore.download_workers must be > 0"));
    }
    return Ok();
}

} // namespace

const char* to_string(UploadTier tier) noexcept {
    switch (tier) {
        case UploadTier::Free: return "Free";
        case UploadTier::Premium: return "Premium";
    }
    return "unknown";
}

Result<UploadTier> parse_upload_tier(const std::string& text) {
    if (text == "Free") {
        return Ok(UploadTier::Free);
    }
    if (text == "Premium") {
        return Ok(UploadTier::Premium);
    }
    return Err<UploadTier>(Error::invalid_argument("Unknown upload tier: " + text));
}

UploadConfig UploadConfig::for_tier(UploadTier tier) {
    UploadConfig config;
    config.tier = tier;

    if (tier == UploadTier::Premium) {
        config.max_concurrent_uploads = 8;
        config.max_concurrent_parts = 8;
        config.chunk_size = 10 * kMiB;
        config.min_chunk_size = 5 * kMiB;
        config.max_chunk_size = 100 * kMiB;
        config.adaptive_chunk_size = true;
        config.retry_attempts = 10;
        config.timeout = std::chrono::seconds(1800);
        config.enable_resume = true;
    }
    return config;
}

Result<void> UploadConfig::validate() const {
    if (max_concurrent_uploads == 0) {
        return Err<void>(Error::invalid_argument("max_concurrent_uploads must be > 0"));
    }
    if (max_concurrent_parts == 0) {
        return Err<void>(Error::invalid_argument("max_concurrent_parts must be > 0"));
    }
    if (min_chunk_size == 0 || chunk_size == 0) {
        return Err<void>(Error::invalid_argument("chunk sizes must be > 0"));
    }
    if (min_chunk_size > max_chunk_size) {
        return Err<void>(Error::invalid_argument("min_chunk_size exceeds max_chunk_size"));
    }
    if (chunk_size < min_chunk_size || chunk_size > max_chunk_size) {
        return Err<void>(Error::invalid_argument("chunk_size must lie within [min_chunk_size, max_chunk_size]"));
    }
    if (timeout.count() <= 0) {
        return Err<void>(Error::invalid_argument("timeout must be > 0"));
    }
    if (bandwidth_limit_bps && *bandwidth_limit_bps <= 0.0) {
        return Err<void>(Error::invalid_argument("bandwidth limit must be > 0 when set"));
    }

    if (tier == UploadTier::Free) {
        if (max_concurrent_uploads > 1) {
            return Err<void>(Error::invalid_argument("Free tier allows one concurrent upload"));
        }
        if (max_concurrent_parts > 1) {
            return Err<void>(Error::invalid_argument("Free tier does not allow parallel parts"));
        }
        if (adaptive_chunk_size) {
            return Err<void>(Error::invalid_argument("Free tier does not allow adaptive chunk size"));
        }
        if (chunk_size != 5 * kMiB || min_chunk_size != 5 * kMiB || max_chunk_size != 5 * kMiB) {
            return Err<void>(Error::invalid_argument("Free tier chunk size is fixed at 5MB"));
        }
    }
    return Ok();
}

Result<AppConfig> parse_app_config(const json& document) {
    if (!document.is_object()) {
        return Err<AppConfig>(Error::invalid_argument("Config root must be a JSON object"));
    }

    AppConfig config;
    try {
        config.bucket = document.value("bucket", "");

        if (document.contains("state_file") && !document.at("state_file").is_null()) {
            config.state_file = std::filesystem::path(document.at("state_file").get<std::string>());
        }

        if (document.contains("logging")) {
            const auto& logging = document.at("logging");
            config.logging.level = logging.value("level", config.logging.level);
            config.logging.pattern = logging.value("pattern", config.logging.pattern);
        }

        if (document.contains("upload")) {
            if (auto res = apply_upload_section(document.at("upload"), config.upload); res.is_error()) {
                return Err<AppConfig>(res.error());
            }
        }

        if (document.contains("restore")) {
            if (auto res = apply_restore_section(document.at("restore"), config.restore); res.is_error()) {
                return Err<AppConfig>(res.error());
            }
        }
    } catch (const json::exception& e) {
        return Err<AppConfig>(Error::invalid_argument(std::string("Malformed config: ") + e.what()));
    }

    if (auto valid = config.upload.validate(); valid.is_error()) {
        return Err<AppConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<AppConfig> load_app_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<AppConfig>(Error::not_found("Failed to open config file: " + path.string()));
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<AppConfig>(Error::invalid_argument("Invalid JSON in config file: " + path.string()));
    }

    spdlog::debug("Loaded config from {}", path.string());
    return parse_app_config(document);
}

json to_json(const UploadConfig& config) {
    json j;
    j["tier"] = to_string(config.tier);
    j["max_concurrent_uploads"] = config.max_concurrent_uploads;
    j["max_concurrent_parts"] = config.max_concurrent_parts;
    j["chunk_size_mb"] = config.chunk_size / kMiB;
    j["min_chunk_size_mb"] = config.min_chunk_size / kMiB;
    j["max_chunk_size_mb"] = config.max_chunk_size / kMiB;
    j["adaptive_chunk_size"] = config.adaptive_chunk_size;
    j["retry_attempts"] = config.retry_attempts;
    j["retry_base_delay_ms"] = config.retry_base_delay.count();
    j["timeout_seconds"] = std::chrono::duration_cast<std::chrono::seconds>(config.timeout).count();
    j["enable_resume"] = config.enable_resume;
    if (config.bandwidth_limit_bps) {
        j["bandwidth_limit_mbps"] = *config.bandwidth_limit_bps / static_cast<double>(kMiB);
    } else {
        j["bandwidth_limit_mbps"] = nullptr;
    }
    return j;
}

} // namespace rv::jobs
