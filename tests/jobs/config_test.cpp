#include "rv/jobs/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace rv::jobs;
using json = nlohmann::json;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() /
                   ("rv_config_test_" + std::string(info->name()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST(UploadConfigTest, FreePreset) {
    auto cfg = UploadConfig::for_tier(UploadTier::Free);
    EXPECT_EQ(cfg.max_concurrent_uploads, 1u);
    EXPECT_EQ(cfg.max_concurrent_parts, 1u);
    EXPECT_EQ(cfg.chunk_size, 5 * kMiB);
    EXPECT_FALSE(cfg.adaptive_chunk_size);
    EXPECT_EQ(cfg.retry_attempts, 3u);
    EXPECT_EQ(cfg.timeout, std::chrono::seconds(600));
    EXPECT_FALSE(cfg.bandwidth_limit_bps.has_value());
    EXPECT_FALSE(cfg.enable_resume);
    EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(UploadConfigTest, PremiumPreset) {
    auto cfg = UploadConfig::for_tier(UploadTier::Premium);
    EXPECT_EQ(cfg.max_concurrent_uploads, 8u);
    EXPECT_EQ(cfg.max_concurrent_parts, 8u);
    EXPECT_EQ(cfg.chunk_size, 10 * kMiB);
    EXPECT_EQ(cfg.min_chunk_size, 5 * kMiB);
    EXPECT_EQ(cfg.max_chunk_size, 100 * kMiB);
    EXPECT_TRUE(cfg.adaptive_chunk_size);
    EXPECT_EQ(cfg.retry_attempts, 10u);
    EXPECT_EQ(cfg.timeout, std::chrono::seconds(1800));
    EXPECT_TRUE(cfg.enable_resume);
    EXPECT_TRUE(cfg.validate().is_ok());
}

TEST(UploadConfigTest, FreeTierLimitsEnforced) {
    auto cfg = UploadConfig::for_tier(UploadTier::Free);
    cfg.max_concurrent_uploads = 2;
    EXPECT_TRUE(cfg.validate().is_error());

    cfg = UploadConfig::for_tier(UploadTier::Free);
    cfg.adaptive_chunk_size = true;
    EXPECT_TRUE(cfg.validate().is_error());
}

TEST(UploadConfigTest, RejectsInconsistentChunkBounds) {
    auto cfg = UploadConfig::for_tier(UploadTier::Premium);
    cfg.min_chunk_size = 200 * kMiB;
    auto res = cfg.validate();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, rv::ErrorKind::InvalidArgument);

    cfg = UploadConfig::for_tier(UploadTier::Premium);
    cfg.max_concurrent_parts = 0;
    EXPECT_TRUE(cfg.validate().is_error());
}

TEST(AppConfigTest, ParsesFullDocument) {
    json doc = {
        {"bucket", "media-archive"},
        {"state_file", "/var/lib/reelvault/state.json"},
        {"logging", {{"level", "debug"}}},
        {"upload", {{"tier", "Premium"}, {"max_concurrent_uploads", 4}, {"bandwidth_limit_mbps", 10.0}}},
        {"restore", {{"default_tier", "Bulk"}, {"poll_interval_seconds", 5}, {"restore_days", 3}}},
    };

    auto res = parse_app_config(doc);
    ASSERT_TRUE(res.is_ok()) << res.error().message;
    const auto& cfg = res.value();
    EXPECT_EQ(cfg.bucket, "media-archive");
    ASSERT_TRUE(cfg.state_file.has_value());
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.upload.tier, UploadTier::Premium);
    EXPECT_EQ(cfg.upload.max_concurrent_uploads, 4u);
    EXPECT_EQ(cfg.upload.max_concurrent_parts, 8u);
    ASSERT_TRUE(cfg.upload.bandwidth_limit_bps.has_value());
    EXPECT_DOUBLE_EQ(*cfg.upload.bandwidth_limit_bps, 10.0 * kMiB);
    EXPECT_EQ(cfg.restore.default_tier, RestoreTier::Bulk);
    EXPECT_EQ(cfg.restore.poll_interval, std::chrono::seconds(5));
    EXPECT_EQ(cfg.restore.restore_days, 3);
}

TEST(AppConfigTest, EmptyDocumentUsesDefaults) {
    auto res = parse_app_config(json::object());
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.value().upload.tier, UploadTier::Free);
    EXPECT_EQ(res.value().restore.default_tier, RestoreTier::Standard);
    EXPECT_FALSE(res.value().state_file.has_value());
}

TEST(AppConfigTest, RejectsBadValues) {
    EXPECT_TRUE(parse_app_config(json::array()).is_error());
    EXPECT_TRUE(parse_app_config(json{{"upload", {{"tier", "Gold"}}}}).is_error());
    EXPECT_TRUE(parse_app_config(json{{"restore", {{"default_tier", "fast"}}}}).is_error());
    EXPECT_TRUE(parse_app_config(json{{"restore", {{"restore_days", 0}}}}).is_error());
    EXPECT_TRUE(parse_app_config(json{{"upload", {{"max_concurrent_uploads", "many"}}}}).is_error());
    // Free tier cannot be widened by overrides
    EXPECT_TRUE(parse_app_config(json{{"upload", {{"max_concurrent_parts", 4}}}}).is_error());
}

TEST(AppConfigTest, LoadFromFile) {
    const auto dir = create_temp_dir();
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"bucket": "b", "upload": {"tier": "Premium", "enable_resume": false}})";
    }

    auto res = load_app_config(path);
    ASSERT_TRUE(res.is_ok()) << res.error().message;
    EXPECT_FALSE(res.value().upload.enable_resume);

    auto missing = load_app_config(dir / "nope.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, rv::ErrorKind::NotFound);

    {
        std::ofstream out(dir / "broken.json");
        out << "{not json";
    }
    auto broken = load_app_config(dir / "broken.json");
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error().kind, rv::ErrorKind::InvalidArgument);
}

TEST(AppConfigTest, UploadConfigSerializesBack) {
    auto cfg = UploadConfig::for_tier(UploadTier::Premium);
    auto j = to_json(cfg);
    EXPECT_EQ(j["tier"], "Premium");
    EXPECT_EQ(j["chunk_size_mb"], 10);
    EXPECT_TRUE(j["bandwidth_limit_mbps"].is_null());

    auto reparsed = parse_app_config(json{{"upload", j}});
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(reparsed.value().upload.max_chunk_size, cfg.max_chunk_size);
}
