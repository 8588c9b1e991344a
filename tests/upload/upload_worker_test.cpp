#include "rv/upload/upload_worker.hpp"
#include "rv/events/events.hpp"
#include "rv/storage/memory_object_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace rv::upload;
using rv::events::Notification;
using rv::events::NotificationHub;
using rv::events::UploadProgress;
using rv::jobs::JobStore;
using rv::jobs::kMiB;
using rv::jobs::UploadConfig;
using rv::jobs::UploadJob;
using rv::jobs::UploadStatus;
using rv::jobs::UploadTier;
using rv::storage::Credentials;
using rv::storage::MemoryObjectStore;
using rv::storage::StaticCredentialProvider;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    fs::path dir = fs::temp_directory_path() /
                   ("rv_upload_worker_test_" + std::string(info->name()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<char> pattern(std::uint64_t size, int seed) {
    std::vector<char> data(static_cast<std::size_t>(size));
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>((i * 31 + static_cast<std::size_t>(seed)) % 251);
    }
    return data;
}

fs::path write_file(const fs::path& dir, const std::string& name, const std::vector<char>& data) {
    const auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

UploadConfig small_chunks() {
    auto cfg = UploadConfig::for_tier(UploadTier::Free);
    cfg.chunk_size = kMiB;
    cfg.min_chunk_size = kMiB;
    cfg.max_chunk_size = kMiB;
    cfg.retry_base_delay = std::chrono::milliseconds(1);
    return cfg;
}

const Credentials kCreds{"key", "secret", std::nullopt, "us-east-1"};

class WorkerHarness {
public:
    WorkerHarness() : credentials(kCreds) {
        hub.subscribe<UploadProgress>([this](const UploadProgress& p) {
            std::lock_guard lock(mutex);
            progress.push_back(p);
        });
        hub.subscribe<Notification>([this](const Notification& n) {
            std::lock_guard lock(mutex);
            notifications.push_back(n);
        });
    }

    UploadJob claim(const fs::path& path, const std::string& key, const std::string& upload_id = "") {
        UploadJob job;
        job.id = "job-" + path.filename().string();
        job.source_path = path.string();
        job.file_name = path.filename().string();
        job.file_size = fs::file_size(path);
        job.object_key = key;
        job.submitted_at = rv::jobs::Clock::now();
        job.upload_id = upload_id;
        EXPECT_TRUE(store.add_upload(job).is_ok());
        auto claimed = store.claim_next_pending();
        EXPECT_TRUE(claimed.has_value());
        return *claimed;
    }

    UploadStatus run(const UploadJob& job, const UploadConfig& cfg, JobControl& control) {
        UploadWorker worker(store, objects, credentials, hub, cfg);
        auto status = worker.run(job, control);
        hub.flush();
        return status;
    }

    UploadStatus run(const UploadJob& job, const UploadConfig& cfg) {
        JobControl control;
        return run(job, cfg, control);
    }

    std::size_t count_notifications(const std::string& status) {
        std::lock_guard lock(mutex);
        std::size_t n = 0;
        for (const auto& note : notifications) {
            n += note.status == status ? 1 : 0;
        }
        return n;
    }

    // Declared before the hub so they outlive its dispatcher
    std::mutex mutex;
    std::vector<UploadProgress> progress;
    std::vector<Notification> notifications;

    JobStore store;
    MemoryObjectStore objects;
    StaticCredentialProvider credentials;
    NotificationHub hub;
};

void wait_for_part_calls(MemoryObjectStore& objects, const std::string& key, std::size_t calls) {
    for (int i = 0; i < 500 && objects.part_calls(key) < calls; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace

TEST(BackoffTest, DoublesUntilCap) {
    const std::chrono::milliseconds base(1000);
    EXPECT_EQ(backoff_delay(base, 1).count(), 1000);
    EXPECT_EQ(backoff_delay(base, 2).count(), 2000);
    EXPECT_EQ(backoff_delay(base, 3).count(), 4000);
    EXPECT_EQ(backoff_delay(base, 6).count(), 30000);
    EXPECT_EQ(backoff_delay(base, 40).count(), 30000);
}

TEST(JobControlTest, StrongerRequestWins) {
    JobControl control;
    EXPECT_FALSE(control.interrupted());

    control.request(Interrupt::Pause);
    control.request(Interrupt::Stop);
    EXPECT_EQ(control.requested(), Interrupt::Pause);

    control.request(Interrupt::Cancel);
    EXPECT_EQ(control.requested(), Interrupt::Cancel);
}

TEST(JobControlTest, WaitWakesOnRequest) {
    JobControl control;
    std::thread signaller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        control.request(Interrupt::Stop);
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(control.wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    signaller.join();

    EXPECT_FALSE(JobControl{}.wait_for(std::chrono::milliseconds(1)));
}

TEST(UploadWorkerTest, UploadsFileInOrderedParts) {
    const auto dir = create_temp_dir();
    const auto data = pattern(3 * kMiB + 123, 1);
    const auto path = write_file(dir, "clip.mov", data);

    WorkerHarness h;
    auto job = h.claim(path, "archive/clip.mov");
    EXPECT_EQ(h.run(job, small_chunks()), UploadStatus::Completed);

    auto stored = h.objects.object_data("archive/clip.mov");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, data);
    EXPECT_EQ(h.objects.part_calls("archive/clip.mov"), 4u);

    auto record = h.store.upload(job.id).value();
    EXPECT_EQ(record.uploaded_bytes, data.size());
    EXPECT_TRUE(record.upload_id.empty());
    EXPECT_TRUE(record.completed_at.has_value());

    ASSERT_EQ(h.count_notifications("completed"), 1u);
    EXPECT_EQ(h.notifications.back().message, "archive/clip.mov");
    ASSERT_FALSE(h.progress.empty());
    EXPECT_DOUBLE_EQ(h.progress.back().percentage, 100.0);
}

TEST(UploadWorkerTest, TwoHundredFiftyMegabytesInFiftyMegabyteParts) {
    const auto dir = create_temp_dir();
    const auto path = dir / "feature.mov";
    { std::ofstream create(path, std::ios::binary); }
    fs::resize_file(path, 262144000);

    auto cfg = UploadConfig::for_tier(UploadTier::Premium);
    cfg.adaptive_chunk_size = false;
    cfg.chunk_size = 50 * kMiB;
    cfg.max_chunk_size = 50 * kMiB;
    cfg.max_concurrent_parts = 2;

    WorkerHarness h;
    h.objects.set_retain_part_data(false);
    auto job = h.claim(path, "archive/feature.mov");

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);
    EXPECT_EQ(h.objects.part_calls("archive/feature.mov"), 5u);
    EXPECT_EQ(h.objects.object_size("archive/feature.mov"), std::optional<std::uint64_t>(262144000));
    EXPECT_EQ(h.store.upload(job.id).value().uploaded_bytes, 262144000u);
}

TEST(UploadWorkerTest, ZeroByteFileCompletes) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "empty.mov", {});

    WorkerHarness h;
    auto job = h.claim(path, "archive/empty.mov");

    EXPECT_EQ(h.run(job, small_chunks()), UploadStatus::Completed);
    EXPECT_TRUE(h.objects.has_object("archive/empty.mov"));
    EXPECT_EQ(h.objects.object_size("archive/empty.mov"), std::optional<std::uint64_t>(0));
}

TEST(UploadWorkerTest, TransientPartErrorsAreRetried) {
    const auto dir = create_temp_dir();
    const auto data = pattern(2 * kMiB, 2);
    const auto path = write_file(dir, "clip.mov", data);

    WorkerHarness h;
    std::atomic<int> failures{0};
    h.objects.set_part_fault([&](const std::string&, std::uint32_t part) -> std::optional<rv::Error> {
        if (part == 2 && failures.fetch_add(1) < 2) {
            return rv::Error::transient("SlowDown");
        }
        return std::nullopt;
    });

    auto job = h.claim(path, "archive/clip.mov");
    EXPECT_EQ(h.run(job, small_chunks()), UploadStatus::Completed);

    auto record = h.store.upload(job.id).value();
    EXPECT_EQ(record.retry_count, 2u);
    EXPECT_EQ(*h.objects.object_data("archive/clip.mov"), data);
}

TEST(UploadWorkerTest, ExhaustedRetriesFailOnce) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(kMiB, 3));

    WorkerHarness h;
    h.objects.set_part_fault([](const std::string&, std::uint32_t) -> std::optional<rv::Error> {
        return rv::Error::transient("ServiceUnavailable");
    });

    auto cfg = small_chunks();
    cfg.retry_attempts = 3;
    auto job = h.claim(path, "archive/clip.mov");

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Failed);
    EXPECT_EQ(h.objects.part_calls("archive/clip.mov"), 4u);
    EXPECT_EQ(h.count_notifications("failed"), 1u);
    EXPECT_EQ(h.objects.open_sessions(), 0u);

    auto record = h.store.upload(job.id).value();
    EXPECT_EQ(record.retry_count, 3u);
    EXPECT_EQ(record.last_error, std::optional<std::string>("ServiceUnavailable"));
}

TEST(UploadWorkerTest, PermanentErrorIsNotRetried) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(2 * kMiB, 4));

    WorkerHarness h;
    h.objects.set_part_fault([](const std::string&, std::uint32_t) -> std::optional<rv::Error> {
        return rv::Error::permanent("AccessDenied: bucket policy");
    });

    auto job = h.claim(path, "archive/clip.mov");
    EXPECT_EQ(h.run(job, small_chunks()), UploadStatus::Failed);
    EXPECT_EQ(h.objects.part_calls("archive/clip.mov"), 1u);
    EXPECT_EQ(h.store.upload(job.id).value().last_error,
              std::optional<std::string>("AccessDenied: bucket policy"));
}

TEST(UploadWorkerTest, MissingCredentialsFailWithProviderMessage) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(10, 5));

    WorkerHarness h;
    auto job = h.claim(path, "archive/clip.mov");

    StaticCredentialProvider none(Credentials{});
    UploadWorker worker(h.store, h.objects, none, h.hub, small_chunks());
    JobControl control;
    EXPECT_EQ(worker.run(job, control), UploadStatus::Failed);
    EXPECT_EQ(h.store.upload(job.id).value().last_error, std::optional<std::string>("No credentials configured"));
}

TEST(UploadWorkerTest, SourceChangedSinceSubmission) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(100, 6));

    WorkerHarness h;
    auto job = h.claim(path, "archive/clip.mov");
    write_file(dir, "clip.mov", pattern(50, 6));

    EXPECT_EQ(h.run(job, small_chunks()), UploadStatus::Failed);
    EXPECT_EQ(h.objects.part_calls("archive/clip.mov"), 0u);
}

TEST(UploadWorkerTest, ResumeSkipsStoredParts) {
    const auto dir = create_temp_dir();
    const auto data = pattern(3 * kMiB, 7);
    const auto path = write_file(dir, "clip.mov", data);

    WorkerHarness h;
    const std::string key = "archive/clip.mov";
    const rv::storage::RequestOptions options;
    const auto upload_id = h.objects.create_multipart_upload(kCreds, key, options).value();
    for (std::uint32_t part = 1; part <= 2; ++part) {
        std::vector<char> slice(data.begin() + (part - 1) * kMiB, data.begin() + part * kMiB);
        ASSERT_TRUE(h.objects.upload_part(kCreds, key, upload_id, part, slice, options).is_ok());
    }

    auto cfg = small_chunks();
    cfg.enable_resume = true;
    auto job = h.claim(path, key, upload_id);

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);
    EXPECT_EQ(h.objects.part_calls(key), 3u);
    EXPECT_EQ(*h.objects.object_data(key), data);
    EXPECT_EQ(h.objects.aborted_sessions(), 0u);
}

TEST(UploadWorkerTest, ResumeFallsBackToFreshSession) {
    const auto dir = create_temp_dir();
    const auto data = pattern(3 * kMiB, 8);
    const auto path = write_file(dir, "clip.mov", data);

    WorkerHarness h;
    const std::string key = "archive/clip.mov";
    const auto upload_id = h.objects.create_multipart_upload(kCreds, key, {}).value();
    ASSERT_TRUE(h.objects.upload_part(kCreds, key, upload_id, 1,
                                      std::vector<char>(data.begin(), data.begin() + kMiB), {}).is_ok());
    h.objects.set_list_parts_supported(false);

    auto cfg = small_chunks();
    cfg.enable_resume = true;
    auto job = h.claim(path, key, upload_id);

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);
    EXPECT_EQ(h.objects.aborted_sessions(), 1u);
    EXPECT_EQ(h.objects.part_calls(key), 4u);
    EXPECT_EQ(*h.objects.object_data(key), data);
}

TEST(UploadWorkerTest, CancelBeforeStart) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(kMiB, 9));

    WorkerHarness h;
    auto job = h.claim(path, "archive/clip.mov");
    JobControl control;
    control.request(Interrupt::Cancel);

    EXPECT_EQ(h.run(job, small_chunks(), control), UploadStatus::Cancelled);
    EXPECT_EQ(h.objects.part_calls("archive/clip.mov"), 0u);
    EXPECT_EQ(h.count_notifications("cancelled"), 1u);
}

TEST(UploadWorkerTest, CancelMidUploadAbortsSession) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(10 * kMiB, 10));

    WorkerHarness h;
    h.objects.set_part_latency(std::chrono::milliseconds(30));
    auto job = h.claim(path, "archive/clip.mov");

    JobControl control;
    std::thread canceller([&]() {
        wait_for_part_calls(h.objects, "archive/clip.mov", 2);
        control.request(Interrupt::Cancel);
    });
    const auto status = h.run(job, small_chunks(), control);
    canceller.join();

    EXPECT_EQ(status, UploadStatus::Cancelled);
    EXPECT_LT(h.objects.part_calls("archive/clip.mov"), 10u);
    EXPECT_EQ(h.objects.open_sessions(), 0u);
    EXPECT_FALSE(h.objects.has_object("archive/clip.mov"));
}

TEST(UploadWorkerTest, PauseKeepsResumableSession) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(10 * kMiB, 11));

    WorkerHarness h;
    h.objects.set_part_latency(std::chrono::milliseconds(30));
    auto cfg = small_chunks();
    cfg.enable_resume = true;
    auto job = h.claim(path, "archive/clip.mov");

    JobControl control;
    std::thread pauser([&]() {
        wait_for_part_calls(h.objects, "archive/clip.mov", 3);
        control.request(Interrupt::Pause);
    });
    const auto status = h.run(job, cfg, control);
    pauser.join();

    EXPECT_EQ(status, UploadStatus::Paused);
    auto record = h.store.upload(job.id).value();
    EXPECT_FALSE(record.upload_id.empty());
    EXPECT_GT(record.uploaded_bytes, 0u);
    EXPECT_LT(record.uploaded_bytes, record.file_size);
    EXPECT_EQ(h.objects.open_sessions(), 1u);
}

TEST(UploadWorkerTest, StopReturnsJobToPending) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(10 * kMiB, 12));

    WorkerHarness h;
    h.objects.set_part_latency(std::chrono::milliseconds(30));
    auto job = h.claim(path, "archive/clip.mov");
    const auto seq = job.enqueue_seq;

    JobControl control;
    std::thread stopper([&]() {
        wait_for_part_calls(h.objects, "archive/clip.mov", 2);
        control.request(Interrupt::Stop);
    });
    const auto status = h.run(job, small_chunks(), control);
    stopper.join();

    EXPECT_EQ(status, UploadStatus::Pending);
    auto record = h.store.upload(job.id).value();
    EXPECT_EQ(record.enqueue_seq, seq);
    EXPECT_TRUE(record.upload_id.empty());
    EXPECT_EQ(h.objects.open_sessions(), 0u);
}

TEST(UploadWorkerTest, PartConcurrencyCeiling) {
    const auto dir = create_temp_dir();
    const auto data = pattern(12 * kMiB, 13);
    const auto path = write_file(dir, "clip.mov", data);

    WorkerHarness h;
    h.objects.set_part_latency(std::chrono::milliseconds(30));
    auto cfg = small_chunks();
    cfg.max_concurrent_parts = 3;
    auto job = h.claim(path, "archive/clip.mov");

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);
    EXPECT_LE(h.objects.max_parallel_parts_per_upload(), 3u);
    EXPECT_GE(h.objects.max_parallel_parts_per_upload(), 2u);
    EXPECT_EQ(*h.objects.object_data("archive/clip.mov"), data);
}

TEST(UploadWorkerTest, ProgressNeverGoesBackwards) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(16 * kMiB, 14));

    WorkerHarness h;
    h.objects.set_part_latency(std::chrono::milliseconds(5));
    auto cfg = small_chunks();
    cfg.max_concurrent_parts = 4;
    auto job = h.claim(path, "archive/clip.mov");

    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);

    ASSERT_GE(h.progress.size(), 16u);
    for (std::size_t i = 1; i < h.progress.size(); ++i) {
        EXPECT_LE(h.progress[i - 1].uploaded_bytes, h.progress[i].uploaded_bytes);
        EXPECT_LE(h.progress[i - 1].percentage, h.progress[i].percentage);
    }
}

TEST(UploadWorkerTest, BandwidthLimitSlowsTransfer) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir, "clip.mov", pattern(4 * kMiB, 15));

    WorkerHarness h;
    auto cfg = small_chunks();
    cfg.bandwidth_limit_bps = 4.0 * kMiB;
    auto job = h.claim(path, "archive/clip.mov");

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(h.run(job, cfg), UploadStatus::Completed);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(750));
}
