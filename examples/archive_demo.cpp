/**
 * @file archive_demo.cpp
 * @brief End-to-end walk through archive and retrieval against the in-memory store
 *
 * WHAT IT SHOWS:
 * - Queue a handful of files and let the worker pool archive them
 * - Request a restore, let the poller observe it, download the copy
 * - Snapshot the job store so a later run can pick up where this one ended
 *
 * USAGE:
 *   archive_demo [config.json]
 */

#include "rv/core/logging.hpp"
#include "rv/events/components.hpp"
#include "rv/events/notification_hub.hpp"
#include "rv/jobs/config.hpp"
#include "rv/jobs/job_store.hpp"
#include "rv/restore/restore_poller.hpp"
#include "rv/restore/restore_tracker.hpp"
#include "rv/storage/memory_object_store.hpp"
#include "rv/upload/upload_queue.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace rv;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> make_sample_files(const fs::path& dir) {
    fs::create_directories(dir);
    std::vector<std::string> paths;
    for (int i = 0; i < 3; ++i) {
        auto path = dir / ("clip_" + std::to_string(i) + ".mov");
        std::ofstream out(path, std::ios::binary);
        std::string block(1024 * 1024, static_cast<char>('a' + i));
        for (int mb = 0; mb <= i; ++mb) {
            out.write(block.data(), static_cast<std::streamsize>(block.size()));
        }
        paths.push_back(path.string());
    }
    return paths;
}

} // namespace

int main(int argc, char* argv[]) {
    jobs::AppConfig app;
    if (argc > 1) {
        auto loaded = jobs::load_app_config(argv[1]);
        if (loaded.is_error()) {
            spdlog::error("Cannot load {}: {}", argv[1], loaded.error().message);
            return 1;
        }
        app = loaded.value();
    } else {
        app.upload = jobs::UploadConfig::for_tier(jobs::UploadTier::Premium);
        app.upload.chunk_size = 5 * jobs::kMiB;
        app.upload.min_chunk_size = 5 * jobs::kMiB;
        app.restore.poll_interval = std::chrono::milliseconds(200);
    }
    configure_logging(app.logging);

    // ════════════════════════════════════════════════════════════
    // Wiring
    // ════════════════════════════════════════════════════════════

    storage::MemoryObjectStore objects;
    storage::StaticCredentialProvider credentials({"demo-key", "demo-secret", std::nullopt, "us-east-1"});
    jobs::JobStore store;
    events::NotificationHub hub;

    events::LoggerComponent logger(hub);
    events::MetricsComponent metrics(hub);

    upload::UploadQueueManager queue(store, objects, credentials, hub, app.upload);
    restore::RestoreJobTracker tracker(store, objects, credentials, hub, app.restore);
    restore::RestorePoller poller(tracker, store, app.restore.poll_interval);

    if (app.state_file && fs::exists(*app.state_file)) {
        auto report = store.load_snapshot(*app.state_file);
        if (report.is_error()) {
            spdlog::warn("Ignoring state file: {}", report.error().message);
        }
    }

    // ════════════════════════════════════════════════════════════
    // Archive
    // ════════════════════════════════════════════════════════════

    const auto work_dir = fs::temp_directory_path() / "reelvault_demo";
    upload::KeyOptions key_options;
    key_options.prefix = "archive";
    key_options.use_date_folder = true;

    auto report = queue.submit(make_sample_files(work_dir), key_options);
    for (const auto& [path, error] : report.rejected) {
        spdlog::warn("Rejected {}: {}", path, error.message);
    }

    if (auto started = queue.start(); started.is_error()) {
        spdlog::error("Cannot start queue: {}", started.error().message);
        return 1;
    }
    if (!queue.wait_until_idle(std::chrono::seconds(30))) {
        spdlog::error("Uploads did not finish in time");
    }
    queue.stop();
    queue.wait_for_workers();

    const auto stats = queue.statistics();
    spdlog::info("Archived {}/{} files, {} bytes", stats.completed_files, stats.total_files, stats.uploaded_bytes);

    // ════════════════════════════════════════════════════════════
    // Retrieve
    // ════════════════════════════════════════════════════════════

    auto archived = tracker.archived_objects("archive/");
    if (archived.is_error() || archived.value().empty()) {
        spdlog::error("Nothing archived");
        return 1;
    }
    const auto key = archived.value().front().key;

    auto requested = tracker.request_restore(key, jobs::RestoreTier::Expedited);
    if (requested.is_error()) {
        spdlog::error("Restore request failed: {}", requested.error().message);
        return 1;
    }

    poller.start();
    // The in-memory store finishes restores only when told to
    objects.complete_restore(key, jobs::Clock::now() + std::chrono::hours(24 * app.restore.restore_days));

    for (int i = 0; i < 50; ++i) {
        auto status = tracker.check_status(key);
        if (status.is_ok() && status.value().status == jobs::RestoreStatus::Completed) {
            break;
        }
        std::this_thread::sleep_for(app.restore.poll_interval);
    }
    poller.stop();

    auto downloaded = tracker.download(key, work_dir / "restored" / fs::path(key).filename());
    if (downloaded.is_error()) {
        spdlog::error("Download rejected: {}", downloaded.error().message);
        return 1;
    }
    tracker.wait_for_downloads();

    if (app.state_file) {
        if (auto saved = store.save_snapshot(*app.state_file); saved.is_error()) {
            spdlog::warn("Could not save state: {}", saved.error().message);
        }
    }

    hub.flush();
    metrics.print_stats();
    return 0;
}
