#pragma once

/**
 * @file memory_object_store.hpp
 * @brief In-process ObjectStore for tests and the demo
 *
 * WHY THIS FILE EXISTS:
 * The orchestration logic (retry, resume, restore polling) is only worth
 * testing against a store that can misbehave on demand. This store keeps
 * objects and multipart sessions in memory and exposes hooks to inject
 * faults, latency and restore outcomes.
 *
 * THREAD SAFETY:
 * All state is behind one mutex. Latency and fault hooks run with the mutex
 * released, so concurrent part uploads really overlap and can be counted.
 *
 * RESTORE MODEL:
 * put_object() stores an archived object. request_restore() marks it
 * InProgress; the test then decides the outcome with complete_restore() or
 * fail_restore(). download_object() only succeeds for a Completed,
 * unexpired restore.
 */

#include "rv/storage/object_store.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rv::storage {

class MemoryObjectStore : public ObjectStore {
public:
    /// Return an error to fail this call of upload_part, nullopt to let it through.
    using PartFault = std::function<std::optional<Error>(const std::string& key, std::uint32_t part_number)>;
    using KeyFault = std::function<std::optional<Error>(const std::string& key)>;

    MemoryObjectStore() = default;

    // ─── ObjectStore ────────────────────────────────────────

    Result<std::string> create_multipart_upload(const Credentials& creds,
                                                const std::string& key,
                                                const RequestOptions& options) override;

    Result<std::string> upload_part(const Credentials& creds,
                                    const std::string& key,
                                    const std::string& upload_id,
                                    std::uint32_t part_number,
                                    const std::vector<char>& data,
                                    const RequestOptions& options) override;

    Result<std::vector<CompletedPart>> list_parts(const Credentials& creds,
                                                  const std::string& key,
                                                  const std::string& upload_id,
                                                  const RequestOptions& options) override;

    Result<void> complete_multipart_upload(const Credentials& creds,
                                           const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<CompletedPart>& parts,
                                           const RequestOptions& options) override;

    Result<void> abort_multipart_upload(const Credentials& creds,
                                        const std::string& key,
                                        const std::string& upload_id,
                                        const RequestOptions& options) override;

    Result<std::vector<ObjectSummary>> list_objects(const Credentials& creds,
                                                    const std::string& prefix,
                                                    const RequestOptions& options) override;

    Result<void> request_restore(const Credentials& creds,
                                 const std::string& key,
                                 jobs::RestoreTier tier,
                                 int days,
                                 const RequestOptions& options) override;

    Result<RestoreState> restore_status(const Credentials& creds,
                                        const std::string& key,
                                        const RequestOptions& options) override;

    Result<std::uint64_t> download_object(const Credentials& creds,
                                          const std::string& key,
                                          const std::filesystem::path& destination,
                                          const DownloadCallback& on_progress,
                                          const RequestOptions& options) override;

    // ─── Upload controls ────────────────────────────────────

    void set_part_fault(PartFault fault);
    void set_complete_fault(KeyFault fault);
    void set_part_latency(std::chrono::milliseconds latency);
    void set_list_parts_supported(bool supported);

    /// With false, parts keep their size but not their bytes (large-file tests).
    void set_retain_part_data(bool retain);

    // ─── Restore controls ───────────────────────────────────

    void put_object(const std::string& key, std::vector<char> data, std::string storage_class = "DEEP_ARCHIVE");
    void set_restore_request_fault(KeyFault fault);
    void complete_restore(const std::string& key, jobs::TimePoint expires_at);
    void fail_restore(const std::string& key, std::string message);
    void expire_restore(const std::string& key);

    /// The next restore_status call for key fails with error.
    void fail_next_status(const std::string& key, Error error);

    // ─── Observations ───────────────────────────────────────

    bool has_object(const std::string& key) const;
    std::optional<std::uint64_t> object_size(const std::string& key) const;
    std::optional<std::vector<char>> object_data(const std::string& key) const;

    std::size_t open_sessions() const;
    std::size_t aborted_sessions() const;
    std::size_t part_calls(const std::string& key) const;
    std::size_t restore_requests(const std::string& key) const;
    std::size_t status_queries(const std::string& key) const;

    /// Highest number of upload_part calls in flight at once, over all sessions.
    std::size_t max_parallel_part_calls() const;

    /// Highest number of upload_part calls in flight at once for a single session.
    std::size_t max_parallel_parts_per_upload() const;

    /// Highest number of distinct sessions with a part call in flight at once.
    std::size_t max_parallel_sessions() const;

private:
    enum class RestorePhase { None, InProgress, Completed, Failed };

    struct StoredObject {
        std::vector<char> data;
        std::uint64_t size = 0;
        std::string storage_class;
        RestorePhase restore = RestorePhase::None;
        std::optional<jobs::TimePoint> expires_at;
        std::string restore_message;
    };

    struct StoredPart {
        std::uint64_t size = 0;
        std::string etag;
        std::vector<char> data;
    };

    struct Session {
        std::string key;
        std::map<std::uint32_t, StoredPart> parts;
        std::size_t active_calls = 0;
    };

    void begin_part_call(const std::string& upload_id);
    void end_part_call(const std::string& upload_id);

    mutable std::mutex mutex_;
    std::map<std::string, StoredObject> objects_;
    std::unordered_map<std::string, Session> sessions_;
    std::uint64_t next_session_ = 0;

    PartFault part_fault_;
    KeyFault complete_fault_;
    KeyFault restore_request_fault_;
    std::chrono::milliseconds part_latency_{0};
    bool list_parts_supported_ = true;
    bool retain_part_data_ = true;
    std::unordered_map<std::string, Error> status_faults_;

    std::size_t aborted_sessions_ = 0;
    std::unordered_map<std::string, std::size_t> part_calls_;
    std::unordered_map<std::string, std::size_t> restore_requests_;
    std::unordered_map<std::string, std::size_t> status_queries_;
    std::size_t active_part_calls_ = 0;
    std::size_t max_parallel_part_calls_ = 0;
    std::size_t max_parallel_parts_per_upload_ = 0;
    std::size_t max_parallel_sessions_ = 0;
};

} // namespace rv::storage
