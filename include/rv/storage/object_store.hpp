#pragma once

/**
 * @file object_store.hpp
 * @brief Boundary to the cloud object store and the credential source
 *
 * WHY THIS FILE EXISTS:
 * The orchestration layer never talks to a cloud SDK directly. Everything it
 * needs from the provider (multipart upload, archive restore, download) is
 * declared here, so the real SDK binding and the in-memory test store are
 * interchangeable.
 *
 * ERROR CONTRACT:
 * - Timeouts and throttling → ErrorKind::Transient
 * - Access denied, quota, invalid bucket/destination → ErrorKind::Permanent
 * - Missing key or upload session → ErrorKind::NotFound
 * Every call carries RequestOptions; exceeding options.timeout is Transient.
 */

#include "rv/core/result.hpp"
#include "rv/jobs/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rv::storage {

struct RequestOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(600)};
};

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::optional<std::string> session_token;
    std::string region;
};

struct CompletedPart {
    std::uint32_t part_number = 0;
    std::uint64_t size = 0;
    std::string etag;
};

struct ObjectSummary {
    std::string key;
    std::uint64_t size = 0;
    std::string storage_class;
};

enum class RemoteRestoreState {
    InProgress,
    Completed,
    Failed,
    NotFound
};

struct RestoreState {
    RemoteRestoreState state = RemoteRestoreState::InProgress;
    std::optional<jobs::TimePoint> expires_at;
    std::string message;
};

/// (bytes written so far, total bytes)
using DownloadCallback = std::function<void(std::uint64_t, std::uint64_t)>;

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // ─── Multipart upload ───────────────────────────────────

    /// Open a multipart session and return its upload id.
    virtual Result<std::string> create_multipart_upload(const Credentials& creds,
                                                        const std::string& key,
                                                        const RequestOptions& options) = 0;

    /// Store one part and return its ETag. Re-uploading a part number replaces it.
    virtual Result<std::string> upload_part(const Credentials& creds,
                                            const std::string& key,
                                            const std::string& upload_id,
                                            std::uint32_t part_number,
                                            const std::vector<char>& data,
                                            const RequestOptions& options) = 0;

    /**
     * Parts already durably stored for a session.
     *
     * Stores that cannot enumerate parts return Permanent; the worker then
     * restarts the upload from zero.
     */
    virtual Result<std::vector<CompletedPart>> list_parts(const Credentials& creds,
                                                          const std::string& key,
                                                          const std::string& upload_id,
                                                          const RequestOptions& options) = 0;

    virtual Result<void> complete_multipart_upload(const Credentials& creds,
                                                   const std::string& key,
                                                   const std::string& upload_id,
                                                   const std::vector<CompletedPart>& parts,
                                                   const RequestOptions& options) = 0;

    virtual Result<void> abort_multipart_upload(const Credentials& creds,
                                                const std::string& key,
                                                const std::string& upload_id,
                                                const RequestOptions& options) = 0;

    // ─── Objects and restore ────────────────────────────────

    virtual Result<std::vector<ObjectSummary>> list_objects(const Credentials& creds,
                                                            const std::string& prefix,
                                                            const RequestOptions& options) = 0;

    /// Ask the provider to make an archived object temporarily readable.
    virtual Result<void> request_restore(const Credentials& creds,
                                         const std::string& key,
                                         jobs::RestoreTier tier,
                                         int days,
                                         const RequestOptions& options) = 0;

    virtual Result<RestoreState> restore_status(const Credentials& creds,
                                                const std::string& key,
                                                const RequestOptions& options) = 0;

    /// Copy a restored object to destination. Returns the number of bytes written.
    virtual Result<std::uint64_t> download_object(const Credentials& creds,
                                                  const std::string& key,
                                                  const std::filesystem::path& destination,
                                                  const DownloadCallback& on_progress,
                                                  const RequestOptions& options) = 0;
};

/**
 * @brief Source of the active credential set
 *
 * Queried before every job; a failure here fails the job permanently.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    virtual Result<Credentials> active_credentials() = 0;
};

class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(Credentials creds) : creds_(std::move(creds)) {}

    Result<Credentials> active_credentials() override {
        if (creds_.access_key_id.empty()) {
            return Err<Credentials>(Error::permanent("No credentials configured"));
        }
        return Ok(creds_);
    }

private:
    Credentials creds_;
};

} // namespace rv::storage
