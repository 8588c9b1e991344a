#include "rv/storage/memory_object_store.hpp"
#include "rv/storage/file_io.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

namespace rv::storage {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kDownloadBlock = 1024 * 1024;

Result<void> check_credentials(const Credentials& creds) {
    if (creds.access_key_id.empty() || creds.secret_access_key.empty()) {
        return Err<void>(Error::permanent("AccessDenied: missing credentials"));
    }
    return Ok();
}

std::string make_etag(const std::string& upload_id, std::uint32_t part_number) {
    return "\"" + upload_id + "-" + std::to_string(part_number) + "\"";
}

} // namespace

// ──────────────────────────────────────────────────────────
// Multipart upload
// ──────────────────────────────────────────────────────────

Result<std::string> MemoryObjectStore::create_multipart_upload(const Credentials& creds,
                                                               const std::string& key,
                                                               const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<std::string>(auth.error());
    }

    std::lock_guard lock(mutex_);
    std::string upload_id = "mpu-" + std::to_string(++next_session_);
    sessions_[upload_id].key = key;
    return Ok(std::move(upload_id));
}

void MemoryObjectStore::begin_part_call(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    ++active_part_calls_;
    max_parallel_part_calls_ = std::max(max_parallel_part_calls_, active_part_calls_);

    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return;
    }
    auto& session = it->second;
    ++session.active_calls;

    const auto busy_sessions = static_cast<std::size_t>(std::count_if(
        sessions_.begin(), sessions_.end(), [](const auto& entry) { return entry.second.active_calls > 0; }));

    max_parallel_parts_per_upload_ = std::max(max_parallel_parts_per_upload_, session.active_calls);
    max_parallel_sessions_ = std::max(max_parallel_sessions_, busy_sessions);
}

void MemoryObjectStore::end_part_call(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    --active_part_calls_;
    auto it = sessions_.find(upload_id);
    if (it != sessions_.end() && it->second.active_calls > 0) {
        --it->second.active_calls;
    }
}

Result<std::string> MemoryObjectStore::upload_part(const Credentials& creds,
                                                   const std::string& key,
                                                   const std::string& upload_id,
                                                   std::uint32_t part_number,
                                                   const std::vector<char>& data,
                                                   const RequestOptions& options) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<std::string>(auth.error());
    }

    PartFault fault;
    std::chrono::milliseconds latency{0};
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end() || it->second.key != key) {
            return Err<std::string>(Error::not_found("NoSuchUpload: " + upload_id));
        }
        ++part_calls_[key];
        fault = part_fault_;
        latency = part_latency_;
    }

    begin_part_call(upload_id);

    if (latency.count() > 0) {
        if (latency > options.timeout) {
            std::this_thread::sleep_for(options.timeout);
            end_part_call(upload_id);
            return Err<std::string>(Error::transient(
                "RequestTimeout: part " + std::to_string(part_number) + " exceeded " +
                std::to_string(options.timeout.count()) + "ms"));
        }
        std::this_thread::sleep_for(latency);
    }

    if (fault) {
        if (auto error = fault(key, part_number)) {
            end_part_call(upload_id);
            return Err<std::string>(*error);
        }
    }

    std::string etag = make_etag(upload_id, part_number);
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            // Aborted while the part was in flight
            --active_part_calls_;
            return Err<std::string>(Error::not_found("NoSuchUpload: " + upload_id));
        }

        StoredPart part;
        part.size = data.size();
        part.etag = etag;
        if (retain_part_data_) {
            part.data = data;
        }
        it->second.parts[part_number] = std::move(part);
    }

    end_part_call(upload_id);
    return Ok(std::move(etag));
}

Result<std::vector<CompletedPart>> MemoryObjectStore::list_parts(const Credentials& creds,
                                                                 const std::string& key,
                                                                 const std::string& upload_id,
                                                                 const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<std::vector<CompletedPart>>(auth.error());
    }

    std::lock_guard lock(mutex_);
    if (!list_parts_supported_) {
        return Err<std::vector<CompletedPart>>(Error::permanent("NotImplemented: ListParts"));
    }

    auto it = sessions_.find(upload_id);
    if (it == sessions_.end() || it->second.key != key) {
        return Err<std::vector<CompletedPart>>(Error::not_found("NoSuchUpload: " + upload_id));
    }

    std::vector<CompletedPart> parts;
    for (const auto& [number, part] : it->second.parts) {
        parts.push_back(CompletedPart{number, part.size, part.etag});
    }
    return Ok(std::move(parts));
}

Result<void> MemoryObjectStore::complete_multipart_upload(const Credentials& creds,
                                                          const std::string& key,
                                                          const std::string& upload_id,
                                                          const std::vector<CompletedPart>& parts,
                                                          const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return auth;
    }

    KeyFault fault;
    {
        std::lock_guard lock(mutex_);
        fault = complete_fault_;
    }
    if (fault) {
        if (auto error = fault(key)) {
            return Err<void>(*error);
        }
    }

    std::lock_guard lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end() || it->second.key != key) {
        return Err<void>(Error::not_found("NoSuchUpload: " + upload_id));
    }

    if (parts.empty()) {
        return Err<void>(Error::permanent("MalformedXML: no parts given"));
    }

    StoredObject object;
    object.storage_class = "DEEP_ARCHIVE";
    std::uint32_t expected = 1;
    for (const auto& part : parts) {
        auto stored = it->second.parts.find(part.part_number);
        if (part.part_number != expected || stored == it->second.parts.end() ||
            stored->second.etag != part.etag) {
            return Err<void>(Error::permanent("InvalidPart: " + std::to_string(part.part_number)));
        }
        object.size += stored->second.size;
        object.data.insert(object.data.end(), stored->second.data.begin(), stored->second.data.end());
        ++expected;
    }

    objects_[key] = std::move(object);
    sessions_.erase(it);
    return Ok();
}

Result<void> MemoryObjectStore::abort_multipart_upload(const Credentials& creds,
                                                       const std::string&,
                                                       const std::string& upload_id,
                                                       const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return auth;
    }

    std::lock_guard lock(mutex_);
    if (sessions_.erase(upload_id) == 0) {
        return Err<void>(Error::not_found("NoSuchUpload: " + upload_id));
    }
    ++aborted_sessions_;
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Objects and restore
// ──────────────────────────────────────────────────────────

Result<std::vector<ObjectSummary>> MemoryObjectStore::list_objects(const Credentials& creds,
                                                                   const std::string& prefix,
                                                                   const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<std::vector<ObjectSummary>>(auth.error());
    }

    std::lock_guard lock(mutex_);
    std::vector<ObjectSummary> result;
    for (const auto& [key, object] : objects_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(ObjectSummary{key, object.size, object.storage_class});
        }
    }
    return Ok(std::move(result));
}

Result<void> MemoryObjectStore::request_restore(const Credentials& creds,
                                                const std::string& key,
                                                jobs::RestoreTier,
                                                int days,
                                                const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return auth;
    }
    if (days <= 0) {
        return Err<void>(Error::permanent("InvalidArgument: restore days must be positive"));
    }

    KeyFault fault;
    {
        std::lock_guard lock(mutex_);
        fault = restore_request_fault_;
    }
    if (fault) {
        if (auto error = fault(key)) {
            return Err<void>(*error);
        }
    }

    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return Err<void>(Error::not_found("NoSuchKey: " + key));
    }

    ++restore_requests_[key];
    auto& object = it->second;
    if (object.restore != RestorePhase::InProgress) {
        object.restore = RestorePhase::InProgress;
        object.expires_at.reset();
        object.restore_message.clear();
    }
    return Ok();
}

Result<RestoreState> MemoryObjectStore::restore_status(const Credentials& creds,
                                                       const std::string& key,
                                                       const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<RestoreState>(auth.error());
    }

    std::lock_guard lock(mutex_);
    ++status_queries_[key];

    auto fault = status_faults_.find(key);
    if (fault != status_faults_.end()) {
        Error error = fault->second;
        status_faults_.erase(fault);
        return Err<RestoreState>(std::move(error));
    }

    RestoreState state;
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        state.state = RemoteRestoreState::NotFound;
        state.message = "NoSuchKey";
        return Ok(std::move(state));
    }

    const auto& object = it->second;
    switch (object.restore) {
        case RestorePhase::None:
            state.state = RemoteRestoreState::NotFound;
            state.message = "No restore requested";
            break;
        case RestorePhase::InProgress:
            state.state = RemoteRestoreState::InProgress;
            break;
        case RestorePhase::Completed:
            state.state = RemoteRestoreState::Completed;
            state.expires_at = object.expires_at;
            break;
        case RestorePhase::Failed:
            state.state = RemoteRestoreState::Failed;
            state.message = object.restore_message;
            break;
    }
    return Ok(std::move(state));
}

Result<std::uint64_t> MemoryObjectStore::download_object(const Credentials& creds,
                                                         const std::string& key,
                                                         const fs::path& destination,
                                                         const DownloadCallback& on_progress,
                                                         const RequestOptions&) {
    if (auto auth = check_credentials(creds); auth.is_error()) {
        return Err<std::uint64_t>(auth.error());
    }

    StoredObject object;
    {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return Err<std::uint64_t>(Error::not_found("NoSuchKey: " + key));
        }
        const auto& stored = it->second;
        const bool readable = stored.restore == RestorePhase::Completed &&
                              stored.expires_at && *stored.expires_at > jobs::Clock::now();
        if (!readable) {
            return Err<std::uint64_t>(Error::permanent("InvalidObjectState: " + key + " is not restored"));
        }
        object = stored;
    }

    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    std::error_code ec;
    fs::remove(destination, ec);

    if (object.data.size() != object.size) {
        // Uploaded without retained bytes: reproduce the size only
        std::ofstream create(destination, std::ios::binary | std::ios::trunc);
        create.close();
        fs::resize_file(destination, object.size, ec);
        if (ec) {
            return Err<std::uint64_t>(Error::permanent("Failed to write " + destination.string()));
        }
        if (on_progress) {
            on_progress(object.size, object.size);
        }
        return Ok(object.size);
    }

    std::uint64_t written = 0;
    if (object.size == 0) {
        std::ofstream create(destination, std::ios::binary | std::ios::trunc);
        if (!create) {
            return Err<std::uint64_t>(Error::permanent("Failed to create " + destination.string()));
        }
    }
    while (written < object.size) {
        const auto block = std::min<std::uint64_t>(kDownloadBlock, object.size - written);
        std::vector<char> chunk(object.data.begin() + static_cast<std::ptrdiff_t>(written),
                                object.data.begin() + static_cast<std::ptrdiff_t>(written + block));
        if (auto res = write_range(destination, written, chunk); res.is_error()) {
            return Err<std::uint64_t>(res.error());
        }
        written += block;
        if (on_progress) {
            on_progress(written, object.size);
        }
    }
    return Ok(written);
}

// ──────────────────────────────────────────────────────────
// Controls
// ──────────────────────────────────────────────────────────

void MemoryObjectStore::set_part_fault(PartFault fault) {
    std::lock_guard lock(mutex_);
    part_fault_ = std::move(fault);
}

void MemoryObjectStore::set_complete_fault(KeyFault fault) {
    std::lock_guard lock(mutex_);
    complete_fault_ = std::move(fault);
}

void MemoryObjectStore::set_part_latency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    part_latency_ = latency;
}

void MemoryObjectStore::set_list_parts_supported(bool supported) {
    std::lock_guard lock(mutex_);
    list_parts_supported_ = supported;
}

void MemoryObjectStore::set_retain_part_data(bool retain) {
    std::lock_guard lock(mutex_);
    retain_part_data_ = retain;
}

void MemoryObjectStore::put_object(const std::string& key, std::vector<char> data, std::string storage_class) {
    std::lock_guard lock(mutex_);
    StoredObject object;
    object.size = data.size();
    object.data = std::move(data);
    object.storage_class = std::move(storage_class);
    objects_[key] = std::move(object);
}

void MemoryObjectStore::set_restore_request_fault(KeyFault fault) {
    std::lock_guard lock(mutex_);
    restore_request_fault_ = std::move(fault);
}

void MemoryObjectStore::complete_restore(const std::string& key, jobs::TimePoint expires_at) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return;
    }
    it->second.restore = RestorePhase::Completed;
    it->second.expires_at = expires_at;
}

void MemoryObjectStore::fail_restore(const std::string& key, std::string message) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return;
    }
    it->second.restore = RestorePhase::Failed;
    it->second.restore_message = std::move(message);
}

void MemoryObjectStore::expire_restore(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return;
    }
    it->second.expires_at = jobs::Clock::now() - std::chrono::seconds(1);
}

void MemoryObjectStore::fail_next_status(const std::string& key, Error error) {
    std::lock_guard lock(mutex_);
    status_faults_[key] = std::move(error);
}

// ──────────────────────────────────────────────────────────
// Observations
// ──────────────────────────────────────────────────────────

bool MemoryObjectStore::has_object(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return objects_.count(key) > 0;
}

std::optional<std::uint64_t> MemoryObjectStore::object_size(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.size;
}

std::optional<std::vector<char>> MemoryObjectStore::object_data(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second.data;
}

std::size_t MemoryObjectStore::open_sessions() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

std::size_t MemoryObjectStore::aborted_sessions() const {
    std::lock_guard lock(mutex_);
    return aborted_sessions_;
}

std::size_t MemoryObjectStore::part_calls(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = part_calls_.find(key);
    return it != part_calls_.end() ? it->second : 0;
}

std::size_t MemoryObjectStore::restore_requests(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = restore_requests_.find(key);
    return it != restore_requests_.end() ? it->second : 0;
}

std::size_t MemoryObjectStore::status_queries(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = status_queries_.find(key);
    return it != status_queries_.end() ? it->second : 0;
}

std::size_t MemoryObjectStore::max_parallel_part_calls() const {
    std::lock_guard lock(mutex_);
    return max_parallel_part_calls_;
}

std::size_t MemoryObjectStore::max_parallel_parts_per_upload() const {
    std::lock_guard lock(mutex_);
    return max_parallel_parts_per_upload_;
}

std::size_t MemoryObjectStore::max_parallel_sessions() const {
    std::lock_guard lock(mutex_);
    return max_parallel_sessions_;
}

} // namespace rv::storage
