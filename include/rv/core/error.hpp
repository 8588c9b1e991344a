#pragma once

#include <string>

namespace rv {

/**
 * @brief Classification of every failure the orchestration layer can report
 *
 * Transient     - timeouts, throttling; fed to the retry policy
 * Permanent     - auth denied, quota exceeded, invalid destination; never retried
 * NotFound      - unknown job id, key or file
 * Precondition  - caller asked for something the current state forbids
 *                 (duplicate submission, removing an active job, ...)
 * InvalidArgument - malformed config or input
 */
enum class ErrorKind {
    Transient,
    Permanent,
    NotFound,
    Precondition,
    InvalidArgument
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Precondition: return "precondition";
        case ErrorKind::InvalidArgument: return "invalid-argument";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::Permanent;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool is_transient() const noexcept { return kind == ErrorKind::Transient; }

    static Error transient(std::string msg) { return {ErrorKind::Transient, std::move(msg)}; }
    static Error permanent(std::string msg) { return {ErrorKind::Permanent, std::move(msg)}; }
    static Error not_found(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
    static Error precondition(std::string msg) { return {ErrorKind::Precondition, std::move(msg)}; }
    static Error invalid_argument(std::string msg) { return {ErrorKind::InvalidArgument, std::move(msg)}; }
};

} // namespace rv
