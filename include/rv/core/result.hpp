#pragma once

/**
 * @file result.hpp
 * @brief Value-or-Error return type of every fallible operation
 *
 * The error side is always rv::Error, so callers can branch on its kind
 * (retry a Transient failure, surface a Precondition to the user) without
 * parsing messages.
 *
 * USAGE:
 * Result<UploadJob> found = store.upload(id);
 * if (found.is_error()) {
 *     return Err<PartPlan>(found.error());
 * }
 * use(found.value());
 *
 * Result<void> carries only the error; success is Ok().
 */

#include "rv/core/error.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace rv {

// Tag types so that Result<Error> or Result<std::string> stay unambiguous
template<typename T>
struct Success {
    T value;
    explicit Success(T v) : value(std::move(v)) {}
};

struct Failure {
    Error error;
    explicit Failure(Error e) : error(std::move(e)) {}
};

template<typename T>
class Result {
public:
    Result(Success<T> ok) : state_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(Failure failed) : state_(std::in_place_index<1>, std::move(failed.error)) {}

    bool is_ok() const noexcept { return state_.index() == 0; }
    bool is_error() const noexcept { return state_.index() == 1; }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    Error& error() { return std::get<1>(state_); }
    const Error& error() const { return std::get<1>(state_); }

private:
    std::variant<T, Error> state_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Failure failed) : error_(std::move(failed.error)) {}

    bool is_ok() const noexcept { return !error_.has_value(); }
    bool is_error() const noexcept { return error_.has_value(); }

    const Error& error() const { return *error_; }

private:
    std::optional<Error> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(Success<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T>
Result<T> Err(Error error) { return Result<T>(Failure(std::move(error))); }

} // namespace rv
