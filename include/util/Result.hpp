#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace reelcast::util {

struct Ok {};

enum class ErrorCode {
    InvalidLocator,     // Malformed magnet link, never retried
    InvalidArgument,    // Caller passed an out-of-contract value
    LaunchNotFound,     // Executable missing from PATH
    SpawnFailed,        // pipe/fork/exec failure
    ParseError,         // Unusable subprocess output
    Timeout,            // Awaited transition did not happen in time
    DeviceUnreachable,
    CastFailed,
    NoPeers,
    TransferFailed,
    NoTarget,
    NoActiveSession,
    SessionNotFound,
    InvalidState,
    IoError,
};

// Stable machine-readable name, used by the JSON output
std::string_view error_code_name(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;
};

template <typename T = Ok>
class Result {
    std::variant<T, Error> value_;

public:
    Result(T v) : value_(std::move(v)) {}
    Result(Error e) : value_(std::move(e)) {}

    static Result<T> ok(T v) { return Result(std::move(v)); }

    static Result<T> err(ErrorCode code, std::string msg) {
        return Result(Error{code, std::move(msg)});
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Result::value on error: " + std::get<Error>(value_).message);
        }
        return std::get<T>(value_);
    }

    T& value() {
        if (is_err()) {
            throw std::runtime_error("Result::value on error: " + std::get<Error>(value_).message);
        }
        return std::get<T>(value_);
    }

    const Error& error() const {
        if (is_ok()) {
            throw std::logic_error("Result::error called on success value");
        }
        return std::get<Error>(value_);
    }

    ErrorCode code() const { return error().code; }
};

using EmptyResult = Result<Ok>;

inline EmptyResult success() { return EmptyResult(Ok{}); }

inline Error make_error(ErrorCode code, std::string msg) {
    return Error{code, std::move(msg)};
}

}  // namespace reelcast::util
