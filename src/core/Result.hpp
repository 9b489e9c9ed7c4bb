#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ossim {

// Failure kinds reported by the simulation engines. None of them is fatal;
// callers decide whether to retry or surface the message.
enum class ErrorCode {
    NONE = 0,
    INVALID_ARGUMENT,    // Precondition violated by the caller
    INSUFFICIENT_MEMORY, // No single free extent is large enough
    NOT_FOUND,           // Lookup key or deallocation target absent
    EMPTY_RESULT,        // Nothing to report yet
    ALREADY_EXISTS       // Name collision in the directory tree
};

const char* toString(ErrorCode code);

/**
 * Outcome of an operation that produces no value.
 */
struct Status {
    ErrorCode error{ErrorCode::NONE};
    std::string message;

    bool ok() const { return error == ErrorCode::NONE; }

    static Status success() { return {}; }
    static Status failure(ErrorCode code, std::string msg) {
        return {code, std::move(msg)};
    }
};

/**
 * Outcome of an operation that produces a value on success. The value is
 * engaged if and only if ok() is true.
 */
template <typename T>
struct Result {
    ErrorCode error{ErrorCode::NONE};
    std::optional<T> value;
    std::string message;

    bool ok() const { return error == ErrorCode::NONE; }

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result failure(ErrorCode code, std::string msg) {
        Result r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }

    static Result failure(const Status& status) {
        return failure(status.error, status.message);
    }

    Status status() const { return {error, message}; }
};

} // namespace ossim
