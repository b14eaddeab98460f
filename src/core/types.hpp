#pragma once

#include <string>
#include <utility>

// Failure categories callers can branch on
enum class ErrorKind {
    None,
    Parse,            // malformed numeric/text content
    NotFound,         // requested resource key absent
    Domain,           // input does not satisfy the operation's precondition
    Upstream,         // document source failed (file, stdin, collaborator)
    UnsupportedUnit,  // storage value with a suffix other than M/G/T
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Forward another result's failure under this value type
    template <typename U>
    static Result<T> Fail(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Fail(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:            return "none";
        case ErrorKind::Parse:           return "parse";
        case ErrorKind::NotFound:        return "not-found";
        case ErrorKind::Domain:          return "domain";
        case ErrorKind::Upstream:        return "upstream";
        case ErrorKind::UnsupportedUnit: return "unsupported-unit";
    }
    return "unknown";
}
