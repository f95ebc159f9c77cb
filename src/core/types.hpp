#pragma once

#include <string>
#include <functional>
#include <cstdint>

// What went wrong, so callers can tell "couldn't reach the host" apart from
// "credentials rejected" without parsing the message.
enum class ErrorKind {
    None,
    Credential,           // key or certificate could not be loaded
    Handshake,            // resolve, TCP connect, key exchange, host key
    Timeout,              // inactivity window elapsed
    Authentication,       // server rejected the auth strategy
    Channel,              // channel open or exec refused
    ProtocolConsistency,  // stream ended without an exit status
    LocalIO,              // writing to the local sink failed
    SessionState,         // call on a busy or closed session
    Config,               // config file unreadable or invalid
    Other,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    static Result<T> Err(const std::string& err) {
        return Err(ErrorKind::Other, err);
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    static Result<void> Err(const std::string& err) {
        return Err(ErrorKind::Other, err);
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Forward an error from one Result type to another.
template <typename To, typename From>
Result<To> propagate(const Result<From>& from) {
    return Result<To>::Err(from.kind, from.error);
}

// Outcome of one remote command run
struct ExecutionResult {
    int exit_status = 0;
    uint64_t bytes_written = 0;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
