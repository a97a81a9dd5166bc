#pragma once

#include <string>
#include <map>
#include <cstdint>

// Error classes shared by the store, the executor and chunk processors.
enum class ErrorKind : std::uint8_t {
    None = 0,

    // Checkpoint store
    NotFound,           // no record for the identifier
    CorruptState,       // primary and backup both invalid
    AlreadyExists,      // conflicting active job
    NotResumable,       // record exists but is not paused/crashed
    ShapeMismatch,      // descriptor set disagrees with the stored record
    LockTimeout,        // exclusive access not obtained within the bound
    IoError,            // disk full, permission denied, ...

    // Executor
    RecoverableChunkFailure,
    FatalJobFailure,

    // Reported by chunk processors
    RateLimited,
    ConnectionLost,
    ServerFault,
    AuthFailure,
    InvalidConfig,
    Internal,
};

const char* error_kind_name(ErrorKind kind);

// Transient unavailability of the external dependency is recoverable;
// everything else stops the job.
bool is_recoverable(ErrorKind kind);

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

    // Re-wrap the error of another result
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
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
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Opaque configuration bag recorded on a job at creation time
// (model, provider, chunking parameters, ...).
using JobConfig = std::map<std::string, std::string>;
