#pragma once

#include <string>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Failure taxonomy carried by Failed jobs and surfaced to the operator.
enum class ErrorClass {
    None,
    Transient,            // network/service failure, retried with backoff
    RemoteRejected,       // 4xx other than throttling, never retried
    LocalIOFailure,       // unreadable source, full disk, hash mismatch
    OversizedSource,      // source larger than one object may be
    PermanentlyTooLarge,  // a single chunk exceeds the monthly quota
    Cancelled,            // operator cancelled the job
};

std::string to_string(ErrorClass c);
ErrorClass error_class_from_string(const std::string& s);

enum class Direction { Upload, Download };

std::string to_string(Direction d);
Direction direction_from_string(const std::string& s);

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Download progress: job id, bytes durably written, total bytes.
using ProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;
