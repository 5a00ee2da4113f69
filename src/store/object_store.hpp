#pragma once

#include <string>
#include <cstdint>
#include <platform/byte_stream.hpp>

enum class StorageClass {
    Standard,
    StandardIA,
    GlacierIR,      // instant retrieval, directly readable
    Glacier,        // flexible retrieval, needs restore
    DeepArchive,    // needs restore, slowest and cheapest
};

std::string to_string(StorageClass c);
bool parse_storage_class(const std::string& s, StorageClass& out);

// Objects in these classes must be restored before a GET succeeds.
bool requires_restore(StorageClass c);

enum class RestoreTier { Bulk, Standard, Expedited };

std::string to_string(RestoreTier t);
bool parse_restore_tier(const std::string& s, RestoreTier& out);

enum class RestoreStatus {
    None,       // no restore requested, or a restored copy has expired
    Ongoing,    // restore accepted, not yet readable
    Restored,   // temporary readable copy exists
};

std::string to_string(RestoreStatus s);

struct ObjectInfo {
    uint64_t size_bytes = 0;
    StorageClass storage_class = StorageClass::Standard;
    RestoreStatus restore_status = RestoreStatus::None;
    std::string restore_expiry;     // ISO time the restored copy lapses, if known
};

struct Ack {
    std::string etag;
};

// How a store call failed, before retry classification.
enum class StoreFailure {
    Network,        // connect/DNS/reset, request never answered
    Timeout,        // request or response timed out
    Service,        // the service answered with an error status
    Construction,   // request could not be built (bad key, bad argument)
};

struct StoreError {
    StoreFailure kind = StoreFailure::Service;
    int http_status = 0;
    std::string code;       // service error code, e.g. "SlowDown", "AccessDenied"
    std::string message;

    std::string describe() const;
};

template <typename T>
struct StoreResult {
    bool success;
    T value;
    StoreError error;

    static StoreResult<T> Ok(T val) {
        return {true, std::move(val), StoreError{}};
    }

    static StoreResult<T> Err(StoreError err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Object-store capability consumed by the pipelines. Implementations own
// signing, connections and wire format; callers only see classified results.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Store bytes [offset, offset+length) of `source` as that byte range of
    // the single object `key` whose final size is `total_size`. The object is
    // readable under `key` once the range ending at `total_size` is
    // acknowledged. Re-putting a range replaces it.
    virtual StoreResult<Ack> put_object(const std::string& key, ByteSource& source,
                                        uint64_t offset, uint64_t length,
                                        uint64_t total_size, StorageClass storage_class) = 0;

    virtual StoreResult<std::string> get_object_range(const std::string& key,
                                                      uint64_t offset, uint64_t length) = 0;

    virtual StoreResult<ObjectInfo> head_object(const std::string& key) = 0;

    // Ask for a temporary readable copy of an archived object for `days` days.
    virtual StoreResult<Ack> restore_object(const std::string& key, RestoreTier tier,
                                            int days) = 0;
};
