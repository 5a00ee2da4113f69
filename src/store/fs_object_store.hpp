#pragma once

#include <string>
#include <mutex>
#include <chrono>
#include <filesystem>
#include <core/clock.hpp>
#include "object_store.hpp"

namespace fs = std::filesystem;

// Object store backed by a local directory (a mounted bucket, NAS share or a
// drill target). Objects live in <root>/objects/<escaped key> with a YAML
// metadata sidecar; in-flight uploads accumulate in <root>/incoming/ and are
// published by rename when their last range arrives. Archive-tier restores are
// simulated with a per-tier delay measured on the injected clock.
class FsObjectStore : public ObjectStore {
public:
    struct Options {
        std::chrono::seconds expedited_delay{0};
        std::chrono::seconds standard_delay{0};
        std::chrono::seconds bulk_delay{0};
    };

    FsObjectStore(fs::path root, const Clock& clock);
    FsObjectStore(fs::path root, const Clock& clock, Options options);

    StoreResult<Ack> put_object(const std::string& key, ByteSource& source,
                                uint64_t offset, uint64_t length,
                                uint64_t total_size, StorageClass storage_class) override;

    StoreResult<std::string> get_object_range(const std::string& key,
                                              uint64_t offset, uint64_t length) override;

    StoreResult<ObjectInfo> head_object(const std::string& key) override;

    StoreResult<Ack> restore_object(const std::string& key, RestoreTier tier, int days) override;

    // Change an existing object's class (lifecycle transition to archive).
    StoreResult<Ack> set_storage_class(const std::string& key, StorageClass storage_class);

    const fs::path& root() const { return root_; }

private:
    struct Meta {
        uint64_t size_bytes = 0;
        StorageClass storage_class = StorageClass::Standard;
        std::string restore_ready_at;     // ISO; "" = never requested
        std::string restore_expires_at;   // ISO
    };

    fs::path object_path(const std::string& key) const;
    fs::path meta_path(const std::string& key) const;
    fs::path incoming_path(const std::string& key) const;

    bool load_meta(const std::string& key, Meta& out, StoreError& err) const;
    StoreError save_meta(const std::string& key, const Meta& meta) const;
    RestoreStatus restore_status(const Meta& meta) const;
    // Caller holds mutex_.
    StoreResult<Ack> rewrite_published(const std::string& key, ByteSource& source,
                                       uint64_t offset, uint64_t length);
    std::chrono::seconds restore_delay(RestoreTier tier) const;

    fs::path root_;
    const Clock& clock_;
    Options options_;
    mutable std::mutex mutex_;
};
