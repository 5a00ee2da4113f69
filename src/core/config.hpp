#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>
#include "types.hpp"
#include "constants.hpp"
#include <store/object_store.hpp>
#include <managers/schedule.hpp>

namespace fs = std::filesystem;

struct StoreConfig {
    std::string root;                                   // FsObjectStore directory
    StorageClass storage_class = StorageClass::Standard;
    uint64_t max_object_bytes = MAX_SINGLE_OBJECT_BYTES;
};

struct TransferConfig {
    uint64_t chunk_bytes = DEFAULT_CHUNK_BYTES;
    int concurrency = DEFAULT_CONCURRENCY;
};

struct QuotaConfig {
    uint64_t monthly_limit_bytes = 0;   // 0 = unlimited
    bool count_uploads = true;
    bool count_downloads = true;
};

struct ScheduleConfig {
    std::vector<ScheduleWindow> windows;    // empty = always open
    uint64_t throughput_bytes_per_sec = 0;
};

struct RetryConfig {
    int64_t base_ms = DEFAULT_RETRY_BASE_MS;
    int64_t cap_ms = DEFAULT_RETRY_CAP_MS;
    uint64_t seed = 0;
};

struct RestoreConfig {
    RestoreTier tier = RestoreTier::Bulk;
    int poll_secs = DEFAULT_RESTORE_POLL_SECS;
    int days = DEFAULT_RESTORE_DAYS;
};

class Config {
public:
    // Load from `path`, or from default_config_path() when empty.
    static Result<Config> load(const fs::path& path = {});

    // Parse YAML text. Missing keys take their defaults.
    static Result<Config> parse(const std::string& yaml_text);

    const fs::path& state_dir() const { return state_dir_; }
    const fs::path& log_dir() const { return log_dir_; }
    const StoreConfig& store() const { return store_; }
    const TransferConfig& transfer() const { return transfer_; }
    const QuotaConfig& quota() const { return quota_; }
    const ScheduleConfig& schedule() const { return schedule_; }
    const RetryConfig& retry() const { return retry_; }
    const RestoreConfig& restore() const { return restore_; }

    Config();

private:
    fs::path state_dir_;
    fs::path log_dir_;
    StoreConfig store_;
    TransferConfig transfer_;
    QuotaConfig quota_;
    ScheduleConfig schedule_;
    RetryConfig retry_;
    RestoreConfig restore_;
};

fs::path get_config_dir();

// $COLDXFER_CONFIG if set, else ~/.coldxfer/config.yaml
fs::path default_config_path();

// Write a commented template to `path` (default path when empty) unless a
// file is already there.
Result<void> create_default_config(const fs::path& path = {});
