#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <platform/durable_file.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".coldxfer";
}

fs::path default_config_path() {
    const char* env = std::getenv("COLDXFER_CONFIG");
    if (env && *env) return platform::expand_home(env);
    return get_config_dir() / "config.yaml";
}

Config::Config()
    : state_dir_(get_config_dir() / "state"), log_dir_(get_config_dir() / "logs") {}

// Byte counts may be written as plain integers or with a suffix ("64M", "1TiB").
static Result<uint64_t> byte_field(const YAML::Node& node, const char* key, uint64_t fallback) {
    if (!node || !node[key]) return Result<uint64_t>::Ok(fallback);
    std::string text = node[key].as<std::string>("");
    uint64_t v = 0;
    if (!parse_byte_size(text, v)) {
        return Result<uint64_t>::Err(fmt::format("invalid byte size for '{}': '{}'", key, text));
    }
    return Result<uint64_t>::Ok(v);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) return Result<Config>::Err("config must be a YAML mapping");

        if (root["state_dir"]) {
            config.state_dir_ = platform::expand_home(root["state_dir"].as<std::string>());
        }
        if (root["log_dir"]) {
            config.log_dir_ = platform::expand_home(root["log_dir"].as<std::string>());
        }

        // ── store ───────────────────────────────────────────
        if (const YAML::Node s = root["store"]) {
            if (s["root"]) config.store_.root = platform::expand_home(s["root"].as<std::string>()).string();
            if (s["storage_class"]) {
                std::string cls = s["storage_class"].as<std::string>();
                if (!parse_storage_class(cls, config.store_.storage_class)) {
                    return Result<Config>::Err("invalid store.storage_class: '" + cls + "'");
                }
            }
            auto max = byte_field(s, "max_object_bytes", config.store_.max_object_bytes);
            if (max.is_err()) return Result<Config>::Err("store: " + max.error);
            config.store_.max_object_bytes = max.value;
        }

        // ── transfer ────────────────────────────────────────
        if (const YAML::Node t = root["transfer"]) {
            auto chunk = byte_field(t, "chunk_bytes", config.transfer_.chunk_bytes);
            if (chunk.is_err()) return Result<Config>::Err("transfer: " + chunk.error);
            config.transfer_.chunk_bytes = chunk.value;
            config.transfer_.concurrency = t["concurrency"].as<int>(config.transfer_.concurrency);
        }
        if (config.transfer_.chunk_bytes == 0) {
            return Result<Config>::Err("transfer.chunk_bytes must be greater than zero");
        }
        if (config.transfer_.concurrency < 1) {
            return Result<Config>::Err("transfer.concurrency must be at least 1");
        }

        // ── quota ───────────────────────────────────────────
        if (const YAML::Node q = root["quota"]) {
            auto limit = byte_field(q, "monthly_limit_bytes", 0);
            if (limit.is_err()) return Result<Config>::Err("quota: " + limit.error);
            config.quota_.monthly_limit_bytes = limit.value;
            config.quota_.count_uploads = q["count_uploads"].as<bool>(true);
            config.quota_.count_downloads = q["count_downloads"].as<bool>(true);
        }

        // ── schedule ────────────────────────────────────────
        if (const YAML::Node sch = root["schedule"]) {
            const YAML::Node windows = sch["windows"];
            if (windows && !windows.IsSequence()) {
                return Result<Config>::Err("schedule.windows must be a list of \"HH:MM-HH:MM\"");
            }
            if (windows) {
                for (const auto& w : windows) {
                    auto parsed = parse_schedule_window(w.as<std::string>(""));
                    if (parsed.is_err()) return Result<Config>::Err("schedule.windows: " + parsed.error);
                    config.schedule_.windows.push_back(parsed.value);
                }
            }
            auto tp = byte_field(sch, "throughput_bytes_per_sec", 0);
            if (tp.is_err()) return Result<Config>::Err("schedule: " + tp.error);
            config.schedule_.throughput_bytes_per_sec = tp.value;
        }

        // ── retry ───────────────────────────────────────────
        if (const YAML::Node r = root["retry"]) {
            config.retry_.base_ms = r["base_ms"].as<int64_t>(config.retry_.base_ms);
            config.retry_.cap_ms = r["cap_ms"].as<int64_t>(config.retry_.cap_ms);
            config.retry_.seed = r["seed"].as<uint64_t>(0);
        }
        if (config.retry_.base_ms <= 0 || config.retry_.cap_ms < config.retry_.base_ms) {
            return Result<Config>::Err("retry: need 0 < base_ms <= cap_ms");
        }

        // ── restore ─────────────────────────────────────────
        if (const YAML::Node rs = root["restore"]) {
            if (rs["tier"]) {
                std::string tier = rs["tier"].as<std::string>();
                if (!parse_restore_tier(tier, config.restore_.tier)) {
                    return Result<Config>::Err("invalid restore.tier: '" + tier + "'");
                }
            }
            config.restore_.poll_secs = rs["poll_secs"].as<int>(config.restore_.poll_secs);
            config.restore_.days = rs["days"].as<int>(config.restore_.days);
        }
        if (config.restore_.poll_secs < 1) {
            return Result<Config>::Err("restore.poll_secs must be at least 1");
        }
        if (config.restore_.days < 1) {
            return Result<Config>::Err("restore.days must be at least 1");
        }
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& path) {
    fs::path p = path.empty() ? default_config_path() : path;
    if (!fs::exists(p)) {
        return Result<Config>::Err("Config not found at " + p.string() +
                                   " (run 'coldxfer init' to create one)");
    }
    auto content = platform::read_file(p);
    if (content.is_err()) return Result<Config>::Err(content.error);

    auto config = parse(content.value);
    if (config.is_err()) {
        return Result<Config>::Err(p.string() + ": " + config.error);
    }
    return config;
}

Result<void> create_default_config(const fs::path& path) {
    fs::path config_path = path.empty() ? default_config_path() : path;

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# coldxfer configuration

# Job ledger (resumable transfer state) and logs
state_dir: "~/.coldxfer/state"
log_dir: "~/.coldxfer/logs"

store:
  root: ""                        # directory backing the object store
  storage_class: "STANDARD"       # STANDARD, STANDARD_IA, GLACIER_IR, GLACIER, DEEP_ARCHIVE
  max_object_bytes: 5000000000

transfer:
  chunk_bytes: 64M
  concurrency: 2

# Monthly transfer budget (0 = unlimited)
quota:
  monthly_limit_bytes: 0
  count_uploads: true
  count_downloads: true

# Allowed UTC time-of-day windows; empty = any time
schedule:
  windows: []                     # e.g. ["00:00-06:00", "22:00-23:30"]
  throughput_bytes_per_sec: 0     # > 0: only start chunks that finish inside a window

retry:
  base_ms: 5000
  cap_ms: 900000

restore:
  tier: "Bulk"                    # Bulk, Standard, Expedited
  poll_secs: 1800
  days: 1
)";

    return platform::write_file_atomic(config_path, default_config);
}
