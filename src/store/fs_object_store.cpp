#include "fs_object_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/durable_file.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <vector>

static StoreError service_error(int status, const std::string& code, const std::string& msg) {
    StoreError e;
    e.kind = StoreFailure::Service;
    e.http_status = status;
    e.code = code;
    e.message = msg;
    return e;
}

static StoreError local_fault(const std::string& msg) {
    // A broken backing directory looks like a failing server to the caller.
    return service_error(500, "InternalError", msg);
}

FsObjectStore::FsObjectStore(fs::path root, const Clock& clock)
    : FsObjectStore(std::move(root), clock, Options{}) {}

FsObjectStore::FsObjectStore(fs::path root, const Clock& clock, Options options)
    : root_(std::move(root)), clock_(clock), options_(options) {}

// ── Paths ───────────────────────────────────────────────────

fs::path FsObjectStore::object_path(const std::string& key) const {
    return root_ / "objects" / escape_key(key);
}

fs::path FsObjectStore::meta_path(const std::string& key) const {
    return root_ / "objects" / (escape_key(key) + ".meta.yaml");
}

fs::path FsObjectStore::incoming_path(const std::string& key) const {
    return root_ / "incoming" / escape_key(key);
}

// ── Metadata ────────────────────────────────────────────────

bool FsObjectStore::load_meta(const std::string& key, Meta& out, StoreError& err) const {
    fs::path p = meta_path(key);
    if (!fs::exists(p)) {
        err = service_error(404, CODE_NO_SUCH_KEY, "no such key: " + key);
        return false;
    }
    try {
        YAML::Node root = YAML::LoadFile(p.string());
        out.size_bytes = root["size_bytes"].as<uint64_t>(0);
        if (!parse_storage_class(root["storage_class"].as<std::string>("STANDARD"),
                                 out.storage_class)) {
            err = local_fault("bad storage class in " + p.string());
            return false;
        }
        out.restore_ready_at = root["restore_ready_at"].as<std::string>("");
        out.restore_expires_at = root["restore_expires_at"].as<std::string>("");
    } catch (const std::exception& e) {
        err = local_fault(fmt::format("unreadable metadata {}: {}", p.string(), e.what()));
        return false;
    }
    return true;
}

StoreError FsObjectStore::save_meta(const std::string& key, const Meta& meta) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "key" << YAML::Value << key;
    out << YAML::Key << "size_bytes" << YAML::Value << meta.size_bytes;
    out << YAML::Key << "storage_class" << YAML::Value << to_string(meta.storage_class);
    out << YAML::Key << "restore_ready_at" << YAML::Value << meta.restore_ready_at;
    out << YAML::Key << "restore_expires_at" << YAML::Value << meta.restore_expires_at;
    out << YAML::EndMap;

    auto r = platform::write_file_atomic(meta_path(key), out.c_str());
    if (r.is_err()) return local_fault(r.error);
    return StoreError{};
}

RestoreStatus FsObjectStore::restore_status(const Meta& meta) const {
    if (meta.restore_ready_at.empty()) return RestoreStatus::None;
    auto ready = parse_iso_utc(meta.restore_ready_at);
    auto expires = parse_iso_utc(meta.restore_expires_at);
    if (!ready || !expires) return RestoreStatus::None;

    TimePoint now = clock_.now();
    if (now < *ready) return RestoreStatus::Ongoing;
    if (now < *expires) return RestoreStatus::Restored;
    return RestoreStatus::None;
}

std::chrono::seconds FsObjectStore::restore_delay(RestoreTier tier) const {
    switch (tier) {
        case RestoreTier::Expedited: return options_.expedited_delay;
        case RestoreTier::Standard:  return options_.standard_delay;
        case RestoreTier::Bulk:      return options_.bulk_delay;
    }
    return options_.bulk_delay;
}

// ── Operations ──────────────────────────────────────────────

// Copy one request body into `sink` at `offset`. An empty message means success.
static StoreError copy_body(ByteSource& source, ByteSink& sink, uint64_t offset,
                            uint64_t length) {
    std::vector<char> buf(FILE_COPY_BUF_SIZE);
    uint64_t done = 0;
    while (done < length) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), length - done));
        auto n = source.read_at(offset + done, buf.data(), want);
        if (n.is_err()) {
            // The request body could not be produced; nothing was stored.
            StoreError e;
            e.kind = StoreFailure::Construction;
            e.message = "reading request body: " + n.error;
            return e;
        }
        if (n.value == 0) {
            StoreError e;
            e.kind = StoreFailure::Construction;
            e.message = fmt::format("request body ended after {} of {} bytes", done, length);
            return e;
        }
        auto w = sink.write_at(offset + done, buf.data(), n.value);
        if (w.is_err()) return local_fault(w.error);
        done += n.value;
    }
    return StoreError{};
}

StoreResult<Ack> FsObjectStore::rewrite_published(const std::string& key, ByteSource& source,
                                                  uint64_t offset, uint64_t length) {
    auto sink_r = FileSink::open(object_path(key));
    if (sink_r.is_err()) return StoreResult<Ack>::Err(local_fault(sink_r.error));
    auto sink = std::move(sink_r.value);

    StoreError err = copy_body(source, *sink, offset, length);
    if (!err.message.empty()) return StoreResult<Ack>::Err(err);
    auto s = sink->sync();
    if (s.is_err()) return StoreResult<Ack>::Err(local_fault(s.error));

    coldxfer_log(fmt::format("fs_store: rewrote {}+{} of published {}", offset, length, key));
    return StoreResult<Ack>::Ok(Ack{fmt::format("{}-{}", offset, offset + length)});
}

StoreResult<Ack> FsObjectStore::put_object(const std::string& key, ByteSource& source,
                                           uint64_t offset, uint64_t length,
                                           uint64_t total_size, StorageClass storage_class) {
    if (key.empty()) {
        StoreError e;
        e.kind = StoreFailure::Construction;
        e.message = "empty object key";
        return StoreResult<Ack>::Err(e);
    }
    if (offset + length > total_size) {
        return StoreResult<Ack>::Err(service_error(400, "InvalidRange",
            fmt::format("range {}+{} past object size {}", offset, length, total_size)));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    fs::path incoming = incoming_path(key);
    std::error_code ec;
    if (offset > 0 && !fs::exists(incoming, ec)) {
        // The final range already published the object and the sender did not
        // see the ack: a resent range overwrites the published bytes.
        Meta meta;
        StoreError missing;
        if (load_meta(key, meta, missing) && meta.size_bytes == total_size) {
            return rewrite_published(key, source, offset, length);
        }
    }

    auto sink_r = FileSink::open(incoming);
    if (sink_r.is_err()) return StoreResult<Ack>::Err(local_fault(sink_r.error));
    auto sink = std::move(sink_r.value);

    auto have = sink->size();
    if (have.is_err()) return StoreResult<Ack>::Err(local_fault(have.error));
    if (offset > have.value) {
        return StoreResult<Ack>::Err(service_error(400, "InvalidPartOrder",
            fmt::format("range starts at {} but only {} bytes received", offset, have.value)));
    }

    StoreError copy_err = copy_body(source, *sink, offset, length);
    if (!copy_err.message.empty()) return StoreResult<Ack>::Err(copy_err);

    auto t = sink->truncate(offset + length);
    if (t.is_err()) return StoreResult<Ack>::Err(local_fault(t.error));
    auto s = sink->sync();
    if (s.is_err()) return StoreResult<Ack>::Err(local_fault(s.error));

    if (offset + length == total_size) {
        sink.reset();
        auto mv = platform::rename_durable(incoming, object_path(key));
        if (mv.is_err()) return StoreResult<Ack>::Err(local_fault(mv.error));

        Meta meta;
        meta.size_bytes = total_size;
        meta.storage_class = storage_class;
        StoreError err = save_meta(key, meta);
        if (!err.message.empty()) return StoreResult<Ack>::Err(err);
        coldxfer_log(fmt::format("fs_store: published {} ({} bytes, {})",
                                 key, total_size, to_string(storage_class)));
    }

    return StoreResult<Ack>::Ok(Ack{fmt::format("{}-{}", offset, offset + length)});
}

StoreResult<std::string> FsObjectStore::get_object_range(const std::string& key,
                                                         uint64_t offset, uint64_t length) {
    std::lock_guard<std::mutex> lock(mutex_);

    Meta meta;
    StoreError err;
    if (!load_meta(key, meta, err)) return StoreResult<std::string>::Err(err);

    if (requires_restore(meta.storage_class) &&
        restore_status(meta) != RestoreStatus::Restored) {
        return StoreResult<std::string>::Err(service_error(403, CODE_INVALID_OBJECT_STATE,
            "object is archived and has no restored copy: " + key));
    }
    if (offset > meta.size_bytes || (offset == meta.size_bytes && length > 0)) {
        return StoreResult<std::string>::Err(service_error(416, "InvalidRange",
            fmt::format("offset {} beyond object size {}", offset, meta.size_bytes)));
    }

    auto src_r = FileSource::open(object_path(key));
    if (src_r.is_err()) return StoreResult<std::string>::Err(local_fault(src_r.error));

    uint64_t n = std::min<uint64_t>(length, meta.size_bytes - offset);
    std::string out;
    auto r = src_r.value->read_exact(offset, static_cast<size_t>(n), out);
    if (r.is_err()) return StoreResult<std::string>::Err(local_fault(r.error));
    return StoreResult<std::string>::Ok(std::move(out));
}

StoreResult<ObjectInfo> FsObjectStore::head_object(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    Meta meta;
    StoreError err;
    if (!load_meta(key, meta, err)) return StoreResult<ObjectInfo>::Err(err);

    ObjectInfo info;
    info.size_bytes = meta.size_bytes;
    info.storage_class = meta.storage_class;
    info.restore_status = requires_restore(meta.storage_class)
        ? restore_status(meta) : RestoreStatus::None;
    if (info.restore_status == RestoreStatus::Restored) {
        info.restore_expiry = meta.restore_expires_at;
    }
    return StoreResult<ObjectInfo>::Ok(info);
}

StoreResult<Ack> FsObjectStore::restore_object(const std::string& key, RestoreTier tier,
                                               int days) {
    std::lock_guard<std::mutex> lock(mutex_);

    Meta meta;
    StoreError err;
    if (!load_meta(key, meta, err)) return StoreResult<Ack>::Err(err);

    if (!requires_restore(meta.storage_class)) {
        return StoreResult<Ack>::Err(service_error(403, CODE_INVALID_OBJECT_STATE,
            fmt::format("{} is {} and cannot be restored", key, to_string(meta.storage_class))));
    }
    if (restore_status(meta) == RestoreStatus::Ongoing) {
        return StoreResult<Ack>::Err(service_error(409, CODE_RESTORE_IN_PROGRESS,
            "restore already in progress for " + key));
    }

    TimePoint ready = clock_.now() + restore_delay(tier);
    meta.restore_ready_at = to_iso_utc(ready);
    meta.restore_expires_at = to_iso_utc(ready + std::chrono::hours(24) * days);
    err = save_meta(key, meta);
    if (!err.message.empty()) return StoreResult<Ack>::Err(err);

    coldxfer_log(fmt::format("fs_store: restore of {} accepted ({}, ready {})",
                             key, to_string(tier), meta.restore_ready_at));
    return StoreResult<Ack>::Ok(Ack{});
}

StoreResult<Ack> FsObjectStore::set_storage_class(const std::string& key,
                                                  StorageClass storage_class) {
    std::lock_guard<std::mutex> lock(mutex_);

    Meta meta;
    StoreError err;
    if (!load_meta(key, meta, err)) return StoreResult<Ack>::Err(err);

    meta.storage_class = storage_class;
    meta.restore_ready_at.clear();
    meta.restore_expires_at.clear();
    err = save_meta(key, meta);
    if (!err.message.empty()) return StoreResult<Ack>::Err(err);
    return StoreResult<Ack>::Ok(Ack{});
}
