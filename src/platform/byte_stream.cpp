#include "byte_stream.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string errno_text(const std::string& what, const fs::path& path) {
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

Result<void> ByteSource::read_exact(uint64_t offset, size_t len, std::string& out) {
    out.resize(len);
    size_t done = 0;
    while (done < len) {
        auto r = read_at(offset + done, &out[done], len - done);
        if (r.is_err()) return Result<void>::Err(r.error);
        if (r.value == 0) {
            return Result<void>::Err(fmt::format(
                "source ended at {} bytes, expected {}", offset + done, offset + len));
        }
        done += r.value;
    }
    return Result<void>::Ok();
}

// ── MemorySource ────────────────────────────────────────────

Result<size_t> MemorySource::read_at(uint64_t offset, char* buf, size_t len) {
    if (offset < base_) {
        return Result<size_t>::Err(fmt::format(
            "read at {} before buffered range starting at {}", offset, base_));
    }
    uint64_t rel = offset - base_;
    if (rel >= data_.size()) return Result<size_t>::Ok(0);
    size_t n = static_cast<size_t>(std::min<uint64_t>(len, data_.size() - rel));
    std::memcpy(buf, data_.data() + rel, n);
    return Result<size_t>::Ok(n);
}

// ── FileSource ──────────────────────────────────────────────

FileSource::FileSource(int fd, uint64_t size, fs::path path)
    : fd_(fd), size_(size), path_(std::move(path)) {}

FileSource::~FileSource() {
    if (fd_ >= 0) ::close(fd_);
}

Result<std::unique_ptr<ByteSource>> FileSource::open(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::unique_ptr<ByteSource>>::Err(errno_text("open", path));
    }
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        std::string err = errno_text("stat", path);
        ::close(fd);
        return Result<std::unique_ptr<ByteSource>>::Err(err);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return Result<std::unique_ptr<ByteSource>>::Err(
            fmt::format("{} is not a regular file", path.string()));
    }
    std::unique_ptr<ByteSource> src(new FileSource(fd, static_cast<uint64_t>(st.st_size), path));
    return Result<std::unique_ptr<ByteSource>>::Ok(std::move(src));
}

Result<size_t> FileSource::read_at(uint64_t offset, char* buf, size_t len) {
    while (true) {
        ssize_t n = ::pread(fd_, buf, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<size_t>::Err(errno_text("read", path_));
        }
        return Result<size_t>::Ok(static_cast<size_t>(n));
    }
}

// ── FileSink ────────────────────────────────────────────────

FileSink::FileSink(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

FileSink::~FileSink() {
    if (fd_ >= 0) ::close(fd_);
}

Result<std::unique_ptr<ByteSink>> FileSink::open(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<std::unique_ptr<ByteSink>>::Err(
            fmt::format("create {}: {}", path.parent_path().string(), ec.message()));
    }
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<std::unique_ptr<ByteSink>>::Err(errno_text("open", path));
    }
    std::unique_ptr<ByteSink> sink(new FileSink(fd, path));
    return Result<std::unique_ptr<ByteSink>>::Ok(std::move(sink));
}

Result<void> FileSink::write_at(uint64_t offset, const char* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(errno_text("write", path_));
        }
        done += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<void> FileSink::truncate(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return Result<void>::Err(errno_text("truncate", path_));
    }
    return Result<void>::Ok();
}

Result<void> FileSink::sync() {
    if (::fsync(fd_) != 0) {
        return Result<void>::Err(errno_text("fsync", path_));
    }
    return Result<void>::Ok();
}

Result<uint64_t> FileSink::size() const {
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        return Result<uint64_t>::Err(errno_text("stat", path_));
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(st.st_size));
}
