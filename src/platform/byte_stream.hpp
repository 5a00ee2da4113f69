#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <core/types.hpp>

// Seekable, read-only view of a transfer's payload (upload source).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    // Read up to `len` bytes at `offset`. Returns the number read; short only at EOF.
    virtual Result<size_t> read_at(uint64_t offset, char* buf, size_t len) = 0;

    // Read exactly `len` bytes at `offset` into `out`.
    Result<void> read_exact(uint64_t offset, size_t len, std::string& out);
};

// Positional writer with an explicit durability point (download destination).
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual Result<void> write_at(uint64_t offset, const char* buf, size_t len) = 0;
    virtual Result<void> truncate(uint64_t size) = 0;
    // Bytes written before sync() returns are durable.
    virtual Result<void> sync() = 0;
    virtual Result<uint64_t> size() const = 0;
};

// In-memory bytes positioned at `base_offset` of a larger stream; used to hand
// an already-read chunk to the store without reading the source twice.
class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::string data, uint64_t base_offset = 0)
        : data_(std::move(data)), base_(base_offset) {}

    uint64_t size() const override { return base_ + data_.size(); }
    Result<size_t> read_at(uint64_t offset, char* buf, size_t len) override;

private:
    std::string data_;
    uint64_t base_;
};

// ── POSIX file implementations ──────────────────────────────

class FileSource : public ByteSource {
public:
    static Result<std::unique_ptr<ByteSource>> open(const std::filesystem::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    uint64_t size() const override { return size_; }
    Result<size_t> read_at(uint64_t offset, char* buf, size_t len) override;

private:
    FileSource(int fd, uint64_t size, std::filesystem::path path);

    int fd_;
    uint64_t size_;
    std::filesystem::path path_;
};

class FileSink : public ByteSink {
public:
    // Opens (creating if needed) without truncating, so a resumed download
    // keeps the bytes it already flushed.
    static Result<std::unique_ptr<ByteSink>> open(const std::filesystem::path& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    Result<void> write_at(uint64_t offset, const char* buf, size_t len) override;
    Result<void> truncate(uint64_t size) override;
    Result<void> sync() override;
    Result<uint64_t> size() const override;

private:
    FileSink(int fd, std::filesystem::path path);

    int fd_;
    std::filesystem::path path_;
};
