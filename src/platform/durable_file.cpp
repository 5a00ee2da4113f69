#include "durable_file.hpp"
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

static std::string errno_text(const std::string& what, const fs::path& path) {
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

Result<void> fsync_dir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return Result<void>::Err(errno_text("open dir", dir));
    int rc = ::fsync(fd);
    std::string err = rc != 0 ? errno_text("fsync dir", dir) : "";
    ::close(fd);
    if (rc != 0) return Result<void>::Err(err);
    return Result<void>::Ok();
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("create {}: {}", path.parent_path().string(),
                                             ec.message()));
    }

    fs::path tmp = path;
    tmp += fmt::format(".tmp.{}", ::getpid());

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return Result<void>::Err(errno_text("open", tmp));

    const char* p = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = errno_text("write", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            return Result<void>::Err(err);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::string err = errno_text("fsync", tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return Result<void>::Err(err);
    }
    if (::close(fd) != 0) {
        std::string err = errno_text("close", tmp);
        ::unlink(tmp.c_str());
        return Result<void>::Err(err);
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        std::string err = errno_text("rename", tmp);
        ::unlink(tmp.c_str());
        return Result<void>::Err(err);
    }
    return fsync_dir(path.parent_path());
}

Result<std::string> read_file(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return Result<std::string>::Err(errno_text("open", path));

    std::string out;
    char buf[8192];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string err = errno_text("read", path);
            ::close(fd);
            return Result<std::string>::Err(err);
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return Result<std::string>::Ok(std::move(out));
}

Result<void> remove_durable(const fs::path& path) {
    if (::unlink(path.c_str()) != 0) {
        if (errno == ENOENT) return Result<void>::Ok();
        return Result<void>::Err(errno_text("unlink", path));
    }
    return fsync_dir(path.parent_path());
}

Result<void> rename_durable(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("create {}: {}", to.parent_path().string(),
                                             ec.message()));
    }
    if (::rename(from.c_str(), to.c_str()) != 0) {
        return Result<void>::Err(errno_text("rename", from));
    }
    auto r = fsync_dir(to.parent_path());
    if (r.is_err()) return r;
    if (from.parent_path() != to.parent_path()) return fsync_dir(from.parent_path());
    return Result<void>::Ok();
}

} // namespace platform
