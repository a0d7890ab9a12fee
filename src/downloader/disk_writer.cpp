/*
 * onyx/src/downloader/disk_writer.cpp
 *
 * Destination file writer:
 * - One descriptor per task, shared read-write by every worker of that task
 * - Positional writes (pwrite) at chunk offsets; no byte-range locking needed
 * - Sparse preallocation to the expected size for multi-part transfers
 * - fdatasync before resume records are persisted, so a record never describes
 *   bytes that are not on disk
 */

#include <onyx/downloader/disk_writer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace onyx::downloader {

namespace fs = std::filesystem;

namespace {

Error make_errno_error(int err, std::string_view what, const fs::path& p) {
    std::string msg(what);
    msg += " (";
    msg += std::error_code(err, std::generic_category()).message();
    msg += "): ";
    msg += p.string();
    return Error{ErrorKind::DiskError, std::move(msg)};
}

} // namespace

Expected<std::unique_ptr<OutputFile>> OutputFile::open(const fs::path& path, Mode mode) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorKind::DiskError, "Failed to create directory " +
                                                   path.parent_path().string() + ": " +
                                                   ec.message()};
        }
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (mode == Mode::Truncate)
        flags |= O_TRUNC;

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) {
        return make_errno_error(errno, "open() failed", path);
    }
    spdlog::debug("OutputFile: opened {} ({})", path.string(),
                  mode == Mode::Truncate ? "truncate" : "preserve");
    return std::unique_ptr<OutputFile>(new OutputFile(path, fd));
}

OutputFile::~OutputFile() {
    if (fd_ >= 0 && ::close(fd_) != 0) {
        spdlog::debug("OutputFile: close() failed for {}: {}", path_.string(),
                      std::error_code(errno, std::generic_category()).message());
    }
}

Expected<void> OutputFile::writeAt(std::uint64_t offset, std::span<const std::byte> data) {
    const auto* p = reinterpret_cast<const char*>(data.data());
    std::size_t remaining = data.size();
    auto pos = static_cast<off_t>(offset);
    while (remaining > 0) {
        ssize_t n = ::pwrite(fd_, p, remaining, pos);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return make_errno_error(errno, "pwrite() failed", path_);
        }
        p += n;
        pos += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return Expected<void>{};
}

Expected<void> OutputFile::preallocate(std::uint64_t size) {
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        return make_errno_error(errno, "fstat() failed", path_);
    }
    if (static_cast<std::uint64_t>(st.st_size) >= size)
        return Expected<void>{};
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return make_errno_error(errno, "ftruncate() failed", path_);
    }
    return Expected<void>{};
}

Expected<void> OutputFile::truncate(std::uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        return make_errno_error(errno, "ftruncate() failed", path_);
    }
    return Expected<void>{};
}

Expected<void> OutputFile::sync() {
#if defined(__APPLE__)
    if (::fsync(fd_) != 0) {
#else
    if (::fdatasync(fd_) != 0) {
#endif
        return make_errno_error(errno, "fdatasync() failed", path_);
    }
    return Expected<void>{};
}

void removeFile(const fs::path& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        spdlog::debug("removeFile: failed to remove {}: {}", path.string(), ec.message());
    }
}

Expected<void> syncFile(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error(errno, "open() failed", path);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return make_errno_error(err, "fsync() failed", path);
    }
    ::close(fd);
    return Expected<void>{};
}

Expected<void> syncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error(errno, "open(O_DIRECTORY) failed", dir);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return make_errno_error(err, "fsync(dir) failed", dir);
    }
    ::close(fd);
    return Expected<void>{};
}

} // namespace onyx::downloader
