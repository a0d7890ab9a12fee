#pragma once

#include <onyx/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace onyx::downloader {

/**
 * Destination file shared by all workers of one task.
 *
 * Writes are positional (pwrite), so workers holding disjoint ranges need no locking.
 * The descriptor is closed when the object is destroyed.
 */
class OutputFile {
public:
    enum class Mode {
        Truncate, // fresh download: create or empty the file
        Preserve  // resume: keep existing bytes
    };

    static Expected<std::unique_ptr<OutputFile>> open(const std::filesystem::path& path, Mode mode);

    ~OutputFile();
    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    Expected<void> writeAt(std::uint64_t offset, std::span<const std::byte> data);

    /**
     * Grow the file to at least size bytes (sparse where the filesystem allows).
     */
    Expected<void> preallocate(std::uint64_t size);

    Expected<void> truncate(std::uint64_t size);

    /**
     * Flush written data to stable storage (fdatasync).
     */
    Expected<void> sync();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    OutputFile(std::filesystem::path path, int fd) : path_(std::move(path)), fd_(fd) {}

    std::filesystem::path path_;
    int fd_{-1};
};

/**
 * Best-effort removal of a file; failures are logged at debug level.
 */
void removeFile(const std::filesystem::path& path) noexcept;

/**
 * fsync a closed file by path (used for files written through streams).
 */
Expected<void> syncFile(const std::filesystem::path& path);

/**
 * fsync a directory so renames and new entries inside it are durable.
 */
Expected<void> syncDirectory(const std::filesystem::path& dir);

} // namespace onyx::downloader
