#pragma once

#include <onyx/downloader/downloader.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

namespace onyx::downloader {

class OutputFile;

/**
 * JSON encoding of a ResumeRecord (one document per task).
 */
[[nodiscard]] nlohmann::json resumeRecordToJson(const ResumeRecord& record);

/**
 * Decode and structurally validate a record. Returns nullopt for malformed documents or
 * documents whose chunks do not partition [0, expected_size).
 */
[[nodiscard]] std::optional<ResumeRecord> resumeRecordFromJson(const nlohmann::json& j);

/**
 * Single-writer front end for one task's ResumeRecord.
 *
 * Workers report chunk progress concurrently; updates are merged monotonically under one
 * mutex and persisted when a size or time threshold is crossed. The destination file is
 * synced before every save so the record never claims bytes that are not on disk.
 */
class ResumeTracker {
public:
    struct Policy {
        std::uint64_t persistEveryBytes{1024ull * 1024ull};
        std::chrono::milliseconds persistInterval{1000};
    };

    ResumeTracker(IResumeStore& store, ResumeRecord record, OutputFile& file, Policy policy);

    /**
     * Merge a worker's view of its chunk. bytesWritten never decreases unless reset is true
     * (single-stream restart from offset 0).
     */
    void update(const Chunk& chunk, bool force = false, bool reset = false);

    /**
     * Persist the current record unconditionally.
     */
    Expected<void> flush();

    [[nodiscard]] ResumeRecord snapshot() const;

private:
    Expected<void> persistLocked();

    IResumeStore& store_;
    OutputFile& file_;
    Policy policy_;

    mutable std::mutex mutex_;
    ResumeRecord record_;
    std::vector<std::uint64_t> persistedBytes_;
    std::chrono::steady_clock::time_point lastSave_;
};

} // namespace onyx::downloader
