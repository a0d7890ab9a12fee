/*
 * onyx/src/downloader/chunk_planner.cpp
 *
 * Splits a resource of known size into per-worker byte ranges. The plan is a pure
 * function of (size, workerCount, minChunkBytes): resume relies on replanning
 * reproducing the boundaries stored in a ResumeRecord.
 */

#include <onyx/downloader/chunk_planner.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace onyx::downloader {

int effectiveWorkerCount(std::uint64_t expectedSize, int workerCount,
                         std::uint64_t minChunkBytes) noexcept {
    const auto requested = static_cast<std::uint64_t>(std::max(1, workerCount));
    if (minChunkBytes == 0)
        minChunkBytes = 1;
    if (expectedSize >= requested * minChunkBytes)
        return static_cast<int>(requested);
    return static_cast<int>(std::max<std::uint64_t>(1, expectedSize / minChunkBytes));
}

std::vector<Chunk> planChunks(std::uint64_t expectedSize, int workerCount,
                              std::uint64_t minChunkBytes) {
    const int n = effectiveWorkerCount(expectedSize, workerCount, minChunkBytes);
    const std::uint64_t base = expectedSize / static_cast<std::uint64_t>(n);

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        Chunk c;
        c.id = static_cast<std::uint32_t>(i);
        c.startOffset = base * static_cast<std::uint64_t>(i);
        c.endOffset = (i == n - 1) ? expectedSize : c.startOffset + base;
        chunks.push_back(c);
    }

    if (n != workerCount) {
        spdlog::debug("ChunkPlanner: {} bytes -> {} chunk(s) (requested {})", expectedSize, n,
                      workerCount);
    }
    return chunks;
}

std::vector<Chunk> planSingleStream(std::optional<std::uint64_t> expectedSize) {
    Chunk c;
    c.id = 0;
    c.startOffset = 0;
    c.endOffset = expectedSize ? *expectedSize : kOpenEndedOffset;
    return {c};
}

bool isValidPartition(const std::vector<Chunk>& chunks, std::uint64_t expectedSize) noexcept {
    if (chunks.empty())
        return false;
    std::uint64_t cursor = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& c = chunks[i];
        if (c.id != i || c.startOffset != cursor || c.endOffset < c.startOffset ||
            c.openEnded())
            return false;
        if (c.bytesWritten > c.endOffset - c.startOffset)
            return false;
        cursor = c.endOffset;
    }
    return cursor == expectedSize;
}

bool sameBoundaries(const std::vector<Chunk>& a, const std::vector<Chunk>& b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](const Chunk& x, const Chunk& y) {
        return x.id == y.id && x.startOffset == y.startOffset && x.endOffset == y.endOffset;
    });
}

} // namespace onyx::downloader
