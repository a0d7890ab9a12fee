#pragma once

#include <onyx/downloader/downloader.hpp>

#include <cstdint>
#include <vector>

namespace onyx::downloader {

/**
 * Number of chunks a resource of expectedSize is split into for the requested worker count.
 * Never yields chunks smaller than minChunkBytes (except a single chunk for small resources).
 */
[[nodiscard]] int effectiveWorkerCount(std::uint64_t expectedSize, int workerCount,
                                       std::uint64_t minChunkBytes) noexcept;

/**
 * Partition [0, expectedSize) into contiguous chunks; the last chunk absorbs the remainder.
 * Identical inputs always produce identical boundaries.
 */
[[nodiscard]] std::vector<Chunk> planChunks(std::uint64_t expectedSize, int workerCount,
                                            std::uint64_t minChunkBytes);

/**
 * Single chunk covering the whole resource; open-ended when the size is unknown.
 */
[[nodiscard]] std::vector<Chunk> planSingleStream(std::optional<std::uint64_t> expectedSize);

/**
 * True when chunks form a gap-free, non-overlapping partition of [0, expectedSize) and no
 * chunk claims more bytes than it spans.
 */
[[nodiscard]] bool isValidPartition(const std::vector<Chunk>& chunks,
                                    std::uint64_t expectedSize) noexcept;

/**
 * True when both plans have the same chunk boundaries (progress is ignored).
 */
[[nodiscard]] bool sameBoundaries(const std::vector<Chunk>& a,
                                  const std::vector<Chunk>& b) noexcept;

} // namespace onyx::downloader
