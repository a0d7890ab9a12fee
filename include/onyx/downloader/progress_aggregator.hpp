#pragma once

#include <onyx/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace onyx::downloader {

/**
 * Per-task progress state shared by the workers of one task.
 *
 * Workers report absolute per-chunk byte counts; subscribers receive ProgressEvents no more
 * often than the configured interval, plus forced events on stage changes.
 */
class ProgressAggregator {
public:
    ProgressAggregator(std::string url, std::chrono::milliseconds interval);

    void subscribe(ProgressCallback cb);

    /**
     * Start a (re)plan. Chunks carry the bytes already present on disk from a previous run.
     */
    void reset(const std::vector<Chunk>& chunks, std::optional<std::uint64_t> total);

    /**
     * Record that chunk idx now holds bytesWritten bytes, received bytes of which arrived
     * over the network in this call.
     */
    void update(std::size_t idx, std::uint64_t bytesWritten, std::uint64_t received);

    /// Single-stream restart from offset 0: the chunk's bytes no longer count.
    void rewind(std::size_t idx);

    void setTotal(std::optional<std::uint64_t> total);
    void setStage(ProgressStage stage);

    void workerStarted();
    void workerFinished();

    /**
     * Emit an event if the cadence allows it (always when force is set). Subscribers run
     * without the state lock held; an unforced call returns at once while another thread is
     * delivering.
     */
    void publish(bool force = false);

    [[nodiscard]] ProgressEvent snapshot() const;
    [[nodiscard]] std::uint64_t downloadedBytes() const;
    [[nodiscard]] std::uint64_t receivedBytes() const noexcept { return received_.load(); }
    [[nodiscard]] int activeWorkers() const noexcept { return active_.load(); }
    [[nodiscard]] int peakWorkers() const noexcept { return peak_.load(); }

private:
    ProgressEvent snapshotLocked() const;

    std::string url_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::mutex emitMutex_; // held while subscribers run
    std::vector<ProgressCallback> subscribers_;
    std::unique_ptr<std::atomic<std::uint64_t>[]> chunkBytes_;
    std::size_t chunkCount_{0};
    std::optional<std::uint64_t> total_{};
    ProgressStage stage_{ProgressStage::Resolving};
    std::chrono::steady_clock::time_point started_{std::chrono::steady_clock::now()};
    std::chrono::steady_clock::time_point lastEmit_{};

    std::atomic<std::uint64_t> received_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

} // namespace onyx::downloader
