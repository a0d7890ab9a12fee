#pragma once

#include <onyx/downloader/downloader.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace onyx::downloader {

class OutputFile;
class ProgressAggregator;
class ResumeTracker;

/**
 * Per-task transfer parameters shared by every worker.
 */
struct TransferContext {
    std::string url;
    RequestOptions request{};
    RetryPolicy retry{};
    bool supportsRange{false};
    bool multiPart{false};                 // every chunk request carries a Range header
    std::optional<std::uint64_t> maxBytes; // enforced while streaming when the size is unknown
    std::optional<HashAlgo> digestAlgo;    // algorithm of the streaming digest, if any
};

enum class WorkerState { Pending, Connecting, Streaming, Complete, Failed };

/**
 * Streams one chunk into the destination file, retrying transient failures with backoff.
 *
 * Resumes at chunk.nextOffset() with a Range request when the server supports ranges;
 * otherwise a partially streamed chunk restarts from offset 0.
 */
class ChunkWorker {
public:
    ChunkWorker(IHttpAdapter& http, OutputFile& file, const TransferContext& ctx,
                ProgressAggregator& progress, ResumeTracker* tracker = nullptr,
                IIntegrityVerifier* digest = nullptr);

    Expected<void> run(Chunk& chunk, const ShouldCancel& shouldCancel);

    [[nodiscard]] WorkerState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::optional<long> lastHttpStatus() const noexcept { return lastHttpStatus_; }

private:
    Expected<void> attempt(Chunk& chunk, const ShouldCancel& shouldCancel);
    void restartFromZero(Chunk& chunk);

    IHttpAdapter& http_;
    OutputFile& file_;
    const TransferContext& ctx_;
    ProgressAggregator& progress_;
    ResumeTracker* tracker_;
    IIntegrityVerifier* digest_;

    std::atomic<WorkerState> state_{WorkerState::Pending};
    std::optional<long> lastHttpStatus_{};
};

/**
 * Runs the chunks of one task on at most workerCount threads. The first chunk that stays
 * Failed stops the others (cooperative cancellation) and its error is returned.
 */
class WorkerPool {
public:
    WorkerPool(IHttpAdapter& http, OutputFile& file, ProgressAggregator& progress,
               ResumeTracker* tracker = nullptr, IIntegrityVerifier* digest = nullptr);

    Expected<void> run(std::vector<Chunk>& chunks, const TransferContext& ctx, int workerCount,
                       const ShouldCancel& shouldCancel = {});

    /// Highest number of chunks streamed at the same time during the last run().
    [[nodiscard]] int peakConcurrency() const noexcept { return peak_.load(); }

    /**
     * Replace how worker threads are started (std::thread by default). A launcher that
     * throws std::system_error is treated like thread exhaustion: run() continues on the
     * threads already started, or fails with ErrorKind::Unknown if there are none.
     */
    using ThreadLauncher = std::function<std::thread(std::function<void()>)>;
    void setThreadLauncher(ThreadLauncher launch) { launch_ = std::move(launch); }

private:
    IHttpAdapter& http_;
    OutputFile& file_;
    ProgressAggregator& progress_;
    ResumeTracker* tracker_;
    IIntegrityVerifier* digest_;

    std::atomic<int> peak_{0};
    ThreadLauncher launch_;
};

} // namespace onyx::downloader
