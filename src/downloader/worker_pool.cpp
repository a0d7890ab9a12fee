/*
 * onyx/src/downloader/worker_pool.cpp
 *
 * Chunk workers and the per-task pool:
 * - Pending -> Connecting -> Streaming -> Complete, or Failed from any non-terminal state
 * - a Range request resumes a chunk at start + bytes_written
 * - a 200 answer to a ranged request surfaces as RangeUnsupported (the manager downgrades)
 * - retryable failures back off exponentially; cancellation is observed between writes
 *   and during backoff
 * - progress is reported per chunk; resume state is merged through the ResumeTracker
 */

#include <onyx/downloader/disk_writer.hpp>
#include <onyx/downloader/progress_aggregator.hpp>
#include <onyx/downloader/resume_store.hpp>
#include <onyx/downloader/retry.hpp>
#include <onyx/downloader/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace onyx::downloader {

namespace {

// Keeps the aggregator's active-worker count balanced on every exit path
class ActiveWorkerGuard {
public:
    ActiveWorkerGuard(ProgressAggregator& progress, std::atomic<int>& active,
                      std::atomic<int>& peak)
        : progress_(progress), active_(active) {
        progress_.workerStarted();
        const int now = active_.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
    }
    ~ActiveWorkerGuard() {
        active_.fetch_sub(1);
        progress_.workerFinished();
    }
    ActiveWorkerGuard(const ActiveWorkerGuard&) = delete;
    ActiveWorkerGuard& operator=(const ActiveWorkerGuard&) = delete;

private:
    ProgressAggregator& progress_;
    std::atomic<int>& active_;
};

} // namespace

ChunkWorker::ChunkWorker(IHttpAdapter& http, OutputFile& file, const TransferContext& ctx,
                         ProgressAggregator& progress, ResumeTracker* tracker,
                         IIntegrityVerifier* digest)
    : http_(http), file_(file), ctx_(ctx), progress_(progress), tracker_(tracker),
      digest_(digest) {}

void ChunkWorker::restartFromZero(Chunk& chunk) {
    spdlog::debug("Worker: {} does not support ranges, restarting chunk {} from 0", ctx_.url,
                  chunk.id);
    chunk.bytesWritten = 0;
    if (digest_ && ctx_.digestAlgo)
        digest_->reset(*ctx_.digestAlgo);
    progress_.rewind(chunk.id);
    if (tracker_)
        tracker_->update(chunk, /*force=*/false, /*reset=*/true);
}

Expected<void> ChunkWorker::attempt(Chunk& chunk, const ShouldCancel& shouldCancel) {
    if (chunk.done())
        return Expected<void>{};

    if (!ctx_.supportsRange && chunk.bytesWritten > 0)
        restartFromZero(chunk);

    const std::uint64_t offset = chunk.nextOffset();
    std::optional<ByteRange> range;
    if (ctx_.supportsRange && (ctx_.multiPart || offset > 0)) {
        ByteRange r;
        r.offset = offset;
        if (!chunk.openEnded())
            r.length = chunk.endOffset - offset;
        range = r;
    }

    state_ = WorkerState::Connecting;

    ResponseCallback onResponse = [&](const ResponseHead& head) -> Expected<void> {
        lastHttpStatus_ = head.httpStatus;
        if (range) {
            if (head.httpStatus != 206) {
                return Error{ErrorKind::RangeUnsupported,
                             "Server ignored Range request (HTTP " +
                                 std::to_string(head.httpStatus) + ")",
                             head.httpStatus};
            }
            if (head.rangeStart && *head.rangeStart != offset) {
                return Error{ErrorKind::RangeUnsupported,
                             "Server answered a different range (start " +
                                 std::to_string(*head.rangeStart) + ", wanted " +
                                 std::to_string(offset) + ")",
                             head.httpStatus};
            }
        }
        if (ctx_.maxBytes) {
            const auto declared = range ? head.instanceLength : head.contentLength;
            if (declared && *declared > *ctx_.maxBytes) {
                return Error{ErrorKind::SizeLimitExceeded,
                             "Declared size " + std::to_string(*declared) + " exceeds limit " +
                                 std::to_string(*ctx_.maxBytes),
                             head.httpStatus};
            }
        }
        state_ = WorkerState::Streaming;
        return Expected<void>{};
    };

    BodySink sink = [&](std::span<const std::byte> data) -> Expected<void> {
        auto bytes = data;
        if (!chunk.openEnded()) {
            const std::uint64_t remaining = chunk.endOffset - chunk.nextOffset();
            if (bytes.size() > remaining)
                bytes = bytes.first(static_cast<std::size_t>(remaining));
        } else if (ctx_.maxBytes && chunk.nextOffset() + bytes.size() > *ctx_.maxBytes) {
            return Error{ErrorKind::SizeLimitExceeded,
                         "Transfer exceeded size limit of " + std::to_string(*ctx_.maxBytes) +
                             " bytes"};
        }
        if (bytes.empty())
            return Expected<void>{};

        auto wr = file_.writeAt(chunk.nextOffset(), bytes);
        if (!wr.ok())
            return wr.error();
        if (digest_)
            digest_->update(bytes);

        chunk.bytesWritten += bytes.size();
        progress_.update(chunk.id, chunk.bytesWritten, bytes.size());
        progress_.publish();
        if (tracker_)
            tracker_->update(chunk);
        return Expected<void>{};
    };

    auto fr = http_.fetch(ctx_.url, ctx_.request, range, onResponse, sink, shouldCancel);
    if (!fr.ok()) {
        auto err = fr.error();
        if (!err.httpStatus && lastHttpStatus_)
            err.httpStatus = lastHttpStatus_;
        return err;
    }
    lastHttpStatus_ = fr.value().httpStatus;

    if (chunk.openEnded()) {
        chunk.endOffset = chunk.startOffset + chunk.bytesWritten;
    } else if (chunk.bytesWritten < chunk.size()) {
        return Error{ErrorKind::NetworkError,
                     "Connection closed early: chunk " + std::to_string(chunk.id) + " has " +
                         std::to_string(chunk.bytesWritten) + " of " +
                         std::to_string(chunk.size()) + " bytes"};
    }
    return Expected<void>{};
}

Expected<void> ChunkWorker::run(Chunk& chunk, const ShouldCancel& shouldCancel) {
    const int maxAttempts = std::max(1, ctx_.retry.maxAttempts);
    auto cancelled = [&] { return shouldCancel && shouldCancel(); };

    for (int attemptNo = 1;; ++attemptNo) {
        if (cancelled()) {
            chunk.status = ChunkStatus::Pending;
            if (tracker_)
                tracker_->update(chunk, /*force=*/true);
            return Error{ErrorKind::Cancelled, "Transfer cancelled"};
        }

        chunk.status = ChunkStatus::Active;
        ++chunk.attemptCount;
        auto r = attempt(chunk, shouldCancel);

        if (r.ok()) {
            chunk.status = ChunkStatus::Complete;
            state_ = WorkerState::Complete;
            if (tracker_)
                tracker_->update(chunk, /*force=*/true);
            progress_.publish();
            return r;
        }

        auto err = r.error();
        if (cancelled() && err.code != ErrorKind::DiskError) {
            err = Error{ErrorKind::Cancelled, "Transfer cancelled"};
        }

        const bool retry =
            isRetryable(err.code) && attemptNo < maxAttempts && err.code != ErrorKind::Cancelled;
        if (!retry) {
            chunk.status =
                err.code == ErrorKind::Cancelled ? ChunkStatus::Pending : ChunkStatus::Failed;
            state_ = err.code == ErrorKind::Cancelled ? WorkerState::Pending : WorkerState::Failed;
            if (tracker_)
                tracker_->update(chunk, /*force=*/true);
            if (err.code != ErrorKind::Cancelled) {
                spdlog::debug("Worker: chunk {} of {} failed after {} attempt(s): {}", chunk.id,
                              ctx_.url, attemptNo, err.message);
            }
            return err;
        }

        chunk.status = ChunkStatus::Pending;
        if (tracker_)
            tracker_->update(chunk, /*force=*/true);
        const auto delay = computeBackoff(ctx_.retry, attemptNo);
        spdlog::debug("Worker: chunk {} of {} attempt {}/{} failed ({}), retrying in {}ms",
                      chunk.id, ctx_.url, attemptNo, maxAttempts, err.message, delay.count());
        if (!sleepWithCancel(delay, shouldCancel)) {
            return Error{ErrorKind::Cancelled, "Transfer cancelled"};
        }
    }
}

WorkerPool::WorkerPool(IHttpAdapter& http, OutputFile& file, ProgressAggregator& progress,
                       ResumeTracker* tracker, IIntegrityVerifier* digest)
    : http_(http), file_(file), progress_(progress), tracker_(tracker), digest_(digest) {}

Expected<void> WorkerPool::run(std::vector<Chunk>& chunks, const TransferContext& ctx,
                               int workerCount, const ShouldCancel& shouldCancel) {
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (!chunks[i].done())
            pending.push_back(i);
        else
            chunks[i].status = ChunkStatus::Complete;
    }
    peak_ = 0;
    if (pending.empty())
        return Expected<void>{};

    const auto threads =
        std::min<std::size_t>(static_cast<std::size_t>(std::max(1, workerCount)), pending.size());

    std::atomic<std::size_t> next{0};
    std::atomic<bool> stop{false};
    std::atomic<int> active{0};
    std::mutex errMutex;
    std::optional<Error> firstError;

    ShouldCancel cancel = [&] { return stop.load() || (shouldCancel && shouldCancel()); };

    auto recordError = [&](Error err) {
        std::lock_guard<std::mutex> lk(errMutex);
        // A real failure outranks the Cancelled errors it causes in sibling workers
        if (!firstError || (firstError->code == ErrorKind::Cancelled &&
                            err.code != ErrorKind::Cancelled)) {
            firstError = std::move(err);
        }
        stop = true;
    };

    auto body = [&] {
        while (!stop.load()) {
            const auto slot = next.fetch_add(1);
            if (slot >= pending.size())
                return;
            auto& chunk = chunks[pending[slot]];
            try {
                ActiveWorkerGuard guard(progress_, active, peak_);
                ChunkWorker worker(http_, file_, ctx, progress_, tracker_, digest_);
                auto r = worker.run(chunk, cancel);
                if (!r.ok())
                    recordError(r.error());
            } catch (const std::exception& ex) {
                recordError(
                    Error{ErrorKind::Unknown, std::string("Worker exception: ") + ex.what()});
            }
        }
    };

    spdlog::debug("WorkerPool: {} chunk(s) pending for {}, {} thread(s)", pending.size(), ctx.url,
                  threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        try {
            workers.push_back(launch_ ? launch_(body) : std::thread(body));
        } catch (const std::system_error& ex) {
            // Out of threads: the ones already running drain the remaining chunks
            spdlog::warn("WorkerPool: started {} of {} thread(s) for {}: {}", workers.size(),
                         threads, ctx.url, ex.what());
            break;
        }
    }
    if (workers.empty()) {
        return Error{ErrorKind::Unknown, "Cannot start worker thread for " + ctx.url};
    }
    for (auto& t : workers)
        t.join();

    if (tracker_) {
        auto fr = tracker_->flush();
        if (!fr.ok()) {
            spdlog::warn("Failed to persist resume state for {}: {}", ctx.url, fr.error().message);
        }
    }

    if (firstError)
        return *firstError;
    if (shouldCancel && shouldCancel())
        return Error{ErrorKind::Cancelled, "Transfer cancelled"};
    return Expected<void>{};
}

} // namespace onyx::downloader
