/*
 * onyx/src/downloader/download_manager.cpp
 *
 * DownloadManager:
 * - Probe server for size and range support (HEAD or GET bytes=0-0), with retries
 * - Refuse oversized resources before the destination is created
 * - Resolve the output name (explicit path, Content-Disposition, URL, generated)
 * - Resume from a compatible ResumeRecord, otherwise plan fresh chunks
 * - Stream chunks in parallel into one preallocated file (positional writes)
 * - Verify the checksum (streaming digest for fresh single-stream transfers, otherwise a
 *   pass over the assembled file)
 * - Finalize: truncate to the final size, sync, drop the resume record
 *
 * Recovery paths:
 * - 200 to a ranged request: discard the plan and re-run once as single-stream
 * - 416: re-resolve the size once and restart from scratch
 * - cancellation: Aborted, resume record preserved
 */

#include <onyx/config/config_helpers.h>
#include <onyx/downloader/batch_scheduler.hpp>
#include <onyx/downloader/chunk_planner.hpp>
#include <onyx/downloader/disk_writer.hpp>
#include <onyx/downloader/name_resolver.hpp>
#include <onyx/downloader/progress_aggregator.hpp>
#include <onyx/downloader/range_resolver.hpp>
#include <onyx/downloader/resume_store.hpp>
#include <onyx/downloader/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace onyx::downloader {

namespace fs = std::filesystem;

namespace {

bool has_http_scheme(std::string_view url) {
    auto lower_prefix = [&](std::string_view prefix) {
        if (url.size() <= prefix.size())
            return false;
        for (std::size_t i = 0; i < prefix.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i])
                return false;
        }
        return true;
    };
    return lower_prefix("http://") || lower_prefix("https://");
}

TaskResult failure(const DownloadTask& task, const fs::path& dest, const Error& err) {
    TaskResult r;
    r.status = err.code == ErrorKind::Cancelled ? TaskStatus::Aborted : TaskStatus::Failed;
    r.error = err.code;
    r.url = task.url;
    r.destinationPath = dest;
    r.message = err.message;
    r.httpStatus = err.httpStatus;
    return r;
}

std::uint64_t extent_of(const std::vector<Chunk>& chunks) {
    std::uint64_t end = 0;
    for (const auto& c : chunks) {
        if (c.bytesWritten > 0)
            end = std::max(end, c.startOffset + c.bytesWritten);
    }
    return end;
}

} // namespace

class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(DownloaderConfig cfg, std::shared_ptr<IHttpAdapter> http,
                    std::unique_ptr<IResumeStore> resume)
        : config_(std::move(cfg)), http_(std::move(http)), resume_(std::move(resume)) {
        if (config_.resumeDir.empty())
            config_.resumeDir = onyx::config::get_cache_dir() / "resume";
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!resume_)
            resume_ = makeJsonResumeStore(config_.resumeDir);
    }

    TaskResult download(const DownloadTask& task, const ProgressCallback& onProgress,
                        const ShouldCancel& shouldCancel) override {
        const auto started = std::chrono::steady_clock::now();
        TaskResult result;
        try {
            result = runTask(task, onProgress, shouldCancel);
        } catch (const std::exception& ex) {
            result = failure(task, task.destinationPath.value_or(fs::path{}),
                             Error{ErrorKind::Unknown, std::string("Exception: ") + ex.what()});
        }
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (result.ok()) {
            spdlog::debug("Download complete: {} -> {} ({} bytes in {}ms)", result.url,
                          result.destinationPath.string(), result.sizeBytes,
                          result.duration.count());
        } else {
            spdlog::debug("Download {}: {} ({}: {})", taskStatusName(result.status), result.url,
                          errorKindName(result.error.value_or(ErrorKind::Unknown)),
                          result.message);
        }
        return result;
    }

    BatchResult downloadMany(const BatchJob& job, const ProgressCallback& onProgress,
                             const ShouldCancel& shouldCancel) override {
        BatchScheduler scheduler(job.concurrencyLimit, job.continueOnError);
        return scheduler.run(
            job.tasks,
            [this, &onProgress](const DownloadTask& task, const ShouldCancel& cancel) {
                return download(task, onProgress, cancel);
            },
            shouldCancel);
    }

    [[nodiscard]] DownloaderConfig config() const override { return config_; }

private:
    RequestOptions requestOptionsFor(const DownloadTask& task) const {
        RequestOptions opts;
        opts.headers = task.headers;
        opts.userAgent = config_.userAgent;
        opts.tls = config_.tls;
        opts.connectTimeout = config_.connectTimeout;
        opts.idleTimeout = config_.idleTimeout;
        opts.followRedirects = config_.followRedirects;
        return opts;
    }

    std::optional<std::uint64_t> sizeLimitFor(const DownloadTask& task) const {
        if (task.maxBytes)
            return task.maxBytes;
        if (config_.maxFileBytes > 0)
            return config_.maxFileBytes;
        return std::nullopt;
    }

    std::optional<ResumeRecord> loadRecord(const std::string& key) {
        auto lr = resume_->load(key);
        if (!lr.ok()) {
            spdlog::warn("Failed to load resume state: {}", lr.error().message);
            return std::nullopt;
        }
        return lr.value();
    }

    // A record is trusted only if it describes exactly the plan we would make now and the
    // file still holds the bytes it claims.
    static bool compatible(const ResumeRecord& rec, const DownloadTask& task, const fs::path& dest,
                           const ResourceInfo& info, const std::vector<Chunk>& plan,
                           std::string& why) {
        const std::uint64_t size = info.size.value_or(0);
        const std::optional<HashAlgo> algo =
            task.expectedChecksum ? std::optional<HashAlgo>(task.expectedChecksum->algo)
                                  : std::nullopt;
        if (rec.url != task.url) {
            why = "url changed";
        } else if (rec.destinationPath != dest) {
            why = "destination changed";
        } else if (rec.expectedSize != size) {
            why = "size changed (" + std::to_string(rec.expectedSize) + " -> " +
                  std::to_string(size) + ")";
        } else if (rec.etag && info.etag && *rec.etag != *info.etag) {
            why = "resource changed (ETag " + *rec.etag + " -> " + *info.etag + ")";
        } else if (rec.workerCount != task.workerCount) {
            why = "worker count changed (" + std::to_string(rec.workerCount) + " -> " +
                  std::to_string(task.workerCount) + ")";
        } else if (!sameBoundaries(rec.chunks, plan)) {
            why = "chunk plan changed";
        } else if (rec.checksumAlgorithm != algo) {
            why = "checksum algorithm changed";
        } else {
            std::error_code ec;
            const auto onDisk = fs::file_size(dest, ec);
            if (ec) {
                why = "destination missing";
            } else if (onDisk < extent_of(rec.chunks)) {
                why = "destination shorter than recorded progress";
            } else {
                return true;
            }
        }
        return false;
    }

    TaskResult runTask(const DownloadTask& input, const ProgressCallback& onProgress,
                       const ShouldCancel& shouldCancel) {
        DownloadTask task = input;
        fs::path dest = task.destinationPath.value_or(fs::path{});

        if (task.url.empty() || !has_http_scheme(task.url)) {
            return failure(task, dest,
                           Error{ErrorKind::InvalidArgument,
                                 "Unsupported or malformed URL: '" + task.url + "'"});
        }
        if (task.workerCount < 1) {
            return failure(task, dest,
                           Error{ErrorKind::InvalidArgument, "worker count must be at least 1"});
        }
        if (task.expectedChecksum && task.expectedChecksum->hex.empty()) {
            return failure(task, dest, Error{ErrorKind::InvalidArgument, "Empty checksum"});
        }

        ProgressAggregator progress(task.url, config_.progressInterval);
        progress.subscribe(onProgress);
        progress.publish(true);

        const RequestOptions opts = requestOptionsFor(task);
        const auto limit = sizeLimitFor(task);
        RangeResolver resolver(*http_, config_.retry);

        auto resolved = resolver.resolve(task.url, opts, shouldCancel);
        if (!resolved.ok())
            return failure(task, dest, resolved.error());
        ResourceInfo info = resolved.value();

        bool forceSingleStream = false;
        bool reResolved = false;

        // Resolve the name once: later passes (fallback, 416 restart) keep the same target.
        bool nameResolved = false;
        std::unique_ptr<PathClaim> claim;

        for (;;) {
            task.state = TaskState::Planning;
            task.expectedSize = info.size;
            task.supportsRange = info.supportsRange && !forceSingleStream;

            if (limit && info.size && *info.size > *limit) {
                return failure(task, dest,
                               Error{ErrorKind::SizeLimitExceeded,
                                     "Resource size " + std::to_string(*info.size) +
                                         " exceeds limit of " + std::to_string(*limit) +
                                         " bytes"});
            }

            if (!nameResolved) {
                auto isResumeTarget = [&](const fs::path& p) {
                    if (!task.resume)
                        return false;
                    auto rec = loadRecord(makeResumeKey(task.url, p));
                    return rec.has_value() && rec->url == task.url;
                };
                // Pick and claim under one lock so concurrent tasks never share a target
                std::lock_guard<std::mutex> lk(claimMutex_);
                auto isClaimed = [&](const fs::path& p) { return claimed_.count(p) > 0; };
                auto named = resolveOutputPath(task, info.suggestedName, info.effectiveUrl,
                                               isResumeTarget, isClaimed);
                if (!named.ok())
                    return failure(task, dest, named.error());
                dest = named.value();
                claimed_.insert(dest);
                claim = std::make_unique<PathClaim>(*this, dest);
                nameResolved = true;
            }

            const std::string key = makeResumeKey(task.url, dest);
            const bool persist = task.resume && task.supportsRange && task.expectedSize;

            // Plan, then decide whether the stored record (if any) matches it
            std::vector<Chunk> chunks =
                task.supportsRange
                    ? planChunks(*task.expectedSize, task.workerCount, config_.minChunkBytes)
                    : planSingleStream(task.expectedSize);

            bool resumed = false;
            if (auto rec = loadRecord(key)) {
                std::string why;
                if (!task.resume) {
                    why = "resume disabled";
                } else if (!task.supportsRange || !task.expectedSize) {
                    why = "server no longer supports ranges";
                } else if (compatible(*rec, task, dest, info, chunks, why)) {
                    for (std::size_t i = 0; i < chunks.size(); ++i) {
                        chunks[i].bytesWritten = rec->chunks[i].bytesWritten;
                        chunks[i].attemptCount = rec->chunks[i].attemptCount;
                        chunks[i].status =
                            chunks[i].done() ? ChunkStatus::Complete : ChunkStatus::Pending;
                    }
                    resumed = true;
                    spdlog::debug("Resuming {} into {}: {} of {} bytes present", task.url,
                                  dest.string(), rec->bytesWritten(), *task.expectedSize);
                }
                if (!resumed) {
                    spdlog::debug("Discarding resume record for {} ({}): restarting", task.url,
                                  why);
                    resume_->remove(key);
                }
            }

            spdlog::debug("Plan for {}: {} chunk(s), size={}, ranges={}", task.url,
                          chunks.size(),
                          task.expectedSize ? std::to_string(*task.expectedSize)
                                            : std::string("unknown"),
                          task.supportsRange);

            progress.setStage(ProgressStage::Connecting);
            auto opened = OutputFile::open(
                dest, resumed ? OutputFile::Mode::Preserve : OutputFile::Mode::Truncate);
            if (!opened.ok())
                return failure(task, dest, opened.error());
            std::unique_ptr<OutputFile> file = std::move(opened).value();

            if (task.expectedSize && *task.expectedSize > 0) {
                auto pr = file->preallocate(*task.expectedSize);
                if (!pr.ok()) {
                    file.reset();
                    if (!resumed)
                        removeFile(dest);
                    return failure(task, dest, pr.error());
                }
            }

            std::unique_ptr<ResumeTracker> tracker;
            if (persist) {
                ResumeRecord record;
                record.key = key;
                record.url = task.url;
                record.destinationPath = dest;
                record.expectedSize = *task.expectedSize;
                if (task.expectedChecksum)
                    record.checksumAlgorithm = task.expectedChecksum->algo;
                record.etag = info.etag;
                record.workerCount = task.workerCount;
                record.chunks = chunks;
                tracker = std::make_unique<ResumeTracker>(
                    *resume_, std::move(record), *file,
                    ResumeTracker::Policy{config_.persistEveryBytes, config_.persistInterval});
                auto fr = tracker->flush();
                if (!fr.ok()) {
                    spdlog::warn("Failed to persist resume state for {}: {}", task.url,
                                 fr.error().message);
                }
            }

            // Streaming digest only when it will see every byte from offset 0
            std::unique_ptr<IIntegrityVerifier> digest;
            if (task.expectedChecksum && chunks.size() == 1 && chunks.front().bytesWritten == 0) {
                digest = makeIntegrityVerifier(task.expectedChecksum->algo);
            }

            TransferContext ctx;
            ctx.url = task.url;
            ctx.request = opts;
            ctx.retry = config_.retry;
            ctx.supportsRange = task.supportsRange;
            ctx.multiPart = chunks.size() > 1;
            ctx.maxBytes = limit;
            if (digest)
                ctx.digestAlgo = task.expectedChecksum->algo;

            task.state = TaskState::Transferring;
            progress.reset(chunks, task.expectedSize);
            progress.setStage(ProgressStage::Downloading);

            WorkerPool pool(*http_, *file, progress, tracker.get(), digest.get());
            auto run = pool.run(chunks, ctx, task.workerCount, shouldCancel);

            if (!run.ok()) {
                const auto& err = run.error();

                if (err.code == ErrorKind::RangeUnsupported && !forceSingleStream) {
                    spdlog::warn("{}: {}; falling back to single-stream", task.url, err.message);
                    tracker.reset();
                    file.reset();
                    resume_->remove(key);
                    forceSingleStream = true;
                    continue;
                }

                if (err.code == ErrorKind::RangeNotSatisfiable) {
                    tracker.reset();
                    file.reset();
                    resume_->remove(key);
                    if (reResolved) {
                        removeFile(dest);
                        return failure(task, dest,
                                       Error{ErrorKind::HttpClientError,
                                             "Range not satisfiable after re-resolving size",
                                             err.httpStatus});
                    }
                    spdlog::warn("{}: range not satisfiable; re-resolving size", task.url);
                    auto again = resolver.resolve(task.url, opts, shouldCancel);
                    if (!again.ok())
                        return failure(task, dest, again.error());
                    info = again.value();
                    reResolved = true;
                    continue;
                }

                task.state = TaskState::Failed;
                auto result = failure(task, dest, err);
                result.bytesTransferred = progress.receivedBytes();

                if (err.code == ErrorKind::Cancelled) {
                    // Record (if any) was flushed by the pool; the partial file stays with it
                    if (!tracker) {
                        file.reset();
                        removeFile(dest);
                    }
                    return result;
                }

                tracker.reset();
                file.reset();
                if (err.code == ErrorKind::SizeLimitExceeded || !persist) {
                    resume_->remove(key);
                    removeFile(dest);
                }
                return result;
            }

            // ---- Verify ----
            task.state = TaskState::Verifying;
            const std::uint64_t finalSize =
                task.expectedSize ? *task.expectedSize : chunks.front().endOffset;
            auto tr = file->truncate(finalSize);
            if (!tr.ok()) {
                return failure(task, dest, tr.error());
            }

            TaskResult result;
            result.url = task.url;
            result.destinationPath = dest;
            result.sizeBytes = finalSize;
            if (pool.peakConcurrency() > 0) {
                spdlog::debug("{}: peak worker concurrency {}", task.url, pool.peakConcurrency());
            }

            if (task.expectedChecksum) {
                progress.setStage(ProgressStage::Verifying);
                const auto& expected = *task.expectedChecksum;
                Checksum actual;
                if (digest) {
                    actual = digest->finalize();
                } else {
                    auto sr = file->sync();
                    if (!sr.ok())
                        return failure(task, dest, sr.error());
                    auto hr = hashFile(dest, expected.algo);
                    if (!hr.ok())
                        return failure(task, dest, hr.error());
                    actual = hr.value();
                }
                result.digest = actual;

                if (!checksumMatches(expected, actual)) {
                    tracker.reset();
                    file.reset();
                    resume_->remove(key);
                    if (task.deleteOnMismatch)
                        removeFile(dest);
                    task.state = TaskState::Failed;
                    result.status = TaskStatus::Failed;
                    result.error = ErrorKind::ChecksumMismatch;
                    result.checksumVerified = false;
                    result.bytesTransferred = progress.receivedBytes();
                    result.message = std::string("Checksum mismatch (") +
                                     hashAlgoName(expected.algo) + " expected " + expected.hex +
                                     ", got " + actual.hex + ")";
                    return result;
                }
                result.checksumVerified = true;
            }

            // ---- Finalize ----
            progress.setStage(ProgressStage::Finalizing);
            auto sr = file->sync();
            if (!sr.ok())
                return failure(task, dest, sr.error());
            tracker.reset();
            file.reset();
            if (dest.has_parent_path()) {
                auto dr = syncDirectory(dest.parent_path());
                if (!dr.ok()) {
                    spdlog::debug("Directory sync failed: {}", dr.error().message);
                }
            }
            resume_->remove(key);

            task.state = TaskState::Done;
            result.status = TaskStatus::Success;
            result.bytesTransferred = progress.receivedBytes();
            result.httpStatus = info.httpStatus > 0 ? std::optional<long>(info.httpStatus)
                                                    : std::nullopt;
            result.message = "Saved to " + dest.string();
            progress.setTotal(finalSize);
            progress.publish(true);
            return result;
        }
    }

private:
    // Output path held by a running task; released when the task returns.
    class PathClaim {
    public:
        PathClaim(DownloadManager& owner, fs::path path)
            : owner_(owner), path_(std::move(path)) {}
        PathClaim(const PathClaim&) = delete;
        PathClaim& operator=(const PathClaim&) = delete;
        ~PathClaim() {
            std::lock_guard<std::mutex> lk(owner_.claimMutex_);
            auto it = owner_.claimed_.find(path_);
            if (it != owner_.claimed_.end())
                owner_.claimed_.erase(it);
        }

    private:
        DownloadManager& owner_;
        fs::path path_;
    };

    DownloaderConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::unique_ptr<IResumeStore> resume_;

    std::mutex claimMutex_;
    std::multiset<fs::path> claimed_;
};

// ---- Factories ----
std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg, std::shared_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IResumeStore> resume) {
    return std::make_unique<DownloadManager>(cfg, std::move(http), std::move(resume));
}

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg) {
    return makeDownloadManagerWithDependencies(cfg, nullptr, nullptr);
}

} // namespace onyx::downloader
