/*
 * onyx/src/downloader/progress_aggregator.cpp
 *
 * Bounded-cadence progress events for one task:
 * - per-chunk counters are lock-free atomics written by the workers
 * - deliveries are serialized by a separate emit lock, so subscribers see a monotonic sequence
 *   and a slow subscriber never holds the state lock the workers update under
 * - speed is averaged over bytes received in this run; resumed bytes do not inflate it
 */

#include <onyx/downloader/progress_aggregator.hpp>

#include <algorithm>
#include <utility>

namespace onyx::downloader {

ProgressAggregator::ProgressAggregator(std::string url, std::chrono::milliseconds interval)
    : url_(std::move(url)), interval_(interval) {}

void ProgressAggregator::subscribe(ProgressCallback cb) {
    if (!cb)
        return;
    std::lock_guard<std::mutex> lk(mutex_);
    subscribers_.push_back(std::move(cb));
}

void ProgressAggregator::reset(const std::vector<Chunk>& chunks,
                               std::optional<std::uint64_t> total) {
    std::lock_guard<std::mutex> lk(mutex_);
    chunkCount_ = chunks.size();
    chunkBytes_ =
        std::make_unique<std::atomic<std::uint64_t>[]>(std::max<std::size_t>(1, chunkCount_));
    for (std::size_t i = 0; i < chunkCount_; ++i)
        chunkBytes_[i].store(chunks[i].bytesWritten);
    total_ = total;
}

void ProgressAggregator::update(std::size_t idx, std::uint64_t bytesWritten,
                                std::uint64_t received) {
    received_.fetch_add(received);
    if (!chunkBytes_ || idx >= chunkCount_)
        return;
    chunkBytes_[idx].store(bytesWritten);
}

void ProgressAggregator::rewind(std::size_t idx) {
    if (!chunkBytes_ || idx >= chunkCount_)
        return;
    chunkBytes_[idx].store(0);
}

void ProgressAggregator::setTotal(std::optional<std::uint64_t> total) {
    std::lock_guard<std::mutex> lk(mutex_);
    total_ = total;
}

void ProgressAggregator::setStage(ProgressStage stage) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stage_ == stage)
            return;
        stage_ = stage;
    }
    publish(true);
}

void ProgressAggregator::workerStarted() {
    const int now = active_.fetch_add(1) + 1;
    int prev = peak_.load();
    while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
    }
}

void ProgressAggregator::workerFinished() {
    active_.fetch_sub(1);
}

std::uint64_t ProgressAggregator::downloadedBytes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < chunkCount_; ++i)
        sum += chunkBytes_[i].load();
    return sum;
}

ProgressEvent ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshotLocked();
}

ProgressEvent ProgressAggregator::snapshotLocked() const {
    ProgressEvent ev;
    ev.url = url_;
    for (std::size_t i = 0; i < chunkCount_; ++i)
        ev.downloadedBytes += chunkBytes_[i].load();
    ev.totalBytes = total_;
    ev.activeWorkers = active_.load();
    ev.stage = stage_;
    ev.timestamp = std::chrono::steady_clock::now();

    if (total_ && *total_ > 0) {
        const auto pct = static_cast<long double>(ev.downloadedBytes) * 100.0L /
                         static_cast<long double>(*total_);
        ev.percentage = static_cast<float>(std::min(pct, 100.0L));
    }

    const auto elapsed = std::chrono::duration<double>(ev.timestamp - started_).count();
    const auto received = received_.load();
    if (elapsed > 0.0 && received > 0) {
        const auto bps = static_cast<std::uint64_t>(static_cast<double>(received) / elapsed);
        ev.speedBps = bps;
        if (total_ && bps > 0 && *total_ >= ev.downloadedBytes) {
            ev.etaSeconds = static_cast<std::uint32_t>((*total_ - ev.downloadedBytes) / bps);
        }
    }
    return ev;
}

void ProgressAggregator::publish(bool force) {
    // Workers never wait on a subscriber: if another thread is delivering, skip this tick
    std::unique_lock<std::mutex> emitting(emitMutex_, std::defer_lock);
    if (force)
        emitting.lock();
    else if (!emitting.try_lock())
        return;

    ProgressEvent ev;
    std::vector<ProgressCallback> subscribers;
    {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(mutex_);
        if (subscribers_.empty())
            return;
        if (!force && lastEmit_.time_since_epoch().count() != 0 && now - lastEmit_ < interval_)
            return;
        lastEmit_ = now;
        ev = snapshotLocked();
        subscribers = subscribers_;
    }
    for (const auto& cb : subscribers)
        cb(ev);
}

} // namespace onyx::downloader
