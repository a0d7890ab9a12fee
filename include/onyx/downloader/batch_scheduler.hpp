#pragma once

#include <onyx/downloader/downloader.hpp>

#include <functional>

namespace onyx::downloader {

/**
 * Executes one task. Must always return a terminal result (never throw across the boundary
 * in normal operation; exceptions are converted to Failed/Unknown by the scheduler).
 */
using TaskRunner = std::function<TaskResult(const DownloadTask&, const ShouldCancel&)>;

/**
 * Runs independent tasks under a global concurrency cap on a bounded thread pool.
 *
 * Results keep submission order. With continueOnError=false the first Failed result cancels
 * in-flight tasks and marks not-yet-started ones Aborted/Cancelled; results always hold one
 * entry per task once run() returns.
 */
class BatchScheduler {
public:
    BatchScheduler(int concurrencyLimit, bool continueOnError);

    BatchResult run(const std::vector<DownloadTask>& tasks, const TaskRunner& runner,
                    const ShouldCancel& shouldCancel = {});

    [[nodiscard]] int concurrencyLimit() const noexcept { return limit_; }

private:
    int limit_;
    bool continueOnError_;
};

} // namespace onyx::downloader
