/*
 * onyx/src/downloader/batch_scheduler.cpp
 *
 * Batch tier: one thread-pool slot per concurrently running task.
 * - boost::asio::thread_pool sized to the concurrency limit bounds active tasks
 * - results are pre-sized and written by index, so order never depends on completion order
 * - abort mode: the first Failed result raises a shared flag observed by every task's
 *   ShouldCancel and by tasks that have not started yet
 */

#include <onyx/downloader/batch_scheduler.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>

namespace onyx::downloader {

namespace {

TaskResult abortedResult(const DownloadTask& task, std::string message) {
    TaskResult r;
    r.status = TaskStatus::Aborted;
    r.error = ErrorKind::Cancelled;
    r.url = task.url;
    if (task.destinationPath)
        r.destinationPath = *task.destinationPath;
    r.message = std::move(message);
    return r;
}

} // namespace

BatchScheduler::BatchScheduler(int concurrencyLimit, bool continueOnError)
    : limit_(std::max(1, concurrencyLimit)), continueOnError_(continueOnError) {}

BatchResult BatchScheduler::run(const std::vector<DownloadTask>& tasks, const TaskRunner& runner,
                                const ShouldCancel& shouldCancel) {
    BatchResult out;
    out.results.resize(tasks.size());
    if (tasks.empty())
        return out;

    std::atomic<bool> abort{false};
    ShouldCancel cancel = [&] { return abort.load() || (shouldCancel && shouldCancel()); };

    const auto threads = std::min<std::size_t>(static_cast<std::size_t>(limit_), tasks.size());
    spdlog::debug("BatchScheduler: {} task(s), concurrency {}, continue_on_error={}",
                  tasks.size(), threads, continueOnError_);

    boost::asio::thread_pool pool(threads);
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::post(pool, [&, i] {
            const auto& task = tasks[i];
            if (cancel()) {
                out.results[i] = abortedResult(task, "Batch aborted before task started");
                return;
            }

            TaskResult result;
            try {
                result = runner(task, cancel);
            } catch (const std::exception& ex) {
                result = TaskResult{};
                result.status = TaskStatus::Failed;
                result.error = ErrorKind::Unknown;
                result.url = task.url;
                result.message = std::string("Unexpected exception: ") + ex.what();
            }

            if (result.status == TaskStatus::Failed && !continueOnError_ && !abort.exchange(true)) {
                spdlog::warn("Aborting batch after failure of {}: {}", task.url, result.message);
            }
            out.results[i] = std::move(result);
        });
    }
    pool.join();

    out.aborted = abort.load() || (shouldCancel && shouldCancel());
    return out;
}

} // namespace onyx::downloader
