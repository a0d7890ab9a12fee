#include <gtest/gtest.h>
#include <onyx/downloader/retry.hpp>

#include <atomic>

using namespace onyx::downloader;
using namespace std::chrono_literals;

TEST(RetryTest, BackoffGrowsExponentiallyUpToCap) {
    RetryPolicy p;
    p.initialBackoff = 500ms;
    p.multiplier = 2.0;
    p.maxBackoff = 3000ms;
    EXPECT_EQ(computeBackoff(p, 1), 500ms);
    EXPECT_EQ(computeBackoff(p, 2), 1000ms);
    EXPECT_EQ(computeBackoff(p, 3), 2000ms);
    EXPECT_EQ(computeBackoff(p, 4), 3000ms);
    EXPECT_EQ(computeBackoff(p, 10), 3000ms);
    EXPECT_EQ(computeBackoff(p, 0), 500ms);
}

TEST(RetryTest, SleepObservesCancellation) {
    std::atomic<int> polls{0};
    const auto start = std::chrono::steady_clock::now();
    const bool completed = sleepWithCancel(10s, [&] { return polls.fetch_add(1) >= 2; });
    EXPECT_FALSE(completed);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    EXPECT_TRUE(sleepWithCancel(5ms, {}));
}

TEST(RetryTest, ErrorClassification) {
    EXPECT_EQ(classifyHttpStatus(404), ErrorKind::HttpClientError);
    EXPECT_EQ(classifyHttpStatus(416), ErrorKind::RangeNotSatisfiable);
    EXPECT_EQ(classifyHttpStatus(429), ErrorKind::HttpRateLimitOrServerError);
    EXPECT_EQ(classifyHttpStatus(503), ErrorKind::HttpRateLimitOrServerError);
    EXPECT_TRUE(isRetryable(ErrorKind::NetworkError));
    EXPECT_TRUE(isRetryable(ErrorKind::Unreachable));
    EXPECT_FALSE(isRetryable(ErrorKind::HttpClientError));
    EXPECT_FALSE(isRetryable(ErrorKind::ChecksumMismatch));
}
