/*
 * onyx/src/downloader/retry.cpp
 *
 * Exponential backoff shared by the resolver and the chunk workers.
 * Sleeps are sliced so cooperative cancellation is observed within ~50ms.
 */

#include <onyx/downloader/retry.hpp>

#include <algorithm>
#include <cmath>
#include <thread>

namespace onyx::downloader {

std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt) {
    if (attempt < 1)
        attempt = 1;
    const double base = static_cast<double>(policy.initialBackoff.count());
    const double factor = std::pow(std::max(1.0, policy.multiplier), attempt - 1);
    const double cap = static_cast<double>(policy.maxBackoff.count());
    const double delay = std::min(base * factor, cap);
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

bool sleepWithCancel(std::chrono::milliseconds duration, const ShouldCancel& shouldCancel) {
    constexpr auto max_slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (true) {
        if (shouldCancel && shouldCancel())
            return false;
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        const std::chrono::steady_clock::duration slice = max_slice;
        std::this_thread::sleep_for(std::min(deadline - now, slice));
    }
}

} // namespace onyx::downloader
