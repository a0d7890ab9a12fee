#pragma once

#include <onyx/downloader/downloader.hpp>

#include <chrono>

namespace onyx::downloader {

/**
 * Delay before the given retry (attempt 1 is the first retry):
 * initialBackoff * multiplier^(attempt-1), capped at maxBackoff.
 */
[[nodiscard]] std::chrono::milliseconds computeBackoff(const RetryPolicy& policy, int attempt);

/**
 * Sleep for the given duration in short slices, returning false as soon as shouldCancel
 * reports true.
 */
bool sleepWithCancel(std::chrono::milliseconds duration, const ShouldCancel& shouldCancel);

} // namespace onyx::downloader
