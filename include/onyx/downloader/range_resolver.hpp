#pragma once

#include <onyx/downloader/downloader.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace onyx::downloader {

/**
 * What a metadata probe learned about a resource.
 */
struct ResourceInfo {
    std::optional<std::uint64_t> size{};
    bool supportsRange{false};
    std::optional<std::string> suggestedName{};
    std::string effectiveUrl;
    std::optional<std::string> etag{};
    long httpStatus{0};
};

/**
 * Probes a URL for size, range support and a server-suggested name.
 * Retryable failures (unreachable, network, 429/5xx) are retried with backoff before the
 * error is surfaced.
 */
class RangeResolver {
public:
    RangeResolver(IHttpAdapter& http, RetryPolicy retry) : http_(http), retry_(retry) {}

    Expected<ResourceInfo> resolve(std::string_view url, const RequestOptions& options,
                                   const ShouldCancel& shouldCancel = {});

private:
    IHttpAdapter& http_;
    RetryPolicy retry_;
};

} // namespace onyx::downloader
