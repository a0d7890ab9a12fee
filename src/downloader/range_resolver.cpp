#include <onyx/downloader/name_resolver.hpp>
#include <onyx/downloader/range_resolver.hpp>
#include <onyx/downloader/retry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace onyx::downloader {

Expected<ResourceInfo> RangeResolver::resolve(std::string_view url, const RequestOptions& options,
                                              const ShouldCancel& shouldCancel) {
    const int maxAttempts = std::max(1, retry_.maxAttempts);
    Error last{ErrorKind::Unknown, "probe not attempted"};

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (shouldCancel && shouldCancel()) {
            return Error{ErrorKind::Cancelled, "Cancelled while resolving " + std::string(url)};
        }

        auto r = http_.probe(url, options);
        if (r.ok()) {
            const auto& head = r.value();
            ResourceInfo info;
            info.size = head.contentLength;
            info.supportsRange = head.acceptRanges && head.contentLength.has_value();
            info.effectiveUrl = head.effectiveUrl.empty() ? std::string(url) : head.effectiveUrl;
            info.etag = head.etag;
            info.httpStatus = head.httpStatus;
            if (head.contentDisposition) {
                info.suggestedName = filenameFromContentDisposition(*head.contentDisposition);
            }
            spdlog::debug("RangeResolver: {} size={} ranges={} name={}", url,
                          info.size ? std::to_string(*info.size) : std::string("unknown"),
                          info.supportsRange, info.suggestedName.value_or("-"));
            return info;
        }

        last = r.error();
        if (!isRetryable(last.code) || attempt == maxAttempts)
            break;

        const auto delay = computeBackoff(retry_, attempt);
        spdlog::debug("RangeResolver: probe of {} failed ({}), retry {}/{} in {}ms", url,
                      last.message, attempt, maxAttempts - 1, delay.count());
        if (!sleepWithCancel(delay, shouldCancel)) {
            return Error{ErrorKind::Cancelled, "Cancelled while resolving " + std::string(url)};
        }
    }
    return last;
}

} // namespace onyx::downloader
