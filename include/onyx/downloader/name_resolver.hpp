#pragma once

#include <onyx/downloader/downloader.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace onyx::downloader {

/**
 * Filename carried by a Content-Disposition header value. Priority:
 * filename*=UTF-8''<pct-encoded>, then filename="...", then filename=token.
 * The result is percent-decoded but not sanitized.
 */
[[nodiscard]] std::optional<std::string> filenameFromContentDisposition(std::string_view header);

/**
 * Last path segment of a URL (query and fragment ignored), percent-decoded.
 */
[[nodiscard]] std::optional<std::string> filenameFromUrl(std::string_view url);

[[nodiscard]] std::string percentDecode(std::string_view s);

/**
 * Replace characters invalid on common filesystems (<>:"/\|?* and control characters)
 * with '_' and trim leading/trailing spaces and dots. May return an empty string.
 */
[[nodiscard]] std::string sanitizeFilename(std::string_view name);

/**
 * "download-<8 hex>" derived from the URL; stable across runs.
 */
[[nodiscard]] std::string generatedName(std::string_view url);

using PathPredicate = std::function<bool(const std::filesystem::path&)>;

/**
 * Pick the output path for a task.
 *
 * An explicit destinationPath wins unless it names an existing directory, in which case it
 * is used as the output directory. Derived names come from suggestedName, then the
 * effective URL, then the request URL, then generatedName(). Unless task.overwrite is set,
 * an existing file that is not a resume target gets a " (n)" suffix before the extension.
 * A path for which isClaimed returns true (held by a task still running) is never picked,
 * even if it does not exist on disk yet.
 */
Expected<std::filesystem::path> resolveOutputPath(const DownloadTask& task,
                                                  const std::optional<std::string>& suggestedName,
                                                  std::string_view effectiveUrl,
                                                  const PathPredicate& isResumeTarget,
                                                  const PathPredicate& isClaimed = {});

} // namespace onyx::downloader
