#pragma once

#include <onyx/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CLI {
class App;
}

namespace onyx::cli {

/**
 * Options shared by every command (set on the root app before subcommands run).
 */
struct GlobalOptions {
    std::string configPath;
    bool verbose{false};
    bool quiet{false};
};

/**
 * Register `download single|batch|accelerated` on app. The chosen subcommand stores its
 * process exit code in exitCode.
 */
void registerDownloadCommand(CLI::App& app, const GlobalOptions& globals, int& exitCode);

/**
 * "10MB", "1.5 GiB", "512k", "2048" -> bytes (powers of 1024). nullopt when malformed.
 */
std::optional<std::uint64_t> parseSize(std::string_view text);

/**
 * "Name: value" -> Header. nullopt without a colon or with an empty name.
 */
std::optional<downloader::Header> parseHeader(std::string_view text);

/**
 * One URL per line; blank lines and '#' comments are skipped.
 */
std::vector<std::string> readUrlList(std::istream& in);

/**
 * 0 when nothing failed, otherwise the failure count capped at 125.
 */
int exitCodeForFailures(std::size_t failed) noexcept;

std::string formatBytes(std::uint64_t bytes);

} // namespace onyx::cli
