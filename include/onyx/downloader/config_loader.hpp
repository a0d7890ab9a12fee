#pragma once

#include <onyx/downloader/downloader.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace onyx::downloader {

/**
 * Apply "[downloader]" key/value pairs on top of cfg. Unknown keys and invalid values are
 * logged and ignored; missing keys keep their current value.
 */
void applyDownloaderSettings(DownloaderConfig& cfg,
                             const std::map<std::string, std::string>& settings);

/**
 * Defaults overlaid with the [downloader] section of configPath (if it exists).
 * An empty resume_dir resolves to <cache dir>/resume.
 */
DownloaderConfig loadDownloaderConfig(const std::filesystem::path& configPath);

} // namespace onyx::downloader
