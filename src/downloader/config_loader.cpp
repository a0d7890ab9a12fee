#include <onyx/config/config_helpers.h>
#include <onyx/downloader/config_loader.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <exception>
#include <optional>
#include <string_view>

namespace onyx::downloader {

namespace {

template <typename T> std::optional<T> parse_number(std::string_view v) {
    T out{};
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

std::optional<double> parse_double(const std::string& v) {
    try {
        std::size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos != v.size())
            return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void warn_invalid(const std::string& key, const std::string& value) {
    spdlog::warn("config: ignoring invalid value for downloader.{}: '{}'", key, value);
}

} // namespace

void applyDownloaderSettings(DownloaderConfig& cfg,
                             const std::map<std::string, std::string>& settings) {
    auto positiveInt = [](const std::string& v) -> std::optional<int> {
        auto n = parse_number<int>(v);
        if (!n || *n < 1)
            return std::nullopt;
        return n;
    };
    auto millis = [](const std::string& v) -> std::optional<std::chrono::milliseconds> {
        auto n = parse_number<long long>(v);
        if (!n || *n < 0)
            return std::nullopt;
        return std::chrono::milliseconds(*n);
    };

    for (const auto& [key, value] : settings) {
        bool ok = true;
        if (key == "workers") {
            if (auto n = positiveInt(value))
                cfg.defaultWorkers = *n;
            else
                ok = false;
        } else if (key == "concurrency") {
            if (auto n = positiveInt(value))
                cfg.batchConcurrency = *n;
            else
                ok = false;
        } else if (key == "min_chunk_bytes") {
            auto n = parse_number<std::uint64_t>(value);
            if (n && *n > 0)
                cfg.minChunkBytes = *n;
            else
                ok = false;
        } else if (key == "retry_attempts") {
            if (auto n = positiveInt(value))
                cfg.retry.maxAttempts = *n;
            else
                ok = false;
        } else if (key == "backoff_ms") {
            if (auto d = millis(value))
                cfg.retry.initialBackoff = *d;
            else
                ok = false;
        } else if (key == "backoff_multiplier") {
            auto d = parse_double(value);
            if (d && *d >= 1.0)
                cfg.retry.multiplier = *d;
            else
                ok = false;
        } else if (key == "max_backoff_ms") {
            if (auto d = millis(value))
                cfg.retry.maxBackoff = *d;
            else
                ok = false;
        } else if (key == "connect_timeout_ms") {
            if (auto d = millis(value); d && d->count() > 0)
                cfg.connectTimeout = *d;
            else
                ok = false;
        } else if (key == "idle_timeout_ms") {
            if (auto d = millis(value); d && d->count() > 0)
                cfg.idleTimeout = *d;
            else
                ok = false;
        } else if (key == "progress_interval_ms") {
            if (auto d = millis(value))
                cfg.progressInterval = *d;
            else
                ok = false;
        } else if (key == "persist_interval_ms") {
            if (auto d = millis(value))
                cfg.persistInterval = *d;
            else
                ok = false;
        } else if (key == "persist_every_bytes") {
            auto n = parse_number<std::uint64_t>(value);
            if (n && *n > 0)
                cfg.persistEveryBytes = *n;
            else
                ok = false;
        } else if (key == "resume_dir") {
            if (!value.empty())
                cfg.resumeDir = onyx::config::expand_tilde(value);
        } else if (key == "user_agent") {
            if (!value.empty())
                cfg.userAgent = value;
        } else if (key == "tls_insecure") {
            if (auto b = onyx::config::parse_bool(value))
                cfg.tls.insecure = *b;
            else
                ok = false;
        } else if (key == "ca_path") {
            cfg.tls.caPath = onyx::config::expand_tilde(value).string();
        } else if (key == "follow_redirects") {
            if (auto b = onyx::config::parse_bool(value))
                cfg.followRedirects = *b;
            else
                ok = false;
        } else if (key == "max_file_bytes") {
            if (auto n = parse_number<std::uint64_t>(value))
                cfg.maxFileBytes = *n;
            else
                ok = false;
        } else {
            spdlog::debug("config: unknown key downloader.{}", key);
        }
        if (!ok)
            warn_invalid(key, value);
    }

    if (cfg.retry.maxBackoff < cfg.retry.initialBackoff)
        cfg.retry.maxBackoff = cfg.retry.initialBackoff;
}

DownloaderConfig loadDownloaderConfig(const std::filesystem::path& configPath) {
    DownloaderConfig cfg;
    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        spdlog::debug("config: loading {}", configPath.string());
        applyDownloaderSettings(cfg, onyx::config::parse_config_section(configPath, "downloader"));
    }
    if (cfg.resumeDir.empty())
        cfg.resumeDir = onyx::config::get_cache_dir() / "resume";
    return cfg;
}

} // namespace onyx::downloader
