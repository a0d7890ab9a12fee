#include <gtest/gtest.h>
#include <onyx/config/config_helpers.h>
#include <onyx/downloader/config_loader.hpp>

#include "../../support/temp_dir_scope.hpp"

#include <cstdlib>

using namespace onyx::downloader;
using onyx::test_support::TempDirScope;
using onyx::test_support::write_file;

TEST(ConfigHelpersTest, ParseBoolLiterals) {
    EXPECT_EQ(onyx::config::parse_bool("true"), std::optional<bool>(true));
    EXPECT_EQ(onyx::config::parse_bool(" Yes "), std::optional<bool>(true));
    EXPECT_EQ(onyx::config::parse_bool("off"), std::optional<bool>(false));
    EXPECT_EQ(onyx::config::parse_bool("0"), std::optional<bool>(false));
    EXPECT_FALSE(onyx::config::parse_bool("maybe").has_value());
}

TEST(ConfigHelpersTest, SectionParsingHandlesBothForms) {
    auto tmp = TempDirScope::unique_under("onyx-cfg");
    const auto path = tmp.path() / "config.toml";
    write_file(path, "# top comment\n"
                     "downloader.user_agent = \"dotted/1.0\"\n"
                     "\n"
                     "[core]\n"
                     "workers = 99\n"
                     "\n"
                     "[downloader]\n"
                     "workers = 8   # inline comment\n"
                     "resume_dir = '/var/tmp/onyx#resume'\n");

    auto values = onyx::config::parse_config_section(path, "downloader");
    EXPECT_EQ(values["workers"], "8");
    EXPECT_EQ(values["user_agent"], "dotted/1.0");
    EXPECT_EQ(values["resume_dir"], "/var/tmp/onyx#resume");
    EXPECT_EQ(onyx::config::parse_config_value(path, "core", "workers"), "99");
    EXPECT_EQ(onyx::config::parse_config_value(path, "core", "missing"), "");
    EXPECT_TRUE(onyx::config::parse_config_section(tmp.path() / "nope.toml", "downloader").empty());
}

TEST(ConfigHelpersTest, ConfigPathHonoursOverrideAndEnvironment) {
    EXPECT_EQ(onyx::config::get_config_path("/etc/onyx.toml"), "/etc/onyx.toml");

    ::setenv("ONYX_CONFIG", "/tmp/from-env.toml", 1);
    EXPECT_EQ(onyx::config::get_config_path(), "/tmp/from-env.toml");
    ::unsetenv("ONYX_CONFIG");

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(onyx::config::get_config_path(), std::filesystem::path("/tmp/xdg/onyx/config.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}

TEST(DownloaderConfigTest, AppliesKnownKeys) {
    DownloaderConfig cfg;
    applyDownloaderSettings(cfg, {{"workers", "8"},
                                  {"concurrency", "3"},
                                  {"retry_attempts", "6"},
                                  {"backoff_ms", "250"},
                                  {"backoff_multiplier", "1.5"},
                                  {"max_backoff_ms", "8000"},
                                  {"connect_timeout_ms", "5000"},
                                  {"idle_timeout_ms", "7000"},
                                  {"tls_insecure", "yes"},
                                  {"follow_redirects", "false"},
                                  {"max_file_bytes", "1048576"},
                                  {"user_agent", "custom/2"},
                                  {"resume_dir", "/var/lib/onyx/resume"}});
    EXPECT_EQ(cfg.defaultWorkers, 8);
    EXPECT_EQ(cfg.batchConcurrency, 3);
    EXPECT_EQ(cfg.retry.maxAttempts, 6);
    EXPECT_EQ(cfg.retry.initialBackoff.count(), 250);
    EXPECT_DOUBLE_EQ(cfg.retry.multiplier, 1.5);
    EXPECT_EQ(cfg.retry.maxBackoff.count(), 8000);
    EXPECT_EQ(cfg.connectTimeout.count(), 5000);
    EXPECT_EQ(cfg.idleTimeout.count(), 7000);
    EXPECT_TRUE(cfg.tls.insecure);
    EXPECT_FALSE(cfg.followRedirects);
    EXPECT_EQ(cfg.maxFileBytes, 1048576u);
    EXPECT_EQ(cfg.userAgent, "custom/2");
    EXPECT_EQ(cfg.resumeDir, std::filesystem::path("/var/lib/onyx/resume"));
}

TEST(DownloaderConfigTest, InvalidValuesKeepDefaults) {
    DownloaderConfig cfg;
    const DownloaderConfig defaults;
    applyDownloaderSettings(cfg, {{"workers", "0"},
                                  {"concurrency", "many"},
                                  {"backoff_multiplier", "0.5"},
                                  {"connect_timeout_ms", "0"},
                                  {"tls_insecure", "perhaps"},
                                  {"unknown_key", "1"}});
    EXPECT_EQ(cfg.defaultWorkers, defaults.defaultWorkers);
    EXPECT_EQ(cfg.batchConcurrency, defaults.batchConcurrency);
    EXPECT_DOUBLE_EQ(cfg.retry.multiplier, defaults.retry.multiplier);
    EXPECT_EQ(cfg.connectTimeout, defaults.connectTimeout);
    EXPECT_FALSE(cfg.tls.insecure);
}

TEST(DownloaderConfigTest, MaxBackoffNeverBelowInitial) {
    DownloaderConfig cfg;
    applyDownloaderSettings(cfg, {{"backoff_ms", "3000"}, {"max_backoff_ms", "1000"}});
    EXPECT_EQ(cfg.retry.maxBackoff, cfg.retry.initialBackoff);
}

TEST(DownloaderConfigTest, LoadOverlaysFileOnDefaults) {
    auto tmp = TempDirScope::unique_under("onyx-cfg-load");
    const auto path = tmp.path() / "config.toml";
    write_file(path, "[downloader]\nworkers = 6\nresume_dir = \"" +
                         (tmp.path() / "state").string() + "\"\n");
    auto cfg = loadDownloaderConfig(path);
    EXPECT_EQ(cfg.defaultWorkers, 6);
    EXPECT_EQ(cfg.batchConcurrency, DownloaderConfig{}.batchConcurrency);
    EXPECT_EQ(cfg.resumeDir, tmp.path() / "state");

    auto missing = loadDownloaderConfig(tmp.path() / "absent.toml");
    EXPECT_EQ(missing.defaultWorkers, DownloaderConfig{}.defaultWorkers);
    EXPECT_EQ(missing.resumeDir, onyx::config::get_cache_dir() / "resume");
}
