/*
 * onyx/src/cli/cmd_download.cpp
 *
 * `onyx download` command group.
 * - single:      one URL, single stream by default (-w for parallel ranges)
 * - batch:       a file of URLs, downloaded concurrently into one directory
 * - accelerated: one URL split into -p parallel range requests
 *
 * Defaults come from the [downloader] section of config.toml; flags override them.
 * Progress goes to stderr (log lines or JSON lines); the final result goes to stdout.
 * Exit code: 0 when every task succeeded, otherwise the number of failed tasks (max 125).
 */

#include <onyx/cli/download_command.h>
#include <onyx/config/config_helpers.h>
#include <onyx/downloader/config_loader.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace onyx::cli {

using namespace onyx::downloader;

namespace {

constexpr int kInterruptedExitCode = 130; // 128 + SIGINT
std::atomic<bool> g_interrupted{false};

void on_interrupt(int) {
    g_interrupted.store(true);
}

struct CommonOpts {
    std::vector<std::string> headers;
    std::string userAgent;
    std::optional<int> timeoutSeconds;
    std::optional<int> retries;
    bool insecure{false};
    bool noResume{false};
    std::string progress{"log"}; // "log" | "json" | "none"
    bool emitJson{false};
};

struct SingleOpts {
    std::string url;
    std::string output;
    std::string checksum;
    std::string maxSize;
    std::optional<int> workers;
    bool deleteOnMismatch{false};
    bool force{false};
    CommonOpts common;
};

struct BatchOpts {
    std::string urlsFile;
    std::string outputDir{"."};
    std::optional<int> concurrency;
    int parts{1};
    std::string maxSize;
    bool continueOnError{false};
    std::string outputFormat{"table"}; // "table" | "json"
    CommonOpts common;
};

const char* stage_name(ProgressStage stage) {
    switch (stage) {
        case ProgressStage::Resolving:
            return "resolving";
        case ProgressStage::Connecting:
            return "connecting";
        case ProgressStage::Downloading:
            return "downloading";
        case ProgressStage::Verifying:
            return "verifying";
        case ProgressStage::Finalizing:
            return "finalizing";
    }
    return "downloading";
}

std::string checksum_validator(std::string& s) {
    return parseChecksum(s) ? std::string{}
                            : std::string{"invalid checksum (expected '<algo>:<hex>' or hex)"};
}

std::string size_validator(std::string& s) {
    return parseSize(s) ? std::string{}
                        : std::string{"invalid size (examples: 1048576, 500KB, 1.5GB)"};
}

std::string header_validator(std::string& s) {
    return parseHeader(s) ? std::string{} : std::string{"invalid header (expected 'Name: value')"};
}

void add_common_options(CLI::App* sub, CommonOpts& o) {
    sub->add_option("-H,--header", o.headers, "Custom request header (repeatable), 'Name: value'.")
        ->check(CLI::Validator(header_validator, "HEADER"));
    sub->add_option("--user-agent", o.userAgent, "Custom User-Agent string.");
    sub->add_option("--timeout", o.timeoutSeconds,
                    "Connect and idle-read timeout in seconds (default from config, 30).")
        ->check(CLI::Range(1, 3600));
    sub->add_option("--retries", o.retries, "Retry attempts per request (default from config, 4).")
        ->check(CLI::Range(0, 20));
    sub->add_flag("--insecure", o.insecure, "Disable TLS certificate verification.");
    sub->add_flag("--no-resume", o.noResume, "Ignore and discard saved resume state.");
    sub->add_option("--progress", o.progress, "Progress format: [log|json|none] (default: log).")
        ->check(CLI::IsMember({"log", "json", "none"}));
    sub->add_flag("--json", o.emitJson, "Emit the final result as JSON on stdout.");
}

void apply_log_level(const GlobalOptions& g, const CommonOpts& o) {
    if (g.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (g.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (o.progress == "log") {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

DownloaderConfig load_config(const GlobalOptions& g, const CommonOpts& o) {
    auto cfg = loadDownloaderConfig(onyx::config::get_config_path(g.configPath));
    if (!o.userAgent.empty())
        cfg.userAgent = o.userAgent;
    if (o.timeoutSeconds) {
        cfg.connectTimeout = std::chrono::seconds(*o.timeoutSeconds);
        cfg.idleTimeout = std::chrono::seconds(*o.timeoutSeconds);
    }
    if (o.retries)
        cfg.retry.maxAttempts = *o.retries + 1;
    if (o.insecure)
        cfg.tls.insecure = true;
    return cfg;
}

std::vector<Header> parse_headers(const std::vector<std::string>& raw) {
    std::vector<Header> out;
    for (const auto& h : raw) {
        if (auto parsed = parseHeader(h))
            out.push_back(std::move(*parsed));
    }
    return out;
}

ProgressCallback make_progress_printer(const std::string& mode) {
    if (mode == "none")
        return {};
    if (mode == "json") {
        return [](const ProgressEvent& ev) {
            json j = {{"type", "progress"},
                      {"url", ev.url},
                      {"stage", stage_name(ev.stage)},
                      {"downloaded_bytes", ev.downloadedBytes},
                      {"active_workers", ev.activeWorkers}};
            j["total_bytes"] = ev.totalBytes ? json(*ev.totalBytes) : json(nullptr);
            j["percent"] = ev.percentage ? json(*ev.percentage) : json(nullptr);
            j["speed_bps"] = ev.speedBps ? json(*ev.speedBps) : json(nullptr);
            j["eta_seconds"] = ev.etaSeconds ? json(*ev.etaSeconds) : json(nullptr);
            fmt::print(stderr, "{}\n", j.dump());
        };
    }
    return [](const ProgressEvent& ev) {
        if (ev.stage != ProgressStage::Downloading) {
            spdlog::info("{}: {}", ev.url, stage_name(ev.stage));
            return;
        }
        std::string line = formatBytes(ev.downloadedBytes);
        if (ev.totalBytes)
            line += " / " + formatBytes(*ev.totalBytes);
        if (ev.percentage)
            line += fmt::format(" ({:.1f}%)", *ev.percentage);
        if (ev.speedBps)
            line += " at " + formatBytes(*ev.speedBps) + "/s";
        if (ev.etaSeconds)
            line += fmt::format(", eta {}s", *ev.etaSeconds);
        spdlog::info("{}: {} [{} worker(s)]", ev.url, line, ev.activeWorkers);
    };
}

json result_to_json(const TaskResult& r) {
    json j = {{"type", "result"},
              {"url", r.url},
              {"path", r.destinationPath.string()},
              {"status", taskStatusName(r.status)},
              {"success", r.ok()},
              {"size_bytes", r.sizeBytes},
              {"bytes_transferred", r.bytesTransferred},
              {"elapsed_ms", r.duration.count()}};
    j["http_status"] = r.httpStatus ? json(*r.httpStatus) : json(nullptr);
    j["checksum_ok"] = r.checksumVerified ? json(*r.checksumVerified) : json(nullptr);
    if (r.digest) {
        j["digest"] = std::string(hashAlgoName(r.digest->algo)) + ":" + r.digest->hex;
    } else {
        j["digest"] = nullptr;
    }
    if (r.error) {
        j["error"] = {{"code", errorKindName(*r.error)}, {"message", r.message}};
    } else {
        j["error"] = nullptr;
    }
    return j;
}

void print_task_result(const TaskResult& r, bool asJson) {
    if (asJson) {
        fmt::print("{}\n", result_to_json(r).dump(2));
        return;
    }
    if (r.ok()) {
        fmt::print("Downloaded {} -> {} ({} in {:.1f}s)\n", r.url, r.destinationPath.string(),
                   formatBytes(r.sizeBytes), static_cast<double>(r.duration.count()) / 1000.0);
        if (r.checksumVerified && *r.checksumVerified)
            fmt::print("Checksum verified ({})\n", hashAlgoName(r.digest->algo));
    } else {
        fmt::print(stderr, "Download {}: {} [{}] {}\n", taskStatusName(r.status), r.url,
                   errorKindName(r.error.value_or(ErrorKind::Unknown)), r.message);
    }
}

void print_batch_table(const BatchResult& batch) {
    fmt::print("{:<8} {:>10} {:>8}  {}\n", "STATUS", "SIZE", "TIME", "URL");
    for (const auto& r : batch.results) {
        fmt::print("{:<8} {:>10} {:>7.1f}s  {}\n", taskStatusName(r.status),
                   r.ok() ? formatBytes(r.sizeBytes) : std::string("-"),
                   static_cast<double>(r.duration.count()) / 1000.0, r.url);
        if (!r.ok() && !r.message.empty())
            fmt::print("{:<8} {}\n", "", r.message);
    }
    fmt::print("\n{} succeeded, {} failed{}\n", batch.succeeded(), batch.failed(),
               batch.aborted ? " (batch aborted)" : "");
}

void apply_output(DownloadTask& task, const std::string& output) {
    if (output.empty())
        return;
    const auto path = onyx::config::expand_tilde(output);
    std::error_code ec;
    if (output.back() == '/' || fs::is_directory(path, ec))
        task.outputDir = path;
    else
        task.destinationPath = path;
}

ShouldCancel install_interrupt_handler() {
    g_interrupted.store(false);
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);
    return [] { return g_interrupted.load(); };
}

int run_single(const GlobalOptions& g, const SingleOpts& o, int defaultWorkers) {
    apply_log_level(g, o.common);
    auto cfg = load_config(g, o.common);

    DownloadTask task;
    task.url = o.url;
    task.workerCount = o.workers.value_or(defaultWorkers > 0 ? defaultWorkers : cfg.defaultWorkers);
    task.resume = !o.common.noResume;
    task.deleteOnMismatch = o.deleteOnMismatch;
    task.overwrite = o.force;
    task.headers = parse_headers(o.common.headers);
    if (!o.checksum.empty())
        task.expectedChecksum = parseChecksum(o.checksum);
    if (!o.maxSize.empty())
        task.maxBytes = parseSize(o.maxSize);
    apply_output(task, o.output);

    auto manager = makeDownloadManager(cfg);
    auto result =
        manager->download(task, make_progress_printer(o.common.progress), install_interrupt_handler());
    print_task_result(result, o.common.emitJson);
    if (g_interrupted.load())
        return kInterruptedExitCode;
    return exitCodeForFailures(result.ok() ? 0 : 1);
}

int run_batch(const GlobalOptions& g, const BatchOpts& o) {
    apply_log_level(g, o.common);
    auto cfg = load_config(g, o.common);

    std::ifstream in(o.urlsFile);
    if (!in) {
        spdlog::error("Cannot open URL list {}", o.urlsFile);
        return 1;
    }
    const auto urls = readUrlList(in);
    if (urls.empty()) {
        spdlog::warn("No URLs found in {}", o.urlsFile);
        return 0;
    }

    BatchJob job;
    job.concurrencyLimit = o.concurrency.value_or(cfg.batchConcurrency);
    job.continueOnError = o.continueOnError;
    const auto headers = parse_headers(o.common.headers);
    const auto maxBytes = o.maxSize.empty() ? std::nullopt : parseSize(o.maxSize);
    for (const auto& url : urls) {
        DownloadTask task;
        task.url = url;
        task.outputDir = onyx::config::expand_tilde(o.outputDir);
        task.workerCount = o.parts;
        task.resume = !o.common.noResume;
        task.headers = headers;
        task.maxBytes = maxBytes;
        job.tasks.push_back(std::move(task));
    }

    spdlog::info("Downloading {} URL(s) with concurrency {}", job.tasks.size(),
                 job.concurrencyLimit);
    auto manager = makeDownloadManager(cfg);
    auto batch = manager->downloadMany(job, make_progress_printer(o.common.progress),
                                       install_interrupt_handler());

    if (o.common.emitJson || o.outputFormat == "json") {
        json j = {{"type", "batch"},
                  {"succeeded", batch.succeeded()},
                  {"failed", batch.failed()},
                  {"aborted", batch.aborted},
                  {"results", json::array()}};
        for (const auto& r : batch.results)
            j["results"].push_back(result_to_json(r));
        fmt::print("{}\n", j.dump(2));
    } else {
        print_batch_table(batch);
    }
    if (g_interrupted.load())
        return kInterruptedExitCode;
    return exitCodeForFailures(batch.failed());
}

} // namespace

std::optional<std::uint64_t> parseSize(std::string_view text) {
    std::string s(text);
    onyx::config::trim(s);
    if (s.empty())
        return std::nullopt;

    std::size_t numEnd = 0;
    while (numEnd < s.size() &&
           (std::isdigit(static_cast<unsigned char>(s[numEnd])) || s[numEnd] == '.'))
        ++numEnd;
    if (numEnd == 0)
        return std::nullopt;

    double value = 0.0;
    try {
        std::size_t used = 0;
        value = std::stod(s.substr(0, numEnd), &used);
        if (used != numEnd)
            return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string unit = s.substr(numEnd);
    onyx::config::trim(unit);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (unit.size() == 3 && unit[1] == 'I' && unit[2] == 'B')
        unit = unit.substr(0, 1) + "B"; // KiB -> KB

    double mult = 1.0;
    if (unit.empty() || unit == "B")
        mult = 1.0;
    else if (unit == "K" || unit == "KB")
        mult = 1024.0;
    else if (unit == "M" || unit == "MB")
        mult = 1024.0 * 1024.0;
    else if (unit == "G" || unit == "GB")
        mult = 1024.0 * 1024.0 * 1024.0;
    else if (unit == "T" || unit == "TB")
        mult = 1024.0 * 1024.0 * 1024.0 * 1024.0;
    else
        return std::nullopt;

    const double bytes = value * mult;
    if (bytes < 0.0 || bytes > 1.8e19)
        return std::nullopt;
    return static_cast<std::uint64_t>(bytes);
}

std::optional<Header> parseHeader(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;
    std::string name(text.substr(0, colon));
    std::string value(text.substr(colon + 1));
    onyx::config::trim(name);
    onyx::config::trim(value);
    if (name.empty())
        return std::nullopt;
    return Header{std::move(name), std::move(value)};
}

std::vector<std::string> readUrlList(std::istream& in) {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        onyx::config::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        urls.push_back(line);
    }
    return urls;
}

int exitCodeForFailures(std::size_t failed) noexcept {
    return static_cast<int>(std::min<std::size_t>(failed, 125));
}

std::string formatBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0)
        return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

void registerDownloadCommand(CLI::App& app, const GlobalOptions& globals, int& exitCode) {
    auto* dl = app.add_subcommand("download", "Download files over HTTP(S) with resume, "
                                              "parallel ranges and checksum verification.");
    dl->require_subcommand(1);

    // ---- single ----
    {
        auto opts = std::make_shared<SingleOpts>();
        auto* sub = dl->add_subcommand("single", "Download one URL.");
        sub->add_option("url", opts->url, "Source URL (http or https).")->required();
        sub->add_option("-o,--output", opts->output,
                        "Output file, or directory (existing or ending in '/').");
        sub->add_option("-c,--checksum", opts->checksum,
                        "Expected checksum '<algo>:<hex>' (md5|sha1|sha256|sha512) or bare hex.")
            ->check(CLI::Validator(checksum_validator, "CHECKSUM"));
        sub->add_option("--max-size", opts->maxSize, "Refuse files larger than SIZE (e.g. 100MB).")
            ->check(CLI::Validator(size_validator, "SIZE"));
        sub->add_option("-w,--workers", opts->workers, "Parallel range requests (default 1).")
            ->check(CLI::Range(1, 64));
        sub->add_flag("--delete-on-mismatch", opts->deleteOnMismatch,
                      "Delete the file when the checksum does not match.");
        sub->add_flag("-f,--force", opts->force, "Overwrite an existing output file.");
        add_common_options(sub, opts->common);
        sub->callback([&globals, &exitCode, opts]() { exitCode = run_single(globals, *opts, 1); });
    }

    // ---- batch ----
    {
        auto opts = std::make_shared<BatchOpts>();
        auto* sub = dl->add_subcommand("batch", "Download every URL listed in a file.");
        sub->add_option("urls_file", opts->urlsFile,
                        "File with one URL per line ('#' starts a comment).")
            ->required()
            ->check(CLI::ExistingFile);
        sub->add_option("-o,--output-dir", opts->outputDir, "Output directory (default: .).");
        sub->add_option("-w,--workers", opts->concurrency,
                        "Concurrent downloads (default from config, 4).")
            ->check(CLI::Range(1, 64));
        sub->add_option("--parts", opts->parts, "Parallel range requests per file (default 1).")
            ->check(CLI::Range(1, 64));
        sub->add_option("--max-size", opts->maxSize, "Refuse files larger than SIZE (e.g. 100MB).")
            ->check(CLI::Validator(size_validator, "SIZE"));
        sub->add_flag("--continue-on-error", opts->continueOnError,
                      "Keep downloading the remaining URLs after a failure.");
        sub->add_option("--output", opts->outputFormat, "Result format: [table|json].")
            ->check(CLI::IsMember({"table", "json"}));
        add_common_options(sub, opts->common);
        sub->callback([&globals, &exitCode, opts]() { exitCode = run_batch(globals, *opts); });
    }

    // ---- accelerated ----
    {
        auto opts = std::make_shared<SingleOpts>();
        auto* sub = dl->add_subcommand("accelerated", "Download one URL as parallel ranges.");
        sub->add_option("url", opts->url, "Source URL (http or https).")->required();
        sub->add_option("-p,--parts", opts->workers,
                        "Number of parts downloaded simultaneously (default from config, 4).")
            ->check(CLI::Range(1, 64));
        sub->add_option("-o,--output", opts->output,
                        "Output file, or directory (existing or ending in '/').");
        sub->add_option("-c,--checksum", opts->checksum,
                        "Expected checksum '<algo>:<hex>' or bare hex.")
            ->check(CLI::Validator(checksum_validator, "CHECKSUM"));
        sub->add_option("--max-size", opts->maxSize, "Refuse files larger than SIZE (e.g. 100MB).")
            ->check(CLI::Validator(size_validator, "SIZE"));
        sub->add_flag("-f,--force", opts->force, "Overwrite an existing output file.");
        add_common_options(sub, opts->common);
        sub->callback([&globals, &exitCode, opts]() { exitCode = run_single(globals, *opts, 0); });
    }

    dl->footer(R"(Behavior:
  - Interrupted downloads resume from saved state on the next run (disable with --no-resume).
  - Existing files are never overwritten silently: a " (n)" suffix is added unless --force.
  - Exit code is 0 on success, otherwise the number of failed downloads (max 125).)");
}

} // namespace onyx::cli
