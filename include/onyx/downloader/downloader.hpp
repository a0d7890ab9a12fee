#pragma once

/*
 * Onyx Downloader - Public Types and Manager Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * downloader subsystem. Component implementations live in src/downloader and
 * are reached through the factories at the bottom of this file.
 *
 * Design principles:
 * - One terminal TaskResult per task, carrying a closed ErrorKind
 * - Resumable multi-part transfers into a single destination file
 * - Robust progress reporting and cooperative cancellation
 * - Clear separation of concerns (HTTP adapter, integrity verification, disk writer, resume)
 */

#include <onyx/version.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace onyx::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Md5, // accepted for compatibility with published checksums; not collision resistant
    Sha1,
    Sha256,
    Sha512
};

/**
 * Progress stages during a single download lifecycle.
 */
enum class ProgressStage { Resolving, Connecting, Downloading, Verifying, Finalizing };

/**
 * Closed error taxonomy for downloader operations.
 */
enum class ErrorKind {
    None = 0,
    InvalidArgument,
    Unreachable,
    NetworkError,
    HttpClientError,
    HttpRateLimitOrServerError,
    RangeUnsupported,
    RangeNotSatisfiable,
    SizeLimitExceeded,
    ChecksumMismatch,
    DiskError,
    ResumeIncompatible,
    Cancelled,
    Unknown
};

[[nodiscard]] constexpr const char* errorKindName(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::Unreachable:
            return "unreachable";
        case ErrorKind::NetworkError:
            return "network_error";
        case ErrorKind::HttpClientError:
            return "http_client_error";
        case ErrorKind::HttpRateLimitOrServerError:
            return "http_rate_limit_or_server_error";
        case ErrorKind::RangeUnsupported:
            return "range_unsupported";
        case ErrorKind::RangeNotSatisfiable:
            return "range_not_satisfiable";
        case ErrorKind::SizeLimitExceeded:
            return "size_limit_exceeded";
        case ErrorKind::ChecksumMismatch:
            return "checksum_mismatch";
        case ErrorKind::DiskError:
            return "disk_error";
        case ErrorKind::ResumeIncompatible:
            return "resume_incompatible";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

/**
 * Transient failures that a Worker or the RangeResolver retries with backoff.
 */
[[nodiscard]] constexpr bool isRetryable(ErrorKind kind) noexcept {
    return kind == ErrorKind::NetworkError || kind == ErrorKind::Unreachable ||
           kind == ErrorKind::HttpRateLimitOrServerError;
}

/**
 * Classify a final HTTP status (>= 400) into the error taxonomy.
 */
[[nodiscard]] constexpr ErrorKind classifyHttpStatus(long status) noexcept {
    if (status == 416)
        return ErrorKind::RangeNotSatisfiable;
    if (status == 429 || status >= 500)
        return ErrorKind::HttpRateLimitOrServerError;
    if (status >= 400)
        return ErrorKind::HttpClientError;
    return ErrorKind::None;
}

/// Marks the end of a chunk whose size is not known until EOF.
inline constexpr std::uint64_t kOpenEndedOffset = std::numeric_limits<std::uint64_t>::max();

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Retry/backoff policy. maxAttempts counts every attempt, including the first.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Downloader default configuration.
 */
struct DownloaderConfig {
    int defaultWorkers{4};
    int batchConcurrency{4};
    std::uint64_t minChunkBytes{1024ull * 1024ull}; // 1 MiB
    RetryPolicy retry{};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds idleTimeout{30000};
    std::chrono::milliseconds progressInterval{250};
    std::chrono::milliseconds persistInterval{1000};
    std::uint64_t persistEveryBytes{1024ull * 1024ull};
    std::filesystem::path resumeDir; // empty = <cache dir>/resume
    std::string userAgent{"Onyx-Download/" ONYX_VERSION_STRING};
    TlsConfig tls{};
    bool followRedirects{true};
    std::uint64_t maxFileBytes{0}; // 0 = unlimited
};

/**
 * Options applied to every request the HTTP adapter issues.
 */
struct RequestOptions {
    std::vector<Header> headers;
    std::string userAgent;
    TlsConfig tls{};
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds idleTimeout{30000};
    bool followRedirects{true};
};

/**
 * Byte range [offset, offset + length). An empty length requests everything from offset.
 */
struct ByteRange {
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length{};
};

/**
 * Response metadata delivered before the first body byte (and returned by probe()).
 */
struct ResponseHead {
    long httpStatus{0};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> rangeStart{};     // Content-Range: bytes <start>-...
    std::optional<std::uint64_t> instanceLength{}; // Content-Range: .../<total>
    bool acceptRanges{false};
    std::optional<std::string> contentDisposition{};
    std::optional<std::string> etag{};
    std::string effectiveUrl;
};

// ==============
// Task model
// ==============

enum class ChunkStatus { Pending, Active, Complete, Failed };

/**
 * One contiguous byte range of a task: [startOffset, endOffset).
 */
struct Chunk {
    std::uint32_t id{0};
    std::uint64_t startOffset{0};
    std::uint64_t endOffset{0};
    std::uint64_t bytesWritten{0};
    ChunkStatus status{ChunkStatus::Pending};
    int attemptCount{0};

    [[nodiscard]] bool openEnded() const noexcept { return endOffset == kOpenEndedOffset; }
    [[nodiscard]] std::uint64_t size() const noexcept {
        return openEnded() ? kOpenEndedOffset : endOffset - startOffset;
    }
    [[nodiscard]] std::uint64_t nextOffset() const noexcept { return startOffset + bytesWritten; }
    [[nodiscard]] bool done() const noexcept {
        return status == ChunkStatus::Complete || (!openEnded() && bytesWritten == size());
    }
};

enum class TaskState { Pending, Planning, Transferring, Verifying, Done, Failed };

/**
 * A single download request. Owned by the caller; the manager works on a copy.
 */
struct DownloadTask {
    std::string url;
    std::optional<std::filesystem::path> destinationPath;
    std::optional<std::filesystem::path> outputDir; // used when the name is derived
    std::optional<std::uint64_t> expectedSize;
    bool supportsRange{false};
    std::optional<Checksum> expectedChecksum;
    int workerCount{4};
    TaskState state{TaskState::Pending};

    std::optional<std::uint64_t> maxBytes; // size limit (overrides config maxFileBytes)
    bool resume{true};
    bool deleteOnMismatch{false};
    bool overwrite{false};
    std::vector<Header> headers;
};

enum class TaskStatus { Success, Failed, Aborted };

[[nodiscard]] constexpr const char* taskStatusName(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Success:
            return "success";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Aborted:
            return "aborted";
    }
    return "failed";
}

/**
 * Final outcome of one task. Built once, never mutated afterwards.
 */
struct TaskResult {
    TaskStatus status{TaskStatus::Failed};
    std::uint64_t bytesTransferred{0}; // bytes received in this run (excludes resumed bytes)
    std::chrono::milliseconds duration{0};
    std::optional<ErrorKind> error{};
    std::optional<bool> checksumVerified{};

    std::string url;
    std::filesystem::path destinationPath;
    std::uint64_t sizeBytes{0};
    std::string message;
    std::optional<long> httpStatus{};
    std::optional<Checksum> digest{};

    [[nodiscard]] bool ok() const noexcept { return status == TaskStatus::Success; }
};

/**
 * Durable snapshot of a task's chunk plan and progress.
 */
struct ResumeRecord {
    static constexpr int kFormatVersion = 1;

    std::string key;
    std::string url;
    std::filesystem::path destinationPath;
    std::uint64_t expectedSize{0};
    std::optional<HashAlgo> checksumAlgorithm{};
    std::optional<std::string> etag{}; // validator seen when the record was created
    int workerCount{1};
    std::vector<Chunk> chunks;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept {
        std::uint64_t total = 0;
        for (const auto& c : chunks)
            total += c.bytesWritten;
        return total;
    }
};

struct BatchJob {
    std::vector<DownloadTask> tasks;
    int concurrencyLimit{4};
    bool continueOnError{true};
};

struct BatchResult {
    std::vector<TaskResult> results; // submission order
    bool aborted{false};

    [[nodiscard]] std::size_t succeeded() const noexcept {
        std::size_t n = 0;
        for (const auto& r : results)
            n += r.status == TaskStatus::Success ? 1 : 0;
        return n;
    }
    [[nodiscard]] std::size_t failed() const noexcept { return results.size() - succeeded(); }
};

/**
 * Streaming progress event for a single URL.
 */
struct ProgressEvent {
    std::string url;
    std::uint64_t downloadedBytes{0};
    std::optional<std::uint64_t> totalBytes{};
    std::optional<float> percentage{}; // 0.0 - 100.0 (approx)
    std::optional<std::uint64_t> speedBps{};
    std::optional<std::uint32_t> etaSeconds{};
    int activeWorkers{0};
    ProgressStage stage{ProgressStage::Downloading};
    std::chrono::steady_clock::time_point timestamp{std::chrono::steady_clock::now()};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorKind code{ErrorKind::None};
    std::string message;
    std::optional<long> httpStatus{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using ResponseCallback = std::function<Expected<void>(const ResponseHead&)>;
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 * Implementations must be safe to call concurrently from several workers.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Probe server metadata: HEAD, falling back to GET bytes=0-0 when HEAD is disallowed.
     */
    virtual Expected<ResponseHead> probe(std::string_view url, const RequestOptions& options) = 0;

    /**
     * GET the resource (or the given range) and stream the body to sink.
     * onResponse sees the final response head before the first body byte and may veto the
     * transfer by returning an error. Statuses >= 400 are reported as errors and never reach
     * the sink.
     */
    virtual Expected<ResponseHead> fetch(std::string_view url, const RequestOptions& options,
                                         const std::optional<ByteRange>& range,
                                         const ResponseCallback& onResponse, const BodySink& sink,
                                         const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Resume persistence for partial downloads, one record per (url, destination).
 */
class IResumeStore {
public:
    virtual ~IResumeStore() = default;

    virtual Expected<std::optional<ResumeRecord>> load(std::string_view key) = 0;
    virtual Expected<void> save(const ResumeRecord& record) = 0;
    virtual void remove(std::string_view key) noexcept = 0;
};

/**
 * Download manager abstraction (orchestrates resolver/planner/pool/verifier/resume).
 */
class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    /**
     * Execute a single task. Always returns exactly one terminal result.
     */
    virtual TaskResult download(const DownloadTask& task, const ProgressCallback& onProgress = {},
                                const ShouldCancel& shouldCancel = {}) = 0;

    /**
     * Execute a batch. Order of results matches the order of tasks.
     */
    virtual BatchResult downloadMany(const BatchJob& job, const ProgressCallback& onProgress = {},
                                     const ShouldCancel& shouldCancel = {}) = 0;

    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

// ======================
// Utility helpers
// ======================

/**
 * Parse "<algo>:<hex>" or bare hex (algorithm inferred from length).
 */
[[nodiscard]] std::optional<Checksum> parseChecksum(std::string_view text);

/**
 * Same algorithm and case-insensitively equal hex; an empty actual digest never matches.
 */
[[nodiscard]] bool checksumMatches(const Checksum& expected, const Checksum& actual);

[[nodiscard]] const char* hashAlgoName(HashAlgo algo) noexcept;
[[nodiscard]] std::optional<HashAlgo> hashAlgoFromName(std::string_view name);

/**
 * Stream a file through the verifier for the given algorithm.
 */
Expected<Checksum> hashFile(const std::filesystem::path& path, HashAlgo algo);

/**
 * Stable identifier for a (url, destination) pair: SHA-256 hex.
 */
[[nodiscard]] std::string makeResumeKey(std::string_view url,
                                        const std::filesystem::path& destination);

// ======================
// Factories
// ======================

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Sha256);
std::unique_ptr<IResumeStore> makeJsonResumeStore(std::filesystem::path directory);

/**
 * Factory function to create a default DownloadManager instance.
 */
std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg);

std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg, std::shared_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IResumeStore> resume);

} // namespace onyx::downloader
