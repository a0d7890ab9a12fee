/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - probe() and fetch() on top of the libcurl easy API; one easy handle per call, so the
 *   adapter is safe to share between workers.
 * - Honors connect/idle timeouts, TLS verify/CA, user agent, headers, redirects, and Range.
 * - The response head (status, Content-Length, Content-Range, Content-Disposition) is handed
 *   to the caller before the first body byte; the caller may veto the transfer.
 * - Cooperative cancellation is checked on every body write and from the transfer-info
 *   callback, so stalled transfers are cancellable too.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <onyx/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace onyx::downloader {

namespace {

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

// Local helper: lowercase copy
std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Case-insensitive starts_with
bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t tmp{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return tmp;
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorKind::None;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            err.code = ErrorKind::Unreachable;
            break;
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorKind::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorKind::InvalidArgument;
            break;
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorKind::HttpClientError;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorKind::Cancelled;
            break;
        default:
            err.code = ErrorKind::Unknown;
            break;
    }
    return err;
}

// Header parser context. Reset on every status line: with redirects curl reports the
// headers of each hop, and only the last block describes the body.
struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> rangeStart{};
    std::optional<std::uint64_t> instanceLength{};
    std::optional<std::string> contentDisposition;
    std::optional<std::string> etag;
};

// "bytes 100-199/1000" or "bytes */1000"
void parse_content_range(std::string_view val, HeaderParseContext& ctx) {
    if (!istarts_with(val, "bytes"))
        return;
    auto rest = std::string_view(val).substr(5);
    while (!rest.empty() && (rest.front() == ' ' || rest.front() == '='))
        rest.remove_prefix(1);
    auto slash = rest.find('/');
    auto span = rest.substr(0, slash);
    if (span != "*") {
        auto dash = span.find('-');
        if (dash != std::string_view::npos) {
            ctx.rangeStart = parse_u64(span.substr(0, dash));
        }
    }
    if (slash != std::string_view::npos) {
        auto total = rest.substr(slash + 1);
        if (total != "*")
            ctx.instanceLength = parse_u64(total);
    }
}

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (istarts_with(line, "HTTP/")) {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes") {
            ctx->acceptRangesBytes = true;
        }
    } else if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        parse_content_range(val, *ctx);
    } else if (key == "content-disposition") {
        ctx->contentDisposition = val;
    } else if (key == "etag") {
        // Strip surrounding quotes if present
        auto v = val;
        if (v.size() >= 2 &&
            ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
            v = v.substr(1, v.size() - 2);
        }
        ctx->etag = std::move(v);
    }

    return total;
}

ResponseHead make_head(CURL* curl, const HeaderParseContext& h) {
    ResponseHead head;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.httpStatus);
    head.contentLength = h.contentLength;
    head.rangeStart = h.rangeStart;
    head.instanceLength = h.instanceLength;
    head.acceptRanges = h.acceptRangesBytes;
    head.contentDisposition = h.contentDisposition;
    head.etag = h.etag;
    char* effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        head.effectiveUrl = effective;
    }
    return head;
}

Error http_status_error(long status) {
    Error err{classifyHttpStatus(status), "HTTP error " + std::to_string(status), status};
    return err;
}

// Write sink context for fetch
struct WriteContext {
    CURL* curl{nullptr};
    const HeaderParseContext* headers{nullptr};
    const ResponseCallback* onResponse{nullptr};
    const BodySink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    bool headDelivered{false};
    ResponseHead head{};
    std::optional<Error> error{};
};

// Runs once per transfer, before the first body byte (or after an empty body).
bool deliver_head(WriteContext& ctx) {
    ctx.headDelivered = true;
    ctx.head = make_head(ctx.curl, *ctx.headers);
    if (ctx.head.httpStatus >= 400) {
        ctx.error = http_status_error(ctx.head.httpStatus);
        return false;
    }
    if (ctx.onResponse && *ctx.onResponse) {
        auto r = (*ctx.onResponse)(ctx.head);
        if (!r.ok()) {
            ctx.error = r.error();
            return false;
        }
    }
    return true;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->headDelivered && !deliver_head(*ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->error = Error{ErrorKind::Cancelled, "Transfer cancelled"};
        return 0;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorKind::Unknown, "No sink provided"}};
    if (!r.ok()) {
        ctx->error = r.error();
        return 0;
    }
    return total;
}

// Transfer-info callback; lets stalled transfers observe cancellation
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<const ShouldCancel*>(userdata);
    if (cancel && *cancel && (*cancel)())
        return 1;
    return 0;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const RequestOptions& options) {
    curl_slist* list = nullptr;
    for (const auto& h : options.headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const RequestOptions& options) {
    // Timeouts: no total deadline, a transfer may legitimately run for hours
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options.connectTimeout.count()));
    const long idleSeconds =
        std::max<long>(1, static_cast<long>((options.idleTimeout.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idleSeconds);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

std::string range_header(const ByteRange& range) {
    std::string h = "Range: bytes=" + std::to_string(range.offset) + "-";
    if (range.length && *range.length > 0) {
        h += std::to_string(range.offset + *range.length - 1);
    }
    return h;
}

// Owns one easy handle and its header list for the duration of a call
class EasyHandle {
public:
    EasyHandle() : curl_(curl_easy_init()) {}
    ~EasyHandle() {
        if (list_)
            curl_slist_free_all(list_);
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    CURL* get() const noexcept { return curl_; }
    void setHeaders(curl_slist* list) {
        list_ = list;
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, list_);
    }

private:
    CURL* curl_{nullptr};
    curl_slist* list_{nullptr};
};

} // namespace

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_initialized(); }
    ~CurlHttpAdapter() override = default;

    Expected<ResponseHead> probe(std::string_view url, const RequestOptions& options) override {
        auto head = headRequest(url, options);
        if (head.ok()) {
            const long status = head.value().httpStatus;
            if (status < 400)
                return head;
            if (status != 403 && status != 405 && status != 501)
                return http_status_error(status);
            spdlog::debug("HEAD {} returned {}, attempting GET Range 0-0", url, status);
        } else {
            if (head.error().code == ErrorKind::Unreachable ||
                head.error().code == ErrorKind::InvalidArgument) {
                return head.error();
            }
            spdlog::debug("HEAD probe failed ({}), attempting GET Range 0-0",
                          head.error().message);
        }
        return rangeProbe(url, options);
    }

    Expected<ResponseHead> fetch(std::string_view url, const RequestOptions& options,
                                 const std::optional<ByteRange>& range,
                                 const ResponseCallback& onResponse, const BodySink& sink,
                                 const ShouldCancel& shouldCancel) override {
        EasyHandle easy;
        CURL* curl = easy.get();
        if (!curl) {
            return Error{ErrorKind::Unknown, "curl_easy_init failed"};
        }

        // Build headers including Range
        curl_slist* list = build_header_list(options);
        if (range) {
            list = curl_slist_append(list, range_header(*range).c_str());
        }
        easy.setHeaders(list);

        const std::string urlStr(url);
        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.headers = &hctx;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &shouldCancel);

        configure_common(curl, options);

        CURLcode rc = curl_easy_perform(curl);

        if (wctx.error) {
            return *wctx.error;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET)");
        }
        // Empty body: the write callback never ran
        if (!wctx.headDelivered && !deliver_head(wctx)) {
            return *wctx.error;
        }
        if (wctx.head.etag) {
            spdlog::debug("HTTP fetch captured ETag: {}", *wctx.head.etag);
        }
        return wctx.head;
    }

private:
    Expected<ResponseHead> headRequest(std::string_view url, const RequestOptions& options) {
        EasyHandle easy;
        CURL* curl = easy.get();
        if (!curl) {
            return Error{ErrorKind::Unknown, "curl_easy_init failed"};
        }
        easy.setHeaders(build_header_list(options));

        const std::string urlStr(url);
        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);
        configure_common(curl, options);

        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "probe(HEAD)");
        }
        return make_head(curl, hctx);
    }

    // GET bytes=0-0: 206 means ranges work and Content-Range carries the size; a 200 means
    // the server ignored the range. The body is never read.
    Expected<ResponseHead> rangeProbe(std::string_view url, const RequestOptions& options) {
        std::optional<ResponseHead> captured;
        ResponseCallback onResponse = [&captured](const ResponseHead& head) -> Expected<void> {
            captured = head;
            return Error{ErrorKind::Cancelled, "probe complete"};
        };
        BodySink sink = [](std::span<const std::byte>) -> Expected<void> {
            return Expected<void>{};
        };
        auto r = fetch(url, options, ByteRange{0, 1}, onResponse, sink, ShouldCancel{});
        if (!captured) {
            if (!r.ok())
                return r.error();
            captured = r.value();
        }

        ResponseHead head = *captured;
        if (head.httpStatus == 206) {
            head.acceptRanges = true;
            head.contentLength = head.instanceLength;
        } else {
            head.acceptRanges = false;
        }
        head.rangeStart.reset();
        return head;
    }
};

/// Factory: the production adapter. Shared by every worker of every task.
std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_shared<CurlHttpAdapter>();
}

} // namespace onyx::downloader
