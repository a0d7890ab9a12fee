/*
 * onyx/src/downloader/name_resolver.cpp
 *
 * Output naming:
 * - explicit destination > Content-Disposition > effective URL segment > request URL segment
 *   > generated name
 * - never silently overwrite: collisions get "name (1).ext", "name (2).ext", ...
 * - a path already described by a resume record is reused, not suffixed
 */

#include <onyx/downloader/name_resolver.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <string>
#include <vector>

namespace onyx::downloader {

namespace fs = std::filesystem;

namespace {

constexpr int kMaxCollisionSuffix = 9999;
constexpr std::size_t kMaxNameBytes = 255;

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

// Split a header value on ';' outside of double quotes.
std::vector<std::string_view> split_params(std::string_view header) {
    std::vector<std::string_view> out;
    bool quoted = false;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const char c = header[i];
        if (c == '\\' && quoted && i + 1 < header.size()) {
            ++i;
        } else if (c == '"') {
            quoted = !quoted;
        } else if (c == ';' && !quoted) {
            out.push_back(header.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    out.push_back(header.substr(begin));
    return out;
}

std::string unquote_value(std::string_view v) {
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        std::string out;
        v = v.substr(1, v.size() - 2);
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '\\' && i + 1 < v.size())
                ++i;
            out.push_back(v[i]);
        }
        return out;
    }
    return std::string(v);
}

} // namespace

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::optional<std::string> filenameFromContentDisposition(std::string_view header) {
    std::optional<std::string> extended;
    std::optional<std::string> plain;

    for (auto param : split_params(header)) {
        auto eq = param.find('=');
        if (eq == std::string_view::npos)
            continue;
        auto name = trim_view(param.substr(0, eq));
        auto value = trim_view(param.substr(eq + 1));
        if (value.empty())
            continue;

        if (iequals(name, "filename*")) {
            // charset'language'pct-encoded
            auto raw = unquote_value(value);
            auto first = raw.find('\'');
            auto second =
                first == std::string::npos ? std::string::npos : raw.find('\'', first + 1);
            if (second != std::string::npos) {
                auto charset = std::string_view(raw).substr(0, first);
                if (charset.empty() || iequals(charset, "utf-8") ||
                    iequals(charset, "iso-8859-1")) {
                    extended = percentDecode(std::string_view(raw).substr(second + 1));
                }
            }
        } else if (iequals(name, "filename")) {
            plain = percentDecode(unquote_value(value));
        }
    }

    if (extended && !extended->empty())
        return extended;
    if (plain && !plain->empty())
        return plain;
    return std::nullopt;
}

std::optional<std::string> filenameFromUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);

    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        url = url.substr(scheme + 3);
        auto slash = url.find('/');
        if (slash == std::string_view::npos)
            return std::nullopt; // host only
        url = url.substr(slash);
    }

    auto last = url.rfind('/');
    auto segment = last == std::string_view::npos ? url : url.substr(last + 1);
    if (segment.empty())
        return std::nullopt;
    auto decoded = percentDecode(segment);
    if (decoded.empty())
        return std::nullopt;
    return decoded;
}

std::string sanitizeFilename(std::string_view name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (unsigned char c : name) {
        const bool invalid = c < 0x20 || c == 0x7f || c == '<' || c == '>' || c == ':' ||
                             c == '"' || c == '/' || c == '\\' || c == '|' || c == '?' ||
                             c == '*';
        cleaned.push_back(invalid ? '_' : static_cast<char>(c));
    }

    std::size_t b = 0;
    std::size_t e = cleaned.size();
    while (b < e && (cleaned[b] == ' ' || cleaned[b] == '.'))
        ++b;
    while (e > b && (cleaned[e - 1] == ' ' || cleaned[e - 1] == '.'))
        --e;
    cleaned = cleaned.substr(b, e - b);

    if (cleaned.size() > kMaxNameBytes) {
        // Keep the extension when truncating
        auto dot = cleaned.rfind('.');
        std::string ext = (dot != std::string::npos && cleaned.size() - dot <= 16)
                              ? cleaned.substr(dot)
                              : std::string{};
        // Back off to a UTF-8 lead byte so no multi-byte character is split
        std::size_t cut = kMaxNameBytes - ext.size();
        while (cut > 0 && (static_cast<unsigned char>(cleaned[cut]) & 0xC0) == 0x80)
            --cut;
        cleaned = cleaned.substr(0, cut) + ext;
    }
    return cleaned;
}

std::string generatedName(std::string_view url) {
    auto verifier = makeIntegrityVerifier(HashAlgo::Sha256);
    verifier->update(std::as_bytes(std::span<const char>(url.data(), url.size())));
    auto digest = verifier->finalize();
    return "download-" + digest.hex.substr(0, 8);
}

Expected<fs::path> resolveOutputPath(const DownloadTask& task,
                                     const std::optional<std::string>& suggestedName,
                                     std::string_view effectiveUrl,
                                     const PathPredicate& isResumeTarget,
                                     const PathPredicate& isClaimed) {
    std::error_code ec;
    fs::path candidate;

    const bool explicitFile =
        task.destinationPath && !task.destinationPath->empty() &&
        !fs::is_directory(*task.destinationPath, ec);

    if (explicitFile) {
        candidate = *task.destinationPath;
    } else {
        fs::path dir;
        if (task.destinationPath && !task.destinationPath->empty())
            dir = *task.destinationPath;
        else if (task.outputDir)
            dir = *task.outputDir;

        std::string name;
        if (suggestedName)
            name = sanitizeFilename(*suggestedName);
        if (name.empty() && !effectiveUrl.empty()) {
            if (auto n = filenameFromUrl(effectiveUrl))
                name = sanitizeFilename(*n);
        }
        if (name.empty()) {
            if (auto n = filenameFromUrl(task.url))
                name = sanitizeFilename(*n);
        }
        if (name.empty())
            name = generatedName(task.url);
        candidate = dir / name;
    }

    candidate = fs::absolute(candidate, ec);
    if (ec) {
        return Error{ErrorKind::DiskError, "Cannot resolve output path: " + ec.message()};
    }
    candidate = candidate.lexically_normal();

    if (task.overwrite)
        return candidate;

    auto usable = [&](const fs::path& p) {
        if (isClaimed && isClaimed(p))
            return false;
        std::error_code xec;
        if (!fs::exists(p, xec))
            return true;
        return isResumeTarget && isResumeTarget(p);
    };

    if (usable(candidate))
        return candidate;

    const auto stem = candidate.stem().string();
    const auto ext = candidate.extension().string();
    const auto parent = candidate.parent_path();
    for (int n = 1; n <= kMaxCollisionSuffix; ++n) {
        auto alt = parent / (stem + " (" + std::to_string(n) + ")" + ext);
        if (usable(alt)) {
            spdlog::debug("NameResolver: {} exists, using {}", candidate.filename().string(),
                          alt.filename().string());
            return alt;
        }
    }
    return Error{ErrorKind::DiskError, "No free output name for " + candidate.string()};
}

} // namespace onyx::downloader
