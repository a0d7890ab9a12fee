/*
 * onyx/src/downloader/integrity_verifier.cpp
 *
 * IntegrityVerifier (OpenSSL EVP)
 *
 * Implements onyx::downloader::IIntegrityVerifier using OpenSSL's EVP interface.
 * - Supports MD5, SHA-1, SHA-256 and SHA-512.
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns a Checksum { algo, hex } and re-arms the context for reuse.
 *
 * Also hosts the checksum helpers declared in downloader.hpp (parseChecksum, hashFile,
 * makeResumeKey) since they all sit on the same digest code.
 */

#include <onyx/downloader/downloader.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>

namespace onyx::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline const EVP_MD* resolve_algo(HashAlgo algo) {
    switch (algo) {
        case HashAlgo::Md5:
            return EVP_md5();
        case HashAlgo::Sha1:
            return EVP_sha1();
        case HashAlgo::Sha256:
            return EVP_sha256();
        case HashAlgo::Sha512:
            return EVP_sha512();
    }
    return EVP_sha256();
}

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool is_hex(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

std::optional<HashAlgo> algo_for_hex_length(std::size_t len) {
    switch (len) {
        case 32:
            return HashAlgo::Md5;
        case 40:
            return HashAlgo::Sha1;
        case 64:
            return HashAlgo::Sha256;
        case 128:
            return HashAlgo::Sha512;
        default:
            return std::nullopt;
    }
}

class OpenSslIntegrityVerifier final : public IIntegrityVerifier {
public:
    explicit OpenSslIntegrityVerifier(HashAlgo algo) { reset(algo); }

    ~OpenSslIntegrityVerifier() override = default;

    void reset(HashAlgo algo) override {
        _algo = algo;
        _md = resolve_algo(_algo);
        _ctx = EvpMdCtx{};
        _finalized = false;
        if (!_ctx || !_md) {
            spdlog::error("IntegrityVerifier: failed to allocate digest context");
            return;
        }
        if (EVP_DigestInit_ex(_ctx.ctx, _md, nullptr) != 1) {
            spdlog::error("IntegrityVerifier: EVP_DigestInit_ex failed for {}",
                          hashAlgoName(_algo));
            _ctx = EvpMdCtx{};
        }
    }

    void update(std::span<const std::byte> data) override {
        if (!_ctx || _finalized || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            spdlog::error("IntegrityVerifier: EVP_DigestUpdate failed");
            _ctx = EvpMdCtx{};
        }
    }

    Checksum finalize() override {
        Checksum out;
        out.algo = _algo;

        if (!_ctx || _finalized) {
            // Empty hex signals "no digest" to callers.
            return out;
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;

        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) != 1) {
            _finalized = true;
            return out;
        }

        out.hex = to_hex_lower(md_buf.data(), md_len);

        // Prepare for potential reuse: re-init with same algo
        reset(_algo);
        return out;
    }

private:
    HashAlgo _algo{HashAlgo::Sha256};
    const EVP_MD* _md{nullptr};
    EvpMdCtx _ctx{};
    bool _finalized{false};
};

} // namespace

const char* hashAlgoName(HashAlgo algo) noexcept {
    switch (algo) {
        case HashAlgo::Md5:
            return "md5";
        case HashAlgo::Sha1:
            return "sha1";
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
    }
    return "sha256";
}

std::optional<HashAlgo> hashAlgoFromName(std::string_view name) {
    const auto n = to_lower(name);
    if (n == "md5")
        return HashAlgo::Md5;
    if (n == "sha1" || n == "sha-1")
        return HashAlgo::Sha1;
    if (n == "sha256" || n == "sha-256")
        return HashAlgo::Sha256;
    if (n == "sha512" || n == "sha-512")
        return HashAlgo::Sha512;
    return std::nullopt;
}

std::optional<Checksum> parseChecksum(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    std::optional<HashAlgo> algo;
    std::string_view hex = text;
    if (auto colon = text.find(':'); colon != std::string_view::npos) {
        algo = hashAlgoFromName(text.substr(0, colon));
        if (!algo)
            return std::nullopt;
        hex = text.substr(colon + 1);
    }
    if (!is_hex(hex))
        return std::nullopt;

    const auto implied = algo_for_hex_length(hex.size());
    if (!implied)
        return std::nullopt;
    if (algo && *algo != *implied)
        return std::nullopt;

    return Checksum{algo.value_or(*implied), to_lower(hex)};
}

Expected<Checksum> hashFile(const std::filesystem::path& path, HashAlgo algo) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorKind::DiskError, "Failed to open for hashing: " + path.string()};
    }
    auto verifier = makeIntegrityVerifier(algo);
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), buffer.size());
        auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorKind::DiskError, "Read failed while hashing: " + path.string()};
    }
    auto digest = verifier->finalize();
    if (digest.hex.empty()) {
        return Error{ErrorKind::Unknown, "Failed to finalize digest for: " + path.string()};
    }
    return digest;
}

std::string makeResumeKey(std::string_view url, const std::filesystem::path& destination) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(destination, ec);
    const std::string dest = (ec ? destination : absolute).lexically_normal().string();

    auto verifier = makeIntegrityVerifier(HashAlgo::Sha256);
    verifier->update(std::as_bytes(std::span<const char>(url.data(), url.size())));
    const char sep = '\n';
    verifier->update(std::as_bytes(std::span<const char>(&sep, 1)));
    verifier->update(std::as_bytes(std::span<const char>(dest.data(), dest.size())));
    return verifier->finalize().hex;
}

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo) {
    return std::make_unique<OpenSslIntegrityVerifier>(algo);
}

bool checksumMatches(const Checksum& expected, const Checksum& actual) {
    if (expected.algo != actual.algo || actual.hex.empty())
        return false;
    const auto a = to_lower(expected.hex);
    const auto b = to_lower(actual.hex);
    if (a.size() != b.size())
        return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace onyx::downloader
