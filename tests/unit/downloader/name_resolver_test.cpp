#include <gtest/gtest.h>
#include <onyx/downloader/name_resolver.hpp>

#include "../../support/temp_dir_scope.hpp"

namespace fs = std::filesystem;
using namespace onyx::downloader;
using onyx::test_support::TempDirScope;
using onyx::test_support::write_file;

TEST(NameResolverTest, ContentDispositionPrefersExtendedFilename) {
    EXPECT_EQ(filenameFromContentDisposition(
                  "attachment; filename=\"plain.txt\"; filename*=UTF-8''r%C3%A9sum%C3%A9.pdf"),
              std::optional<std::string>("r\xC3\xA9sum\xC3\xA9.pdf"));
    EXPECT_EQ(filenameFromContentDisposition("attachment; filename=\"a;b.txt\""),
              std::optional<std::string>("a;b.txt"));
    EXPECT_EQ(filenameFromContentDisposition("attachment; filename=report.csv"),
              std::optional<std::string>("report.csv"));
    EXPECT_FALSE(filenameFromContentDisposition("inline").has_value());
    EXPECT_FALSE(filenameFromContentDisposition("attachment; filename=\"\"").has_value());
}

TEST(NameResolverTest, UrlSegmentIgnoresQueryAndDecodes) {
    EXPECT_EQ(filenameFromUrl("https://example.com/files/my%20file.tar.gz?token=1#frag"),
              std::optional<std::string>("my file.tar.gz"));
    EXPECT_FALSE(filenameFromUrl("https://example.com/").has_value());
    EXPECT_FALSE(filenameFromUrl("https://example.com").has_value());
    EXPECT_EQ(percentDecode("100%"), "100%");
    EXPECT_EQ(percentDecode("%zz%41"), "%zzA");
}

TEST(NameResolverTest, SanitizeReplacesInvalidCharacters) {
    EXPECT_EQ(sanitizeFilename("a<b>c:d\"e|f?g*h.txt"), "a_b_c_d_e_f_g_h.txt");
    EXPECT_EQ(sanitizeFilename("../etc/passwd"), "_etc_passwd");
    EXPECT_EQ(sanitizeFilename("  .hidden. "), "hidden");
    EXPECT_EQ(sanitizeFilename("..."), "");

    std::string longName(400, 'x');
    longName += ".iso";
    auto cut = sanitizeFilename(longName);
    EXPECT_EQ(cut.size(), 255u);
    EXPECT_EQ(cut.substr(cut.size() - 4), ".iso");
}

TEST(NameResolverTest, TruncationKeepsUtf8CharactersWhole) {
    auto whole_utf8 = [](const std::string& s) {
        for (std::size_t i = 0; i < s.size();) {
            const auto c = static_cast<unsigned char>(s[i]);
            const std::size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : 4;
            if ((c & 0xC0) == 0x80 || i + len > s.size())
                return false;
            for (std::size_t k = 1; k < len; ++k) {
                if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80)
                    return false;
            }
            i += len;
        }
        return true;
    };

    // "ab" puts the cut point on the second byte of a two-byte character
    std::string twoByte = "ab";
    for (int i = 0; i < 200; ++i)
        twoByte += "\xC3\xA9";
    twoByte += ".txt";
    auto cut2 = sanitizeFilename(twoByte);
    EXPECT_LE(cut2.size(), 255u);
    EXPECT_EQ(cut2.size(), 254u);
    EXPECT_TRUE(whole_utf8(cut2));
    EXPECT_EQ(cut2.substr(cut2.size() - 4), ".txt");

    std::string threeByte = "x";
    for (int i = 0; i < 120; ++i)
        threeByte += "\xE2\x82\xAC";
    threeByte += ".pdf";
    auto cut3 = sanitizeFilename(threeByte);
    EXPECT_LE(cut3.size(), 255u);
    EXPECT_TRUE(whole_utf8(cut3));
    EXPECT_EQ(cut3.substr(cut3.size() - 4), ".pdf");
}

TEST(NameResolverTest, GeneratedNameIsStable) {
    auto a = generatedName("https://example.com/");
    EXPECT_EQ(a.rfind("download-", 0), 0u);
    EXPECT_EQ(a.size(), std::string("download-").size() + 8);
    EXPECT_EQ(a, generatedName("https://example.com/"));
    EXPECT_NE(a, generatedName("https://example.org/"));
}

TEST(NameResolverTest, DerivedNamePriority) {
    auto tmp = TempDirScope::unique_under("onyx-names");
    DownloadTask task;
    task.url = "https://example.com/dl?id=7";
    task.outputDir = tmp.path();

    auto fromHeader = resolveOutputPath(task, std::string("server.bin"),
                                        "https://cdn.example.com/real.bin", {});
    ASSERT_TRUE(fromHeader.ok());
    EXPECT_EQ(fromHeader.value().filename(), "server.bin");

    auto fromRedirect =
        resolveOutputPath(task, std::nullopt, "https://cdn.example.com/real.bin", {});
    ASSERT_TRUE(fromRedirect.ok());
    EXPECT_EQ(fromRedirect.value().filename(), "real.bin");

    auto fromRequest = resolveOutputPath(task, std::nullopt, "", {});
    ASSERT_TRUE(fromRequest.ok());
    EXPECT_EQ(fromRequest.value().filename(), "dl");

    task.url = "https://example.com/";
    auto generated = resolveOutputPath(task, std::nullopt, "https://example.com/", {});
    ASSERT_TRUE(generated.ok());
    EXPECT_EQ(generated.value().filename(), generatedName(task.url));
    EXPECT_TRUE(generated.value().is_absolute());
}

TEST(NameResolverTest, CollisionsGetNumericSuffix) {
    auto tmp = TempDirScope::unique_under("onyx-collide");
    write_file(tmp.path() / "data.csv", "old");
    write_file(tmp.path() / "data (1).csv", "old");

    DownloadTask task;
    task.url = "https://example.com/data.csv";
    task.outputDir = tmp.path();
    auto r = resolveOutputPath(task, std::nullopt, "", {});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().filename(), "data (2).csv");

    task.overwrite = true;
    auto forced = resolveOutputPath(task, std::nullopt, "", {});
    ASSERT_TRUE(forced.ok());
    EXPECT_EQ(forced.value().filename(), "data.csv");
}

TEST(NameResolverTest, ResumeTargetIsReusedInsteadOfSuffixed) {
    auto tmp = TempDirScope::unique_under("onyx-resume-name");
    const auto partial = (tmp.path() / "big.iso").lexically_normal();
    write_file(partial, "partial");

    DownloadTask task;
    task.url = "https://example.com/big.iso";
    task.destinationPath = partial;
    auto r = resolveOutputPath(task, std::nullopt, "",
                               [&](const fs::path& p) { return p == partial; });
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value(), partial);
}

TEST(NameResolverTest, ExistingDirectoryAsDestinationActsAsOutputDir) {
    auto tmp = TempDirScope::unique_under("onyx-dir-dest");
    DownloadTask task;
    task.url = "https://example.com/pkg.zip";
    task.destinationPath = tmp.path();
    auto r = resolveOutputPath(task, std::nullopt, "", {});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().parent_path(), fs::absolute(tmp.path()).lexically_normal());
    EXPECT_EQ(r.value().filename(), "pkg.zip");
}
