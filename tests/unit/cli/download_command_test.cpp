#include <gtest/gtest.h>
#include <onyx/cli/download_command.h>
#include <onyx/cli/onyx_cli.h>

#include <sstream>
#include <vector>

using namespace onyx::cli;

TEST(DownloadCommandTest, ParseSizeUnits) {
    EXPECT_EQ(parseSize("2048"), std::optional<std::uint64_t>(2048));
    EXPECT_EQ(parseSize("512k"), std::optional<std::uint64_t>(512 * 1024));
    EXPECT_EQ(parseSize("10MB"), std::optional<std::uint64_t>(10ull * 1024 * 1024));
    EXPECT_EQ(parseSize("1.5 GiB"), std::optional<std::uint64_t>(1610612736ull));
    EXPECT_EQ(parseSize(" 3 b "), std::optional<std::uint64_t>(3));
    EXPECT_FALSE(parseSize("").has_value());
    EXPECT_FALSE(parseSize("MB").has_value());
    EXPECT_FALSE(parseSize("10 parsecs").has_value());
    EXPECT_FALSE(parseSize("1.2.3").has_value());
}

TEST(DownloadCommandTest, ParseHeader) {
    auto h = parseHeader("Authorization:  Bearer abc:def ");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->name, "Authorization");
    EXPECT_EQ(h->value, "Bearer abc:def");
    EXPECT_FALSE(parseHeader("NoColon").has_value());
    EXPECT_FALSE(parseHeader(": value").has_value());
}

TEST(DownloadCommandTest, ReadUrlListSkipsBlanksAndComments) {
    std::istringstream in("https://a.example/1\n"
                          "\n"
                          "  # mirror list\n"
                          "  https://b.example/2  \n"
                          "#https://c.example/3\n");
    auto urls = readUrlList(in);
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[0], "https://a.example/1");
    EXPECT_EQ(urls[1], "https://b.example/2");
}

TEST(DownloadCommandTest, ExitCodeAndByteFormatting) {
    EXPECT_EQ(exitCodeForFailures(0), 0);
    EXPECT_EQ(exitCodeForFailures(3), 3);
    EXPECT_EQ(exitCodeForFailures(1000), 125);

    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(1536), "1.5 KiB");
    EXPECT_EQ(formatBytes(10ull * 1024 * 1024), "10.0 MiB");
}

TEST(DownloadCommandTest, RejectsInvalidOptionValues) {
    OnyxCLI cli;
    std::vector<const char*> args = {"onyx", "download", "single", "--checksum", "sha256:xyz",
                                     "https://example.com/f"};
    EXPECT_NE(cli.run(static_cast<int>(args.size()), const_cast<char**>(args.data())), 0);

    OnyxCLI cli2;
    std::vector<const char*> args2 = {"onyx", "download", "accelerated", "-p", "0",
                                      "https://example.com/f"};
    EXPECT_NE(cli2.run(static_cast<int>(args2.size()), const_cast<char**>(args2.data())), 0);
}

TEST(DownloadCommandTest, SubcommandsAreRegistered) {
    OnyxCLI cli;
    auto* download = cli.getApp()->get_subcommand("download");
    ASSERT_NE(download, nullptr);
    EXPECT_NE(download->get_subcommand("single"), nullptr);
    EXPECT_NE(download->get_subcommand("batch"), nullptr);
    EXPECT_NE(download->get_subcommand("accelerated"), nullptr);
}
