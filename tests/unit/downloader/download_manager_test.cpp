#include <gtest/gtest.h>
#include <onyx/downloader/downloader.hpp>

#include "../../support/fake_http_adapter.h"
#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace onyx::downloader;
using namespace onyx::test_support;

namespace {

constexpr std::uint64_t MiB = 1024ull * 1024ull;
const std::string kUrl = "https://files.example.com/archive.bin";

std::string sha256_of(const std::string& s) {
    auto v = makeIntegrityVerifier(HashAlgo::Sha256);
    v->update(std::as_bytes(std::span<const char>(s.data(), s.size())));
    return v->finalize().hex;
}

class DownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirScope>(TempDirScope::unique_under("onyx-manager"));
        http_ = std::make_shared<FakeHttpAdapter>();
        cfg_.minChunkBytes = 256 * 1024;
        cfg_.retry.maxAttempts = 4;
        cfg_.retry.initialBackoff = std::chrono::milliseconds(1);
        cfg_.retry.maxBackoff = std::chrono::milliseconds(4);
        cfg_.progressInterval = std::chrono::milliseconds(0);
        cfg_.persistEveryBytes = 256 * 1024;
        cfg_.resumeDir = dir_->path() / "resume";
        manager_ = makeManager();
    }

    std::unique_ptr<IDownloadManager> makeManager() {
        return makeDownloadManagerWithDependencies(cfg_, http_,
                                                   makeJsonResumeStore(cfg_.resumeDir));
    }

    DownloadTask task(int workers = 4) const {
        DownloadTask t;
        t.url = kUrl;
        t.destinationPath = dir_->path() / "archive.bin";
        t.workerCount = workers;
        return t;
    }

    fs::path dest() const { return (dir_->path() / "archive.bin").lexically_normal(); }

    std::optional<ResumeRecord> storedRecord() const {
        auto store = makeJsonResumeStore(cfg_.resumeDir);
        auto r = store->load(makeResumeKey(kUrl, dest()));
        return r.ok() ? r.value() : std::nullopt;
    }

    std::unique_ptr<TempDirScope> dir_;
    std::shared_ptr<FakeHttpAdapter> http_;
    DownloaderConfig cfg_;
    std::unique_ptr<IDownloadManager> manager_;
};

} // namespace

TEST_F(DownloadManagerTest, ParallelDownloadWithChecksum) {
    const auto body = make_payload(10 * MiB);
    http_->addResource(kUrl, FakeResource{body});

    auto t = task(4);
    t.expectedChecksum = Checksum{HashAlgo::Sha256, sha256_of(body)};

    std::vector<ProgressEvent> events;
    std::mutex m;
    auto r = manager_->download(t, [&](const ProgressEvent& ev) {
        std::lock_guard<std::mutex> lk(m);
        events.push_back(ev);
    });

    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.sizeBytes, body.size());
    EXPECT_EQ(r.bytesTransferred, body.size());
    EXPECT_EQ(r.checksumVerified, std::optional<bool>(true));
    EXPECT_EQ(r.destinationPath, dest());
    EXPECT_EQ(read_file(dest()), body);
    EXPECT_FALSE(storedRecord().has_value());
    EXPECT_LE(http_->peakInFlight(), 4);

    ASSERT_FALSE(events.empty());
    std::uint64_t last = 0;
    for (const auto& ev : events) {
        EXPECT_GE(ev.downloadedBytes, last);
        last = ev.downloadedBytes;
    }
    EXPECT_EQ(events.back().downloadedBytes, body.size());
}

TEST_F(DownloadManagerTest, InterruptedDownloadResumesFromRecord) {
    const auto body = make_payload(10 * MiB);
    http_->addResource(kUrl, FakeResource{body});

    auto first = manager_->download(task(4), {}, [&] { return http_->bytesDelivered() >= MiB; });
    ASSERT_EQ(first.status, TaskStatus::Aborted);
    EXPECT_EQ(first.error, ErrorKind::Cancelled);
    ASSERT_TRUE(fs::exists(dest()));

    auto rec = storedRecord();
    ASSERT_TRUE(rec.has_value());
    const auto persisted = rec->bytesWritten();
    EXPECT_GT(persisted, 0u);
    EXPECT_EQ(rec->workerCount, 4);

    const auto before = http_->requests().size();
    auto second = makeManager()->download(task(4));
    ASSERT_TRUE(second.ok()) << second.message;
    EXPECT_EQ(second.destinationPath, dest());
    EXPECT_EQ(second.bytesTransferred, body.size() - persisted);
    EXPECT_EQ(read_file(dest()), body);
    EXPECT_FALSE(storedRecord().has_value());

    // Every unfinished chunk continues at its recorded offset, never from its start
    const auto reqs = http_->requests();
    std::vector<std::uint64_t> offsets;
    for (std::size_t i = before; i < reqs.size(); ++i) {
        ASSERT_TRUE(reqs[i].range.has_value());
        offsets.push_back(reqs[i].range->offset);
    }
    for (const auto& c : rec->chunks) {
        if (c.bytesWritten == c.size())
            continue;
        EXPECT_NE(std::find(offsets.begin(), offsets.end(), c.startOffset + c.bytesWritten),
                  offsets.end())
            << "chunk " << c.id;
    }
    EXPECT_EQ(offsets.size(), static_cast<std::size_t>(std::count_if(
                                  rec->chunks.begin(), rec->chunks.end(),
                                  [](const Chunk& c) { return c.bytesWritten < c.size(); })));
}

TEST_F(DownloadManagerTest, ResumeAgainstServerWithoutRangesRestartsFromScratch) {
    const auto body = make_payload(4 * MiB);
    http_->addResource(kUrl, FakeResource{body});

    auto first = manager_->download(task(4), {}, [&] { return http_->bytesDelivered() >= MiB; });
    ASSERT_EQ(first.status, TaskStatus::Aborted);
    ASSERT_TRUE(storedRecord().has_value());

    FakeResource noRanges{body};
    noRanges.acceptRanges = false;
    http_->addResource(kUrl, noRanges);

    auto second = makeManager()->download(task(4));
    ASSERT_TRUE(second.ok()) << second.message;
    EXPECT_EQ(second.destinationPath, dest());
    EXPECT_EQ(second.bytesTransferred, body.size());
    EXPECT_EQ(read_file(dest()), body);
    EXPECT_FALSE(storedRecord().has_value());

    const auto reqs = http_->requests();
    ASSERT_FALSE(reqs.empty());
    EXPECT_FALSE(reqs.back().range.has_value());
}

TEST_F(DownloadManagerTest, ChangedWorkerCountDiscardsRecord) {
    const auto body = make_payload(4 * MiB);
    http_->addResource(kUrl, FakeResource{body});

    auto first = manager_->download(task(4), {}, [&] { return http_->bytesDelivered() >= MiB; });
    ASSERT_EQ(first.status, TaskStatus::Aborted);
    ASSERT_TRUE(storedRecord().has_value());

    auto second = makeManager()->download(task(2));
    ASSERT_TRUE(second.ok()) << second.message;
    EXPECT_EQ(second.destinationPath, dest());
    EXPECT_EQ(second.bytesTransferred, body.size());
    EXPECT_EQ(read_file(dest()), body);
}

TEST_F(DownloadManagerTest, ChangedETagDiscardsRecord) {
    FakeResource v1{make_payload(4 * MiB, 1)};
    v1.etag = "\"v1\"";
    http_->addResource(kUrl, v1);

    auto first = manager_->download(task(4), {}, [&] { return http_->bytesDelivered() >= MiB; });
    ASSERT_EQ(first.status, TaskStatus::Aborted);
    auto rec = storedRecord();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->etag, std::optional<std::string>("\"v1\""));

    FakeResource v2{make_payload(4 * MiB, 2)};
    v2.etag = "\"v2\"";
    http_->addResource(kUrl, v2);

    auto second = makeManager()->download(task(4));
    ASSERT_TRUE(second.ok()) << second.message;
    EXPECT_EQ(second.bytesTransferred, v2.body.size());
    EXPECT_EQ(read_file(dest()), v2.body);
}

TEST_F(DownloadManagerTest, IgnoredRangeFallsBackToSingleStream) {
    const auto body = make_payload(3 * MiB);
    FakeResource res{body};
    res.ignoreRange = true;
    http_->addResource(kUrl, res);

    auto r = manager_->download(task(4));
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(read_file(dest()), body);

    const auto reqs = http_->requests();
    ASSERT_FALSE(reqs.empty());
    EXPECT_FALSE(reqs.back().range.has_value());
}

TEST_F(DownloadManagerTest, ChecksumMismatchDeletesFileWhenAsked) {
    const auto body = make_payload(MiB);
    http_->addResource(kUrl, FakeResource{body});

    auto t = task(2);
    t.expectedChecksum = Checksum{HashAlgo::Sha256, std::string(64, '0')};
    t.deleteOnMismatch = true;
    auto r = manager_->download(t);
    EXPECT_EQ(r.status, TaskStatus::Failed);
    EXPECT_EQ(r.error, ErrorKind::ChecksumMismatch);
    EXPECT_EQ(r.checksumVerified, std::optional<bool>(false));
    ASSERT_TRUE(r.digest.has_value());
    EXPECT_EQ(r.digest->hex, sha256_of(body));
    EXPECT_FALSE(fs::exists(dest()));
    EXPECT_FALSE(storedRecord().has_value());
}

TEST_F(DownloadManagerTest, ChecksumMismatchKeepsFileByDefault) {
    const auto body = make_payload(64 * 1024);
    http_->addResource(kUrl, FakeResource{body});

    auto t = task(1);
    t.expectedChecksum = Checksum{HashAlgo::Md5, std::string(32, 'a')};
    auto r = manager_->download(t);
    EXPECT_EQ(r.error, ErrorKind::ChecksumMismatch);
    EXPECT_TRUE(fs::exists(dest()));
}

TEST_F(DownloadManagerTest, DeclaredSizeOverLimitIsRefusedBeforeTransfer) {
    http_->addResource(kUrl, FakeResource{make_payload(2 * MiB)});

    auto t = task(2);
    t.maxBytes = MiB;
    auto r = manager_->download(t);
    EXPECT_EQ(r.status, TaskStatus::Failed);
    EXPECT_EQ(r.error, ErrorKind::SizeLimitExceeded);
    EXPECT_EQ(http_->fetchCount(), 0);
    EXPECT_FALSE(fs::exists(dest()));
}

TEST_F(DownloadManagerTest, StreamedSizeOverLimitAbortsAndCleansUp) {
    FakeResource res{make_payload(2 * MiB)};
    res.sendLength = false;
    res.acceptRanges = false;
    http_->addResource(kUrl, res);

    auto t = task(2);
    t.maxBytes = MiB;
    auto r = manager_->download(t);
    EXPECT_EQ(r.error, ErrorKind::SizeLimitExceeded);
    EXPECT_FALSE(fs::exists(dest()));
}

TEST_F(DownloadManagerTest, ServerErrorsAreRetried) {
    const auto body = make_payload(128 * 1024);
    FakeResource res{body};
    res.failStatus = 503;
    res.failFetches = 2;
    http_->addResource(kUrl, res);

    auto r = manager_->download(task(1));
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(http_->fetchCount(), 3);
    EXPECT_EQ(read_file(dest()), body);
}

TEST_F(DownloadManagerTest, DroppedChunkRetriesFromItsCurrentOffset) {
    const auto body = make_payload(10 * MiB);
    FakeResource res{body};
    res.dropAfterBytes = 1 * MiB;
    res.dropFetches = 1;
    res.dropOnlyAt = 5 * MiB; // third of four 2.5 MiB chunks
    http_->addResource(kUrl, res);

    auto t = task(4);
    t.expectedChecksum = Checksum{HashAlgo::Sha256, sha256_of(body)};
    auto r = manager_->download(t);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.checksumVerified, std::optional<bool>(true));
    EXPECT_EQ(read_file(dest()), body);

    bool resumedMidChunk = false;
    for (const auto& req : http_->requests()) {
        if (req.range && req.range->offset == 6 * MiB)
            resumedMidChunk = true;
    }
    EXPECT_TRUE(resumedMidChunk);
    EXPECT_EQ(http_->fetchCount(), 5);
}

TEST_F(DownloadManagerTest, UnsatisfiableRangeReResolvesSizeOnce) {
    const auto body = make_payload(2 * MiB);
    FakeResource res{body};
    res.advertisedSize = 4 * MiB;
    res.advertiseProbes = 1;
    http_->addResource(kUrl, res);

    auto r = manager_->download(task(4));
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.sizeBytes, body.size());
    EXPECT_EQ(http_->probeCount(), 2);
    EXPECT_EQ(read_file(dest()), body);
}

TEST_F(DownloadManagerTest, UnsatisfiableRangeTwiceFails) {
    FakeResource res{make_payload(2 * MiB)};
    res.advertisedSize = 4 * MiB;
    res.advertiseProbes = 2;
    http_->addResource(kUrl, res);

    auto r = manager_->download(task(4));
    EXPECT_EQ(r.status, TaskStatus::Failed);
    EXPECT_EQ(r.error, ErrorKind::HttpClientError);
    EXPECT_EQ(http_->probeCount(), 2);
    EXPECT_FALSE(fs::exists(dest()));
    EXPECT_FALSE(storedRecord().has_value());
}

TEST_F(DownloadManagerTest, NotFoundIsNotRetried) {
    auto t = task(1);
    t.url = "https://files.example.com/missing.bin";
    auto r = manager_->download(t);
    EXPECT_EQ(r.status, TaskStatus::Failed);
    EXPECT_EQ(r.error, ErrorKind::HttpClientError);
    EXPECT_EQ(r.httpStatus, std::optional<long>(404));
    EXPECT_EQ(http_->probeCount(), 1);
    EXPECT_EQ(http_->fetchCount(), 0);
}

TEST_F(DownloadManagerTest, UnknownSizeStreamsToEof) {
    const auto body = make_payload(700 * 1024 + 13);
    FakeResource res{body};
    res.sendLength = false;
    res.acceptRanges = false;
    http_->addResource(kUrl, res);

    auto r = manager_->download(task(4));
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.sizeBytes, body.size());
    EXPECT_EQ(fs::file_size(dest()), body.size());
    EXPECT_EQ(read_file(dest()), body);
}

TEST_F(DownloadManagerTest, EmptyResource) {
    http_->addResource(kUrl, FakeResource{std::string{}});
    auto r = manager_->download(task(4));
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.sizeBytes, 0u);
    EXPECT_TRUE(fs::exists(dest()));
    EXPECT_EQ(fs::file_size(dest()), 0u);
    EXPECT_EQ(http_->fetchCount(), 0);
}

TEST_F(DownloadManagerTest, InvalidArgumentsFailFast) {
    auto t = task(1);
    t.url = "ftp://example.com/x";
    EXPECT_EQ(manager_->download(t).error, ErrorKind::InvalidArgument);

    t = task(0);
    EXPECT_EQ(manager_->download(t).error, ErrorKind::InvalidArgument);
    EXPECT_EQ(http_->probeCount(), 0);
}

TEST_F(DownloadManagerTest, NameComesFromContentDispositionAndAvoidsCollisions) {
    FakeResource res{make_payload(1000)};
    res.contentDisposition = "attachment; filename=\"report.pdf\"";
    http_->addResource(kUrl, res);
    write_file(dir_->path() / "report.pdf", "existing");

    DownloadTask t;
    t.url = kUrl;
    t.outputDir = dir_->path();
    t.workerCount = 1;
    auto r = manager_->download(t);
    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(r.destinationPath.filename(), "report (1).pdf");
    EXPECT_EQ(read_file(dir_->path() / "report.pdf"), "existing");
}

TEST_F(DownloadManagerTest, BatchContinuesAfterFailure) {
    http_->addResource("https://files.example.com/a.bin", FakeResource{make_payload(1000, 1)});
    http_->addResource("https://files.example.com/c.bin", FakeResource{make_payload(2000, 3)});

    BatchJob job;
    job.concurrencyLimit = 2;
    job.continueOnError = true;
    for (const char* name : {"a.bin", "missing.bin", "c.bin"}) {
        DownloadTask t;
        t.url = std::string("https://files.example.com/") + name;
        t.outputDir = dir_->path();
        t.workerCount = 1;
        job.tasks.push_back(t);
    }

    auto batch = manager_->downloadMany(job);
    ASSERT_EQ(batch.results.size(), 3u);
    EXPECT_TRUE(batch.results[0].ok());
    EXPECT_EQ(batch.results[1].status, TaskStatus::Failed);
    EXPECT_EQ(batch.results[1].httpStatus, std::optional<long>(404));
    EXPECT_TRUE(batch.results[2].ok());
    EXPECT_EQ(batch.failed(), 1u);
    EXPECT_FALSE(batch.aborted);
    EXPECT_EQ(read_file(dir_->path() / "c.bin"), make_payload(2000, 3));
}

TEST_F(DownloadManagerTest, ConcurrentTasksWithSameDerivedNameGetDistinctFiles) {
    const auto bodyA = make_payload(512 * 1024, 11);
    const auto bodyB = make_payload(512 * 1024, 12);
    http_->addResource("https://a.example.com/x/file.bin", FakeResource{bodyA});
    http_->addResource("https://b.example.com/y/file.bin", FakeResource{bodyB});
    http_->setPieceDelay(std::chrono::milliseconds(2));

    BatchJob job;
    job.concurrencyLimit = 2;
    job.continueOnError = true;
    for (const char* url : {"https://a.example.com/x/file.bin", "https://b.example.com/y/file.bin"}) {
        DownloadTask t;
        t.url = url;
        t.outputDir = dir_->path();
        t.workerCount = 1;
        job.tasks.push_back(t);
    }

    auto batch = manager_->downloadMany(job);
    ASSERT_EQ(batch.results.size(), 2u);
    ASSERT_TRUE(batch.results[0].ok()) << batch.results[0].message;
    ASSERT_TRUE(batch.results[1].ok()) << batch.results[1].message;

    const auto& pathA = batch.results[0].destinationPath;
    const auto& pathB = batch.results[1].destinationPath;
    EXPECT_NE(pathA, pathB);
    EXPECT_EQ(read_file(pathA), bodyA);
    EXPECT_EQ(read_file(pathB), bodyB);

    std::vector<std::string> names{pathA.filename().string(), pathB.filename().string()};
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"file (1).bin", "file.bin"}));
}

TEST_F(DownloadManagerTest, SlowProgressSubscriberDoesNotStallWorkers) {
    const auto body = make_payload(8 * MiB);
    http_->addResource(kUrl, FakeResource{body});

    std::atomic<int> calls{0};
    const auto t0 = std::chrono::steady_clock::now();
    auto r = manager_->download(task(4), [&](const ProgressEvent&) {
        calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(r.ok()) << r.message;
    EXPECT_EQ(read_file(dest()), body);
    // 128 body pieces; delivering each one inline would take over six seconds
    EXPECT_LT(elapsed, std::chrono::seconds(3));
    EXPECT_LT(calls.load(), 60);
}
