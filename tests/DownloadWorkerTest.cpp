#include <gtest/gtest.h>

#include <atomic>
#include <mutex>

#include "core/DownloadWorker.h"
#include "TestSupport.h"

using namespace hlsd_test;

class DownloadWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache = std::make_unique<CacheStore>(tmp.path().string(), "worker");
        std::string error;
        ASSERT_TRUE(cache->ensureDirectory(error)) << error;
    }

    std::vector<WorkerReport> runWorker(const std::vector<std::uint64_t>& indices, RetryPolicy policy = { 3, std::chrono::milliseconds(0) }) {
        SegmentQueue queue(indices.size());
        for (auto i : indices)
            queue.push({ i, "seg" + std::to_string(i) + ".ts", segmentUrl(i) });

        ConnectionPool pool(fakeFactory(server), 1);
        std::vector<WorkerReport> reports;
        DownloadWorker worker(queue, *cache, pool, policy,
            [&](const WorkerReport& r) { reports.push_back(r); }, stop);
        worker.run();
        return reports;
    }

    TempDir tmp;
    FakeServer server;
    std::unique_ptr<CacheStore> cache;
    std::atomic<bool> stop{ false };
};

TEST_F(DownloadWorkerTest, WritesSuccessfulSegmentsToCache) {
    server.serveStream(3);
    const auto reports = runWorker({ 0, 1, 2 });

    ASSERT_EQ(reports.size(), 3u);
    for (const auto& r : reports) {
        EXPECT_TRUE(r.success);
        EXPECT_EQ(r.bytesDownloaded, segmentBody(r.segmentIndex).size());
        EXPECT_EQ(readFile(cache->segmentPath(r.segmentIndex)), segmentBody(r.segmentIndex));
    }
}

TEST_F(DownloadWorkerTest, ExhaustedRetriesReportIndexAndCause) {
    server.failAlways(segmentUrl(5), 503);
    const auto reports = runWorker({ 5 });

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success);
    EXPECT_EQ(reports[0].kind, ErrorKind::SegmentFetch);
    EXPECT_EQ(reports[0].error, "Segment 5: HTTP 503");
    EXPECT_EQ(server.attempts(segmentUrl(5)), 3);
    EXPECT_FALSE(cache->isComplete(5));
}

TEST_F(DownloadWorkerTest, TransportErrorsConsumeTheRetryBudget) {
    server.transportFailure(segmentUrl(1));
    const auto reports = runWorker({ 1 }, { 2, std::chrono::milliseconds(0) });

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].error, "Segment 1: Connection timed out");
    EXPECT_EQ(server.attempts(segmentUrl(1)), 2);
}

TEST_F(DownloadWorkerTest, RecoversWithinRetryBudget) {
    server.flaky(segmentUrl(2), segmentBody(2), 2);
    const auto reports = runWorker({ 2 });

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].success);
    EXPECT_EQ(server.attempts(segmentUrl(2)), 3);
}

TEST_F(DownloadWorkerTest, EmptyBodyIsAFailedAttempt) {
    server.serve(segmentUrl(0), "");
    const auto reports = runWorker({ 0 });

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success);
    EXPECT_EQ(reports[0].error, "Segment 0: empty response");
}

TEST_F(DownloadWorkerTest, SkipsSegmentsAlreadyInCache) {
    server.serveStream(2);
    std::string error;
    ASSERT_TRUE(cache->write(1, "already-here", error));

    const auto reports = runWorker({ 0, 1 });
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_TRUE(reports[1].success);
    EXPECT_EQ(reports[1].bytesDownloaded, std::string("already-here").size());
    EXPECT_EQ(server.attempts(segmentUrl(1)), 0);
    EXPECT_EQ(readFile(cache->segmentPath(1)), "already-here");
}

TEST_F(DownloadWorkerTest, StopFlagPreventsNewWork) {
    server.serveStream(3);
    stop.store(true);

    const auto reports = runWorker({ 0, 1, 2 });
    EXPECT_TRUE(reports.empty());
    EXPECT_TRUE(server.segmentRequests().empty());
}

TEST_F(DownloadWorkerTest, StopBeforeRetryAbandonsWithoutFailure) {
    server.failAlways(segmentUrl(0), 500);

    SegmentQueue queue(1);
    queue.push({ 0, "seg0.ts", segmentUrl(0) });

    // Raise the stop flag from inside the first attempt.
    class StoppingFetcher : public Fetcher {
    public:
        StoppingFetcher(FakeServer& s, std::atomic<bool>& f) : server(s), flag(f) {}
        bool get(const std::string& url, HttpResponse& out) override {
            flag.store(true);
            return server.get(url, out);
        }
    private:
        FakeServer& server;
        std::atomic<bool>& flag;
    };

    ConnectionPool pool([this]() { return std::make_unique<StoppingFetcher>(server, stop); }, 1);
    std::vector<WorkerReport> reports;
    DownloadWorker worker(queue, *cache, pool, { 3, std::chrono::milliseconds(0) },
        [&](const WorkerReport& r) { reports.push_back(r); }, stop);
    worker.run();

    EXPECT_EQ(server.attempts(segmentUrl(0)), 1);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success);
    EXPECT_EQ(reports[0].kind, ErrorKind::None);
}

TEST_F(DownloadWorkerTest, CacheWriteFailureIsReportedAsCacheError) {
    server.serveStream(1);
    std::string error;
    ASSERT_TRUE(cache->purge(error));
    writeFile(fs::path(cache->directory()), "not a directory");

    const auto reports = runWorker({ 0 });
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_FALSE(reports[0].success);
    EXPECT_EQ(reports[0].kind, ErrorKind::CacheIO);
    EXPECT_EQ(server.attempts(segmentUrl(0)), 1);

    fs::remove(fs::path(cache->directory()));
}
