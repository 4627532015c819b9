#include <gtest/gtest.h>

#include <mutex>
#include <thread>

#include "monitor/ProgressAggregator.h"

namespace {
constexpr std::uint64_t MiB = 1024 * 1024;

ProgressCounters midRun() {
    ProgressCounters c;
    c.total = 10;
    c.cachedAtStart = 2;
    c.bytesAtStart = 2 * MiB;
    c.downloaded = 6;
    c.bytes = 6 * MiB;
    c.failed = 1;
    c.errors = { "Segment 4: HTTP 503" };
    return c;
}
}

TEST(ProgressAggregatorTest, ComputesRatesFromWorkDoneThisRun) {
    const ProgressSnapshot s = ProgressAggregator::compute(midRun(), SessionStatus::Downloading, 2.0);

    EXPECT_EQ(s.status, SessionStatus::Downloading);
    EXPECT_DOUBLE_EQ(s.percent, 60.0);
    EXPECT_EQ(s.downloadedSegments, 6u);
    EXPECT_EQ(s.totalSegments, 10u);
    EXPECT_EQ(s.failedSegments, 1u);
    EXPECT_EQ(s.bytesDownloaded, 6 * MiB);
    EXPECT_DOUBLE_EQ(s.speedSegPerSec, 2.0); // (6 - 2) / 2s
    EXPECT_DOUBLE_EQ(s.speedMBps, 2.0);      // (6 - 2) MiB / 2s
    EXPECT_EQ(s.etaSeconds, 2u);             // 4 remaining at 2 seg/s
    ASSERT_EQ(s.errors.size(), 1u);
    EXPECT_EQ(s.errors[0], "Segment 4: HTTP 503");
}

TEST(ProgressAggregatorTest, NoElapsedTimeMeansNoRateAndNoEta) {
    const ProgressSnapshot s = ProgressAggregator::compute(midRun(), SessionStatus::Downloading, 0.0);
    EXPECT_DOUBLE_EQ(s.speedSegPerSec, 0.0);
    EXPECT_DOUBLE_EQ(s.speedMBps, 0.0);
    EXPECT_EQ(s.etaSeconds, 0u);
}

TEST(ProgressAggregatorTest, NonDownloadingSnapshotsCarryNoLiveRate) {
    const ProgressSnapshot failed = ProgressAggregator::compute(midRun(), SessionStatus::Failed, 2.0);
    EXPECT_DOUBLE_EQ(failed.speedSegPerSec, 0.0);
    EXPECT_DOUBLE_EQ(failed.speedMBps, 0.0);
    EXPECT_EQ(failed.etaSeconds, 0u);

    ProgressCounters done = midRun();
    done.downloaded = 10;
    done.bytes = 10 * MiB;
    done.failed = 0;
    done.errors.clear();
    const ProgressSnapshot completed = ProgressAggregator::compute(done, SessionStatus::Completed, 4.0);
    EXPECT_DOUBLE_EQ(completed.percent, 100.0);
    EXPECT_DOUBLE_EQ(completed.speedMBps, 2.0); // run average
    EXPECT_DOUBLE_EQ(completed.speedSegPerSec, 0.0);
}

TEST(ProgressAggregatorTest, ZeroTotalReportsZeroPercent) {
    ProgressCounters empty;
    EXPECT_DOUBLE_EQ(ProgressAggregator::compute(empty, SessionStatus::Downloading, 1.0).percent, 0.0);
}

TEST(ProgressAggregatorTest, SuccessEmitsAndFailureOnlyRecords) {
    std::vector<ProgressSnapshot> seen;
    ProgressAggregator progress([&](const ProgressSnapshot& s) { seen.push_back(s); });
    progress.reset(4, 1, 100);

    progress.recordSuccess(50);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].status, SessionStatus::Downloading);
    EXPECT_EQ(seen[0].downloadedSegments, 2u);
    EXPECT_EQ(seen[0].bytesDownloaded, 150u);
    EXPECT_DOUBLE_EQ(seen[0].percent, 50.0);

    progress.recordFailure("Segment 3: HTTP 404");
    EXPECT_EQ(seen.size(), 1u);

    const ProgressCounters c = progress.counters();
    EXPECT_EQ(c.downloaded, 2u);
    EXPECT_EQ(c.failed, 1u);
    EXPECT_EQ(c.cachedAtStart, 1u);
    EXPECT_EQ(c.bytesAtStart, 100u);
    ASSERT_EQ(c.errors.size(), 1u);
}

TEST(ProgressAggregatorTest, FatalSnapshotCarriesOnlyTheReason) {
    ProgressAggregator progress(nullptr);
    progress.reset(3, 0, 0);
    progress.recordFailure("Segment 0: HTTP 500");

    const ProgressSnapshot s = progress.emitFatal(SessionStatus::Failed, "merge error: ffmpeg exited with code 1");
    ASSERT_EQ(s.errors.size(), 1u);
    EXPECT_EQ(s.errors[0], "merge error: ffmpeg exited with code 1");
    EXPECT_EQ(s.status, SessionStatus::Failed);
}

TEST(ProgressAggregatorTest, ConcurrentSnapshotsNeverGoBackwards) {
    std::mutex mtx;
    std::vector<std::uint64_t> order;
    ProgressAggregator progress([&](const ProgressSnapshot& s) {
        std::lock_guard<std::mutex> lock(mtx);
        order.push_back(s.downloadedSegments);
        });
    progress.reset(400, 0, 0);

    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i)
                progress.recordSuccess(10);
            });
    }
    for (auto& w : workers)
        w.join();

    ASSERT_EQ(order.size(), 400u);
    for (std::size_t i = 0; i < order.size(); ++i)
        EXPECT_EQ(order[i], i + 1);
}
