#pragma once
#include <atomic>
#include <chrono>
#include <functional>

#include "utils.h"
#include "SegmentQueue.h"
#include "ConnectionPool.h"
#include "../io/CacheStore.h"

struct RetryPolicy {
    unsigned attempts = 3;
    std::chrono::milliseconds delay{ 1000 };
};

class DownloadWorker {
public:
    using ReportCallback = std::function<void(const WorkerReport&)>;

    DownloadWorker(SegmentQueue& queue,
        CacheStore& cache,
        ConnectionPool& pool,
        RetryPolicy policy,
        ReportCallback cb,
        std::atomic<bool>& stopFlag);

    void run();

private:
    WorkerReport fetchSegment(const SegmentDescriptor& seg, Fetcher& client);

    SegmentQueue& segmentQueue;
    CacheStore& cacheStore;
    ConnectionPool& connectionPool;
    RetryPolicy retry;
    ReportCallback report;
    std::atomic<bool>& shouldStop;
};
