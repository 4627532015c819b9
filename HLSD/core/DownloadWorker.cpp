#include "DownloadWorker.h"

#include <thread>

DownloadWorker::DownloadWorker(SegmentQueue& queue,
    CacheStore& cache,
    ConnectionPool& pool,
    RetryPolicy policy,
    ReportCallback cb,
    std::atomic<bool>& stopFlag)
    : segmentQueue(queue),
    cacheStore(cache),
    connectionPool(pool),
    retry(policy),
    report(std::move(cb)),
    shouldStop(stopFlag) {
}


void DownloadWorker::run() {
    while (!shouldStop.load(std::memory_order_relaxed)) {

        auto segOpt = segmentQueue.tryPop();
        if (!segOpt.has_value())
            return;

        // Popped but not started: stays pending in the cache for the next run.
        if (shouldStop.load(std::memory_order_relaxed))
            return;

        const SegmentDescriptor seg = *segOpt;

        // Another process may have filled it since the resume scan.
        if (cacheStore.isComplete(seg.index)) {
            report({ seg.index, cacheStore.sizeOf(seg.index), true, ErrorKind::None, {} });
            continue;
        }

        auto client = connectionPool.acquire();
        if (!client) {
            report({ seg.index, 0, false, ErrorKind::SegmentFetch,
                "Segment " + std::to_string(seg.index) + ": no connection available" });
            continue;
        }

        WorkerReport rep = fetchSegment(seg, *client);

        connectionPool.release(std::move(client));

        report(rep);
    }
}

// success: written to cache. kind None without success: abandoned on stop,
// the segment stays pending.
WorkerReport DownloadWorker::fetchSegment(const SegmentDescriptor& seg, Fetcher& client) {
    WorkerReport rep{};
    rep.segmentIndex = seg.index;
    rep.bytesDownloaded = 0;
    rep.success = false;
    rep.kind = ErrorKind::None;

    const unsigned attempts = retry.attempts == 0 ? 1 : retry.attempts;
    std::string cause;

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        HttpResponse resp;

        if (!client.get(seg.resolvedUrl, resp)) {
            cause = resp.error.empty() ? "transport error" : resp.error;
        }
        else if (resp.status != 200) {
            cause = "HTTP " + std::to_string(resp.status);
        }
        else if (resp.body.empty()) {
            cause = "empty response";
        }
        else {
            if (shouldStop.load(std::memory_order_relaxed))
                return rep;

            std::string ioError;
            if (!cacheStore.write(seg.index, resp.body, ioError)) {
                rep.kind = ErrorKind::CacheIO;
                rep.error = "Segment " + std::to_string(seg.index) + ": " + ioError;
                return rep;
            }

            rep.bytesDownloaded = resp.body.size();
            rep.success = true;
            return rep;
        }

        if (attempt == attempts)
            break;

        if (shouldStop.load(std::memory_order_relaxed))
            return rep;

        std::this_thread::sleep_for(retry.delay);
    }

    rep.kind = ErrorKind::SegmentFetch;
    rep.error = "Segment " + std::to_string(seg.index) + ": " + cause;
    return rep;
}
