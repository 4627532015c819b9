#include "DownloadSession.h"

#include <thread>
#include <sstream>
#include <iomanip>
#include <algorithm>

#include "SegmentPlanner.h"

const char* toString(SessionState state) {
    switch (state) {
    case SessionState::Planning:    return "planning";
    case SessionState::Resuming:    return "resuming";
    case SessionState::Downloading: return "downloading";
    case SessionState::Merging:     return "merging";
    case SessionState::Completed:   return "completed";
    case SessionState::Failed:      return "failed";
    case SessionState::Cancelled:   return "cancelled";
    }
    return "unknown";
}

DownloadSession::DownloadSession(const DownloadConfig& config,
    ConnectionPool::Factory clientFactory,
    Muxer& muxer,
    ProgressSink sink,
    volatile std::sig_atomic_t* externalStop)
    : cfg(config),
    externalStopSignal(externalStop),
    connectionPool(std::make_unique<ConnectionPool>(std::move(clientFactory), kMaxThreads)),
    merger(muxer),
    progress(std::move(sink))
{
}

DownloadSession::~DownloadSession() {
    if (threadPool)
        threadPool->shutdown();
    logger.stop();
}

SessionResult DownloadSession::run() {
    logger.start();
    startTime = std::chrono::steady_clock::now();

    std::string error;

    transition(SessionState::Planning);
    if (!plan(error))
        return fail(SessionState::Failed, ErrorKind::Manifest, error);

    transition(SessionState::Resuming);
    if (!resume(error))
        return fail(SessionState::Failed, ErrorKind::CacheIO, error);

    if (externalStopSignal && *externalStopSignal != 0)
        cancel();

    if (cached.size() < segmentList.size()) {
        if (!cancelRequested.load()) {
            transition(SessionState::Downloading);
            download();
        }
    }
    else {
        logger.log("All " + std::to_string(segmentList.size()) + " segments already cached");
        progress.emit(SessionStatus::Downloading);
    }

    if (cancelRequested.load())
        return fail(SessionState::Cancelled, ErrorKind::None, "download cancelled");

    {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (fatalKind != ErrorKind::None)
            return fail(SessionState::Failed, fatalKind, fatalError);
    }

    const ProgressCounters counters = progress.counters();
    if (counters.failed > 0) {
        return fail(SessionState::Failed, ErrorKind::SegmentFetch,
            std::to_string(counters.failed) + " segment(s) could not be downloaded");
    }
    if (counters.downloaded != counters.total) {
        return fail(SessionState::Failed, ErrorKind::SegmentFetch,
            "download incomplete: " + std::to_string(counters.downloaded) + "/" + std::to_string(counters.total) + " segments");
    }

    transition(SessionState::Merging);
    progress.emit(SessionStatus::Merging);

    std::uint64_t fileSize = 0;
    if (!merger.merge(*cacheStore, segmentList.size(), cfg.outputPath, fileSize, error))
        return fail(SessionState::Failed, ErrorKind::Merge, error);

    return succeed(fileSize);
}

void DownloadSession::cancel() {
    cancelRequested.store(true);
    stopFlag.store(true);
}

bool DownloadSession::plan(std::string& error) {
    HttpResponse resp;

    auto client = connectionPool->acquire();
    const bool fetched = client && client->get(cfg.manifestUrl, resp);
    connectionPool->release(std::move(client));

    if (!fetched) {
        error = "cannot fetch manifest " + cfg.manifestUrl + ": " + (resp.error.empty() ? "no connection" : resp.error);
        return false;
    }
    if (resp.status != 200) {
        error = "cannot fetch manifest " + cfg.manifestUrl + " (HTTP " + std::to_string(resp.status) + ")";
        return false;
    }

    if (!SegmentPlanner::plan(resp.body, cfg.manifestUrl, segmentList, error))
        return false;

    streamDesc = SegmentPlanner::describe(cfg.manifestUrl);
    logger.log("Manifest lists " + std::to_string(segmentList.size()) + " segments");
    return true;
}

bool DownloadSession::resume(std::string& error) {
    const std::string key = CacheStore::keyFor(streamDesc.manifestUrl);
    if (key.empty()) {
        error = "cannot derive cache key for " + streamDesc.manifestUrl;
        return false;
    }

    const std::string root = cfg.cacheRoot.empty() ? CacheStore::defaultRoot() : cfg.cacheRoot;
    cacheStore = std::make_unique<CacheStore>(root, key);

    if (!cacheStore->ensureDirectory(error))
        return false;

    const CacheScan scan = cacheStore->scan(segmentList.size());
    cached = scan.complete;
    progress.reset(segmentList.size(), cached.size(), scan.bytes);

    logger.log("Cache: " + cacheStore->directory());
    if (!cached.empty()) {
        logger.log("Found " + std::to_string(cached.size()) + "/" + std::to_string(segmentList.size())
            + " cached segments, resuming");
    }
    return true;
}

std::size_t DownloadSession::chooseWorkerCount(std::size_t pending) const {
    std::size_t n = cfg.maxThreads;
    if (n == 0) {
        std::size_t hw = std::thread::hardware_concurrency();
        if (hw == 0) hw = 4;
        n = std::clamp<std::size_t>(hw * 2, 2, kMaxThreads);
    }

    n = std::clamp<std::size_t>(n, 1, kMaxThreads);
    return std::max<std::size_t>(1, std::min(n, pending));
}

void DownloadSession::download() {
    std::vector<SegmentDescriptor> pending;
    for (const auto& seg : segmentList) {
        if (cached.count(seg.index) == 0)
            pending.push_back(seg);
    }

    segmentQueue = std::make_unique<SegmentQueue>(pending.size());
    // Sized to the pending list; a refused push leaves the run incomplete.
    for (auto& seg : pending) {
        const std::uint64_t index = seg.index;
        if (!segmentQueue->push(std::move(seg)))
            logger.error("Segment " + std::to_string(index) + " could not be queued");
    }

    workerCount = chooseWorkerCount(segmentQueue->size());
    logger.log("Downloading " + std::to_string(segmentQueue->size()) + " segments with "
        + std::to_string(workerCount) + " threads");

    threadPool = std::make_unique<ThreadPool>(stopFlag);
    spawnWorkers();
    waitForWorkers();
}

void DownloadSession::spawnWorkers() {
    const RetryPolicy policy{ cfg.retryAttempts, cfg.retryDelay };

    auto workerFn = [this, policy]() {

        DownloadWorker worker(
            *segmentQueue,
            *cacheStore,
            *connectionPool,
            policy,
            [this](const WorkerReport& rep) {
                onWorkerReport(rep);
            },
            stopFlag
        );

        worker.run();
        };

    threadPool->start(workerCount, workerFn);
}

void DownloadSession::waitForWorkers() {
    auto lastProgressLog = std::chrono::steady_clock::now();

    while (threadPool->active() > 0) {
        if (externalStopSignal && *externalStopSignal != 0 && !cancelRequested.load()) {
            logger.warn("Interrupt received, stopping after in-flight segments");
            cancel();
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastProgressLog >= std::chrono::seconds(5)) {
            const ProgressCounters c = progress.counters();
            const double pct = c.total == 0 ? 0.0 : static_cast<double>(c.downloaded) * 100.0 / static_cast<double>(c.total);

            std::ostringstream os;
            os << "Progress: " << c.downloaded << "/" << c.total << " segments ("
                << std::fixed << std::setprecision(1) << pct << "%), "
                << c.failed << " failed";
            logger.log(os.str());
            lastProgressLog = now;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    threadPool->join();
}

void DownloadSession::onWorkerReport(const WorkerReport& report) {
    if (report.success) {
        progress.recordSuccess(report.bytesDownloaded);
        return;
    }

    switch (report.kind) {
    case ErrorKind::SegmentFetch:
        progress.recordFailure(report.error);
        logger.warn(report.error);
        break;
    case ErrorKind::CacheIO:
    {
        {
            std::lock_guard<std::mutex> lock(errorMutex);
            if (fatalKind == ErrorKind::None) {
                fatalKind = ErrorKind::CacheIO;
                fatalError = report.error;
            }
        }
        logger.error(report.error);
        stopFlag.store(true);
        break;
    }
    default:
        // Abandoned on stop; the segment stays pending in the cache.
        break;
    }
}

SessionResult DownloadSession::succeed(std::uint64_t fileSize) {
    std::string purgeError;
    if (!cacheStore->purge(purgeError))
        logger.warn("Cache cleanup failed: " + purgeError);

    transition(SessionState::Completed);

    SessionResult result;
    result.success = true;
    result.kind = ErrorKind::None;
    result.snapshot = progress.emit(SessionStatus::Completed, fileSize);

    logger.log("Saved " + cfg.outputPath + " (" + std::to_string(fileSize) + " bytes), cache cleaned");
    logConclusion(result.snapshot);
    logger.stop();
    return result;
}

SessionResult DownloadSession::fail(SessionState terminal, ErrorKind kind, const std::string& reason) {
    transition(terminal);

    SessionResult result;
    result.success = false;
    result.kind = kind;

    const SessionStatus status = terminal == SessionState::Cancelled
        ? SessionStatus::Cancelled
        : SessionStatus::Failed;

    // Segment failures surface as the aggregated list; anything else is the sole reason.
    if (kind == ErrorKind::SegmentFetch || kind == ErrorKind::None)
        result.snapshot = progress.emit(status);
    else
        result.snapshot = progress.emitFatal(status, reason);

    if (kind == ErrorKind::None)
        logger.warn(reason);
    else
        logger.error(std::string(toString(kind)) + ": " + reason);

    if (kind == ErrorKind::SegmentFetch) {
        const auto& errors = result.snapshot.errors;
        const std::size_t shown = std::min<std::size_t>(errors.size(), 10);
        for (std::size_t i = 0; i < shown; ++i)
            logger.error("  " + errors[i]);
        if (errors.size() > shown)
            logger.error("  ... and " + std::to_string(errors.size() - shown) + " more");
    }

    if (cacheStore && cacheStore->exists())
        logger.log("Cache preserved at " + cacheStore->directory() + ", run again to resume");

    logConclusion(result.snapshot);
    logger.stop();
    return result;
}

void DownloadSession::transition(SessionState next) {
    const SessionState prev = current.exchange(next);
    if (prev != next)
        logger.log(std::string("State: ") + toString(prev) + " -> " + toString(next));
}

void DownloadSession::logConclusion(const ProgressSnapshot& snap) {
    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - startTime;
    const std::uint64_t fetched = snap.bytesDownloaded - progress.counters().bytesAtStart;
    const double avgSpeed = duration.count() > 0
        ? static_cast<double>(fetched) / duration.count() / (1024.0 * 1024.0)
        : 0.0;

    std::ostringstream conclusion;
    conclusion << "Download " << toString(snap.status)
        << " in " << std::fixed << std::setprecision(2)
        << duration.count() << "s, avg speed "
        << std::setprecision(2) << avgSpeed
        << " MB/s, threads " << workerCount
        << ", segments " << snap.downloadedSegments << "/" << snap.totalSegments;

    if (snap.failedSegments > 0)
        conclusion << " (" << snap.failedSegments << " failed)";

    logger.log(conclusion.str());
}
