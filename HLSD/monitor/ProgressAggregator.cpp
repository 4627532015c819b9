#include "ProgressAggregator.h"

namespace {
constexpr double kBytesPerMiB = 1024.0 * 1024.0;
}

ProgressAggregator::ProgressAggregator(ProgressSink s)
    : sink(std::move(s)),
    start(std::chrono::steady_clock::now()) {
}

void ProgressAggregator::reset(std::uint64_t totalSegments, std::uint64_t cachedSegments, std::uint64_t cachedBytes) {
    std::lock_guard<std::mutex> lock(mtx);
    state = ProgressCounters{};
    state.total = totalSegments;
    state.cachedAtStart = cachedSegments;
    state.bytesAtStart = cachedBytes;
    state.downloaded = cachedSegments;
    state.bytes = cachedBytes;
    start = std::chrono::steady_clock::now();
}

void ProgressAggregator::recordSuccess(std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mtx);
    ++state.downloaded;
    state.bytes += bytes;
    emitLocked(SessionStatus::Downloading, 0);
}

void ProgressAggregator::recordFailure(const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx);
    ++state.failed;
    state.errors.push_back(error);
}

ProgressSnapshot ProgressAggregator::emit(SessionStatus status, std::uint64_t fileSize) {
    std::lock_guard<std::mutex> lock(mtx);
    return emitLocked(status, fileSize);
}

ProgressSnapshot ProgressAggregator::emitFatal(SessionStatus status, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx);
    return emitLocked(status, 0, &reason);
}

ProgressSnapshot ProgressAggregator::emitLocked(SessionStatus status, std::uint64_t fileSize, const std::string* reason) {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    ProgressSnapshot snap = compute(state, status, elapsed.count());
    snap.fileSize = fileSize;
    if (reason)
        snap.errors = { *reason };

    if (sink)
        sink(snap);
    return snap;
}

ProgressCounters ProgressAggregator::counters() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

ProgressSnapshot ProgressAggregator::compute(const ProgressCounters& c, SessionStatus status, double elapsedSeconds) {
    ProgressSnapshot snap;
    snap.status = status;
    snap.downloadedSegments = c.downloaded;
    snap.totalSegments = c.total;
    snap.failedSegments = c.failed;
    snap.bytesDownloaded = c.bytes;
    snap.errors = c.errors;
    snap.percent = c.total == 0 ? 0.0 : static_cast<double>(c.downloaded) / static_cast<double>(c.total) * 100.0;

    if (elapsedSeconds > 0) {
        snap.speedSegPerSec = static_cast<double>(c.downloaded - c.cachedAtStart) / elapsedSeconds;
        snap.speedMBps = static_cast<double>(c.bytes - c.bytesAtStart) / elapsedSeconds / kBytesPerMiB;
    }

    if (snap.speedSegPerSec > 0 && c.downloaded < c.total)
        snap.etaSeconds = static_cast<std::uint64_t>(static_cast<double>(c.total - c.downloaded) / snap.speedSegPerSec);

    if (status != SessionStatus::Downloading) {
        // Terminal and merge snapshots carry no live rate, except the run average on completion.
        snap.speedSegPerSec = 0.0;
        snap.etaSeconds = 0;
        if (status != SessionStatus::Completed)
            snap.speedMBps = 0.0;
    }

    return snap;
}
