#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
#include <cstddef>
#include <csignal>
#include <chrono>

#include "utils.h"
#include "SegmentQueue.h"
#include "ThreadPool.h"
#include "ConnectionPool.h"
#include "DownloadWorker.h"
#include "Merger.h"
#include "../io/CacheStore.h"
#include "../monitor/ProgressAggregator.h"
#include "../monitor/Logger.h"

enum class SessionState {
    Planning,
    Resuming,
    Downloading,
    Merging,
    Completed,
    Failed,
    Cancelled
};

const char* toString(SessionState state);

// One run over one media playlist: plan, resume from cache, fetch, merge, clean up.
// A session runs once; resuming later means a new session on the same manifest URL.
class DownloadSession {
public:
    static constexpr std::size_t kMaxThreads = 32;

    DownloadSession(const DownloadConfig& config,
        ConnectionPool::Factory clientFactory,
        Muxer& muxer,
        ProgressSink sink = nullptr,
        volatile std::sig_atomic_t* externalStop = nullptr);
    ~DownloadSession();

    SessionResult run();

    // Cooperative: workers stop taking segments and skip pending retries.
    // Safe to call from any thread, including from the progress sink.
    void cancel();

    SessionState state() const { return current.load(); }
    bool cancelled() const { return cancelRequested.load(); }

    const StreamDescriptor& stream() const { return streamDesc; }
    const std::vector<SegmentDescriptor>& segments() const { return segmentList; }
    const std::set<std::uint64_t>& cachedAtStart() const { return cached; }
    std::size_t workers() const { return workerCount; }

private:
    bool plan(std::string& error);
    bool resume(std::string& error);
    void download();
    void spawnWorkers();
    void waitForWorkers();
    std::size_t chooseWorkerCount(std::size_t pending) const;

    void onWorkerReport(const WorkerReport& report);

    SessionResult succeed(std::uint64_t fileSize);
    SessionResult fail(SessionState terminal, ErrorKind kind, const std::string& reason);
    void transition(SessionState next);
    void logConclusion(const ProgressSnapshot& snap);

private:
    DownloadConfig cfg;
    volatile std::sig_atomic_t* externalStopSignal{ nullptr };

    std::atomic<bool> stopFlag{ false };
    std::atomic<bool> cancelRequested{ false };
    std::atomic<SessionState> current{ SessionState::Planning };

    StreamDescriptor streamDesc;
    std::vector<SegmentDescriptor> segmentList;
    std::set<std::uint64_t> cached;

    std::unique_ptr<ConnectionPool> connectionPool;
    std::unique_ptr<CacheStore> cacheStore;
    std::unique_ptr<SegmentQueue> segmentQueue;
    std::unique_ptr<ThreadPool> threadPool;

    Merger merger;
    ProgressAggregator progress;
    Logger logger;

    std::mutex errorMutex;
    ErrorKind fatalKind{ ErrorKind::None };
    std::string fatalError;

    std::size_t workerCount{ 0 };
    std::chrono::steady_clock::time_point startTime;
};
