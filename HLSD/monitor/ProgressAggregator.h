#pragma once
#include <mutex>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../core/utils.h"

// Runs on whichever thread reported the update, while the counters lock
// is held. Must return promptly and must be safe to call concurrently.
using ProgressSink = std::function<void(const ProgressSnapshot&)>;

struct ProgressCounters {
    std::uint64_t total = 0;
    std::uint64_t cachedAtStart = 0;
    std::uint64_t bytesAtStart = 0;

    std::uint64_t downloaded = 0;
    std::uint64_t failed = 0;
    std::uint64_t bytes = 0;

    std::vector<std::string> errors;
};

class ProgressAggregator {
public:
    explicit ProgressAggregator(ProgressSink sink);

    void reset(std::uint64_t totalSegments, std::uint64_t cachedSegments, std::uint64_t cachedBytes);

    void recordSuccess(std::uint64_t bytes);
    void recordFailure(const std::string& error);

    ProgressSnapshot emit(SessionStatus status, std::uint64_t fileSize = 0);
    // Terminal snapshot whose error list is the single fatal reason.
    ProgressSnapshot emitFatal(SessionStatus status, const std::string& reason);

    ProgressCounters counters() const;

    static ProgressSnapshot compute(const ProgressCounters& c, SessionStatus status, double elapsedSeconds);

private:
    ProgressSnapshot emitLocked(SessionStatus status, std::uint64_t fileSize, const std::string* reason = nullptr);

    ProgressSink sink;
    ProgressCounters state;
    std::chrono::steady_clock::time_point start;
    mutable std::mutex mtx;
};
