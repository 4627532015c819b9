#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cstddef>

struct DownloadConfig {
    std::string manifestUrl;
    std::string outputPath;
    std::string cacheRoot;

    std::size_t maxThreads = 0; // 0 = auto

    unsigned retryAttempts = 3;
    std::chrono::milliseconds retryDelay{ 1000 };
    std::chrono::seconds requestTimeout{ 30 };

    std::string muxerPath = "ffmpeg";

    std::string userAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/127.0.0.0 Safari/537.36";
    std::vector<std::string> headers;
    bool verifyPeer = true;

    std::size_t variantIndex = 0; // 0 = highest bandwidth
    bool listVariants = false;
};

struct StreamDescriptor {
    std::string manifestUrl;
    std::string baseUrl;
};

struct SegmentDescriptor {
    std::uint64_t index;
    std::string uri;
    std::string resolvedUrl;
};

struct StreamVariant {
    std::string url;
    std::uint64_t bandwidth;
    std::string resolution;
    std::string label;
};

enum class ErrorKind {
    None,
    Manifest,
    SegmentFetch,
    CacheIO,
    Merge
};

enum class SessionStatus {
    Downloading,
    Merging,
    Completed,
    Failed,
    Cancelled
};

inline const char* toString(SessionStatus status) {
    switch (status) {
    case SessionStatus::Downloading: return "downloading";
    case SessionStatus::Merging:     return "merging";
    case SessionStatus::Completed:   return "completed";
    case SessionStatus::Failed:      return "failed";
    case SessionStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

inline const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:         return "none";
    case ErrorKind::Manifest:     return "manifest error";
    case ErrorKind::SegmentFetch: return "segment fetch error";
    case ErrorKind::CacheIO:      return "cache I/O error";
    case ErrorKind::Merge:        return "merge error";
    }
    return "unknown";
}

// Immutable once emitted.
struct ProgressSnapshot {
    SessionStatus status = SessionStatus::Downloading;
    double percent = 0.0;

    std::uint64_t downloadedSegments = 0;
    std::uint64_t totalSegments = 0;
    std::uint64_t failedSegments = 0;
    std::uint64_t bytesDownloaded = 0;

    double speedMBps = 0.0;
    double speedSegPerSec = 0.0;
    std::uint64_t etaSeconds = 0;

    std::uint64_t fileSize = 0; // only on Completed
    std::vector<std::string> errors;
};

struct WorkerReport {
    std::uint64_t segmentIndex;
    std::uint64_t bytesDownloaded;
    bool success;
    ErrorKind kind;
    std::string error;
};

struct SessionResult {
    bool success = false;
    ErrorKind kind = ErrorKind::None;
    ProgressSnapshot snapshot;
};
