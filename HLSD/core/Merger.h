#pragma once
#include <string>
#include <vector>
#include <cstdint>

#include "Muxer.h"
#include "../io/CacheStore.h"

class Merger {
public:
    explicit Merger(Muxer& muxer);

    // Muxes every cached segment, ascending by index, into destPath.
    // Succeeds only if the muxer succeeds and destPath ends up non-empty.
    bool merge(const CacheStore& cache,
        std::uint64_t totalSegments,
        const std::string& destPath,
        std::uint64_t& fileSize,
        std::string& error);

    static std::vector<std::string> orderedPaths(const CacheStore& cache, std::uint64_t totalSegments);

    // Single-quoted, with ' written as '\''. Accepted by the concat demuxer and by sh.
    static std::string singleQuote(const std::string& text);

    // ffmpeg concat demuxer format: one "file '<path>'" line per entry.
    static bool writeConcatList(const std::vector<std::string>& paths,
        const std::string& listPath,
        std::string& error);

private:
    Muxer& muxer;
};
