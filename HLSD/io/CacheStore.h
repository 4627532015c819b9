#pragma once
#include <string>
#include <set>
#include <cstdint>

struct CacheScan {
    std::set<std::uint64_t> complete;
    std::uint64_t bytes = 0;
};

// On-disk segment cache for one stream: <root>/<key>/segment_NNNNN.ts.
// A segment file with size > 0 is complete; anything else is pending.
class CacheStore {
public:
    CacheStore(const std::string& root, const std::string& key);

    // 16 lowercase hex chars of MD5(manifestUrl).
    static std::string keyFor(const std::string& manifestUrl);
    static std::string defaultRoot();

    bool ensureDirectory(std::string& error);
    bool exists() const;

    std::string segmentPath(std::uint64_t index) const;
    const std::string& directory() const { return cacheDir; }

    bool isComplete(std::uint64_t index) const;
    std::uint64_t sizeOf(std::uint64_t index) const;
    CacheScan scan(std::uint64_t totalSegments) const;

    bool write(std::uint64_t index, const std::string& data, std::string& error);
    bool purge(std::string& error);

private:
    std::string cacheDir;
};
