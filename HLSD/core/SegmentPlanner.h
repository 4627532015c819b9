#pragma once
#include <string>
#include <vector>

#include "utils.h"

class SegmentPlanner {
public:
    // Ordered segment list of a media playlist. Fails on a master playlist
    // or on a playlist without segments.
    static bool plan(const std::string& manifestText,
        const std::string& manifestUrl,
        std::vector<SegmentDescriptor>& out,
        std::string& error);

    static bool isMasterPlaylist(const std::string& manifestText);

    // Variants sorted by bandwidth, highest first; equal bandwidths keep manifest order.
    static bool listVariants(const std::string& manifestText,
        const std::string& manifestUrl,
        std::vector<StreamVariant>& out,
        std::string& error);

    static StreamDescriptor describe(const std::string& manifestUrl);

    static std::string resolveUrl(const std::string& manifestUrl, const std::string& ref);
    static std::string manifestHost(const std::string& manifestUrl);
    static std::string manifestDirectory(const std::string& manifestUrl);
};
