#pragma once
#include <string>
#include <vector>

// Concatenates already-encoded segments into one container without re-encoding.
class Muxer {
public:
    virtual ~Muxer() = default;

    virtual bool merge(const std::vector<std::string>& orderedPaths,
        const std::string& destPath,
        std::string& error) = 0;
};
