#pragma once
#include <string>
#include <vector>

#include "../core/Muxer.h"

// Stream-copy concatenation through the ffmpeg concat demuxer. The list file
// is written next to the first segment.
class FfmpegMuxer : public Muxer {
public:
    explicit FfmpegMuxer(const std::string& ffmpegPath);

    bool merge(const std::vector<std::string>& orderedPaths,
        const std::string& destPath,
        std::string& error) override;

    bool available() const;

    std::string buildCommand(const std::string& listPath, const std::string& destPath) const;

private:
    std::string binary;
};
