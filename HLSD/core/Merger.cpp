#include "Merger.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

Merger::Merger(Muxer& m)
    : muxer(m) {
}

std::string Merger::singleQuote(const std::string& text) {
    std::string quoted = "'";
    for (char ch : text) {
        if (ch == '\'')
            quoted += "'\\''";
        else
            quoted += ch;
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> Merger::orderedPaths(const CacheStore& cache, std::uint64_t totalSegments) {
    std::vector<std::string> paths;
    paths.reserve(static_cast<std::size_t>(totalSegments));
    for (std::uint64_t i = 0; i < totalSegments; ++i)
        paths.push_back(fs::absolute(cache.segmentPath(i)).string());
    return paths;
}

bool Merger::writeConcatList(const std::vector<std::string>& paths,
    const std::string& listPath,
    std::string& error) {
    std::ofstream out(listPath, std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot create concat list " + listPath;
        return false;
    }

    for (const auto& p : paths)
        out << "file " << singleQuote(p) << '\n';

    out.flush();
    if (!out) {
        error = "cannot write concat list " + listPath;
        return false;
    }
    return true;
}

bool Merger::merge(const CacheStore& cache,
    std::uint64_t totalSegments,
    const std::string& destPath,
    std::uint64_t& fileSize,
    std::string& error) {
    fileSize = 0;

    for (std::uint64_t i = 0; i < totalSegments; ++i) {
        if (!cache.isComplete(i)) {
            error = "segment " + std::to_string(i) + " missing from cache";
            return false;
        }
    }

    std::error_code ec;
    const fs::path dest(destPath);
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            error = "cannot create output directory " + dest.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    if (!muxer.merge(orderedPaths(cache, totalSegments), destPath, error))
        return false;

    if (!fs::is_regular_file(dest, ec)) {
        error = "merge produced no output file " + destPath;
        return false;
    }

    const auto size = fs::file_size(dest, ec);
    if (ec || size == 0) {
        error = "merge produced an empty output file " + destPath;
        return false;
    }

    fileSize = static_cast<std::uint64_t>(size);
    return true;
}
