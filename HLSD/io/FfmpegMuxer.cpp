#include "FfmpegMuxer.h"

#include <cstdlib>
#include <filesystem>

#ifndef _WIN32
#include <sys/wait.h>
#endif

#include "../core/Merger.h"

namespace fs = std::filesystem;

namespace {
#ifdef _WIN32
const char* kDiscardOutput = " > NUL 2>&1";
#else
const char* kDiscardOutput = " > /dev/null 2>&1";
#endif
}

FfmpegMuxer::FfmpegMuxer(const std::string& ffmpegPath)
    : binary(ffmpegPath) {
}

bool FfmpegMuxer::available() const {
    const std::string command = Merger::singleQuote(binary) + " -version" + kDiscardOutput;
    return std::system(command.c_str()) == 0;
}

std::string FfmpegMuxer::buildCommand(const std::string& listPath, const std::string& destPath) const {
    std::string command = Merger::singleQuote(binary);
    command += " -nostdin -hide_banner -loglevel warning";
    command += " -f concat -safe 0 -i " + Merger::singleQuote(listPath);
    command += " -c copy -bsf:a aac_adtstoasc -y ";
    command += Merger::singleQuote(destPath);
    return command;
}

bool FfmpegMuxer::merge(const std::vector<std::string>& orderedPaths,
    const std::string& destPath,
    std::string& error) {
    if (orderedPaths.empty()) {
        error = "nothing to merge";
        return false;
    }

    const std::string listPath = (fs::path(orderedPaths.front()).parent_path() / "concat.txt").string();
    if (!Merger::writeConcatList(orderedPaths, listPath, error))
        return false;

    const std::string command = buildCommand(listPath, destPath);
    const int status = std::system(command.c_str());

    if (status == -1) {
        error = "cannot launch " + binary;
        return false;
    }
#ifdef _WIN32
    const bool exited = true;
    const int code = status;
#else
    const bool exited = WIFEXITED(status);
    const int code = exited ? WEXITSTATUS(status) : -1;
#endif

    if (!exited || code != 0) {
        error = "ffmpeg exited with code " + std::to_string(code);
        if (code == 127)
            error += " (" + binary + " not found)";
        return false;
    }

    return true;
}
