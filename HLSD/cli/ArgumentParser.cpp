#include "ArgumentParser.h"
#include <iostream>
#include <cstdlib>
#include <cctype>
#include <algorithm>

namespace {
bool parseNumber(const std::string& text, unsigned long long& value) {
    if (text.empty() || text.size() > 18
        || !std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); }))
        return false;

    value = std::stoull(text);
    return true;
}
}

std::string ArgumentParser::deriveOutputFromUrl(const std::string& url) {
    std::string name = url;

    auto special = name.find_first_of("?#");
    if (special != std::string::npos)
        name = name.substr(0, special);

    // Get file name from url
    auto slash = name.find_last_of('/');
    if (slash != std::string::npos)
        name = name.substr(slash + 1);

    auto dot = name.find_last_of('.');
    if (dot != std::string::npos)
        name = name.substr(0, dot);

    if (name.empty())
        name = "video";

    return name + ".mp4";
}

bool ArgumentParser::parse(int argc, char* argv[], DownloadConfig& out) {
    if (argc < 2) {
        printUsage();
        return false;
    }

    out = DownloadConfig{};
    out.manifestUrl = argv[1];

    if (out.manifestUrl.empty() || out.manifestUrl[0] == '-') {
        printUsage();
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        unsigned long long number = 0;

        const bool hasValue = i + 1 < argc;
        const std::string value = hasValue ? argv[i + 1] : std::string();

        if (arg == "-o" && hasValue) {
            out.outputPath = value;
            ++i;
        }
        else if (arg == "-c" && hasValue) {
            out.cacheRoot = value;
            ++i;
        }
        else if (arg == "-f" && hasValue) {
            out.muxerPath = value;
            ++i;
        }
        else if (arg == "-H" && hasValue && value.find(':') != std::string::npos) {
            out.headers.push_back(value);
            ++i;
        }
        else if (arg == "-t" && hasValue && parseNumber(value, number) && number >= 1 && number <= 32) {
            out.maxThreads = static_cast<std::size_t>(number);
            ++i;
        }
        else if (arg == "-r" && hasValue && parseNumber(value, number) && number >= 1 && number <= 100) {
            out.retryAttempts = static_cast<unsigned>(number);
            ++i;
        }
        else if (arg == "-d" && hasValue && parseNumber(value, number)) {
            out.retryDelay = std::chrono::milliseconds(number);
            ++i;
        }
        else if (arg == "-T" && hasValue && parseNumber(value, number) && number >= 1) {
            out.requestTimeout = std::chrono::seconds(number);
            ++i;
        }
        else if (arg == "-v" && hasValue && parseNumber(value, number) && number >= 1) {
            out.variantIndex = static_cast<std::size_t>(number);
            ++i;
        }
        else if (arg == "-k") {
            out.verifyPeer = false;
        }
        else if (arg == "-l") {
            out.listVariants = true;
        }
        else {
            printUsage();
            return false;
        }
    }

    if (out.outputPath.empty())
        out.outputPath = deriveOutputFromUrl(out.manifestUrl);

    return true;
}

void ArgumentParser::printUsage() const {
    printUsage(std::cout);
}

void ArgumentParser::printUsage(std::ostream& os) const {
    os <<
        "Usage:\n"
        "  hlsd <manifest-url> [-o <output>] [options]\n\n"
        "Options:\n"
        "  -o <file>        Output file path (default: name from url, .mp4)\n"
        "  -t <threads>     Download threads, 1-32 (default: auto)\n"
        "  -c <dir>         Cache root (default: $XDG_CACHE_HOME/hlsd or ~/.cache/hlsd)\n"
        "  -r <attempts>    Attempts per segment (default: 3)\n"
        "  -d <ms>          Delay between attempts (default: 1000)\n"
        "  -T <seconds>     Per-request timeout (default: 30)\n"
        "  -f <path>        ffmpeg binary (default: ffmpeg)\n"
        "  -H <header>      Extra request header, e.g. \"Referer: https://host/\" (repeatable)\n"
        "  -k               Do not verify TLS certificates\n"
        "  -v <n>           Variant to download from a master playlist (default: highest bandwidth)\n"
        "  -l               List variants of a master playlist and exit\n";
}
