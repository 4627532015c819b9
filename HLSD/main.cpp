#include <iostream>
#include <iomanip>
#include <chrono>
#include <mutex>
#include <sstream>
#include <csignal>

#include <curl/curl.h>

#include "cli/ArgumentParser.h"
#include "core/DownloadSession.h"
#include "core/SegmentPlanner.h"
#include "io/FfmpegMuxer.h"
#include "net/HttpClient.h"
#include "monitor/Logger.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

HttpOptions httpOptionsFrom(const DownloadConfig& config) {
    HttpOptions opts;
    opts.timeout = config.requestTimeout;
    opts.userAgent = config.userAgent;
    opts.headers = config.headers;
    opts.verifyPeer = config.verifyPeer;
    return opts;
}

// Turns a master playlist URL into the chosen variant's media playlist URL.
// Returns false when the run should end here (listing requested or an error).
bool selectVariant(DownloadConfig& config, const HttpOptions& opts, Logger& logger, bool& listed) {
    listed = false;

    HttpClient client(opts);
    HttpResponse resp;
    if (!client.get(config.manifestUrl, resp)) {
        logger.error("Cannot fetch manifest: " + resp.error);
        return false;
    }
    if (resp.status != 200) {
        logger.error("Cannot fetch manifest (HTTP " + std::to_string(resp.status) + ")");
        return false;
    }

    std::vector<StreamVariant> variants;
    std::string error;
    if (!SegmentPlanner::listVariants(resp.body, config.manifestUrl, variants, error)) {
        logger.error(error);
        return false;
    }

    if (config.listVariants) {
        std::cout << "Available variants:\n";
        for (std::size_t i = 0; i < variants.size(); ++i)
            std::cout << "[" << (i + 1) << "] " << variants[i].label << "\n";
        listed = true;
        return false;
    }

    const std::size_t pick = config.variantIndex == 0 ? 0 : config.variantIndex - 1;
    if (pick >= variants.size()) {
        logger.error("Variant " + std::to_string(config.variantIndex) + " out of range (1-"
            + std::to_string(variants.size()) + ")");
        return false;
    }

    if (variants[pick].url != config.manifestUrl) {
        logger.log("Selected variant: " + variants[pick].label);
        config.manifestUrl = variants[pick].url;
    }
    return true;
}

class ConsoleProgress {
public:
    void operator()(const ProgressSnapshot& snap) {
        std::lock_guard<std::mutex> lock(mtx);

        const auto now = std::chrono::steady_clock::now();
        const bool terminal = snap.status != SessionStatus::Downloading;
        if (!terminal && now - lastPrint < std::chrono::milliseconds(500))
            return;
        lastPrint = now;

        std::ostringstream os;
        os << "\r[" << toString(snap.status) << "] "
            << std::fixed << std::setprecision(1) << snap.percent << "% | "
            << snap.downloadedSegments << "/" << snap.totalSegments << " | "
            << snap.speedSegPerSec << " seg/s | "
            << std::setprecision(2) << snap.speedMBps << " MB/s | ETA: "
            << snap.etaSeconds << "s    ";
        std::cout << os.str();
        if (terminal)
            std::cout << std::endl;
        else
            std::cout << std::flush;
    }

private:
    std::mutex mtx;
    std::chrono::steady_clock::time_point lastPrint{};
};
}

int main(int argc, char* argv[]) {
    DownloadConfig config;
    ArgumentParser parser;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!parser.parse(argc, argv, config))
        return 1;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "curl initialisation failed" << std::endl;
        return 2;
    }

    Logger logger;
    const HttpOptions opts = httpOptionsFrom(config);

    bool listed = false;
    if (!selectVariant(config, opts, logger, listed)) {
        curl_global_cleanup();
        return listed ? 0 : 2;
    }

    FfmpegMuxer muxer(config.muxerPath);
    if (!muxer.available())
        logger.warn(config.muxerPath + " not found; segments will download but cannot be merged");

    ConsoleProgress console;
    SessionResult result;
    {
        DownloadSession session(config,
            [opts]() { return std::make_unique<HttpClient>(opts); },
            muxer,
            [&console](const ProgressSnapshot& snap) { console(snap); },
            &gStopRequested);

        result = session.run();
    }

    curl_global_cleanup();

    return result.success ? 0 : 2;
}
