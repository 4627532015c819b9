#pragma once
#include <string>
#include <vector>
#include <chrono>

#include "Fetcher.h"

struct HttpOptions {
    std::chrono::seconds timeout{ 30 };
    std::string userAgent;
    std::vector<std::string> headers;
    bool verifyPeer = true;
};

class HttpClient : public Fetcher {
public:
    explicit HttpClient(const HttpOptions& options);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    bool get(const std::string& url, HttpResponse& out) override;

private:
    void* curl;
    void* headerList{ nullptr };
    // Registered as CURLOPT_ERRORBUFFER; must outlive the handle.
    std::vector<char> errorBuffer;
    HttpOptions opts;
};
