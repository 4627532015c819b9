#pragma once
#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string error;
};

class Fetcher {
public:
    virtual ~Fetcher() = default;

    // false on transport failure (out.error set), true when a response arrived
    virtual bool get(const std::string& url, HttpResponse& out) = 0;
};
