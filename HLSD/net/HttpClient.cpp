#include "HttpClient.h"

#include <algorithm>

#include <curl/curl.h>

static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    std::size_t total = size * nmemb;
    body->append(ptr, total);
    return total;
}

HttpClient::HttpClient(const HttpOptions& options)
    : errorBuffer(CURL_ERROR_SIZE, '\0'),
    opts(options) {
    curl = curl_easy_init();

    curl_slist* list = nullptr;
    for (const auto& h : opts.headers)
        list = curl_slist_append(list, h.c_str());
    headerList = list;
}

HttpClient::~HttpClient() {
    if (headerList)
        curl_slist_free_all(static_cast<curl_slist*>(headerList));
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

bool HttpClient::get(const std::string& url, HttpResponse& out) {
    out.status = 0;
    out.body.clear();
    out.error.clear();

    CURL* c = static_cast<CURL*>(curl);
    if (!c) {
        out.error = "curl handle unavailable";
        return false;
    }

    curl_easy_reset(c);

    std::fill(errorBuffer.begin(), errorBuffer.end(), '\0');

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, static_cast<void*>(&out.body));
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(opts.timeout.count()));
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer.data());

    if (!opts.userAgent.empty())
        curl_easy_setopt(c, CURLOPT_USERAGENT, opts.userAgent.c_str());
    if (headerList)
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(headerList));
    if (!opts.verifyPeer) {
        curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        out.error = errorBuffer[0] != '\0' ? errorBuffer.data() : curl_easy_strerror(res);
        out.body.clear();
        return false;
    }

    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &out.status);
    return true;
}
