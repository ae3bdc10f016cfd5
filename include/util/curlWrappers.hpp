#pragma once

#include "util/s3Helpers.hpp"

#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace sw::util {

inline constexpr const auto* HTTP_USER_AGENT = "syncwright/0.1";

// Applied to every handle. A transfer that stays under lowSpeedBytes per second
// for lowSpeedSecs is aborted with CURLE_OPERATION_TIMEDOUT.
struct RequestLimits {
    long connectTimeoutSecs = 30;
    long lowSpeedBytes = 1;
    long lowSpeedSecs = 120;
};

// Owns one easy handle; every request gets a fresh one.
class CurlEasy {
public:
    explicit CurlEasy(const RequestLimits& limits = {}) : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_USERAGENT, HTTP_USER_AGENT);
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_FOLLOWLOCATION, 0L);   // a redirect would invalidate the signature
        curl_easy_setopt(h_, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(h_, CURLOPT_CONNECTTIMEOUT, limits.connectTimeoutSecs);
        curl_easy_setopt(h_, CURLOPT_LOW_SPEED_LIMIT, limits.lowSpeedBytes);
        curl_easy_setopt(h_, CURLOPT_LOW_SPEED_TIME, limits.lowSpeedSecs);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

// Request headers; the strings outlive the curl_slist that points into them.
class SList {
public:
    SList() = default;
    SList(SList&& other) noexcept : store_(std::move(other.store_)), head_(other.head_) { other.head_ = nullptr; }
    SList(const SList&) = delete;
    SList& operator=(const SList&) = delete;
    ~SList() { curl_slist_free_all(head_); }

    void add(std::string line) {
        store_.push_back(std::move(line));
        head_ = curl_slist_append(head_, store_.back().c_str());
        if (!head_) throw std::runtime_error("curl_slist_append failed");
    }

    void add(const std::string& name, const std::string& value) { add(name + ": " + value); }

    [[nodiscard]] curl_slist* get() const { return head_; }

private:
    std::vector<std::string> store_;
    curl_slist* head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    std::string hdr;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }

    // Worth sending again as-is: transport trouble, throttling or a server-side error.
    [[nodiscard]] bool transient() const {
        if (curl != CURLE_OK)
            return curl != CURLE_URL_MALFORMAT && curl != CURLE_UNSUPPORTED_PROTOCOL;
        return http == 408 || http == 429 || http / 100 == 5;
    }

    // "HTTP 503" or the curl error text
    [[nodiscard]] std::string status() const {
        if (curl != CURLE_OK) return curl_easy_strerror(curl);
        return "HTTP " + std::to_string(http);
    }
};

// One request on a fresh handle. `setup` sets the URL, method, headers and body.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup, const RequestLimits& limits = {}) {
    CurlEasy h(limits);
    HttpResponse r;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &r.hdr);

    setup(static_cast<CURL*>(h));

    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    return r;
}

}
