#include "storage/cloud/S3Controller.hpp"
#include "storage/Errors.hpp"
#include "util/timestamp.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cstring>
#include <iterator>
#include <regex>
#include <utility>

using namespace sw::util;

namespace sw::cloud {

namespace {

struct UploadCursor {
    const std::string* data;
    size_t pos = 0;
};

size_t readFromCursor(char* out, const size_t size, const size_t nmemb, void* userdata) {
    auto* cur = static_cast<UploadCursor*>(userdata);
    const size_t to_copy = std::min(size * nmemb, cur->data->size() - cur->pos);
    std::memcpy(out, cur->data->data() + cur->pos, to_copy);
    cur->pos += to_copy;
    return to_copy;
}

const std::string kUnsigned = "UNSIGNED-PAYLOAD";

std::string rstrip(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

}

S3Controller::S3Controller(config::S3Config cfg) : cfg_(std::move(cfg)) {
    cfg_.endpoint = rstrip(cfg_.endpoint);
    if (cfg_.endpoint.empty()) throw std::invalid_argument("S3Controller requires an endpoint");
    if (cfg_.bucket.empty()) throw std::invalid_argument("S3Controller requires a bucket");
    ensureCurlGlobalInit();
}

void S3Controller::fail(const std::string& op, const std::string& key, const HttpResponse& resp) const {
    log::Registry::cloud()->error("[S3Controller] {} failed for {}: CURL={} HTTP={} Response:\n{}",
                                  op, key, static_cast<int>(resp.curl), resp.http, resp.body);
    throw S3Error("S3 " + op + " failed for '" + key + "': " + resp.status(), resp.transient());
}

ValidateResult S3Controller::validateAPICredentials() const {
    if (cfg_.secret_access_key.empty())
        return {false, "S3 secret access key is empty"};

    const std::regex re_endpoint(R"(^https?://([A-Za-z0-9.-]+|\d{1,3}(?:\.\d{1,3}){3})(:\d{1,5})?/?$)");
    if (cfg_.access_key.empty()) return {false, "S3 access key is empty"};
    if (!std::regex_match(cfg_.endpoint, re_endpoint))
        return {false, "Endpoint format looks wrong (expect https://<host>[:port]/)."};

    // --- Live probe: ListBuckets ---
    const auto serviceUrl = cfg_.endpoint + "/";
    SList hdrs = makeSigHeaders("GET", "/", kUnsigned);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, serviceUrl.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });

    if (resp.ok()) return {true, "Credentials validated (ListBuckets succeeded)."};
    if (resp.curl != CURLE_OK) return {false, "Auth probe failed: " + resp.status()};

    const std::string& body = resp.body;
    const bool accessDenied = body.find("AccessDenied") != std::string::npos;
    const bool badSig =
        body.find("SignatureDoesNotMatch") != std::string::npos ||
        body.find("InvalidAccessKeyId") != std::string::npos ||
        body.find("AuthFailure") != std::string::npos ||
        body.find("XAmzContentSHA256Mismatch") != std::string::npos;

    if (accessDenied && !badSig) return {true, "Credentials validated (auth OK, ListBuckets denied)."};
    return {false, "Auth probe failed: " + resp.body};
}

void S3Controller::putObject(const std::string& key, const std::string& body) const {
    const std::string payloadHash = sha256Hex(body);

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type", "application/octet-stream");

    UploadCursor cursor{&body};
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromCursor);
    });

    if (!resp.ok()) fail("putObject", key, resp);
}

void S3Controller::deleteObject(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("DELETE", canonical, sha256Hex(""));

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) fail("deleteObject", key, resp);
}

std::vector<uint8_t> S3Controller::downloadToBuffer(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("GET", canonical, kUnsigned);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });

    if (!resp.ok()) fail("downloadToBuffer", key, resp);
    return {resp.body.begin(), resp.body.end()};
}

std::vector<uint8_t> S3Controller::downloadRange(const std::string& key, const size_t len) const {
    if (len == 0) return {};

    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key);

    SList hdrs = makeSigHeaders("GET", canonical, kUnsigned);
    hdrs.add("Range", "bytes=0-" + std::to_string(len - 1));

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
    });

    // 416: zero-length object
    if (resp.curl == CURLE_OK && resp.http == 416) return {};
    if (!resp.ok()) fail("downloadRange", key, resp);

    std::vector<uint8_t> out(resp.body.begin(), resp.body.end());
    if (out.size() > len) out.resize(len); // servers that ignore Range send everything
    return out;
}

std::string S3Controller::initiateMultipartUpload(const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, "uploads");

    SList hdrs = makeSigHeaders("POST", canonical, sha256Hex(""), "uploads=");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (!resp.ok()) fail("initiateMultipartUpload", key, resp);
    return parseUploadId(resp.body);
}

std::string S3Controller::uploadPart(const std::string& key, const std::string& uploadId,
                                     const int partNumber, const std::string& partData) const {
    CurlEasy tmpHandle;
    const std::string query = "partNumber=" + std::to_string(partNumber) +
                              "&uploadId=" + uriEncode(static_cast<CURL*>(tmpHandle), uploadId);
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, query);

    SList hdrs = makeSigHeaders("PUT", canonical, sha256Hex(partData), query);
    hdrs.add("Content-Type", "application/octet-stream");

    UploadCursor cursor{&partData};
    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &cursor);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(partData.size()));
        curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromCursor);
    });

    if (!resp.ok()) fail("uploadPart " + std::to_string(partNumber), key, resp);

    std::string etag;
    if (!extractETag(resp.hdr, etag))
        throw storage::BackendError("S3 uploadPart returned no ETag for '" + key + "'");
    return etag;
}

void S3Controller::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                           const std::vector<std::string>& etags) const {
    if (etags.empty()) throw std::invalid_argument("completeMultipartUpload needs at least one part");

    CurlEasy tmpHandle;
    const std::string query = "uploadId=" + uriEncode(static_cast<CURL*>(tmpHandle), uploadId);
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, query);

    const auto body = composeMultiPartUploadXMLBody(etags);
    SList hdrs = makeSigHeaders("POST", canonical, sha256Hex(body), query);
    hdrs.add("Content-Type", "application/xml");

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    // S3 can report a failed completion inside a 200 body
    if (!resp.ok() || resp.body.find("<Error>") != std::string::npos) fail("completeMultipartUpload", key, resp);
}

void S3Controller::abortMultipartUpload(const std::string& key, const std::string& uploadId) const {
    CurlEasy tmpHandle;
    const std::string query = "uploadId=" + uriEncode(static_cast<CURL*>(tmpHandle), uploadId);
    const auto [canonical, url] = constructPaths(static_cast<CURL*>(tmpHandle), key, query);

    SList hdrs = makeSigHeaders("DELETE", canonical, sha256Hex(""), query);

    const auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) fail("abortMultipartUpload", key, resp);
}

ListPage S3Controller::listObjects(const std::string& prefix) const {
    ListPage all;
    std::string continuationToken;

    do {
        CurlEasy tmpHandle;
        auto* curl = static_cast<CURL*>(tmpHandle);

        // canonical query: parameters sorted by name
        std::string query;
        if (!continuationToken.empty()) query += "continuation-token=" + uriEncode(curl, continuationToken) + "&";
        query += "delimiter=%2F&list-type=2";
        if (!prefix.empty()) query += "&prefix=" + uriEncode(curl, prefix);

        const std::string canonical = "/" + cfg_.bucket;
        const std::string url = cfg_.endpoint + canonical + "?" + query;

        SList hdrs = makeSigHeaders("GET", canonical, kUnsigned, query);

        const auto resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        });

        if (!resp.ok()) fail("listObjects", prefix, resp);

        auto page = parseListObjectsV2(resp.body);
        std::ranges::move(page.objects, std::back_inserter(all.objects));
        std::ranges::move(page.commonPrefixes, std::back_inserter(all.commonPrefixes));

        continuationToken = page.truncated ? page.nextContinuationToken : "";
    } while (!continuationToken.empty());

    return all;
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
            {"host", cfg_.endpoint.substr(cfg_.endpoint.find("//") + 2)},
            {"x-amz-content-sha256", payloadHash},
            {"x-amz-date", getCurrentTimestamp()}
    };
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& key,
                                                                 const std::string& query) const {
    const auto canonicalPath = "/" + cfg_.bucket + "/" + escapeKeyPreserveSlashes(curl, key);
    const auto url = cfg_.endpoint + canonicalPath + (query.empty() ? "" : "?" + query);
    return {canonicalPath, url};
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash,
                                   const std::string& canonicalQuery) const {
    const auto base = buildHeaderMap(payloadHash);      // host + dates
    const auto auth = buildAuthorizationHeader(cfg_, method, canonical, base, payloadHash, canonicalQuery);

    SList out;
    out.add("Authorization", auth);
    for (const auto& [k, v] : base) out.add(k, v);
    return out;  // RAII slist
}

}
