#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <map>

namespace sw::config {
struct S3Config;
}

namespace sw::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
std::string uriEncode(CURL* curl, const std::string& value);
std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);

// SigV4. `canonicalQuery` must already be sorted and URI-encoded.
std::string buildAuthorizationHeader(const config::S3Config& s3,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

void ensureCurlGlobalInit();

}
