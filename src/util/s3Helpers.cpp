#include "util/s3Helpers.hpp"
#include "config/Config.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <stdexcept>

namespace sw::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);

    std::ostringstream oss;
    for (unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string uriEncode(CURL* curl, const std::string& value) {
    char* esc = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!esc) throw std::runtime_error("escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        out << uriEncode(curl, key.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::ostringstream xml;

    xml << "<CompleteMultipartUpload>";

    for (size_t i = 0; i < etags.size(); ++i)
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << etags[i] << "</ETag></Part>";

    xml << "</CompleteMultipartUpload>";

    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    auto pos = respHdr.find("ETag:");
    if (pos == std::string::npos) pos = respHdr.find("etag:");
    if (pos == std::string::npos) return false;
    pos += 5; // Skip "ETag:"
    while (pos < respHdr.size() && (respHdr[pos] == ' ' || respHdr[pos] == '\t')) ++pos;
    auto end = respHdr.find_first_of("\r\n", pos);
    etagOut = respHdr.substr(pos, end - pos);
    while (!etagOut.empty() && (etagOut.back() == ' ' || etagOut.back() == '\t')) etagOut.pop_back();

    return !etagOut.empty();
}

std::string buildAuthorizationHeader(const config::S3Config& s3,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD, same instant as amzDate

    // Build canonical headers and signed headers
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    // Canonical request block
    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << canonicalQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    // String to sign
    const std::string credentialScope = dateStamp + "/" + s3.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    // Key derivation
    const std::string kDate    = hmacSha256Raw("AWS4" + s3.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, s3.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << s3.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

}
