#pragma once

#include "config/Config.hpp"
#include "storage/Errors.hpp"
#include "util/curlWrappers.hpp"

#include <cstdint>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sw::cloud {

struct ValidateResult { bool ok; std::string msg; };

// A failed request. `transient` marks failures that may succeed when sent again unchanged.
struct S3Error : storage::BackendError {
    S3Error(const std::string& msg, const bool transient) : storage::BackendError(msg), transient_(transient) {}

    [[nodiscard]] bool transient() const { return transient_; }

private:
    bool transient_;
};

struct ObjectInfo {
    std::string key;
    uintmax_t size = 0;
    std::time_t last_modified = 0;
};

// One ListObjectsV2 page, already split by delimiter.
struct ListPage {
    std::vector<ObjectInfo> objects;
    std::vector<std::string> commonPrefixes;
    bool truncated = false;
    std::string nextContinuationToken;
};

ListPage parseListObjectsV2(const std::string& xml);
std::string parseUploadId(const std::string& xml);

// Path-style S3 client signed with SigV4. Every failed request throws S3Error.
class S3Controller {
public:
    explicit S3Controller(config::S3Config cfg);

    void putObject(const std::string& key, const std::string& body) const;

    void deleteObject(const std::string& key) const;

    [[nodiscard]] std::vector<uint8_t> downloadToBuffer(const std::string& key) const;

    // Bytes [0, len) of an object; shorter objects come back whole.
    [[nodiscard]] std::vector<uint8_t> downloadRange(const std::string& key, size_t len) const;

    [[nodiscard]] std::string initiateMultipartUpload(const std::string& key) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId,
                                         int partNumber, const std::string& partData) const;

    void completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                 const std::vector<std::string>& etags) const;

    void abortMultipartUpload(const std::string& key, const std::string& uploadId) const;

    // All objects and common prefixes directly under `prefix` (delimiter "/"), every page.
    [[nodiscard]] ListPage listObjects(const std::string& prefix) const;

    [[nodiscard]] ValidateResult validateAPICredentials() const;

    [[nodiscard]] const config::S3Config& config() const { return cfg_; }

private:
    config::S3Config cfg_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& key,
                                                       const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                       const std::string& canonical,
                                       const std::string& payloadHash,
                                       const std::string& canonicalQuery = "") const;

    [[noreturn]] void fail(const std::string& op, const std::string& key, const util::HttpResponse& resp) const;
};

}
