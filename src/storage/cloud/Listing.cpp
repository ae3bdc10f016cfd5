#include "storage/cloud/S3Controller.hpp"
#include "storage/Errors.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <pugixml.hpp>

namespace sw::cloud {

ListPage parseListObjectsV2(const std::string& xml) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml.c_str());

    if (!result) {
        log::Registry::cloud()->error("[S3Controller] [parseListObjectsV2] Failed to parse XML: {}", result.description());
        throw storage::BackendError(std::string("Malformed ListObjectsV2 response: ") + result.description());
    }

    const pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) throw storage::BackendError("No ListBucketResult node found in S3 response");

    ListPage page;
    for (pugi::xml_node content : root.children("Contents")) {
        const auto keyNode = content.child("Key");
        const auto sizeNode = content.child("Size");
        const auto modifiedNode = content.child("LastModified");

        if (!keyNode || !sizeNode) {
            log::Registry::cloud()->warn("[S3Controller] [parseListObjectsV2] Skipping entry due to missing child elements");
            continue;
        }

        ObjectInfo info;
        info.key = keyNode.text().get();
        info.size = std::stoull(sizeNode.text().get());
        if (modifiedNode) info.last_modified = util::parseTimestampFromString(modifiedNode.text().get());
        page.objects.push_back(std::move(info));
    }

    for (pugi::xml_node prefix : root.children("CommonPrefixes"))
        if (const auto p = prefix.child("Prefix")) page.commonPrefixes.emplace_back(p.text().get());

    page.truncated = root.child("IsTruncated").text().as_bool(false);
    page.nextContinuationToken = root.child("NextContinuationToken").text().get();
    return page;
}

std::string parseUploadId(const std::string& xml) {
    pugi::xml_document doc;
    if (!doc.load_string(xml.c_str()))
        throw storage::BackendError("Malformed InitiateMultipartUpload response");

    const std::string id = doc.child("InitiateMultipartUploadResult").child("UploadId").text().get();
    if (id.empty()) throw storage::BackendError("InitiateMultipartUpload response carries no UploadId");
    return id;
}

}
