#include "storage/model/Entry.hpp"
#include "storage/model/File.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace sw::storage::model {

void to_json(nlohmann::json& j, const Entry& entry) {
    j = {
        {"name", entry.name},
        {"path", entry.path.string()},
        {"type", entry.isDirectory() ? "directory" : "file"},
        {"exists", entry.exists},
        {"created_at", util::timestampToString(entry.created_at)},
        {"updated_at", util::timestampToString(entry.updated_at)}
    };
    if (!entry.isDirectory()) j["size_bytes"] = static_cast<const File&>(entry).size_bytes;
}

}
