#include "sync/model/Policy.hpp"
#include "config/Config.hpp"

#include <nlohmann/json.hpp>

namespace sw::sync::model {

Policy Policy::fromConfig(const config::SyncConfig& cfg) {
    return {
        .equality = parseEqualityMethods(cfg.equality_methods),
        .retryCount = cfg.retry_count,
        .createDirectories = cfg.create_directories,
        .deleteDirectories = cfg.delete_directories,
        .createFiles = cfg.create_files,
        .updateFiles = cfg.update_files,
        .deleteFiles = cfg.delete_files
    };
}

void to_json(nlohmann::json& j, const Policy& p) {
    j = {
        {"equality_methods", to_string(p.equality)},
        {"retry_count", p.retryCount},
        {"create_directories", p.createDirectories},
        {"delete_directories", p.deleteDirectories},
        {"create_files", p.createFiles},
        {"update_files", p.updateFiles},
        {"delete_files", p.deleteFiles}
    };
}

}
