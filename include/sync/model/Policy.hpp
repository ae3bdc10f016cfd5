#pragma once

#include "sync/model/EqualityMethod.hpp"

#include <nlohmann/json_fwd.hpp>

namespace sw::config { struct SyncConfig; }

namespace sw::sync::model {

// Read-only for the duration of a run.
struct Policy {
    EqualityMethod equality = DefaultEqualityMethods;
    unsigned int retryCount = 3;
    bool createDirectories = true;
    bool deleteDirectories = false;
    bool createFiles = true;
    bool updateFiles = true;
    bool deleteFiles = false;

    static Policy fromConfig(const config::SyncConfig& cfg);
};

void to_json(nlohmann::json& j, const Policy& p);

}
