#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace sw::sync::model {

// Owned by a single run. "Seen" counts source-side entries visited.
struct Stats {
    uint64_t directoriesSeen = 0;
    uint64_t directoriesCreated = 0;
    uint64_t directoriesDeleted = 0;
    uint64_t filesSeen = 0;
    uint64_t filesCreated = 0;
    uint64_t filesUpdated = 0;
    uint64_t filesDeleted = 0;
};

void to_json(nlohmann::json& j, const Stats& s);

}
