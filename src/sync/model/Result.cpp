#include "sync/model/Result.hpp"

#include <nlohmann/json.hpp>

namespace sw::sync::model {

std::string to_string(const Outcome o) {
    switch (o) {
        case Outcome::Completed: return "completed";
        case Outcome::Cancelled: return "cancelled";
        case Outcome::Failed: return "failed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Stats& s) {
    j = {
        {"directories", {
            {"seen", s.directoriesSeen},
            {"created", s.directoriesCreated},
            {"deleted", s.directoriesDeleted}
        }},
        {"files", {
            {"seen", s.filesSeen},
            {"created", s.filesCreated},
            {"updated", s.filesUpdated},
            {"deleted", s.filesDeleted}
        }}
    };
}

void to_json(nlohmann::json& j, const Result& r) {
    j = {
        {"outcome", to_string(r.outcome)},
        {"stats", r.stats}
    };
    if (!r.error.empty()) j["error"] = r.error;
}

}
