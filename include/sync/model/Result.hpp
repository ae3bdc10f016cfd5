#pragma once

#include "sync/model/Stats.hpp"

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sw::sync::model {

enum class Outcome { Completed, Cancelled, Failed };

std::string to_string(Outcome o);

// Statistics are filled in whatever the outcome.
struct Result {
    Outcome outcome = Outcome::Completed;
    Stats stats;
    std::string error;

    [[nodiscard]] bool completed() const { return outcome == Outcome::Completed; }
};

void to_json(nlohmann::json& j, const Result& r);

}
