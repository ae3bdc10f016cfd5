#include "sync/Planner.hpp"
#include "storage/model/Entry.hpp"
#include "log/Registry.hpp"

#include <map>

using namespace sw::sync::model;

namespace sw::sync {

bool Pair::sameKind() const {
    return source && target && source->isDirectory() == target->isDirectory();
}

std::vector<Pair> Planner::build(const std::vector<std::shared_ptr<storage::model::Entry>>& source,
                                 const std::vector<std::shared_ptr<storage::model::Entry>>& target) {
    std::map<std::string, Pair> byName;

    for (const auto& e : source) {
        auto& p = byName[e->name];
        if (p.source) {
            log::Registry::sync()->warn("[Planner] Duplicate source entry '{}', keeping the first", e->name);
            continue;
        }
        p.name = e->name;
        p.source = e;
    }

    for (const auto& e : target) {
        auto& p = byName[e->name];
        if (p.target) {
            log::Registry::sync()->warn("[Planner] Duplicate target entry '{}', keeping the first", e->name);
            continue;
        }
        p.name = e->name;
        p.target = e;
    }

    std::vector<Pair> plan;
    plan.reserve(byName.size());
    for (auto& [_, p] : byName) plan.push_back(std::move(p));
    return plan;
}

}
