#pragma once

#include <memory>
#include <string>
#include <vector>

namespace sw::storage::model { struct Entry; }

namespace sw::sync {

namespace model {

// One name within a directory level; either side may be missing.
struct Pair {
    std::string name;
    std::shared_ptr<storage::model::Entry> source{};
    std::shared_ptr<storage::model::Entry> target{};

    [[nodiscard]] bool sourceOnly() const { return source && !target; }
    [[nodiscard]] bool targetOnly() const { return !source && target; }
    [[nodiscard]] bool sameKind() const;
};

}

struct Planner {
    // Union of both listings by name, in sorted name order.
    static std::vector<model::Pair> build(const std::vector<std::shared_ptr<storage::model::Entry>>& source,
                                          const std::vector<std::shared_ptr<storage::model::Entry>>& target);
};

}
