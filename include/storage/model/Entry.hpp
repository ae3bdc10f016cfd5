#pragma once

#include <filesystem>
#include <string>
#include <ctime>
#include <memory>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sw::storage::model {

struct Entry {
    std::string name{};
    std::filesystem::path path{};   // backend-relative, as the owning engine addresses it
    bool exists{true};
    std::time_t created_at{}, updated_at{};

    // Set by adapters wrapping another engine: the entry as the wrapped engine sees it.
    std::shared_ptr<Entry> inner{};

    Entry() = default;
    virtual ~Entry() = default;

    [[nodiscard]] virtual bool isDirectory() const = 0;
};

void to_json(nlohmann::json& j, const Entry& entry);

}
