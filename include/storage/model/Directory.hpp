#pragma once

#include "storage/model/Entry.hpp"

namespace sw::storage::model {

struct Directory final : Entry {
    Directory() = default;

    [[nodiscard]] bool isDirectory() const override { return true; }
};

}
