#pragma once

#include "storage/model/Entry.hpp"

#include <cstdint>

namespace sw::storage::model {

struct File final : Entry {
    uintmax_t size_bytes{0};

    File() = default;

    [[nodiscard]] bool isDirectory() const override { return false; }
};

}
