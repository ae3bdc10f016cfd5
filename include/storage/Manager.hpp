#pragma once

#include "storage/Engine.hpp"
#include "config/Config.hpp"

#include <memory>

namespace sw::storage {

// Turns a root configuration into a ready Root: backend first, then each
// encryption layer (innermost first), capabilities probed once, login run
// if advertised, root directory resolved.
class Manager {
public:
    static std::shared_ptr<Engine> buildEngine(const config::RootConfig& cfg);

    static Root resolve(const config::RootConfig& cfg, const concurrency::Interrupt& interrupt);

    static Root resolve(std::shared_ptr<Engine> engine, const fs::path& path, const concurrency::Interrupt& interrupt);
};

}
