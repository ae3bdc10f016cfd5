#include "storage/Manager.hpp"
#include "storage/LocalEngine.hpp"
#include "storage/CloudEngine.hpp"
#include "storage/EncryptedEngine.hpp"
#include "storage/model/Directory.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace sw::storage {

std::shared_ptr<Engine> Manager::buildEngine(const config::RootConfig& cfg) {
    std::shared_ptr<Engine> engine;
    if (cfg.provider == "local") engine = std::make_shared<LocalEngine>();
    else if (cfg.provider == "s3") engine = std::make_shared<CloudEngine>(cfg.s3);
    else throw std::invalid_argument("Unknown storage provider: " + cfg.provider);

    for (const auto& layer : cfg.encryption) engine = std::make_shared<EncryptedEngine>(engine, layer);
    return engine;
}

Root Manager::resolve(const config::RootConfig& cfg, const concurrency::Interrupt& interrupt) {
    log::Registry::storage()->debug("[Manager] Resolving {} root {} with {} encryption layer(s)",
                                    cfg.provider, cfg.path.string(), cfg.encryption.size());
    return resolve(buildEngine(cfg), cfg.path, interrupt);
}

Root Manager::resolve(std::shared_ptr<Engine> engine, const fs::path& path, const concurrency::Interrupt& interrupt) {
    if (!engine) throw std::invalid_argument("Cannot resolve a root without an engine");

    Root root;
    root.capabilities = engine->capabilities();
    if (root.capabilities.login) engine->logIn(interrupt);
    root.directory = engine->root(path, interrupt);
    root.engine = std::move(engine);
    return root;
}

}
