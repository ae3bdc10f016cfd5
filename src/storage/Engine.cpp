#include "storage/Engine.hpp"
#include "storage/model/Entry.hpp"
#include "storage/model/File.hpp"

#include <stdexcept>

namespace sw::storage {

void Engine::logIn(const concurrency::Interrupt&) {}

std::string Engine::fullPath(const model::Entry& entry) const {
    throw std::logic_error("Engine does not provide full paths: " + entry.name);
}

std::vector<uint8_t> Engine::readHead(const model::File& file, const size_t len, const concurrency::Interrupt& interrupt) {
    const auto in = openRead(file, interrupt);
    std::vector<uint8_t> head(len);
    head.resize(readFully(*in, head.data(), len));
    return head;
}

std::string Root::display(const model::Entry& entry) const {
    if (capabilities.fullPath && engine) return engine->fullPath(entry);
    return entry.path.empty() ? entry.name : entry.path.string();
}

}
