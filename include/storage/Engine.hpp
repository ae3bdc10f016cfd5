#pragma once

#include "concurrency/Interrupt.hpp"
#include "storage/Stream.hpp"

#include <ctime>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sw::storage::model {
struct Entry;
struct File;
struct Directory;
}

namespace sw::storage {

namespace fs = std::filesystem;

enum class StorageType { Local, Cloud, Encrypted };

// Optional behaviour a backend advertises. Probed once per root, never per item.
struct Capabilities {
    bool login = false;     // logIn() must run before first use
    bool fullPath = false;  // fullPath() yields a stable display path
};

// The contract every backend and adapter satisfies. Entries handed out by an
// engine are only ever passed back to that same engine.
class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual StorageType type() const = 0;
    [[nodiscard]] virtual Capabilities capabilities() const = 0;

    virtual void logIn(const concurrency::Interrupt& interrupt);
    [[nodiscard]] virtual std::string fullPath(const model::Entry& entry) const;

    // Get-or-create the directory a configured root path names.
    virtual std::shared_ptr<model::Directory> root(const fs::path& path, const concurrency::Interrupt& interrupt) = 0;

    virtual std::vector<std::shared_ptr<model::Entry>> list(const model::Directory& dir,
                                                            const concurrency::Interrupt& interrupt) = 0;

    // Replaces an existing file of the same name. A failed or cancelled call
    // leaves no complete-looking file behind.
    virtual std::shared_ptr<model::File> createFile(const model::Directory& dir, const std::string& name,
                                                    ReadStream& content, uintmax_t length,
                                                    const concurrency::Interrupt& interrupt,
                                                    std::optional<std::time_t> modified = std::nullopt) = 0;

    virtual std::shared_ptr<model::Directory> createDirectory(const model::Directory& parent, const std::string& name,
                                                              const concurrency::Interrupt& interrupt) = 0;

    virtual void remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) = 0;

    virtual std::unique_ptr<ReadStream> openRead(const model::File& file, const concurrency::Interrupt& interrupt) = 0;

    // First `len` bytes of a file (fewer if it is shorter). Backends with ranged reads override this.
    virtual std::vector<uint8_t> readHead(const model::File& file, size_t len, const concurrency::Interrupt& interrupt);
};

// A resolved side of a run: the engine chain, its root directory and the
// capabilities probed when it was set up.
struct Root {
    std::shared_ptr<Engine> engine;
    std::shared_ptr<model::Directory> directory;
    Capabilities capabilities;

    [[nodiscard]] std::string display(const model::Entry& entry) const;
};

}
