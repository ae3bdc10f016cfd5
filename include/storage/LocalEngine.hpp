#pragma once

#include "storage/Engine.hpp"

namespace sw::storage {

class LocalEngine final : public Engine {
public:
    // In-flight writes live beside their destination as TMP_PREFIX + random suffix. A leftover
    // from a crashed run is an ordinary entry and goes through the delete rules like any other.
    static constexpr const auto* TMP_PREFIX = ".swtmp-";
    static constexpr size_t TMP_SUFFIX_LENGTH = 16;
    static constexpr size_t COPY_CHUNK_SIZE = 64 * 1024;

    LocalEngine() = default;

    [[nodiscard]] StorageType type() const override { return StorageType::Local; }
    [[nodiscard]] Capabilities capabilities() const override { return {.login = false, .fullPath = true}; }

    [[nodiscard]] std::string fullPath(const model::Entry& entry) const override;

    std::shared_ptr<model::Directory> root(const fs::path& path, const concurrency::Interrupt& interrupt) override;

    std::vector<std::shared_ptr<model::Entry>> list(const model::Directory& dir,
                                                    const concurrency::Interrupt& interrupt) override;

    std::shared_ptr<model::File> createFile(const model::Directory& dir, const std::string& name,
                                            ReadStream& content, uintmax_t length,
                                            const concurrency::Interrupt& interrupt,
                                            std::optional<std::time_t> modified = std::nullopt) override;

    std::shared_ptr<model::Directory> createDirectory(const model::Directory& parent, const std::string& name,
                                                      const concurrency::Interrupt& interrupt) override;

    void remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) override;

    std::unique_ptr<ReadStream> openRead(const model::File& file, const concurrency::Interrupt& interrupt) override;

private:
    static std::shared_ptr<model::Directory> makeDirectory(const fs::path& path);
    static std::shared_ptr<model::File> makeFile(const fs::path& path);
};

}
