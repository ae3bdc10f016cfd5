#pragma once

#include "storage/Engine.hpp"
#include "config/Config.hpp"

#include <memory>

namespace sw::cloud { class S3Controller; }

namespace sw::storage {

// S3-compatible object store. Directories are zero-byte "name/" marker
// objects, or simply prefixes that other keys imply.
class CloudEngine final : public Engine {
public:
    static constexpr uintmax_t MULTIPART_THRESHOLD = 8 * 1024 * 1024;
    static constexpr size_t PART_SIZE = 8 * 1024 * 1024;
    static constexpr int PART_ATTEMPTS = 3;

    explicit CloudEngine(const config::S3Config& cfg);
    explicit CloudEngine(std::shared_ptr<cloud::S3Controller> controller);
    ~CloudEngine() override;

    [[nodiscard]] StorageType type() const override { return StorageType::Cloud; }
    [[nodiscard]] Capabilities capabilities() const override { return {.login = true, .fullPath = true}; }

    void logIn(const concurrency::Interrupt& interrupt) override;
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

    std::vector<uint8_t> readHead(const model::File& file, size_t len, const concurrency::Interrupt& interrupt) override;

private:
    std::shared_ptr<cloud::S3Controller> s3_;

    void uploadMultipart(const std::string& key, ReadStream& content, uintmax_t length,
                         const concurrency::Interrupt& interrupt) const;
};

}
