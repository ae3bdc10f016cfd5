#pragma once

#include "storage/Engine.hpp"
#include "config/Config.hpp"

namespace sw::crypto {
class KeyRing;
class NameCipher;
}

namespace sw::storage {

// Transparent encryption over any other engine, including another
// EncryptedEngine. Entries it returns wrap the inner engine's entries.
class EncryptedEngine final : public Engine {
public:
    struct Options {
        uint8_t version = 2;                   // scheme for newly written content
        uint32_t chunkSize = 64 * 1024;
        bool encryptFileNames = false;
        bool encryptDirectoryNames = false;
    };

    EncryptedEngine(std::shared_ptr<Engine> inner, const config::EncryptionConfig& cfg);
    EncryptedEngine(std::shared_ptr<Engine> inner, std::shared_ptr<const crypto::KeyRing> keys, Options opts);

    [[nodiscard]] StorageType type() const override { return StorageType::Encrypted; }
    [[nodiscard]] Capabilities capabilities() const override { return inner_->capabilities(); }

    void logIn(const concurrency::Interrupt& interrupt) override { inner_->logIn(interrupt); }
    [[nodiscard]] std::string fullPath(const model::Entry& entry) const override;

    std::shared_ptr<model::Directory> root(const fs::path& path, const concurrency::Interrupt& interrupt) override;

    std::vector<std::shared_ptr<model::Entry>> list(const model::Directory& dir,
                                                    const concurrency::Interrupt& interrupt) override;

    std::shared_ptr<model::File> createFile(const model::Directory& dir, const std::string& name,
                                            ReadStream& content, uintmax_t length,
                                            const concurrency::Interrupt& interrupt,
                                            std::optional<std::time_t> modified) override;

    std::shared_ptr<model::Directory> createDirectory(const model::Directory& parent, const std::string& name,
                                                      const concurrency::Interrupt& interrupt) override;

    void remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) override;

    std::unique_ptr<ReadStream> openRead(const model::File& file, const concurrency::Interrupt& interrupt) override;

    [[nodiscard]] const std::shared_ptr<Engine>& inner() const { return inner_; }

private:
    std::shared_ptr<Engine> inner_;
    std::shared_ptr<const crypto::KeyRing> keys_;
    std::shared_ptr<const crypto::NameCipher> names_;
    Options opts_;

    [[nodiscard]] std::string encodeName(const std::string& name, bool directory) const;
    [[nodiscard]] std::string decodeName(const std::string& name, bool directory) const;

    std::shared_ptr<model::Directory> wrapDirectory(const model::Directory& parent,
                                                    const std::shared_ptr<model::Directory>& inner,
                                                    const std::string& plainName) const;
    std::shared_ptr<model::File> wrapFile(const model::Directory& parent, const std::shared_ptr<model::File>& inner,
                                          const std::string& plainName, uintmax_t plainSize) const;
};

}
