#include "storage/EncryptedEngine.hpp"
#include "storage/Errors.hpp"
#include "storage/model/File.hpp"
#include "storage/model/Directory.hpp"
#include "crypto/KeyRing.hpp"
#include "crypto/NameCipher.hpp"
#include "crypto/StreamCipher.hpp"
#include "log/Registry.hpp"

namespace sw::storage {

namespace {

template <typename T>
std::shared_ptr<T> unwrap(const model::Entry& entry) {
    auto inner = std::dynamic_pointer_cast<T>(entry.inner);
    if (!inner) throw BackendError("Entry '" + entry.name + "' was not produced by an encrypting engine");
    return inner;
}

EncryptedEngine::Options optionsFrom(const config::EncryptionConfig& cfg) {
    if (cfg.version != crypto::SCHEME_AES_GCM && cfg.version != crypto::SCHEME_SECRETSTREAM)
        throw std::invalid_argument("Unsupported encryption.version " + std::to_string(cfg.version));
    return {
        .version = static_cast<uint8_t>(cfg.version),
        .chunkSize = crypto::DEFAULT_CHUNK_SIZE,
        .encryptFileNames = cfg.encrypt_file_names,
        .encryptDirectoryNames = cfg.encrypt_directory_names
    };
}

}

EncryptedEngine::EncryptedEngine(std::shared_ptr<Engine> inner, const config::EncryptionConfig& cfg)
    : EncryptedEngine(std::move(inner), std::make_shared<crypto::KeyRing>(cfg), optionsFrom(cfg)) {}

EncryptedEngine::EncryptedEngine(std::shared_ptr<Engine> inner, std::shared_ptr<const crypto::KeyRing> keys,
                                 const Options opts)
    : inner_(std::move(inner)), keys_(std::move(keys)),
      names_(std::make_shared<crypto::NameCipher>(keys_)), opts_(opts) {
    if (!inner_) throw std::invalid_argument("EncryptedEngine requires an inner engine");
    if (opts_.version != crypto::SCHEME_AES_GCM && opts_.version != crypto::SCHEME_SECRETSTREAM)
        throw std::invalid_argument("Unsupported content scheme version " + std::to_string(opts_.version));
}

std::string EncryptedEngine::fullPath(const model::Entry& entry) const {
    return inner_->fullPath(*unwrap<model::Entry>(entry));
}

std::string EncryptedEngine::encodeName(const std::string& name, const bool directory) const {
    const bool encrypt = directory ? opts_.encryptDirectoryNames : opts_.encryptFileNames;
    return encrypt ? names_->encrypt(name) : name;
}

std::string EncryptedEngine::decodeName(const std::string& name, const bool directory) const {
    const bool encrypt = directory ? opts_.encryptDirectoryNames : opts_.encryptFileNames;
    return encrypt ? names_->decrypt(name) : name;
}

std::shared_ptr<model::Directory> EncryptedEngine::wrapDirectory(const model::Directory& parent,
                                                                 const std::shared_ptr<model::Directory>& inner,
                                                                 const std::string& plainName) const {
    auto d = std::make_shared<model::Directory>();
    d->name = plainName;
    d->path = parent.path / plainName;
    d->exists = inner->exists;
    d->created_at = inner->created_at;
    d->updated_at = inner->updated_at;
    d->inner = inner;
    return d;
}

std::shared_ptr<model::File> EncryptedEngine::wrapFile(const model::Directory& parent,
                                                       const std::shared_ptr<model::File>& inner,
                                                       const std::string& plainName, const uintmax_t plainSize) const {
    auto f = std::make_shared<model::File>();
    f->name = plainName;
    f->path = parent.path / plainName;
    f->exists = inner->exists;
    f->created_at = inner->created_at;
    f->updated_at = inner->updated_at;
    f->size_bytes = plainSize;
    f->inner = inner;
    return f;
}

std::shared_ptr<model::Directory> EncryptedEngine::root(const fs::path& path, const concurrency::Interrupt& interrupt) {
    const auto inner = inner_->root(path, interrupt);
    auto d = std::make_shared<model::Directory>();
    d->name = inner->name;
    d->path = "/";
    d->exists = inner->exists;
    d->created_at = inner->created_at;
    d->updated_at = inner->updated_at;
    d->inner = inner;
    return d;
}

std::vector<std::shared_ptr<model::Entry>> EncryptedEngine::list(const model::Directory& dir,
                                                                 const concurrency::Interrupt& interrupt) {
    const auto innerDir = unwrap<model::Directory>(dir);

    std::vector<std::shared_ptr<model::Entry>> entries;
    for (const auto& e : inner_->list(*innerDir, interrupt)) {
        interrupt.check();
        if (e->isDirectory()) {
            const auto d = std::static_pointer_cast<model::Directory>(e);
            entries.push_back(wrapDirectory(dir, d, decodeName(d->name, true)));
            continue;
        }

        const auto f = std::static_pointer_cast<model::File>(e);
        const auto name = decodeName(f->name, false);
        const auto head = inner_->readHead(*f, crypto::MAX_HEADER_SIZE, interrupt);
        const auto header = crypto::ContentHeader::parse(head.data(), head.size());
        entries.push_back(wrapFile(dir, f, name, crypto::plainLength(header, f->size_bytes)));
    }
    return entries;
}

std::shared_ptr<model::File> EncryptedEngine::createFile(const model::Directory& dir, const std::string& name,
                                                         ReadStream& content, const uintmax_t length,
                                                         const concurrency::Interrupt& interrupt,
                                                         const std::optional<std::time_t> modified) {
    const auto innerDir = unwrap<model::Directory>(dir);

    crypto::EncryptingStream sealed(keys_, content, opts_.version, opts_.chunkSize);
    const auto innerLength = crypto::cipherLength(opts_.version, length, opts_.chunkSize);

    const auto innerFile = inner_->createFile(*innerDir, encodeName(name, false), sealed, innerLength,
                                              interrupt, modified);
    return wrapFile(dir, innerFile, name, length);
}

std::shared_ptr<model::Directory> EncryptedEngine::createDirectory(const model::Directory& parent,
                                                                   const std::string& name,
                                                                   const concurrency::Interrupt& interrupt) {
    const auto innerParent = unwrap<model::Directory>(parent);
    const auto innerDir = inner_->createDirectory(*innerParent, encodeName(name, true), interrupt);
    return wrapDirectory(parent, innerDir, name);
}

void EncryptedEngine::remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) {
    inner_->remove(*unwrap<model::Entry>(entry), interrupt);
}

std::unique_ptr<ReadStream> EncryptedEngine::openRead(const model::File& file, const concurrency::Interrupt& interrupt) {
    auto in = inner_->openRead(*unwrap<model::File>(file), interrupt);
    const auto header = crypto::readHeader(*in);
    log::Registry::crypto()->trace("[EncryptedEngine] Reading {} with content scheme {}", file.path.string(),
                                   header.version);
    return std::make_unique<crypto::DecryptingStream>(keys_, header, std::move(in));
}

}
