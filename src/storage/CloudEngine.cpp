#include "storage/CloudEngine.hpp"
#include "storage/Errors.hpp"
#include "storage/model/File.hpp"
#include "storage/model/Directory.hpp"
#include "storage/cloud/S3Controller.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <set>

namespace sw::storage {

namespace {

std::string normalizePrefix(const fs::path& path) {
    auto s = path.generic_string();
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

std::string join(const fs::path& dir, const std::string& name) {
    const auto base = dir.generic_string();
    return base.empty() ? name : base + "/" + name;
}

std::string leafOf(const std::string& key) {
    const auto pos = key.find_last_of('/');
    return pos == std::string::npos ? key : key.substr(pos + 1);
}

std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

std::shared_ptr<model::Directory> makeDirectory(const std::string& key) {
    auto d = std::make_shared<model::Directory>();
    d->name = leafOf(key);
    d->path = key;
    return d;
}

}

CloudEngine::CloudEngine(const config::S3Config& cfg)
    : CloudEngine(std::make_shared<cloud::S3Controller>(cfg)) {}

CloudEngine::CloudEngine(std::shared_ptr<cloud::S3Controller> controller) : s3_(std::move(controller)) {
    if (!s3_) throw std::invalid_argument("CloudEngine requires an S3 controller");
}

CloudEngine::~CloudEngine() = default;

void CloudEngine::logIn(const concurrency::Interrupt& interrupt) {
    interrupt.check();
    const auto [ok, msg] = s3_->validateAPICredentials();
    if (!ok) {
        log::Registry::cloud()->error("[CloudEngine] Credential check failed for bucket {}: {}", s3_->config().bucket, msg);
        throw BackendError("S3 login failed: " + msg);
    }
    log::Registry::cloud()->info("[CloudEngine] {}", msg);
}

std::string CloudEngine::fullPath(const model::Entry& entry) const {
    return "s3://" + s3_->config().bucket + "/" + entry.path.generic_string();
}

std::shared_ptr<model::Directory> CloudEngine::root(const fs::path& path, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    const auto prefix = normalizePrefix(path);
    // PUT of an empty marker is idempotent, so get-or-create needs no lookup
    if (!prefix.empty()) s3_->putObject(prefix + "/", "");
    return makeDirectory(prefix);
}

std::vector<std::shared_ptr<model::Entry>> CloudEngine::list(const model::Directory& dir,
                                                             const concurrency::Interrupt& interrupt) {
    interrupt.check();
    const auto base = dir.path.generic_string();
    const auto prefix = base.empty() ? std::string() : base + "/";
    const auto page = s3_->listObjects(prefix);

    std::vector<std::shared_ptr<model::Entry>> entries;
    std::set<std::string> seen;

    for (const auto& p : page.commonPrefixes) {
        auto key = p;
        while (!key.empty() && key.back() == '/') key.pop_back();
        if (key.size() <= prefix.size() || !seen.insert(leafOf(key)).second) continue;
        entries.push_back(makeDirectory(key));
    }

    for (const auto& obj : page.objects) {
        if (obj.key == prefix || obj.key.size() <= prefix.size()) continue;   // own marker
        if (obj.key.back() == '/') {
            auto key = obj.key.substr(0, obj.key.size() - 1);
            if (seen.insert(leafOf(key)).second) entries.push_back(makeDirectory(key));
            continue;
        }
        if (!seen.insert(leafOf(obj.key)).second) {
            log::Registry::cloud()->warn("[CloudEngine] Object {} shadows a directory of the same name, skipping", obj.key);
            continue;
        }
        auto f = std::make_shared<model::File>();
        f->name = leafOf(obj.key);
        f->path = obj.key;
        f->size_bytes = obj.size;
        f->created_at = f->updated_at = obj.last_modified;
        entries.push_back(f);
    }
    return entries;
}

std::shared_ptr<model::File> CloudEngine::createFile(const model::Directory& dir, const std::string& name,
                                                     ReadStream& content, const uintmax_t length,
                                                     const concurrency::Interrupt& interrupt,
                                                     std::optional<std::time_t>) {
    if (name.empty() || name.find('/') != std::string::npos) throw BackendError("Invalid object name: '" + name + "'");
    interrupt.check();

    const auto key = join(dir.path, name);

    if (length > MULTIPART_THRESHOLD) {
        uploadMultipart(key, content, length, interrupt);
    } else {
        std::string body(length, '\0');
        const auto n = readFully(content, reinterpret_cast<uint8_t*>(body.data()), body.size());
        uint8_t probe;
        if (n != length || content.read(&probe, 1) != 0)
            throw BackendError("Content length of " + key + " does not match the declared " + std::to_string(length));
        interrupt.check();
        s3_->putObject(key, body);
    }

    auto f = std::make_shared<model::File>();
    f->name = name;
    f->path = key;
    f->size_bytes = length;
    f->created_at = f->updated_at = now();
    return f;
}

void CloudEngine::uploadMultipart(const std::string& key, ReadStream& content, const uintmax_t length,
                                  const concurrency::Interrupt& interrupt) const {
    const auto uploadId = s3_->initiateMultipartUpload(key);
    log::Registry::cloud()->debug("[CloudEngine] Multipart upload {} started for {}", uploadId, key);

    try {
        std::vector<std::string> etags;
        uintmax_t sent = 0;
        int partNo = 1;

        while (true) {
            interrupt.check();
            std::string part(PART_SIZE, '\0');
            const auto n = readFully(content, reinterpret_cast<uint8_t*>(part.data()), part.size());
            if (n == 0) break;
            part.resize(n);

            for (int attempt = 1;; ++attempt) {
                interrupt.check();
                try {
                    etags.push_back(s3_->uploadPart(key, uploadId, partNo, part));
                    break;
                } catch (const cloud::S3Error& e) {
                    if (!e.transient() || attempt >= PART_ATTEMPTS) throw;
                    log::Registry::cloud()->warn("[CloudEngine] Part {} of {} failed (attempt {}/{}): {}",
                                                 partNo, key, attempt, PART_ATTEMPTS, e.what());
                }
            }

            sent += n;
            ++partNo;
        }

        if (sent != length)
            throw BackendError("Content length of " + key + " does not match the declared " + std::to_string(length));

        s3_->completeMultipartUpload(key, uploadId, etags);
    } catch (...) {
        try {
            s3_->abortMultipartUpload(key, uploadId);
        } catch (const BackendError& e) {
            log::Registry::cloud()->error("[CloudEngine] Failed to abort multipart upload {} for {}: {}",
                                          uploadId, key, e.what());
        }
        throw;
    }
}

std::shared_ptr<model::Directory> CloudEngine::createDirectory(const model::Directory& parent, const std::string& name,
                                                               const concurrency::Interrupt& interrupt) {
    if (name.empty() || name.find('/') != std::string::npos) throw BackendError("Invalid directory name: '" + name + "'");
    interrupt.check();

    const auto key = join(parent.path, name);
    s3_->putObject(key + "/", "");
    auto d = makeDirectory(key);
    d->created_at = d->updated_at = now();
    return d;
}

void CloudEngine::remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    const auto key = entry.path.generic_string();
    if (key.empty()) throw BackendError("Refusing to remove the bucket root");
    s3_->deleteObject(entry.isDirectory() ? key + "/" : key);
}

std::unique_ptr<ReadStream> CloudEngine::openRead(const model::File& file, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    return std::make_unique<BufferStream>(s3_->downloadToBuffer(file.path.generic_string()));
}

std::vector<uint8_t> CloudEngine::readHead(const model::File& file, const size_t len,
                                           const concurrency::Interrupt& interrupt) {
    interrupt.check();
    return s3_->downloadRange(file.path.generic_string(), len);
}

}
