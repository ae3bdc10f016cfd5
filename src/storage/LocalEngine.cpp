#include "storage/LocalEngine.hpp"
#include "storage/Errors.hpp"
#include "storage/model/File.hpp"
#include "storage/model/Directory.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <system_error>

namespace sw::storage {

namespace {

void validateName(const std::string& name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos)
        throw BackendError("Invalid entry name: '" + name + "'");
}

}

std::shared_ptr<model::Directory> LocalEngine::makeDirectory(const fs::path& path) {
    auto d = std::make_shared<model::Directory>();
    d->name = path.filename().string();
    d->path = path;
    d->updated_at = d->created_at = util::toTimeT(fs::last_write_time(path));
    return d;
}

std::shared_ptr<model::File> LocalEngine::makeFile(const fs::path& path) {
    auto f = std::make_shared<model::File>();
    f->name = path.filename().string();
    f->path = path;
    f->size_bytes = fs::file_size(path);
    f->updated_at = f->created_at = util::toTimeT(fs::last_write_time(path));
    return f;
}

std::string LocalEngine::fullPath(const model::Entry& entry) const {
    return entry.path.string();
}

std::shared_ptr<model::Directory> LocalEngine::root(const fs::path& path, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    try {
        if (fs::exists(path)) {
            if (!fs::is_directory(path)) throw BackendError("Root path exists and is not a directory: " + path.string());
        } else {
            fs::create_directories(path);
            log::Registry::storage()->info("[LocalEngine] Created root directory {}", path.string());
        }
        return makeDirectory(fs::absolute(path));
    } catch (const fs::filesystem_error& e) {
        throw BackendError("Failed to resolve root " + path.string() + ": " + e.what());
    }
}

std::vector<std::shared_ptr<model::Entry>> LocalEngine::list(const model::Directory& dir,
                                                             const concurrency::Interrupt& interrupt) {
    interrupt.check();
    std::vector<std::shared_ptr<model::Entry>> entries;
    try {
        for (const auto& de : fs::directory_iterator(dir.path)) {
            if (de.is_directory()) entries.push_back(makeDirectory(de.path()));
            else if (de.is_regular_file()) entries.push_back(makeFile(de.path()));
            else log::Registry::storage()->debug("[LocalEngine] Skipping special file {}", de.path().string());
        }
    } catch (const fs::filesystem_error& e) {
        log::Registry::storage()->error("[LocalEngine] Failed to list {}: {}", dir.path.string(), e.what());
        throw BackendError("Failed to list " + dir.path.string() + ": " + e.what());
    }
    return entries;
}

std::shared_ptr<model::File> LocalEngine::createFile(const model::Directory& dir, const std::string& name,
                                                     ReadStream& content, const uintmax_t length,
                                                     const concurrency::Interrupt& interrupt,
                                                     const std::optional<std::time_t> modified) {
    validateName(name);
    interrupt.check();

    const auto finalPath = dir.path / name;
    // Fixed length so any name the filesystem accepts also fits as a temp name
    const auto tmpPath = dir.path / (std::string(TMP_PREFIX) + util::generate_random_suffix(TMP_SUFFIX_LENGTH));

    try {
        {
            std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
            if (!out) throw BackendError("Failed to open temp file for writing: " + tmpPath.string());

            std::vector<uint8_t> buf(COPY_CHUNK_SIZE);
            uintmax_t written = 0;
            while (const auto n = content.read(buf.data(), buf.size())) {
                interrupt.check();
                out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(n));
                if (!out) throw BackendError("Failed to write " + tmpPath.string());
                written += n;
            }
            out.close();
            if (!out) throw BackendError("Failed to flush " + tmpPath.string());

            if (written != length)
                throw BackendError("Short content for " + finalPath.string() + ": expected " +
                                   std::to_string(length) + " bytes, got " + std::to_string(written));
        }

        if (modified) fs::last_write_time(tmpPath, util::toFileTime(*modified));
        interrupt.check();
        fs::rename(tmpPath, finalPath);
        return makeFile(finalPath);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw BackendError("Failed to create " + finalPath.string() + ": " + e.what());
    } catch (...) {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw;
    }
}

std::shared_ptr<model::Directory> LocalEngine::createDirectory(const model::Directory& parent, const std::string& name,
                                                               const concurrency::Interrupt& interrupt) {
    validateName(name);
    interrupt.check();

    const auto path = parent.path / name;
    try {
        if (!fs::create_directory(path) && !fs::is_directory(path))
            throw BackendError("Path exists and is not a directory: " + path.string());
        return makeDirectory(path);
    } catch (const fs::filesystem_error& e) {
        throw BackendError("Failed to create directory " + path.string() + ": " + e.what());
    }
}

void LocalEngine::remove(const model::Entry& entry, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    try {
        // fs::remove refuses non-empty directories, which is the contract
        if (!fs::remove(entry.path))
            log::Registry::storage()->debug("[LocalEngine] {} was already gone", entry.path.string());
    } catch (const fs::filesystem_error& e) {
        throw BackendError("Failed to remove " + entry.path.string() + ": " + e.what());
    }
}

std::unique_ptr<ReadStream> LocalEngine::openRead(const model::File& file, const concurrency::Interrupt& interrupt) {
    interrupt.check();
    return std::make_unique<FileStream>(file.path);
}

}
