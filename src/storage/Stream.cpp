#include "storage/Stream.hpp"
#include "storage/Errors.hpp"

#include <algorithm>
#include <cstring>

namespace sw::storage {

size_t BufferStream::read(uint8_t* buf, const size_t len) {
    const auto n = std::min(len, data_.size() - pos_);
    if (n) std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
}

FileStream::FileStream(const std::filesystem::path& path) : path_(path), in_(path, std::ios::binary) {
    if (!in_) throw BackendError("Failed to open file for reading: " + path.string());
}

size_t FileStream::read(uint8_t* buf, const size_t len) {
    if (len == 0 || in_.eof()) return 0;
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (in_.bad()) throw BackendError("Failed to read file: " + path_.string());
    return static_cast<size_t>(in_.gcount());
}

size_t readFully(ReadStream& in, uint8_t* buf, const size_t len) {
    size_t total = 0;
    while (total < len) {
        const auto n = in.read(buf + total, len - total);
        if (n == 0) break;
        total += n;
    }
    return total;
}

std::vector<uint8_t> readAll(ReadStream& in) {
    std::vector<uint8_t> out;
    uint8_t chunk[64 * 1024];
    while (const auto n = in.read(chunk, sizeof(chunk)))
        out.insert(out.end(), chunk, chunk + n);
    return out;
}

}
