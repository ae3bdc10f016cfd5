#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace sw::storage {

// Pull-based byte source. read() returns 0 only at end of stream.
struct ReadStream {
    virtual ~ReadStream() = default;
    virtual size_t read(uint8_t* buf, size_t len) = 0;
};

class BufferStream final : public ReadStream {
public:
    explicit BufferStream(std::vector<uint8_t> data) : data_(std::move(data)) {}

    size_t read(uint8_t* buf, size_t len) override;

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

class FileStream final : public ReadStream {
public:
    explicit FileStream(const std::filesystem::path& path);

    size_t read(uint8_t* buf, size_t len) override;

private:
    std::filesystem::path path_;
    std::ifstream in_;
};

// Reads until `len` bytes are collected or the stream ends.
size_t readFully(ReadStream& in, uint8_t* buf, size_t len);

std::vector<uint8_t> readAll(ReadStream& in);

}
