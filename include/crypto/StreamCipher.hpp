#pragma once

#include "crypto/KeyRing.hpp"
#include "storage/Stream.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace sw::crypto {

// Content layout: "SWC1" | version (1) | file salt (16) | scheme data | body
//   version 1: iv (12)                          | AES-256-GCM(ciphertext || tag), header as AAD
//   version 2: chunk size (u32 LE) | stream (24) | secretstream chunks, each C + 17, last one FINAL
constexpr std::array<uint8_t, 4> CONTENT_MAGIC = {'S', 'W', 'C', '1'};
constexpr uint8_t SCHEME_AES_GCM = 1;
constexpr uint8_t SCHEME_SECRETSTREAM = 2;

constexpr size_t HEADER_PREFIX_SIZE = CONTENT_MAGIC.size() + 1 + FILE_SALT_SIZE;
constexpr size_t V1_IV_SIZE = 12;
constexpr size_t V1_TAG_SIZE = 16;
constexpr size_t V1_HEADER_SIZE = HEADER_PREFIX_SIZE + V1_IV_SIZE;
constexpr size_t V2_STREAM_HEADER_SIZE = 24;
constexpr size_t V2_HEADER_SIZE = HEADER_PREFIX_SIZE + 4 + V2_STREAM_HEADER_SIZE;
constexpr size_t V2_CHUNK_OVERHEAD = 17;
constexpr size_t MAX_HEADER_SIZE = V2_HEADER_SIZE;

constexpr uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr uint32_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

struct ContentHeader {
    uint8_t version = SCHEME_SECRETSTREAM;
    std::array<uint8_t, FILE_SALT_SIZE> salt{};
    std::array<uint8_t, V1_IV_SIZE> iv{};
    uint32_t chunkSize = DEFAULT_CHUNK_SIZE;
    std::array<uint8_t, V2_STREAM_HEADER_SIZE> streamHeader{};

    [[nodiscard]] size_t size() const { return sizeFor(version); }
    [[nodiscard]] std::vector<uint8_t> serialize() const;

    // `len` may run past the header. Throws storage::EncryptionError.
    static ContentHeader parse(const uint8_t* data, size_t len);
    static size_t sizeFor(uint8_t version);
};

[[nodiscard]] uintmax_t cipherLength(uint8_t version, uintmax_t plainLength, uint32_t chunkSize = DEFAULT_CHUNK_SIZE);

// Recovers the plaintext length from the stored length; throws if the two cannot belong together.
[[nodiscard]] uintmax_t plainLength(const ContentHeader& header, uintmax_t cipherLength);

// Consumes exactly the header from `in`.
ContentHeader readHeader(storage::ReadStream& in);

class EncryptingStream final : public storage::ReadStream {
public:
    EncryptingStream(std::shared_ptr<const KeyRing> keys, storage::ReadStream& plain,
                     uint8_t version, uint32_t chunkSize = DEFAULT_CHUNK_SIZE);
    ~EncryptingStream() override;

    size_t read(uint8_t* buf, size_t len) override;

private:
    struct State;

    std::shared_ptr<const KeyRing> keys_;
    storage::ReadStream& plain_;
    ContentHeader header_;
    Key fileKey_{};
    std::unique_ptr<State> state_;
    std::vector<uint8_t> chunk_, out_;
    size_t outPos_ = 0;
    bool started_ = false, done_ = false;

    void fill();
};

class DecryptingStream final : public storage::ReadStream {
public:
    DecryptingStream(std::shared_ptr<const KeyRing> keys, ContentHeader header,
                     std::unique_ptr<storage::ReadStream> cipher);
    ~DecryptingStream() override;

    size_t read(uint8_t* buf, size_t len) override;

private:
    struct State;

    std::shared_ptr<const KeyRing> keys_;
    ContentHeader header_;
    std::unique_ptr<storage::ReadStream> cipher_;
    Key fileKey_{};
    std::unique_ptr<State> state_;
    std::vector<uint8_t> chunk_, out_;
    size_t outPos_ = 0;
    bool done_ = false;

    void fill();
};

}
