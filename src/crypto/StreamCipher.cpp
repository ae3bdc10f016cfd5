#include "crypto/StreamCipher.hpp"
#include "crypto/util/encrypt.hpp"
#include "storage/Errors.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <algorithm>
#include <cstring>

namespace sw::crypto {

static_assert(V2_STREAM_HEADER_SIZE == crypto_secretstream_xchacha20poly1305_HEADERBYTES);
static_assert(V2_CHUNK_OVERHEAD == crypto_secretstream_xchacha20poly1305_ABYTES);
static_assert(V1_IV_SIZE == crypto_aead_aes256gcm_NPUBBYTES);
static_assert(V1_TAG_SIZE == crypto_aead_aes256gcm_ABYTES);

using storage::EncryptionError;

namespace {

void putU32(uint8_t* p, const uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = static_cast<uint8_t>(v >> (8 * i));
}

uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | static_cast<uint32_t>(p[1]) << 8 |
           static_cast<uint32_t>(p[2]) << 16 | static_cast<uint32_t>(p[3]) << 24;
}

std::vector<uint8_t> toVector(const Key& k) { return {k.begin(), k.end()}; }

}

size_t ContentHeader::sizeFor(const uint8_t version) {
    switch (version) {
        case SCHEME_AES_GCM: return V1_HEADER_SIZE;
        case SCHEME_SECRETSTREAM: return V2_HEADER_SIZE;
        default: throw EncryptionError("Unsupported content scheme version " + std::to_string(version));
    }
}

std::vector<uint8_t> ContentHeader::serialize() const {
    std::vector<uint8_t> out(size());
    std::ranges::copy(CONTENT_MAGIC, out.begin());
    out[CONTENT_MAGIC.size()] = version;
    std::ranges::copy(salt, out.begin() + CONTENT_MAGIC.size() + 1);

    uint8_t* rest = out.data() + HEADER_PREFIX_SIZE;
    if (version == SCHEME_AES_GCM) {
        std::memcpy(rest, iv.data(), iv.size());
    } else {
        putU32(rest, chunkSize);
        std::memcpy(rest + 4, streamHeader.data(), streamHeader.size());
    }
    return out;
}

ContentHeader ContentHeader::parse(const uint8_t* data, const size_t len) {
    if (len < HEADER_PREFIX_SIZE) throw EncryptionError("Encrypted content header is truncated");
    if (!std::equal(CONTENT_MAGIC.begin(), CONTENT_MAGIC.end(), data))
        throw EncryptionError("Content was not written by this encryption layer (bad magic)");

    ContentHeader h;
    h.version = data[CONTENT_MAGIC.size()];
    if (len < sizeFor(h.version)) throw EncryptionError("Encrypted content header is truncated");

    std::memcpy(h.salt.data(), data + CONTENT_MAGIC.size() + 1, h.salt.size());

    const uint8_t* rest = data + HEADER_PREFIX_SIZE;
    if (h.version == SCHEME_AES_GCM) {
        std::memcpy(h.iv.data(), rest, h.iv.size());
    } else {
        h.chunkSize = getU32(rest);
        if (h.chunkSize == 0 || h.chunkSize > MAX_CHUNK_SIZE)
            throw EncryptionError("Invalid chunk size in content header: " + std::to_string(h.chunkSize));
        std::memcpy(h.streamHeader.data(), rest + 4, h.streamHeader.size());
    }
    return h;
}

uintmax_t cipherLength(const uint8_t version, const uintmax_t plainLength, const uint32_t chunkSize) {
    if (version == SCHEME_AES_GCM) return V1_HEADER_SIZE + plainLength + V1_TAG_SIZE;
    if (version == SCHEME_SECRETSTREAM) {
        if (chunkSize == 0) throw std::invalid_argument("chunk size must be positive");
        // a FINAL chunk always follows the last full one, possibly empty
        const uintmax_t chunks = plainLength / chunkSize + 1;
        return V2_HEADER_SIZE + plainLength + V2_CHUNK_OVERHEAD * chunks;
    }
    throw EncryptionError("Unsupported content scheme version " + std::to_string(version));
}

uintmax_t plainLength(const ContentHeader& header, const uintmax_t cipherLength) {
    if (header.version == SCHEME_AES_GCM) {
        if (cipherLength < V1_HEADER_SIZE + V1_TAG_SIZE)
            throw EncryptionError("Encrypted content is shorter than its framing");
        return cipherLength - V1_HEADER_SIZE - V1_TAG_SIZE;
    }

    if (cipherLength < V2_HEADER_SIZE + V2_CHUNK_OVERHEAD)
        throw EncryptionError("Encrypted content is shorter than its framing");

    const uintmax_t body = cipherLength - V2_HEADER_SIZE;
    const uintmax_t stride = static_cast<uintmax_t>(header.chunkSize) + V2_CHUNK_OVERHEAD;
    const uintmax_t chunks = (body + stride - 1) / stride;
    if (body - (chunks - 1) * stride < V2_CHUNK_OVERHEAD)
        throw EncryptionError("Encrypted content length does not match its chunking");
    return body - V2_CHUNK_OVERHEAD * chunks;
}

ContentHeader readHeader(storage::ReadStream& in) {
    uint8_t buf[MAX_HEADER_SIZE]{};
    if (storage::readFully(in, buf, HEADER_PREFIX_SIZE) != HEADER_PREFIX_SIZE)
        throw EncryptionError("Encrypted content header is truncated");
    if (!std::equal(CONTENT_MAGIC.begin(), CONTENT_MAGIC.end(), buf))
        throw EncryptionError("Content was not written by this encryption layer (bad magic)");

    const auto size = ContentHeader::sizeFor(buf[CONTENT_MAGIC.size()]);
    if (storage::readFully(in, buf + HEADER_PREFIX_SIZE, size - HEADER_PREFIX_SIZE) != size - HEADER_PREFIX_SIZE)
        throw EncryptionError("Encrypted content header is truncated");
    return ContentHeader::parse(buf, size);
}

// ---------------- EncryptingStream ----------------

struct EncryptingStream::State {
    crypto_secretstream_xchacha20poly1305_state st;
};

EncryptingStream::EncryptingStream(std::shared_ptr<const KeyRing> keys, storage::ReadStream& plain,
                                   const uint8_t version, const uint32_t chunkSize)
    : keys_(std::move(keys)), plain_(plain) {
    util::ensureSodium();

    if (version != SCHEME_AES_GCM && version != SCHEME_SECRETSTREAM)
        throw EncryptionError("Unsupported content scheme version " + std::to_string(version));
    if (version == SCHEME_SECRETSTREAM && (chunkSize == 0 || chunkSize > MAX_CHUNK_SIZE))
        throw std::invalid_argument("Invalid chunk size: " + std::to_string(chunkSize));
    if (version == SCHEME_AES_GCM && !util::is_aes_gcm_supported())
        throw EncryptionError("Content scheme 1 (AES256-GCM) is not supported on this CPU");

    header_.version = version;
    header_.chunkSize = chunkSize;
    randombytes_buf(header_.salt.data(), header_.salt.size());
    fileKey_ = keys_->fileKey(header_.salt.data());

    if (version == SCHEME_AES_GCM) {
        randombytes_buf(header_.iv.data(), header_.iv.size());
    } else {
        state_ = std::make_unique<State>();
        crypto_secretstream_xchacha20poly1305_init_push(&state_->st, header_.streamHeader.data(), fileKey_.data());
        chunk_.resize(chunkSize);
    }
}

EncryptingStream::~EncryptingStream() {
    sodium_memzero(fileKey_.data(), fileKey_.size());
    if (state_) sodium_memzero(&state_->st, sizeof(state_->st));
}

void EncryptingStream::fill() {
    out_.clear();
    outPos_ = 0;

    if (!started_) {
        started_ = true;
        out_ = header_.serialize();
        if (header_.version != SCHEME_AES_GCM) return;

        // single shot: the whole plaintext is sealed at once
        const auto plaintext = storage::readAll(plain_);
        const auto sealed = util::encrypt_aes256_gcm(plaintext, toVector(fileKey_),
                                                     {header_.iv.begin(), header_.iv.end()}, out_);
        out_.insert(out_.end(), sealed.begin(), sealed.end());
        done_ = true;
        return;
    }

    const auto n = storage::readFully(plain_, chunk_.data(), chunk_.size());
    const uint8_t tag = n < chunk_.size() ? crypto_secretstream_xchacha20poly1305_TAG_FINAL
                                          : crypto_secretstream_xchacha20poly1305_TAG_MESSAGE;

    out_.resize(n + V2_CHUNK_OVERHEAD);
    unsigned long long clen = 0;
    crypto_secretstream_xchacha20poly1305_push(&state_->st, out_.data(), &clen, chunk_.data(), n, nullptr, 0, tag);
    out_.resize(clen);

    if (tag == crypto_secretstream_xchacha20poly1305_TAG_FINAL) done_ = true;
}

size_t EncryptingStream::read(uint8_t* buf, const size_t len) {
    size_t total = 0;
    while (total < len) {
        if (outPos_ == out_.size()) {
            if (done_) break;
            fill();
            continue;
        }
        const auto n = std::min(len - total, out_.size() - outPos_);
        std::memcpy(buf + total, out_.data() + outPos_, n);
        outPos_ += n;
        total += n;
    }
    return total;
}

// ---------------- DecryptingStream ----------------

struct DecryptingStream::State {
    crypto_secretstream_xchacha20poly1305_state st;
};

DecryptingStream::DecryptingStream(std::shared_ptr<const KeyRing> keys, ContentHeader header,
                                   std::unique_ptr<storage::ReadStream> cipher)
    : keys_(std::move(keys)), header_(header), cipher_(std::move(cipher)) {
    util::ensureSodium();

    fileKey_ = keys_->fileKey(header_.salt.data());

    if (header_.version == SCHEME_SECRETSTREAM) {
        state_ = std::make_unique<State>();
        if (crypto_secretstream_xchacha20poly1305_init_pull(&state_->st, header_.streamHeader.data(), fileKey_.data()) != 0)
            throw EncryptionError("Invalid secretstream header");
        chunk_.resize(static_cast<size_t>(header_.chunkSize) + V2_CHUNK_OVERHEAD);
    } else if (header_.version != SCHEME_AES_GCM) {
        throw EncryptionError("Unsupported content scheme version " + std::to_string(header_.version));
    }
}

DecryptingStream::~DecryptingStream() {
    sodium_memzero(fileKey_.data(), fileKey_.size());
    if (state_) sodium_memzero(&state_->st, sizeof(state_->st));
}

void DecryptingStream::fill() {
    out_.clear();
    outPos_ = 0;

    if (header_.version == SCHEME_AES_GCM) {
        const auto sealed = storage::readAll(*cipher_);
        out_ = util::decrypt_aes256_gcm(sealed, toVector(fileKey_),
                                        {header_.iv.begin(), header_.iv.end()}, header_.serialize());
        done_ = true;
        return;
    }

    const auto n = storage::readFully(*cipher_, chunk_.data(), chunk_.size());
    if (n < V2_CHUNK_OVERHEAD) throw EncryptionError("Encrypted content is truncated");

    out_.resize(n - V2_CHUNK_OVERHEAD);
    unsigned long long mlen = 0;
    uint8_t tag = 0;
    if (crypto_secretstream_xchacha20poly1305_pull(&state_->st, out_.data(), &mlen, &tag,
                                                   chunk_.data(), n, nullptr, 0) != 0) {
        log::Registry::crypto()->warn("[DecryptingStream] Chunk failed authentication");
        throw EncryptionError("Encrypted content failed authentication");
    }
    out_.resize(mlen);

    if (tag == crypto_secretstream_xchacha20poly1305_TAG_FINAL) {
        uint8_t extra;
        if (cipher_->read(&extra, 1) != 0) throw EncryptionError("Trailing data after final chunk");
        done_ = true;
    } else if (n < chunk_.size()) {
        throw EncryptionError("Encrypted content is truncated");
    }
}

size_t DecryptingStream::read(uint8_t* buf, const size_t len) {
    size_t total = 0;
    while (total < len) {
        if (outPos_ == out_.size()) {
            if (done_) break;
            fill();
            continue;
        }
        const auto n = std::min(len - total, out_.size() - outPos_);
        std::memcpy(buf + total, out_.data() + outPos_, n);
        outPos_ += n;
        total += n;
    }
    return total;
}

}
