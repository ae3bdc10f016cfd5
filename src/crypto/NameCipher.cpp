#include "crypto/NameCipher.hpp"
#include "crypto/KeyRing.hpp"
#include "crypto/util/encrypt.hpp"
#include "storage/Errors.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <vector>

namespace sw::crypto {

namespace {

constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr size_t TAG_SIZE = crypto_aead_xchacha20poly1305_ietf_ABYTES;

void sivNonce(uint8_t* nonce, const std::string& name, const Key& key) {
    crypto_generichash(nonce, NONCE_SIZE,
                       reinterpret_cast<const unsigned char*>(name.data()), name.size(),
                       key.data(), key.size());
}

}

NameCipher::NameCipher(std::shared_ptr<const KeyRing> keys) : keys_(std::move(keys)) {
    if (!keys_) throw std::invalid_argument("NameCipher requires a key ring");
}

std::string NameCipher::encrypt(const std::string& name) const {
    std::vector<uint8_t> token(1 + NONCE_SIZE + name.size() + TAG_SIZE);
    token[0] = VERSION;

    uint8_t* nonce = token.data() + 1;
    sivNonce(nonce, name, keys_->nameSivKey());

    unsigned long long clen = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(
        nonce + NONCE_SIZE, &clen,
        reinterpret_cast<const unsigned char*>(name.data()), name.size(),
        nullptr, 0, nullptr, nonce, keys_->nameKey().data());

    token.resize(1 + NONCE_SIZE + clen);
    return util::b64url_encode(token);
}

std::string NameCipher::decrypt(const std::string& token) const {
    const auto raw = util::b64url_decode(token);
    if (raw.size() < 1 + NONCE_SIZE + TAG_SIZE)
        throw storage::EncryptionError("Encrypted name is too short: " + token);
    if (raw[0] != VERSION)
        throw storage::EncryptionError("Unsupported name encryption version " + std::to_string(raw[0]));

    const uint8_t* nonce = raw.data() + 1;
    const uint8_t* ct = nonce + NONCE_SIZE;
    const size_t ctLen = raw.size() - 1 - NONCE_SIZE;

    std::string name(ctLen - TAG_SIZE, '\0');
    unsigned long long mlen = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            reinterpret_cast<unsigned char*>(name.data()), &mlen, nullptr,
            ct, ctLen, nullptr, 0, nonce, keys_->nameKey().data()) != 0) {
        log::Registry::crypto()->warn("[NameCipher] Failed to authenticate name token {}", token);
        throw storage::EncryptionError("Failed to decrypt name: " + token);
    }
    name.resize(mlen);

    uint8_t expected[NONCE_SIZE];
    sivNonce(expected, name, keys_->nameSivKey());
    if (sodium_memcmp(expected, nonce, NONCE_SIZE) != 0)
        throw storage::EncryptionError("Name token nonce mismatch: " + token);

    return name;
}

}
