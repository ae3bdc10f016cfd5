#include "crypto/KeyRing.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <stdexcept>

namespace sw::crypto {

namespace {

constexpr char CONTENT_CONTEXT[] = "swcontnt";
constexpr char NAME_CONTEXT[]    = "swnames_";

static_assert(sizeof(CONTENT_CONTEXT) - 1 == crypto_kdf_CONTEXTBYTES);
static_assert(sizeof(NAME_CONTEXT) - 1 == crypto_kdf_CONTEXTBYTES);

std::pair<unsigned long long, size_t> kdfLimits(const std::string& strength) {
    if (strength == "interactive")
        return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    if (strength == "moderate")
        return {crypto_pwhash_OPSLIMIT_MODERATE, crypto_pwhash_MEMLIMIT_MODERATE};
    if (strength == "sensitive")
        return {crypto_pwhash_OPSLIMIT_SENSITIVE, crypto_pwhash_MEMLIMIT_SENSITIVE};
    throw std::invalid_argument("Unknown encryption.kdf strength: " + strength);
}

}

KeyRing::KeyRing(const config::EncryptionConfig& cfg) {
    util::ensureSodium();

    if (cfg.password.empty()) throw std::invalid_argument("Encryption password must not be empty");

    const auto [ops, mem] = kdfLimits(cfg.kdf);

    uint8_t salt[crypto_pwhash_SALTBYTES];
    crypto_generichash(salt, sizeof(salt),
                       reinterpret_cast<const unsigned char*>(cfg.salt.data()), cfg.salt.size(),
                       nullptr, 0);

    if (crypto_pwhash(master_.data(), master_.size(),
                      cfg.password.c_str(), cfg.password.size(),
                      salt, ops, mem, crypto_pwhash_ALG_ARGON2ID13) != 0) {
        log::Registry::crypto()->error("[KeyRing] Argon2id derivation failed (kdf = {})", cfg.kdf);
        throw std::runtime_error("Key derivation failed (out of memory?)");
    }

    deriveSubkeys();
    log::Registry::crypto()->debug("[KeyRing] Derived keys (kdf = {})", cfg.kdf);
}

KeyRing::KeyRing(const Key& master) : master_(master) {
    util::ensureSodium();
    deriveSubkeys();
}

KeyRing::~KeyRing() {
    sodium_memzero(master_.data(), master_.size());
    sodium_memzero(contentKey_.data(), contentKey_.size());
    sodium_memzero(nameKey_.data(), nameKey_.size());
    sodium_memzero(nameSivKey_.data(), nameSivKey_.size());
}

void KeyRing::deriveSubkeys() {
    crypto_kdf_derive_from_key(contentKey_.data(), contentKey_.size(), 1, CONTENT_CONTEXT, master_.data());
    crypto_kdf_derive_from_key(nameKey_.data(), nameKey_.size(), 1, NAME_CONTEXT, master_.data());
    crypto_kdf_derive_from_key(nameSivKey_.data(), nameSivKey_.size(), 2, NAME_CONTEXT, master_.data());
}

Key KeyRing::fileKey(const uint8_t* salt) const {
    Key key{};
    crypto_generichash(key.data(), key.size(), salt, FILE_SALT_SIZE, contentKey_.data(), contentKey_.size());
    return key;
}

}
