#pragma once

#include <memory>
#include <string>

namespace sw::crypto {

class KeyRing;

// Deterministic, authenticated name encryption. The nonce is a keyed hash of
// the name, so equal names always map to the same token.
class NameCipher {
public:
    static constexpr uint8_t VERSION = 1;

    explicit NameCipher(std::shared_ptr<const KeyRing> keys);

    [[nodiscard]] std::string encrypt(const std::string& name) const;

    // Throws storage::EncryptionError for tokens this key did not produce.
    [[nodiscard]] std::string decrypt(const std::string& token) const;

private:
    std::shared_ptr<const KeyRing> keys_;
};

}
