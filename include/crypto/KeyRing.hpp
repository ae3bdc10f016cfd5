#pragma once

#include "config/Config.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace sw::crypto {

constexpr size_t KEY_SIZE = 32;
constexpr size_t FILE_SALT_SIZE = 16;

using Key = std::array<uint8_t, KEY_SIZE>;

// Keys for one encryption layer. The master key is stretched from the
// password once; everything else is derived from it.
class KeyRing {
public:
    explicit KeyRing(const config::EncryptionConfig& cfg);
    explicit KeyRing(const Key& master);

    ~KeyRing();

    KeyRing(const KeyRing&) = delete;
    KeyRing& operator=(const KeyRing&) = delete;

    [[nodiscard]] const Key& nameKey() const { return nameKey_; }
    [[nodiscard]] const Key& nameSivKey() const { return nameSivKey_; }

    // Per-file content key: keyed BLAKE2b of the file salt under the content subkey.
    [[nodiscard]] Key fileKey(const uint8_t* salt) const;

private:
    Key master_{}, contentKey_{}, nameKey_{}, nameSivKey_{};

    void deriveSubkeys();
};

}
