#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sw::crypto::util {

constexpr size_t AES_KEY_SIZE = 32;      // 256-bit
constexpr size_t AES_IV_SIZE  = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE = 16;      // GCM auth tag

// sodium_init() once per process; throws if libsodium cannot start.
void ensureSodium();

[[nodiscard]] bool is_aes_gcm_supported();

// Returns ciphertext || tag. `aad` is authenticated but not encrypted.
std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad);

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad);

// URL- and filename-safe base64 without padding
std::string b64url_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> b64url_decode(const std::string& b64);

}
