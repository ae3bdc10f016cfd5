#include "crypto/util/encrypt.hpp"
#include "storage/Errors.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <cstring>
#include <mutex>
#include <stdexcept>

namespace sw::crypto::util {

void ensureSodium() {
    static std::once_flag flag;
    static int rc = 0;
    std::call_once(flag, [] { rc = sodium_init(); });
    if (rc < 0) throw std::runtime_error("libsodium failed to initialize");
}

bool is_aes_gcm_supported() {
    ensureSodium();
    return crypto_aead_aes256gcm_is_available() != 0;
}

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        log::Registry::crypto()->error("[encrypt_aes256_gcm] Invalid key or IV size: "
                                       "key size = {}, iv size = {}",
                                       key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }

    if (!is_aes_gcm_supported())
        throw storage::EncryptionError("AES256-GCM not supported on this CPU");

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    crypto_aead_aes256gcm_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        aad.data(), aad.size(),
        nullptr, iv.data(), key.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv,
    const std::vector<uint8_t>& aad)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        log::Registry::crypto()->error("[decrypt_aes256_gcm] Invalid key or IV size: "
                                       "key size = {}, iv size = {}",
                                       key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }

    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw storage::EncryptionError("Ciphertext shorter than the authentication tag");

    if (!is_aes_gcm_supported())
        throw storage::EncryptionError("AES256-GCM not supported on this CPU");

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - AES_TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            aad.data(), aad.size(),
            iv.data(), key.data()) != 0)
    {
        throw storage::EncryptionError("Decryption failed: authentication error");
    }

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::string b64url_encode(const std::vector<uint8_t>& data) {
    ensureSodium();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_URLSAFE_NO_PADDING);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64url_decode(const std::string& b64) {
    ensureSodium();
    std::vector<uint8_t> decoded(b64.size() * 3 / 4 + 1);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0)
    {
        throw storage::EncryptionError("Invalid base64: " + b64);
    }
    decoded.resize(out_len);
    return decoded;
}

}
