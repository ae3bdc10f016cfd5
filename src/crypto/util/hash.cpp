#include "crypto/util/hash.hpp"
#include "crypto/util/encrypt.hpp"
#include "storage/Stream.hpp"

#include <sodium.h>
#include <sstream>
#include <iomanip>

namespace sw::crypto::hash {

std::string blake2b(storage::ReadStream& in, const concurrency::Interrupt& interrupt) {
    util::ensureSodium();

    constexpr size_t hash_len = crypto_generichash_BYTES;
    unsigned char hash[hash_len];

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, hash_len);

    uint8_t buffer[8192];
    while (const auto n = in.read(buffer, sizeof(buffer))) {
        interrupt.check();
        crypto_generichash_update(&state, buffer, n);
    }

    crypto_generichash_final(&state, hash, hash_len);

    std::ostringstream result;
    for (size_t i = 0; i < hash_len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return result.str();
}

}
