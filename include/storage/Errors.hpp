#pragma once

#include <stdexcept>
#include <string>

namespace sw::storage {

// Raised by any backend for I/O, transport or protocol failures.
struct BackendError : std::runtime_error {
    explicit BackendError(const std::string& msg) : std::runtime_error(msg) {}
};

// Wrong password, tampered ciphertext, undecodable names, unknown scheme versions.
struct EncryptionError : BackendError {
    explicit EncryptionError(const std::string& msg) : BackendError(msg) {}
};

}
