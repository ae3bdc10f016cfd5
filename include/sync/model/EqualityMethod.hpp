#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sw::sync::model {

enum class EqualityMethod : uint8_t {
    None          = 0,
    Length        = 1 << 0,
    LastWriteTime = 1 << 1,
    ContentHash   = 1 << 2,
    Always        = 1 << 3,   // never equal, every source file is copied again
};

constexpr EqualityMethod operator|(EqualityMethod a, EqualityMethod b) {
    return static_cast<EqualityMethod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr EqualityMethod operator&(EqualityMethod a, EqualityMethod b) {
    return static_cast<EqualityMethod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr EqualityMethod& operator|=(EqualityMethod& a, const EqualityMethod b) { return a = a | b; }

constexpr bool hasFlag(const EqualityMethod set, const EqualityMethod flag) {
    return (set & flag) == flag && flag != EqualityMethod::None;
}

constexpr EqualityMethod DefaultEqualityMethods = EqualityMethod::Length | EqualityMethod::LastWriteTime;

// Accepts length, mtime|lastwritetime, digest|content|hash, none (case-insensitive).
// An empty list means name-only matching.
EqualityMethod parseEqualityMethods(const std::vector<std::string>& tokens);

// "Length|LastWriteTime", or "None" for the empty set
std::string to_string(EqualityMethod methods);

}
