#pragma once

#include "concurrency/Interrupt.hpp"

#include <string>

namespace sw::storage {
struct ReadStream;
}

namespace sw::crypto::hash {

// Hex BLAKE2b-256 of everything left in `in`. The interrupt is checked between blocks.
std::string blake2b(storage::ReadStream& in, const concurrency::Interrupt& interrupt);

}
