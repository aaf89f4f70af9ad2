#pragma once

#include <cstdint>
#include <span>

namespace gv::crypto {

// Fills `out` from the libsodium CSPRNG.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace gv::crypto
