#pragma once
#include <array>
#include <cstdint>

#include "gv/crypto/secretbox.h"

namespace gv::core {

using StreamNonce = std::array<uint8_t, crypto::SecretBox::NONCE_SIZE>;

// Big-endian `base + index`, wrapping modulo 2^192.
constexpr StreamNonce NonceForIndex(const StreamNonce& base, uint64_t index) noexcept {
  StreamNonce out = base;
  unsigned carry = 0;
  for (size_t i = 0; i < out.size(); ++i) {
    const size_t pos = out.size() - 1 - i;
    const unsigned addend = i < sizeof(index) ? static_cast<unsigned>((index >> (8 * i)) & 0xFFu) : 0u;
    const unsigned sum = static_cast<unsigned>(out[pos]) + addend + carry;
    out[pos] = static_cast<uint8_t>(sum & 0xFFu);
    carry = sum >> 8;
  }
  return out;
}

StreamNonce RandomNonceBase();

}  // namespace gv::core
