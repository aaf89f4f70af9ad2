#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gv::crypto {

// XSalsa20-Poly1305 via libsodium. Sealed layout: nonce || tag || ciphertext.
struct SecretBox {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 24;
  static constexpr size_t MAC_SIZE = 16;
  static constexpr size_t OVERHEAD = NONCE_SIZE + MAC_SIZE;

  static std::vector<uint8_t> Seal(std::span<const uint8_t> plaintext,
                                   std::span<const uint8_t, NONCE_SIZE> nonce,
                                   std::span<const uint8_t, KEY_SIZE> key);

  // Throws gv::Error (Crypto, kMalformedCiphertext) when `sealed` is shorter
  // than OVERHEAD and AuthenticationFailureError when the tag does not verify.
  static std::vector<uint8_t> Open(std::span<const uint8_t> sealed,
                                   std::span<const uint8_t, KEY_SIZE> key);
};

}  // namespace gv::crypto
