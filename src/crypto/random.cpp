#include "gv/crypto/random.h"

#include <sodium.h>

#include "gv/crypto/provider.h"

namespace gv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
  EnsureCryptoProviderInitialized(); // randombytes needs sodium_init
  randombytes_buf(out.data(), out.size());
}

}  // namespace gv::crypto
