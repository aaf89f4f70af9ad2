#include "gv/security/zeroizer.h"

#include <sodium.h>

namespace gv::security {

// sodium_memzero is not elided by the optimizer and needs no sodium_init.
void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  if (data.empty()) {
    return;
  }
  sodium_memzero(data.data(), data.size());
}

} // namespace gv::security
