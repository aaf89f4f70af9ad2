#include "gv/core/nonce.h"

#include "gv/crypto/random.h"

namespace gv::core {

StreamNonce RandomNonceBase() {
  StreamNonce base{};
  crypto::SystemRandomBytes(base);
  return base;
}

}  // namespace gv::core
