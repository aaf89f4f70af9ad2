#include "gv/crypto/secretbox.h"

#include <sodium.h>

#include <algorithm>
#include <string>

#include "gv/crypto/provider.h"
#include "gv/error.h"
#include "gv/errors.h"

namespace gv::crypto {

static_assert(SecretBox::KEY_SIZE == crypto_secretbox_KEYBYTES);
static_assert(SecretBox::NONCE_SIZE == crypto_secretbox_NONCEBYTES);
static_assert(SecretBox::MAC_SIZE == crypto_secretbox_MACBYTES);

std::vector<uint8_t> SecretBox::Seal(std::span<const uint8_t> plaintext,
                                     std::span<const uint8_t, NONCE_SIZE> nonce,
                                     std::span<const uint8_t, KEY_SIZE> key) {
  EnsureCryptoProviderInitialized();
  std::vector<uint8_t> sealed(OVERHEAD + plaintext.size());
  std::copy(nonce.begin(), nonce.end(), sealed.begin());
  if (crypto_secretbox_easy(sealed.data() + NONCE_SIZE, plaintext.data(), plaintext.size(),
                            nonce.data(), key.data()) != 0) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kPrimitiveFailed,
                "crypto_secretbox_easy failed");
  }
  return sealed;
}

std::vector<uint8_t> SecretBox::Open(std::span<const uint8_t> sealed,
                                     std::span<const uint8_t, KEY_SIZE> key) {
  EnsureCryptoProviderInitialized();
  if (sealed.size() < OVERHEAD) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kMalformedCiphertext,
                std::string(errors::msg::kCiphertextTruncated));
  }
  const auto nonce = sealed.first(NONCE_SIZE);
  const auto boxed = sealed.subspan(NONCE_SIZE);
  std::vector<uint8_t> plaintext(boxed.size() - MAC_SIZE);
  if (crypto_secretbox_open_easy(plaintext.data(), boxed.data(), boxed.size(), nonce.data(),
                                 key.data()) != 0) {
    throw AuthenticationFailureError(std::string(errors::msg::kChunkAuthenticationFailed));
  }
  return plaintext;
}

}  // namespace gv::crypto
