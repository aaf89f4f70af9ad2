#include "gv/crypto/blob_signing.h"

#include <sodium.h>

#include <array>
#include <vector>

#include "gv/crypto/provider.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/security/zeroizer.h"

namespace gv::crypto {

BlobSignature SignBlob(std::span<const uint8_t> blob) {
  EnsureCryptoProviderInitialized();
  std::array<uint8_t, crypto_sign_PUBLICKEYBYTES> public_key{};
  std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret_key{};
  gv::security::Zeroizer::ScopeWiper<uint8_t> wipe_secret(secret_key.data(), secret_key.size());
  if (crypto_sign_keypair(public_key.data(), secret_key.data()) != 0) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kPrimitiveFailed, "crypto_sign_keypair failed");
  }
  std::array<uint8_t, crypto_sign_BYTES> signature{};
  unsigned long long signature_len = 0;
  if (crypto_sign_detached(signature.data(), &signature_len, blob.data(), blob.size(),
                           secret_key.data()) != 0) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kPrimitiveFailed, "crypto_sign_detached failed");
  }
  return BlobSignature{encoding::ToHex(public_key), encoding::ToHex(signature)};
}

bool VerifyBlob(std::span<const uint8_t> blob, std::string_view verify_key_hex,
                std::string_view signature_hex) {
  EnsureCryptoProviderInitialized();
  std::vector<uint8_t> public_key;
  std::vector<uint8_t> signature;
  try {
    public_key = encoding::FromHex(verify_key_hex);
    signature = encoding::FromHex(signature_hex);
  } catch (const Error&) {
    return false;
  }
  if (public_key.size() != crypto_sign_PUBLICKEYBYTES || signature.size() != crypto_sign_BYTES) {
    return false;
  }
  return crypto_sign_verify_detached(signature.data(), blob.data(), blob.size(),
                                     public_key.data()) == 0;
}

}  // namespace gv::crypto
