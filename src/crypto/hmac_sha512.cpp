#include "gv/crypto/hmac_sha512.h"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

#include "gv/crypto/provider.h"
#include "gv/error.h"

namespace gv::crypto {

namespace {

class EVPMacDeleter {
public:
  void operator()(EVP_MAC* mac) const noexcept { EVP_MAC_free(mac); }
  void operator()(EVP_MAC_CTX* ctx) const noexcept { EVP_MAC_CTX_free(ctx); }
};

[[noreturn]] void ThrowMacError(const char* context) {
  throw Error(ErrorDomain::Crypto, errors::crypto::kPrimitiveFailed,
              BuildOpenSSLErrorMessage(context));
}

}  // namespace

struct HMAC_SHA512::State {
  std::unique_ptr<EVP_MAC, EVPMacDeleter> mac;
  std::unique_ptr<EVP_MAC_CTX, EVPMacDeleter> ctx;
  bool finalized{false};
};

HMAC_SHA512::HMAC_SHA512(std::span<const uint8_t> key) : state_(std::make_unique<State>()) {
  EnsureCryptoProviderInitialized();
  state_->mac.reset(EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_HMAC, nullptr));
  if (!state_->mac) {
    ThrowMacError("EVP_MAC_fetch(HMAC)");
  }
  state_->ctx.reset(EVP_MAC_CTX_new(state_->mac.get()));
  if (!state_->ctx) {
    ThrowMacError("EVP_MAC_CTX_new");
  }
  char digest_name[] = "SHA512";
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
      OSSL_PARAM_construct_end()};
  if (EVP_MAC_init(state_->ctx.get(), key.data(), key.size(), params) != 1) {
    ThrowMacError("EVP_MAC_init");
  }
}

HMAC_SHA512::~HMAC_SHA512() = default;
HMAC_SHA512::HMAC_SHA512(HMAC_SHA512&&) noexcept = default;
HMAC_SHA512& HMAC_SHA512::operator=(HMAC_SHA512&&) noexcept = default;

void HMAC_SHA512::Update(std::span<const uint8_t> data) {
  if (!state_ || state_->finalized) {
    throw Error(ErrorDomain::State, errors::state::kInvalidTransition, "HMAC already finalized");
  }
  if (data.empty()) {
    return;
  }
  if (EVP_MAC_update(state_->ctx.get(), data.data(), data.size()) != 1) {
    ThrowMacError("EVP_MAC_update");
  }
}

std::array<uint8_t, HMAC_SHA512::TAG_SIZE> HMAC_SHA512::Finalize() {
  if (!state_ || state_->finalized) {
    throw Error(ErrorDomain::State, errors::state::kInvalidTransition, "HMAC already finalized");
  }
  std::array<uint8_t, TAG_SIZE> out{};
  size_t len = 0;
  if (EVP_MAC_final(state_->ctx.get(), out.data(), &len, out.size()) != 1) {
    ThrowMacError("EVP_MAC_final");
  }
  if (len != out.size()) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kPrimitiveFailed,
                "Unexpected HMAC-SHA512 length");
  }
  state_->finalized = true;
  return out;
}

std::array<uint8_t, HMAC_SHA512::TAG_SIZE> HMAC_SHA512::Compute(std::span<const uint8_t> key,
                                                                std::span<const uint8_t> msg) {
  auto provider = GetCryptoProviderShared();
  return provider->HMACSHA512(key, msg);
}

} // namespace gv::crypto
