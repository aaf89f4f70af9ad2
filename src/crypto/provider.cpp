#include "gv/crypto/provider.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <sodium.h>

#include <array>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "gv/common.h"
#include "gv/crypto/ct.h"
#include "gv/error.h"

namespace gv::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = errors::crypto::kPrimitiveFailed) {
  throw gv::Error(gv::ErrorDomain::Crypto, code, message);
}

[[noreturn]] void ThrowSelfTestFailure(const std::string& message) {
  throw gv::Error(gv::ErrorDomain::Dependency, errors::dependency::kSelfTestFailed, message);
}

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void RunSHA256KnownAnswerTest() {
  // FIPS 180-2 "abc"
  static constexpr std::array<uint8_t, 32> kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
      0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  OpenSSLCryptoProvider provider;
  const auto digest = provider.SHA256(gv::AsBytes("abc"));
  if (!ct::CompareEqual(digest, kExpected)) {
    ThrowSelfTestFailure("SHA-256 KAT mismatch");
  }
}

void RunHMACSHA512KnownAnswerTest() {
  // RFC 4231 test case 2
  static constexpr std::array<uint8_t, 64> kExpected{
      0x16, 0x4b, 0x7a, 0x7b, 0xfc, 0xf8, 0x19, 0xe2, 0xe3, 0x95, 0xfb, 0xe7, 0x3b, 0x56, 0xe0, 0xa3,
      0x87, 0xbd, 0x64, 0x22, 0x2e, 0x83, 0x1f, 0xd6, 0x10, 0x27, 0x0c, 0xd7, 0xea, 0x25, 0x05, 0x54,
      0x97, 0x58, 0xbf, 0x75, 0xc0, 0x5a, 0x99, 0x4a, 0x6d, 0x03, 0x4f, 0x65, 0xf8, 0xf0, 0xe6, 0xfd,
      0xca, 0xea, 0xb1, 0xa3, 0x4d, 0x4a, 0x6b, 0x4b, 0x63, 0x6e, 0x07, 0x0a, 0x38, 0xbc, 0xe7, 0x37};
  OpenSSLCryptoProvider provider;
  const auto tag = provider.HMACSHA512(gv::AsBytes("Jefe"), gv::AsBytes("what do ya want for nothing?"));
  if (!ct::CompareEqual(tag, kExpected)) {
    ThrowSelfTestFailure("HMAC-SHA512 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    if (sodium_init() < 0) {
      throw gv::Error(gv::ErrorDomain::Dependency, errors::dependency::kLibraryUnavailable,
                      "sodium_init failed");
    }
    std::clog << "[crypto] libsodium " << sodium_version_string() << ", "
              << OpenSSL_version(OPENSSL_VERSION) << std::endl;
    RunSHA256KnownAnswerTest();
    RunHMACSHA512KnownAnswerTest();
    state.kat_passed = true;
    std::clog << "[crypto] SHA-256 and HMAC-SHA512 known-answer tests passed" << std::endl;
  });
}

}  // namespace

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length");
  }
  return out;
}

std::array<uint8_t, 64> OpenSSLCryptoProvider::HMACSHA512(std::span<const uint8_t> key,
                                                          std::span<const uint8_t> message) {
  std::array<uint8_t, 64> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha512)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA512 length");
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

}  // namespace gv::crypto
