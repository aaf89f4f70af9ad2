#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace gv::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) = 0;

  virtual std::array<uint8_t, 64> HMACSHA512(std::span<const uint8_t> key,
                                             std::span<const uint8_t> message) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> SHA256(std::span<const uint8_t> data) override;

  std::array<uint8_t, 64> HMACSHA512(std::span<const uint8_t> key,
                                     std::span<const uint8_t> message) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
// Initializes libsodium and runs the digest known-answer tests once per process.
void EnsureCryptoProviderInitialized();

// Formats the oldest queued OpenSSL error after `context`.
std::string BuildOpenSSLErrorMessage(const char* context);

}  // namespace gv::crypto
