#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace gv::crypto {

// RSA key handle for wrapping symmetric keys with OAEP (SHA-256, MGF1-SHA-256).
class RsaKey {
public:
  static RsaKey FromPublicPem(std::string_view pem);
  static RsaKey FromPrivatePem(std::string_view pem,
                               std::optional<std::string_view> passphrase = std::nullopt);
  static RsaKey LoadPublicPemFile(const std::filesystem::path& path);
  static RsaKey LoadPrivatePemFile(const std::filesystem::path& path,
                                   std::optional<std::string_view> passphrase = std::nullopt);
  static RsaKey Generate(unsigned bits = 3072);

  [[nodiscard]] std::string PublicPem() const;
  [[nodiscard]] std::string PrivatePem() const;
  [[nodiscard]] bool has_private() const noexcept { return has_private_; }
  [[nodiscard]] EVP_PKEY* get() const noexcept { return key_.get(); }

private:
  RsaKey(std::shared_ptr<EVP_PKEY> key, bool has_private);

  std::shared_ptr<EVP_PKEY> key_;
  bool has_private_{false};
};

// Returns the hex-encoded OAEP ciphertext of `key_material`.
std::string WrapKey(const RsaKey& recipient, std::span<const uint8_t> key_material);
// Needs a private key; throws gv::Error (Crypto, kKeyWrapFailed) on padding failure.
std::vector<uint8_t> UnwrapKey(const RsaKey& recipient, std::string_view wrapped_hex);

}  // namespace gv::crypto
