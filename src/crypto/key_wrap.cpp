#include "gv/crypto/key_wrap.h"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <fstream>
#include <iterator>
#include <utility>

#include "gv/common.h"
#include "gv/crypto/provider.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/security/zeroizer.h"

namespace gv::crypto {

namespace {

class OpenSSLDeleter {
public:
  void operator()(BIO* bio) const noexcept { BIO_free(bio); }
  void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, OpenSSLDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, OpenSSLDeleter>;

std::shared_ptr<EVP_PKEY> AdoptKey(EVP_PKEY* raw) {
  return std::shared_ptr<EVP_PKEY>(raw, [](EVP_PKEY* key) { EVP_PKEY_free(key); });
}

[[noreturn]] void ThrowInvalidKey(const char* context) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidKey, BuildOpenSSLErrorMessage(context));
}

[[noreturn]] void ThrowWrapError(const char* context) {
  throw Error(ErrorDomain::Crypto, errors::crypto::kKeyWrapFailed, BuildOpenSSLErrorMessage(context));
}

BioPtr MemoryBio(std::string_view pem) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    ThrowInvalidKey("BIO_new_mem_buf");
  }
  return bio;
}

std::string DrainBio(BIO* bio) {
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  if (len <= 0 || data == nullptr) {
    return {};
  }
  return std::string(data, static_cast<size_t>(len));
}

std::string ReadTextFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error(ErrorDomain::IO, errors::io::kOpenFailed,
                "Unable to open key file: " + PathToUtf8String(path));
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void RequireRsa(EVP_PKEY* key) {
  if (EVP_PKEY_is_a(key, "RSA") != 1) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey, "Key is not an RSA key");
  }
}

PkeyCtxPtr OaepContext(EVP_PKEY* key, bool encrypt) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key, nullptr));
  if (!ctx) {
    ThrowWrapError("EVP_PKEY_CTX_new_from_pkey");
  }
  const int init = encrypt ? EVP_PKEY_encrypt_init(ctx.get()) : EVP_PKEY_decrypt_init(ctx.get());
  if (init != 1) {
    ThrowWrapError(encrypt ? "EVP_PKEY_encrypt_init" : "EVP_PKEY_decrypt_init");
  }
  if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != 1 ||
      EVP_PKEY_CTX_set_rsa_oaep_md(ctx.get(), EVP_sha256()) != 1 ||
      EVP_PKEY_CTX_set_rsa_mgf1_md(ctx.get(), EVP_sha256()) != 1) {
    ThrowWrapError("configuring RSA-OAEP");
  }
  return ctx;
}

}  // namespace

RsaKey::RsaKey(std::shared_ptr<EVP_PKEY> key, bool has_private)
    : key_(std::move(key)), has_private_(has_private) {}

RsaKey RsaKey::FromPublicPem(std::string_view pem) {
  auto bio = MemoryBio(pem);
  EVP_PKEY* raw = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (raw == nullptr) {
    ThrowInvalidKey("PEM_read_bio_PUBKEY");
  }
  auto key = AdoptKey(raw);
  RequireRsa(key.get());
  return RsaKey(std::move(key), false);
}

RsaKey RsaKey::FromPrivatePem(std::string_view pem, std::optional<std::string_view> passphrase) {
  auto bio = MemoryBio(pem);
  std::string pass;
  if (passphrase) {
    pass.assign(passphrase->begin(), passphrase->end());
  }
  EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr,
                                          passphrase ? pass.data() : nullptr);
  gv::security::Zeroizer::WipeString(pass);
  if (raw == nullptr) {
    ThrowInvalidKey("PEM_read_bio_PrivateKey");
  }
  auto key = AdoptKey(raw);
  RequireRsa(key.get());
  return RsaKey(std::move(key), true);
}

RsaKey RsaKey::LoadPublicPemFile(const std::filesystem::path& path) {
  return FromPublicPem(ReadTextFile(path));
}

RsaKey RsaKey::LoadPrivatePemFile(const std::filesystem::path& path,
                                  std::optional<std::string_view> passphrase) {
  auto pem = ReadTextFile(path);
  try {
    auto key = FromPrivatePem(pem, passphrase);
    gv::security::Zeroizer::WipeString(pem);
    return key;
  } catch (const Error&) {
    gv::security::Zeroizer::WipeString(pem);
    throw;
  }
}

RsaKey RsaKey::Generate(unsigned bits) {
  EVP_PKEY* raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(bits));
  if (raw == nullptr) {
    ThrowWrapError("EVP_PKEY_Q_keygen(RSA)");
  }
  return RsaKey(AdoptKey(raw), true);
}

std::string RsaKey::PublicPem() const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
    ThrowWrapError("PEM_write_bio_PUBKEY");
  }
  return DrainBio(bio.get());
}

std::string RsaKey::PrivatePem() const {
  if (!has_private_) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey, "Key has no private half");
  }
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr,
                                       nullptr) != 1) {
    ThrowWrapError("PEM_write_bio_PrivateKey");
  }
  return DrainBio(bio.get());
}

std::string WrapKey(const RsaKey& recipient, std::span<const uint8_t> key_material) {
  auto ctx = OaepContext(recipient.get(), true);
  size_t out_len = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, key_material.data(), key_material.size()) != 1) {
    ThrowWrapError("EVP_PKEY_encrypt (size)");
  }
  std::vector<uint8_t> wrapped(out_len);
  if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_len, key_material.data(),
                       key_material.size()) != 1) {
    ThrowWrapError("EVP_PKEY_encrypt");
  }
  wrapped.resize(out_len);
  return encoding::ToHex(wrapped);
}

std::vector<uint8_t> UnwrapKey(const RsaKey& recipient, std::string_view wrapped_hex) {
  if (!recipient.has_private()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey,
                "Unwrapping requires a private key");
  }
  const auto wrapped = encoding::FromHex(wrapped_hex);
  auto ctx = OaepContext(recipient.get(), false);
  size_t out_len = 0;
  if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(), wrapped.size()) != 1) {
    ThrowWrapError("EVP_PKEY_decrypt (size)");
  }
  std::vector<uint8_t> plain(out_len);
  if (EVP_PKEY_decrypt(ctx.get(), plain.data(), &out_len, wrapped.data(), wrapped.size()) != 1) {
    ThrowWrapError("EVP_PKEY_decrypt");
  }
  plain.resize(out_len);
  return plain;
}

}  // namespace gv::crypto
