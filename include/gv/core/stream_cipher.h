#pragma once
#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "gv/core/nonce.h"
#include "gv/crypto/blob_signing.h"
#include "gv/crypto/hmac_sha512.h"
#include "gv/crypto/key_wrap.h"
#include "gv/crypto/secretbox.h"

namespace gv::core {

struct DerivedKeys;

inline constexpr size_t kCipherChunkSize = 16 * 1024;
inline constexpr size_t kCipherOverhead = crypto::SecretBox::OVERHEAD;
inline constexpr size_t kPlainChunkSize = kCipherChunkSize - kCipherOverhead;

// Whole-stream signing mode, fixed when the cipher is built.
struct NoSigning {};
struct HmacSigning {
  std::vector<uint8_t> key;
};
using SigningMode = std::variant<NoSigning, HmacSigning>;

// Decrypt-time signature policy. There is deliberately no default: callers
// either name the signature to verify or opt out explicitly.
class SignatureCheck {
public:
  static SignatureCheck Skip() { return SignatureCheck(std::nullopt); }
  static SignatureCheck Require(std::string signature_hex) {
    return SignatureCheck(std::move(signature_hex));
  }

  [[nodiscard]] bool required() const noexcept { return signature_.has_value(); }
  [[nodiscard]] const std::string& signature() const { return *signature_; }

private:
  explicit SignatureCheck(std::optional<std::string> signature) : signature_(std::move(signature)) {}
  std::optional<std::string> signature_;
};

struct WrappedKeys {
  std::string encryption_key;             // hex
  std::optional<std::string> signing_key; // hex, empty when signing is disabled
};

// JSON-friendly description of a cipher: wrapped keys plus the last signature.
struct CipherInfo {
  std::optional<std::string> secret_key;
  std::optional<std::string> auth_key;
  std::optional<std::string> signature;

  [[nodiscard]] nlohmann::json ToJson() const;
  static CipherInfo FromJson(const nlohmann::json& value);
};

namespace detail {
struct CipherState;
}

// Pull-style ciphertext producer. The source stream must outlive it.
class EncryptingStream {
public:
  // Next sealed chunk; kCipherChunkSize bytes except possibly the last.
  std::optional<std::vector<uint8_t>> Next();
  std::vector<uint8_t> ReadAll();

private:
  friend class StreamCipher;
  EncryptingStream(std::shared_ptr<detail::CipherState> state, std::istream& source,
                   std::optional<uint64_t> max_bytes);

  std::shared_ptr<detail::CipherState> state_;
  std::istream* source_;
  std::optional<uint64_t> remaining_;
  StreamNonce nonce_base_;
  uint64_t index_{0};
  std::optional<crypto::HMAC_SHA512> mac_;
  bool done_{false};
};

// Pull-style plaintext producer. With SignatureCheck::Require the running MAC is
// checked once the ciphertext is exhausted, so the call that hits the end of
// the stream throws on mismatch.
class DecryptingStream {
public:
  std::optional<std::vector<uint8_t>> Next();
  std::vector<uint8_t> ReadAll();

private:
  friend class StreamCipher;
  DecryptingStream(std::shared_ptr<detail::CipherState> state, std::istream& source,
                   std::optional<uint64_t> max_bytes, std::optional<std::vector<uint8_t>> expected);

  std::shared_ptr<detail::CipherState> state_;
  std::istream* source_;
  std::optional<uint64_t> remaining_;
  std::optional<std::vector<uint8_t>> expected_;
  std::optional<crypto::HMAC_SHA512> mac_;
  bool done_{false};
};

class StreamCipher {
public:
  StreamCipher(std::span<const uint8_t> encryption_key, SigningMode signing);

  static StreamCipher FromDerivedKeys(const DerivedKeys& keys);
  // Random 32-byte encryption key and, if enabled, a random 64-byte signing key.
  static StreamCipher Generate(bool enable_signing);
  static StreamCipher FromWrappedKeys(const crypto::RsaKey& private_key, const WrappedKeys& wrapped);
  static StreamCipher FromInfo(const CipherInfo& info, const crypto::RsaKey& private_key);

  StreamCipher(StreamCipher&&) noexcept = default;
  StreamCipher& operator=(StreamCipher&&) noexcept = default;
  StreamCipher(const StreamCipher&) = delete;
  StreamCipher& operator=(const StreamCipher&) = delete;

  // One random nonce base per call. `last_signature` is replaced once the
  // returned stream is exhausted.
  EncryptingStream Encrypt(std::istream& plaintext, std::optional<uint64_t> max_bytes = std::nullopt) const;
  DecryptingStream Decrypt(std::istream& ciphertext, const SignatureCheck& check,
                           std::optional<uint64_t> max_bytes = std::nullopt) const;

  std::string SignStream(std::istream& ciphertext, std::optional<uint64_t> max_bytes = std::nullopt) const;
  bool VerifyStream(std::istream& ciphertext, std::string_view signature_hex,
                    std::optional<uint64_t> max_bytes = std::nullopt) const;

  // Plaintext bytes that encrypt to exactly `encrypted_block_size` bytes.
  static uint64_t UnencryptedBlockSize(uint64_t encrypted_block_size);
  static uint64_t EncryptedSize(uint64_t plain_size) noexcept;

  static crypto::BlobSignature SignBlob(std::span<const uint8_t> ciphertext) {
    return crypto::SignBlob(ciphertext);
  }
  static bool VerifyBlob(std::span<const uint8_t> ciphertext, std::string_view verify_key_hex,
                         std::string_view signature_hex) {
    return crypto::VerifyBlob(ciphertext, verify_key_hex, signature_hex);
  }

  [[nodiscard]] WrappedKeys WrapKeys(const crypto::RsaKey& recipient) const;
  [[nodiscard]] CipherInfo CreateInfo(const crypto::RsaKey* recipient = nullptr) const;

  [[nodiscard]] std::optional<std::string> last_signature() const;
  [[nodiscard]] bool has_signing_key() const noexcept;

private:
  std::shared_ptr<detail::CipherState> state_;
};

}  // namespace gv::core
