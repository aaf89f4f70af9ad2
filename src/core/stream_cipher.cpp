#include "gv/core/stream_cipher.h"

#include <algorithm>
#include <mutex>
#include <string>

#include "gv/core/key_derivation.h"
#include "gv/crypto/ct.h"
#include "gv/crypto/random.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/security/zeroizer.h"

namespace gv::core {

namespace detail {

struct CipherState {
  std::array<uint8_t, crypto::SecretBox::KEY_SIZE> encryption_key{};
  SigningMode signing;
  mutable std::mutex signature_mutex;
  std::optional<std::string> last_signature;

  ~CipherState() {
    gv::security::Zeroizer::Wipe(encryption_key);
    if (auto* hmac = std::get_if<HmacSigning>(&signing)) {
      gv::security::Zeroizer::WipeVector(hmac->key);
    }
  }

  std::span<const uint8_t, crypto::SecretBox::KEY_SIZE> key() const {
    return std::span<const uint8_t, crypto::SecretBox::KEY_SIZE>(encryption_key);
  }

  void StoreSignature(std::optional<std::string> signature) {
    std::lock_guard<std::mutex> lock(signature_mutex);
    last_signature = std::move(signature);
  }
};

}  // namespace detail

namespace {

// Running MAC for encryption: absent when signing is disabled.
std::optional<crypto::HMAC_SHA512> OptionalMac(const SigningMode& mode) {
  if (const auto* hmac = std::get_if<HmacSigning>(&mode)) {
    return crypto::HMAC_SHA512(hmac->key);
  }
  return std::nullopt;
}

// Running MAC for explicit sign/verify requests: signing must be configured.
crypto::HMAC_SHA512 RequiredMac(const SigningMode& mode) {
  if (const auto* hmac = std::get_if<HmacSigning>(&mode)) {
    return crypto::HMAC_SHA512(hmac->key);
  }
  throw Error(ErrorDomain::Security, errors::security::kMissingSigningKey,
              std::string(errors::msg::kMissingSigningKey));
}

// Reads up to `limit` bytes, bounded by `remaining` when set.
std::vector<uint8_t> ReadBounded(std::istream& in, size_t limit, std::optional<uint64_t>& remaining) {
  size_t want = limit;
  if (remaining) {
    want = static_cast<size_t>(std::min<uint64_t>(*remaining, limit));
  }
  std::vector<uint8_t> buffer(want);
  if (want == 0) {
    return buffer;
  }
  in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
  if (in.bad()) {
    throw Error(ErrorDomain::IO, errors::io::kReadFailed, "Stream read failed");
  }
  buffer.resize(static_cast<size_t>(in.gcount()));
  if (remaining) {
    *remaining -= buffer.size();
  }
  return buffer;
}

template <typename Stream>
std::vector<uint8_t> DrainStream(Stream& stream) {
  std::vector<uint8_t> out;
  while (auto chunk = stream.Next()) {
    out.insert(out.end(), chunk->begin(), chunk->end());
  }
  return out;
}

std::array<uint8_t, crypto::HMAC_SHA512::TAG_SIZE> MacStream(crypto::HMAC_SHA512 mac, std::istream& in,
                                                             std::optional<uint64_t> max_bytes) {
  for (;;) {
    auto chunk = ReadBounded(in, kCipherChunkSize, max_bytes);
    if (chunk.empty()) {
      break;
    }
    mac.Update(chunk);
  }
  return mac.Finalize();
}

}  // namespace

EncryptingStream::EncryptingStream(std::shared_ptr<detail::CipherState> state, std::istream& source,
                                   std::optional<uint64_t> max_bytes)
    : state_(std::move(state)),
      source_(&source),
      remaining_(max_bytes),
      nonce_base_(RandomNonceBase()),
      mac_(OptionalMac(state_->signing)) {}

std::optional<std::vector<uint8_t>> EncryptingStream::Next() {
  if (done_) {
    return std::nullopt;
  }
  auto plain = ReadBounded(*source_, kPlainChunkSize, remaining_);
  gv::security::Zeroizer::ScopeWiper<uint8_t> wipe_plain(plain.data(), plain.size());
  if (plain.empty()) {
    done_ = true;
    if (mac_) {
      const auto tag = mac_->Finalize();
      state_->StoreSignature(encoding::ToHex(tag));
    } else {
      state_->StoreSignature(std::nullopt);
    }
    return std::nullopt;
  }
  const auto nonce = NonceForIndex(nonce_base_, index_++);
  auto sealed = crypto::SecretBox::Seal(plain, nonce, state_->key());
  if (mac_) {
    mac_->Update(sealed);
  }
  return sealed;
}

std::vector<uint8_t> EncryptingStream::ReadAll() {
  return DrainStream(*this);
}

DecryptingStream::DecryptingStream(std::shared_ptr<detail::CipherState> state, std::istream& source,
                                   std::optional<uint64_t> max_bytes,
                                   std::optional<std::vector<uint8_t>> expected)
    : state_(std::move(state)),
      source_(&source),
      remaining_(max_bytes),
      expected_(std::move(expected)) {
  if (expected_) {
    mac_.emplace(RequiredMac(state_->signing));
  }
}

std::optional<std::vector<uint8_t>> DecryptingStream::Next() {
  if (done_) {
    return std::nullopt;
  }
  auto sealed = ReadBounded(*source_, kCipherChunkSize, remaining_);
  if (sealed.empty()) {
    done_ = true;
    if (mac_) {
      const auto tag = mac_->Finalize();
      if (!crypto::ct::Equal(tag, *expected_)) {
        throw Error(ErrorDomain::Security, errors::security::kSignatureMismatch,
                    std::string(errors::msg::kSignatureMismatch));
      }
    }
    return std::nullopt;
  }
  if (mac_) {
    mac_->Update(sealed);
  }
  return crypto::SecretBox::Open(sealed, state_->key());
}

std::vector<uint8_t> DecryptingStream::ReadAll() {
  return DrainStream(*this);
}

StreamCipher::StreamCipher(std::span<const uint8_t> encryption_key, SigningMode signing)
    : state_(std::make_shared<detail::CipherState>()) {
  if (encryption_key.size() != crypto::SecretBox::KEY_SIZE) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey,
                std::string(errors::msg::kInvalidKeySize));
  }
  if (const auto* hmac = std::get_if<HmacSigning>(&signing); hmac && hmac->key.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey, "Signing key must not be empty");
  }
  std::copy(encryption_key.begin(), encryption_key.end(), state_->encryption_key.begin());
  state_->signing = std::move(signing);
}

StreamCipher StreamCipher::FromDerivedKeys(const DerivedKeys& keys) {
  if (keys.signing_key) {
    return StreamCipher(keys.encryption_key, HmacSigning{*keys.signing_key});
  }
  return StreamCipher(keys.encryption_key, NoSigning{});
}

StreamCipher StreamCipher::Generate(bool enable_signing) {
  std::array<uint8_t, crypto::SecretBox::KEY_SIZE> key{};
  gv::security::Zeroizer::ScopeWiper<uint8_t> wipe_key(key.data(), key.size());
  crypto::SystemRandomBytes(key);
  if (!enable_signing) {
    return StreamCipher(key, NoSigning{});
  }
  HmacSigning signing{std::vector<uint8_t>(kSigningKeySize)};
  crypto::SystemRandomBytes(signing.key);
  return StreamCipher(key, std::move(signing));
}

StreamCipher StreamCipher::FromWrappedKeys(const crypto::RsaKey& private_key, const WrappedKeys& wrapped) {
  auto key = crypto::UnwrapKey(private_key, wrapped.encryption_key);
  gv::security::Zeroizer::ScopeWiper<uint8_t> wipe_key(key.data(), key.size());
  if (!wrapped.signing_key) {
    return StreamCipher(key, NoSigning{});
  }
  return StreamCipher(key, HmacSigning{crypto::UnwrapKey(private_key, *wrapped.signing_key)});
}

StreamCipher StreamCipher::FromInfo(const CipherInfo& info, const crypto::RsaKey& private_key) {
  if (!info.secret_key) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey, "Cipher info has no wrapped key");
  }
  auto cipher = FromWrappedKeys(private_key, WrappedKeys{*info.secret_key, info.auth_key});
  cipher.state_->StoreSignature(info.signature);
  return cipher;
}

EncryptingStream StreamCipher::Encrypt(std::istream& plaintext, std::optional<uint64_t> max_bytes) const {
  return EncryptingStream(state_, plaintext, max_bytes);
}

DecryptingStream StreamCipher::Decrypt(std::istream& ciphertext, const SignatureCheck& check,
                                       std::optional<uint64_t> max_bytes) const {
  std::optional<std::vector<uint8_t>> expected;
  if (check.required()) {
    if (!has_signing_key()) {
      throw Error(ErrorDomain::Security, errors::security::kMissingSigningKey,
                  std::string(errors::msg::kMissingSigningKey));
    }
    expected = encoding::FromHex(check.signature());
  }
  return DecryptingStream(state_, ciphertext, max_bytes, std::move(expected));
}

std::string StreamCipher::SignStream(std::istream& ciphertext, std::optional<uint64_t> max_bytes) const {
  const auto tag = MacStream(RequiredMac(state_->signing), ciphertext, max_bytes);
  return encoding::ToHex(tag);
}

bool StreamCipher::VerifyStream(std::istream& ciphertext, std::string_view signature_hex,
                                std::optional<uint64_t> max_bytes) const {
  auto mac = RequiredMac(state_->signing);
  std::vector<uint8_t> expected;
  try {
    expected = encoding::FromHex(signature_hex);
  } catch (const Error&) {
    return false;
  }
  const auto tag = MacStream(std::move(mac), ciphertext, max_bytes);
  return crypto::ct::Equal(tag, expected);
}

uint64_t StreamCipher::UnencryptedBlockSize(uint64_t encrypted_block_size) {
  if (encrypted_block_size % kCipherChunkSize != 0) {
    throw Error(ErrorDomain::Config, errors::config::kNotAligned,
                std::string(errors::msg::kBlockNotAligned) + ": " +
                    std::to_string(encrypted_block_size) + " % " + std::to_string(kCipherChunkSize));
  }
  return (encrypted_block_size / kCipherChunkSize) * kPlainChunkSize;
}

uint64_t StreamCipher::EncryptedSize(uint64_t plain_size) noexcept {
  const uint64_t chunks = (plain_size + kPlainChunkSize - 1) / kPlainChunkSize;
  return plain_size + chunks * kCipherOverhead;
}

WrappedKeys StreamCipher::WrapKeys(const crypto::RsaKey& recipient) const {
  WrappedKeys wrapped;
  wrapped.encryption_key = crypto::WrapKey(recipient, state_->encryption_key);
  if (const auto* hmac = std::get_if<HmacSigning>(&state_->signing)) {
    wrapped.signing_key = crypto::WrapKey(recipient, hmac->key);
  }
  return wrapped;
}

CipherInfo StreamCipher::CreateInfo(const crypto::RsaKey* recipient) const {
  CipherInfo info;
  info.signature = last_signature();
  if (recipient != nullptr) {
    auto wrapped = WrapKeys(*recipient);
    info.secret_key = std::move(wrapped.encryption_key);
    info.auth_key = std::move(wrapped.signing_key);
  }
  return info;
}

std::optional<std::string> StreamCipher::last_signature() const {
  std::lock_guard<std::mutex> lock(state_->signature_mutex);
  return state_->last_signature;
}

bool StreamCipher::has_signing_key() const noexcept {
  return std::holds_alternative<HmacSigning>(state_->signing);
}

namespace {

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> OptionalFromJson(const nlohmann::json& value, const char* key) {
  const auto& field = value.at(key);
  if (field.is_null()) {
    return std::nullopt;
  }
  return field.get<std::string>();
}

}  // namespace

nlohmann::json CipherInfo::ToJson() const {
  return nlohmann::json{
      {"secret_key", OptionalToJson(secret_key)},
      {"auth_key", OptionalToJson(auth_key)},
      {"signature", OptionalToJson(signature)},
  };
}

CipherInfo CipherInfo::FromJson(const nlohmann::json& value) {
  try {
    return CipherInfo{OptionalFromJson(value, "secret_key"), OptionalFromJson(value, "auth_key"),
                      OptionalFromJson(value, "signature")};
  } catch (const nlohmann::json::exception& ex) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKey,
                std::string("Cipher info malformed: ") + ex.what());
  }
}

}  // namespace gv::core
