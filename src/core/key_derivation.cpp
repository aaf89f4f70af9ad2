#include "gv/core/key_derivation.h"

#include <sodium.h>

#if defined(GV_HAVE_ARGON2) && GV_HAVE_ARGON2
#include <argon2.h>
#endif

#include <cstdint>
#include <limits>
#include <string>

#include "gv/crypto/provider.h"
#include "gv/crypto/random.h"
#include "gv/crypto/secretbox.h"
#include "gv/encoding.h"
#include "gv/error.h"
#include "gv/errors.h"
#include "gv/security/zeroizer.h"

namespace gv::core {

namespace {

[[noreturn]] void ThrowInvalidParameters(std::string_view message) {
  throw Error(ErrorDomain::Config, errors::config::kInvalidKdfParameters, std::string(message));
}

bool IsKnownConstruct(std::string_view construct) {
  return construct == kConstructArgon2i || construct == kConstructArgon2id;
}

[[noreturn]] void ThrowUnsupportedConstruct(std::string_view construct) {
  throw Error(ErrorDomain::Config, errors::config::kUnsupportedConstruct,
              std::string(errors::msg::kUnsupportedConstruct) + ": " + std::string(construct));
}

std::vector<uint8_t> RandomSalt() {
  std::vector<uint8_t> salt(kKdfSaltSize);
  crypto::SystemRandomBytes(salt);
  return salt;
}

std::vector<uint8_t> RunArgon2i(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                                size_t out_len, uint64_t ops, uint64_t mem) {
  std::vector<uint8_t> out(out_len);
  if (crypto_pwhash(out.data(), out.size(), reinterpret_cast<const char*>(password.data()),
                    password.size(), salt.data(), static_cast<unsigned long long>(ops),
                    static_cast<size_t>(mem), crypto_pwhash_ALG_ARGON2I13) != 0) {
    gv::security::Zeroizer::WipeVector(out);
    throw Error(ErrorDomain::Crypto, errors::crypto::kDerivationFailed,
                std::string(errors::msg::kKdfDerivationFailed) + " (argon2i, ops=" +
                    std::to_string(ops) + ", mem=" + std::to_string(mem) + ")");
  }
  return out;
}

std::vector<uint8_t> RunArgon2id(std::span<const uint8_t> password, std::span<const uint8_t> salt,
                                 size_t out_len, uint64_t ops, uint64_t mem) {
#if defined(GV_HAVE_ARGON2) && GV_HAVE_ARGON2
  std::vector<uint8_t> out(out_len);
  const int rc = argon2id_hash_raw(static_cast<uint32_t>(ops), static_cast<uint32_t>(mem / 1024),
                                   1, password.data(), password.size(), salt.data(), salt.size(),
                                   out.data(), out.size());
  if (rc != ARGON2_OK) {
    gv::security::Zeroizer::WipeVector(out);
    throw Error(ErrorDomain::Crypto, errors::crypto::kDerivationFailed,
                std::string(errors::msg::kKdfDerivationFailed) + ": " + argon2_error_message(rc),
                rc);
  }
  return out;
#else
  (void)password;
  (void)salt;
  (void)out_len;
  (void)ops;
  (void)mem;
  throw Error(ErrorDomain::Config, errors::config::kUnsupportedConstruct,
              std::string(errors::msg::kArgon2Unavailable));
#endif
}

std::vector<uint8_t> RunKdf(const KeyDerivationParameters& params, std::span<const uint8_t> password,
                            std::span<const uint8_t> salt, size_t out_len) {
  if (params.construct == kConstructArgon2i) {
    return RunArgon2i(password, salt, out_len, params.ops, params.mem);
  }
  return RunArgon2id(password, salt, out_len, params.ops, params.mem);
}

}  // namespace

KdfCost CostForTier(std::string_view construct, KdfCostTier tier) {
  if (construct == kConstructArgon2i) {
    switch (tier) {
    case KdfCostTier::kInteractive:
      return {crypto_pwhash_argon2i_OPSLIMIT_INTERACTIVE, crypto_pwhash_argon2i_MEMLIMIT_INTERACTIVE};
    case KdfCostTier::kModerate:
      return {crypto_pwhash_argon2i_OPSLIMIT_MODERATE, crypto_pwhash_argon2i_MEMLIMIT_MODERATE};
    case KdfCostTier::kSensitive:
      return {crypto_pwhash_argon2i_OPSLIMIT_SENSITIVE, crypto_pwhash_argon2i_MEMLIMIT_SENSITIVE};
    }
  }
  if (construct == kConstructArgon2id) {
    switch (tier) {
    case KdfCostTier::kInteractive:
      return {crypto_pwhash_argon2id_OPSLIMIT_INTERACTIVE, crypto_pwhash_argon2id_MEMLIMIT_INTERACTIVE};
    case KdfCostTier::kModerate:
      return {crypto_pwhash_argon2id_OPSLIMIT_MODERATE, crypto_pwhash_argon2id_MEMLIMIT_MODERATE};
    case KdfCostTier::kSensitive:
      return {crypto_pwhash_argon2id_OPSLIMIT_SENSITIVE, crypto_pwhash_argon2id_MEMLIMIT_SENSITIVE};
    }
  }
  ThrowUnsupportedConstruct(construct);
}

KeyDerivationParameters KeyDerivationParameters::CreateDefault(bool enable_signing, KdfCostTier tier,
                                                               std::string_view construct) {
  const auto cost = CostForTier(construct, tier);
  KeyDerivationParameters params;
  params.construct = std::string(construct);
  params.ops = cost.ops;
  params.mem = cost.mem;
  params.encryption_key_size = crypto::SecretBox::KEY_SIZE;
  params.signing_key_size = enable_signing ? kSigningKeySize : 0;
  params.encryption_salt = RandomSalt();
  if (enable_signing) {
    params.signing_salt = RandomSalt();
  }
  return params;
}

void KeyDerivationParameters::Validate() const {
  if (!IsKnownConstruct(construct)) {
    ThrowUnsupportedConstruct(construct);
  }
  if (encryption_key_size != crypto::SecretBox::KEY_SIZE) {
    ThrowInvalidParameters(errors::msg::kInvalidKeySize);
  }
  if (signing_key_size != 0 && signing_key_size != kSigningKeySize) {
    ThrowInvalidParameters(errors::msg::kInvalidKeySize);
  }
  if (encryption_salt.size() != kKdfSaltSize) {
    ThrowInvalidParameters(errors::msg::kInvalidSaltSize);
  }
  if (signing_key_size == 0) {
    if (!signing_salt.empty()) {
      ThrowInvalidParameters(errors::msg::kSigningSaltWithoutKey);
    }
  } else if (signing_salt.size() != kKdfSaltSize) {
    ThrowInvalidParameters(errors::msg::kInvalidSaltSize);
  }
  if (ops == 0 || mem == 0) {
    ThrowInvalidParameters(errors::msg::kCostBelowMinimum);
  }
  // libargon2 takes 32-bit pass counts and whole KiB of memory.
  if (construct == kConstructArgon2id) {
    constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();
    if (ops > kMax32 || mem % 1024 != 0 || mem / 1024 > kMax32) {
      ThrowInvalidParameters(errors::msg::kCostOutOfRange);
    }
  }
}

nlohmann::json KeyDerivationParameters::ToJson() const {
  return nlohmann::json{
      {"construct", construct},
      {"ops", ops},
      {"mem", mem},
      {"encryption_key_size", encryption_key_size},
      {"signing_key_size", signing_key_size},
      {"encryption_salt", encoding::ToBase64(encryption_salt)},
      {"signing_salt", encoding::ToBase64(signing_salt)},
  };
}

KeyDerivationParameters KeyDerivationParameters::FromJson(const nlohmann::json& value) {
  KeyDerivationParameters params;
  try {
    params.construct = value.at("construct").get<std::string>();
    params.ops = value.at("ops").get<uint64_t>();
    params.mem = value.at("mem").get<uint64_t>();
    params.encryption_key_size = value.at("encryption_key_size").get<size_t>();
    params.signing_key_size = value.at("signing_key_size").get<size_t>();
    params.encryption_salt = encoding::FromBase64(value.at("encryption_salt").get<std::string>());
    params.signing_salt = encoding::FromBase64(value.at("signing_salt").get<std::string>());
  } catch (const nlohmann::json::exception& ex) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidKdfParameters,
                std::string("Key derivation record malformed: ") + ex.what());
  }
  return params;
}

DerivedKeys::~DerivedKeys() {
  gv::security::Zeroizer::WipeVector(encryption_key);
  if (signing_key) {
    gv::security::Zeroizer::WipeVector(*signing_key);
  }
}

DerivedKeys DeriveKeys(std::span<const uint8_t> password,
                       const std::optional<KeyDerivationParameters>& params,
                       const DefaultParameterOptions& defaults) {
  crypto::EnsureCryptoProviderInitialized();
  DerivedKeys keys;
  keys.parameters = params ? *params
                           : KeyDerivationParameters::CreateDefault(defaults.enable_signing,
                                                                    defaults.tier,
                                                                    defaults.construct);
  keys.parameters.Validate();
  const auto& setup = keys.parameters;
  keys.encryption_key = RunKdf(setup, password, setup.encryption_salt, setup.encryption_key_size);
  if (setup.signing_key_size != 0) {
    keys.signing_key = RunKdf(setup, password, setup.signing_salt, setup.signing_key_size);
  }
  return keys;
}

}  // namespace gv::core
