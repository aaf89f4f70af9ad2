#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace gv::core {

inline constexpr std::string_view kConstructArgon2i{"argon2i"};
inline constexpr std::string_view kConstructArgon2id{"argon2id"};
inline constexpr size_t kKdfSaltSize = 16;
inline constexpr size_t kSigningKeySize = 64;

enum class KdfCostTier { kInteractive, kModerate, kSensitive };

struct KdfCost {
  uint64_t ops{0};
  uint64_t mem{0}; // bytes
};

// Throws gv::Error (Config, kUnsupportedConstruct) for unknown constructs.
KdfCost CostForTier(std::string_view construct, KdfCostTier tier);

// Persisted record that lets a password regenerate the same keys.
struct KeyDerivationParameters {
  std::string construct;
  uint64_t ops{0};
  uint64_t mem{0};
  size_t encryption_key_size{0};
  size_t signing_key_size{0};
  std::vector<uint8_t> encryption_salt;
  std::vector<uint8_t> signing_salt;

  // Fresh salts from the system CSPRNG.
  static KeyDerivationParameters CreateDefault(bool enable_signing,
                                               KdfCostTier tier = KdfCostTier::kSensitive,
                                               std::string_view construct = kConstructArgon2i);

  // Rejects unknown constructs, key sizes that do not match the cipher and MAC,
  // salt sizes that do not match the construct, and argon2id costs that do not
  // fit libargon2's 32-bit pass count and whole-KiB memory.
  void Validate() const;

  [[nodiscard]] nlohmann::json ToJson() const;
  static KeyDerivationParameters FromJson(const nlohmann::json& value);

  bool operator==(const KeyDerivationParameters&) const = default;
};

// Key material lives only in memory and is wiped on destruction.
struct DerivedKeys {
  std::vector<uint8_t> encryption_key;
  std::optional<std::vector<uint8_t>> signing_key;
  KeyDerivationParameters parameters;

  DerivedKeys() = default;
  DerivedKeys(const DerivedKeys&) = default;
  DerivedKeys(DerivedKeys&&) noexcept = default;
  DerivedKeys& operator=(const DerivedKeys&) = default;
  DerivedKeys& operator=(DerivedKeys&&) noexcept = default;
  ~DerivedKeys();
};

struct DefaultParameterOptions {
  bool enable_signing{false};
  KdfCostTier tier{KdfCostTier::kSensitive};
  std::string construct{kConstructArgon2i};
};

// Deterministic for identical (password, params). When `params` is empty a new
// record is generated from `defaults`. Deliberately expensive; keep it off hot
// paths.
DerivedKeys DeriveKeys(std::span<const uint8_t> password,
                       const std::optional<KeyDerivationParameters>& params,
                       const DefaultParameterOptions& defaults = {});

}  // namespace gv::core
