#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace gv::crypto {

// Incremental HMAC-SHA512 over an arbitrarily long message.
class HMAC_SHA512 {
public:
  static constexpr size_t TAG_SIZE = 64;

  explicit HMAC_SHA512(std::span<const uint8_t> key);
  ~HMAC_SHA512();
  HMAC_SHA512(HMAC_SHA512&&) noexcept;
  HMAC_SHA512& operator=(HMAC_SHA512&&) noexcept;
  HMAC_SHA512(const HMAC_SHA512&) = delete;
  HMAC_SHA512& operator=(const HMAC_SHA512&) = delete;

  void Update(std::span<const uint8_t> data);
  // May be called once; later calls to Update or Finalize throw.
  std::array<uint8_t, TAG_SIZE> Finalize();

  // One-shot tag through the active CryptoProvider.
  static std::array<uint8_t, TAG_SIZE> Compute(std::span<const uint8_t> key,
                                               std::span<const uint8_t> msg);

private:
  struct State;
  std::unique_ptr<State> state_;
};

} // namespace gv::crypto
