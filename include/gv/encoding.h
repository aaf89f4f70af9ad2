#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gv::encoding {

// Lowercase hex.
std::string ToHex(std::span<const uint8_t> bytes);
// Throws gv::Error (Validation) on odd length or non-hex characters.
std::vector<uint8_t> FromHex(std::string_view hex);

// Standard padded base64 alphabet.
std::string ToBase64(std::span<const uint8_t> bytes);
std::vector<uint8_t> FromBase64(std::string_view text);

}  // namespace gv::encoding
