#include "gv/encoding.h"

#include <sodium.h>

#include "gv/error.h"
#include "gv/errors.h"

namespace gv::encoding {

std::string ToHex(std::span<const uint8_t> bytes) {
  std::string out(bytes.size() * 2 + 1, '\0');
  sodium_bin2hex(out.data(), out.size(), bytes.data(), bytes.size());
  out.pop_back();
  return out;
}

std::vector<uint8_t> FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                std::string(errors::msg::kMalformedHex));
  }
  std::vector<uint8_t> out(hex.size() / 2);
  size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded, &end) != 0 ||
      decoded != out.size() || end != hex.data() + hex.size()) {
    throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                std::string(errors::msg::kMalformedHex));
  }
  return out;
}

std::string ToBase64(std::span<const uint8_t> bytes) {
  const size_t encoded_len = sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
  std::string out(encoded_len, '\0');
  sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(),
                    sodium_base64_VARIANT_ORIGINAL);
  out.resize(encoded_len - 1); // drop terminator
  return out;
}

std::vector<uint8_t> FromBase64(std::string_view text) {
  std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
  size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &decoded, &end,
                        sodium_base64_VARIANT_ORIGINAL) != 0 ||
      end != text.data() + text.size()) {
    throw Error(ErrorDomain::Validation, errors::validation::kMalformedEncoding,
                std::string(errors::msg::kMalformedBase64));
  }
  out.resize(decoded);
  return out;
}

}  // namespace gv::encoding
