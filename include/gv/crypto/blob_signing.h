#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace gv::crypto {

struct BlobSignature {
  std::string verify_key; // hex Ed25519 public key
  std::string signature;  // hex detached signature
};

// Signs with a throwaway Ed25519 keypair; the secret key is wiped before return.
BlobSignature SignBlob(std::span<const uint8_t> blob);

// False for a wrong signature or a malformed key/signature encoding.
bool VerifyBlob(std::span<const uint8_t> blob, std::string_view verify_key_hex,
                std::string_view signature_hex);

}  // namespace gv::crypto
