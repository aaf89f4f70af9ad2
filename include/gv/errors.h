#pragma once

#include <string_view>

namespace gv::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kUnsupportedConstruct{"Key derivation construct not implemented"};
inline constexpr std::string_view kKdfDerivationFailed{"Key derivation failed"};
inline constexpr std::string_view kArgon2Unavailable{"Argon2id support not available in this build"};
inline constexpr std::string_view kInvalidKeySize{"Key size does not match the selected primitive"};
inline constexpr std::string_view kInvalidSaltSize{"Salt size does not match the selected construct"};
inline constexpr std::string_view kSigningSaltWithoutKey{"Signing salt given while signing is disabled"};
inline constexpr std::string_view kCostBelowMinimum{"Key derivation cost parameters below construct minimum"};
inline constexpr std::string_view kCostOutOfRange{"Key derivation cost parameters exceed the construct's limits"};
inline constexpr std::string_view kBlockNotAligned{"Encrypted block size is not a multiple of the cipher chunk size"};
inline constexpr std::string_view kMissingSigningKey{"No signing key configured, but a signature was requested"};
inline constexpr std::string_view kSignatureMismatch{"Stream signature does not match"};
inline constexpr std::string_view kCiphertextTruncated{"Ciphertext chunk shorter than cipher overhead"};
inline constexpr std::string_view kChunkAuthenticationFailed{"Ciphertext chunk failed authentication"};
inline constexpr std::string_view kMalformedHex{"Malformed hex encoding"};
inline constexpr std::string_view kMalformedBase64{"Malformed base64 encoding"};
inline constexpr std::string_view kInvalidPartSize{"Part size must be 1 MiB times a power of two, at most 4 GiB"};
inline constexpr std::string_view kInitializationNoId{"Backend did not return an upload id"};
inline constexpr std::string_view kRetriesExhausted{"Upload retries exhausted with incomplete parts"};
inline constexpr std::string_view kFinalizeChecksumMismatch{"Backend archive checksum does not match local tree hash"};
inline constexpr std::string_view kMissingLeadingChunk{"No chunk starts at offset 0"};
inline constexpr std::string_view kChunkSizeMismatch{"Chunks do not end at the file size"};
inline constexpr std::string_view kNonContiguousChunks{"Chunk ranges contain gaps or overlaps"};
inline constexpr std::string_view kSnapshotMissingCipher{"Encrypted upload snapshot requires a cipher to resume"};
inline constexpr std::string_view kSnapshotMalformed{"Upload snapshot malformed"};
inline constexpr std::string_view kSourceUnreadable{"Unable to read source file"};
}  // namespace gv::errors::msg
