#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Backend = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated platform error numbers
  // never collide with framework codes.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Backend:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
    } // namespace io

    namespace config {
      inline constexpr int kUnsupportedConstruct = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kNotAligned = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInvalidPartSize = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kInvalidKdfParameters = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kInvalidEnvironment = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kMissingCipher = Make(ErrorDomain::Config, 0x06);
      inline constexpr int kInvalidSnapshot = Make(ErrorDomain::Config, 0x07);
      inline constexpr int kInvalidKey = Make(ErrorDomain::Config, 0x08);
    } // namespace config

    namespace crypto {
      inline constexpr int kDerivationFailed = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kPrimitiveFailed = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kMalformedCiphertext = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kKeyWrapFailed = Make(ErrorDomain::Crypto, 0x04);
    } // namespace crypto

    namespace security {
      inline constexpr int kAuthenticationRejected = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kSignatureMismatch = Make(ErrorDomain::Security, 0x02);
      inline constexpr int kMissingSigningKey = Make(ErrorDomain::Security, 0x03);
    } // namespace security

    namespace validation {
      inline constexpr int kMissingLeadingChunk = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kSizeMismatch = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kNonContiguousChunks = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kUnknownRecord = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kMalformedEncoding = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace state {
      inline constexpr int kInitializationFailed = Make(ErrorDomain::State, 0x01);
      inline constexpr int kRetriesExhausted = Make(ErrorDomain::State, 0x02);
      inline constexpr int kFinalizeChecksumMismatch = Make(ErrorDomain::State, 0x03);
      inline constexpr int kInvalidTransition = Make(ErrorDomain::State, 0x04);
    } // namespace state

    namespace backend {
      inline constexpr int kRequestFailed = Make(ErrorDomain::Backend, 0x01);
      inline constexpr int kTimeout = Make(ErrorDomain::Backend, 0x02);
    } // namespace backend

    namespace dependency {
      inline constexpr int kLibraryUnavailable = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kSelfTestFailed = Make(ErrorDomain::Dependency, 0x02);
    } // namespace dependency

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Raised when an AEAD tag does not verify.
  struct AuthenticationFailureError : public Error {
    explicit AuthenticationFailureError(const std::string& msg)
        : Error(ErrorDomain::Security, errors::security::kAuthenticationRejected, msg) {}
  };

  enum class ChunkBoundaryErrorKind : std::uint8_t {
    kMissingLeadingChunk,
    kSizeMismatch,
    kNonContiguousChunks
  };

  struct ChunkBoundaryError : public Error {
    ChunkBoundaryErrorKind kind;
    ChunkBoundaryError(ChunkBoundaryErrorKind k, int c, std::string msg)
        : Error(ErrorDomain::Validation, c, std::move(msg)), kind(k) {}
  };

  // Caller-facing taxonomy tag for an error.
  enum class ErrorClass : std::uint8_t {
    kConfiguration,
    kTransient,
    kIntegrity,
    kExhaustion,
    kInternal
  };

  inline ErrorClass ClassifyError(const Error& err) {
    switch (err.domain) {
    case ErrorDomain::Config:
      return ErrorClass::kConfiguration;
    case ErrorDomain::Security:
    case ErrorDomain::Validation:
      return ErrorClass::kIntegrity;
    case ErrorDomain::Crypto:
      return err.code == errors::crypto::kMalformedCiphertext ? ErrorClass::kIntegrity
                                                              : ErrorClass::kInternal;
    case ErrorDomain::State:
      if (err.code == errors::state::kRetriesExhausted ||
          err.code == errors::state::kFinalizeChecksumMismatch) {
        return ErrorClass::kExhaustion;
      }
      return ErrorClass::kInternal;
    case ErrorDomain::Backend:
    case ErrorDomain::IO:
      return err.retryability == Retryability::kFatal ? ErrorClass::kInternal
                                                      : ErrorClass::kTransient;
    case ErrorDomain::Dependency:
    case ErrorDomain::Internal:
      break;
    }
    return ErrorClass::kInternal;
  }

  inline constexpr std::string_view ErrorClassName(ErrorClass cls) {
    switch (cls) {
    case ErrorClass::kConfiguration:
      return "configuration";
    case ErrorClass::kTransient:
      return "transient";
    case ErrorClass::kIntegrity:
      return "integrity";
    case ErrorClass::kExhaustion:
      return "exhaustion";
    case ErrorClass::kInternal:
      return "internal";
    }
    return "internal";
  }
} // namespace gv
