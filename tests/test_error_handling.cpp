#include "gv/error.h"
#include "gv/orchestrator/backend.h"

#include <cassert>
#include <iostream>
#include <string>

namespace errtest {

  void TestClassification() {
    using gv::ClassifyError;
    using gv::Error;
    using gv::ErrorClass;
    using gv::ErrorDomain;

    assert(ClassifyError(Error(ErrorDomain::Config, gv::errors::config::kInvalidPartSize, "x")) ==
           ErrorClass::kConfiguration);
    assert(ClassifyError(gv::AuthenticationFailureError("tag")) == ErrorClass::kIntegrity);
    assert(ClassifyError(Error(ErrorDomain::Crypto, gv::errors::crypto::kMalformedCiphertext, "x")) ==
           ErrorClass::kIntegrity);
    assert(ClassifyError(Error(ErrorDomain::State, gv::errors::state::kRetriesExhausted, "x")) ==
           ErrorClass::kExhaustion);
    assert(ClassifyError(Error(ErrorDomain::State, gv::errors::state::kInvalidTransition, "x")) ==
           ErrorClass::kInternal);
    assert(ClassifyError(Error(ErrorDomain::IO, gv::errors::io::kWriteFailed, "x", 16,
                               gv::Retryability::kTransient)) == ErrorClass::kTransient);
    assert(ClassifyError(Error(ErrorDomain::IO, gv::errors::io::kWriteFailed, "x")) == ErrorClass::kInternal);
  }

  void TestClassNames() {
    assert(gv::ErrorClassName(gv::ErrorClass::kConfiguration) == "configuration");
    assert(gv::ErrorClassName(gv::ErrorClass::kTransient) == "transient");
    assert(gv::ErrorClassName(gv::ErrorClass::kIntegrity) == "integrity");
    assert(gv::ErrorClassName(gv::ErrorClass::kExhaustion) == "exhaustion");
    assert(gv::ErrorClassName(gv::ErrorClass::kInternal) == "internal");
  }

  void TestBackendErrors() {
    const auto transient = gv::orchestrator::BackendError("throttled");
    assert(transient.domain == gv::ErrorDomain::Backend);
    assert(gv::orchestrator::IsRetryableBackendError(transient));

    const auto fatal = gv::orchestrator::BackendError("denied", gv::Retryability::kFatal);
    assert(!gv::orchestrator::IsRetryableBackendError(fatal));
    assert(!gv::orchestrator::IsRetryableBackendError(
        gv::Error(gv::ErrorDomain::IO, gv::errors::io::kReadFailed, "disk", std::nullopt,
                  gv::Retryability::kTransient)) &&
           "only backend errors are retried per chunk");
  }

  void TestChunkBoundaryErrorCarriesKind() {
    try {
      throw gv::ChunkBoundaryError(gv::ChunkBoundaryErrorKind::kSizeMismatch,
                                   gv::errors::validation::kSizeMismatch, "overshoot");
    } catch (const gv::Error& err) {
      assert(err.domain == gv::ErrorDomain::Validation);
      const auto* boundary = dynamic_cast<const gv::ChunkBoundaryError*>(&err);
      assert(boundary != nullptr && boundary->kind == gv::ChunkBoundaryErrorKind::kSizeMismatch);
      assert(std::string(err.what()) == "overshoot");
    }
  }

} // namespace errtest

int main() {
  errtest::TestClassification();
  errtest::TestClassNames();
  errtest::TestBackendErrors();
  errtest::TestChunkBoundaryErrorCarriesKind();
  std::cout << "error handling tests ok\n";
  return 0;
}
