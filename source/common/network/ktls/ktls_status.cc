#include "source/common/network/ktls/ktls_status.h"

#include "source/common/common/assert.h"
#include "source/common/common/utility.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

namespace {

constexpr absl::string_view StatusCodePayloadUrl = "KernelTls.Ktls.StatusCode";
constexpr absl::string_view ErrnoPayloadUrl = "KernelTls.Ktls.Errno";

absl::Status withCode(absl::Status status, KtlsStatusCode code) {
  status.SetPayload(StatusCodePayloadUrl, absl::Cord(absl::StrCat(static_cast<int>(code))));
  return status;
}

absl::Status lengthError(KtlsStatusCode code, absl::string_view what, size_t expected,
                         size_t actual) {
  return withCode(absl::InvalidArgumentError(absl::StrCat("kTLS: wrong ", what,
                                                          " length, desired: ", expected,
                                                          ", actual: ", actual)),
                  code);
}

absl::Status systemError(KtlsStatusCode code, absl::string_view message, int sys_errno) {
  absl::Status status = withCode(
      absl::ErrnoToStatus(sys_errno, absl::StrCat(message, ": ", errorDetails(sys_errno))), code);
  status.SetPayload(ErrnoPayloadUrl, absl::Cord(absl::StrCat(sys_errno)));
  return status;
}

} // namespace

std::string toString(KtlsStatusCode code) {
  switch (code) {
  case KtlsStatusCode::Ok:
    return "Ok";
  case KtlsStatusCode::InvalidKeyLength:
    return "InvalidKeyLength";
  case KtlsStatusCode::InvalidIvLength:
    return "InvalidIvLength";
  case KtlsStatusCode::InvalidSequenceLength:
    return "InvalidSequenceLength";
  case KtlsStatusCode::WireSizeMismatch:
    return "WireSizeMismatch";
  case KtlsStatusCode::UlpBindFailed:
    return "UlpBindFailed";
  case KtlsStatusCode::KernelRejected:
    return "KernelRejected";
  case KtlsStatusCode::CipherSuiteMismatch:
    return "CipherSuiteMismatch";
  }
  return "";
}

absl::Status invalidKeyLengthError(size_t expected, size_t actual) {
  return lengthError(KtlsStatusCode::InvalidKeyLength, "key", expected, actual);
}

absl::Status invalidIvLengthError(size_t expected, size_t actual) {
  return lengthError(KtlsStatusCode::InvalidIvLength, "iv", expected, actual);
}

absl::Status invalidSequenceLengthError(size_t expected, size_t actual) {
  return lengthError(KtlsStatusCode::InvalidSequenceLength, "seq", expected, actual);
}

absl::Status wireSizeMismatchError(size_t expected, size_t actual) {
  return lengthError(KtlsStatusCode::WireSizeMismatch, "cryptoInfo", expected, actual);
}

absl::Status ulpBindFailedError(int sys_errno) {
  return systemError(KtlsStatusCode::UlpBindFailed, "kTLS: failed to attach tls ULP", sys_errno);
}

absl::Status kernelRejectedError(absl::string_view direction, int sys_errno) {
  return systemError(KtlsStatusCode::KernelRejected,
                     absl::StrCat("kTLS: setsockopt(SOL_TLS, ", direction, ") failed"),
                     sys_errno);
}

absl::Status cipherSuiteMismatchError(absl::string_view message) {
  return withCode(absl::InvalidArgumentError(message), KtlsStatusCode::CipherSuiteMismatch);
}

KtlsStatusCode getStatusCode(const absl::Status& status) {
  if (status.ok()) {
    return KtlsStatusCode::Ok;
  }
  const absl::optional<absl::Cord> payload = status.GetPayload(StatusCodePayloadUrl);
  RELEASE_ASSERT(payload.has_value(), "status was not produced by the kTLS status helpers");
  int code = 0;
  RELEASE_ASSERT(absl::SimpleAtoi(std::string(*payload), &code), "malformed kTLS status payload");
  return static_cast<KtlsStatusCode>(code);
}

int ktlsErrno(const absl::Status& status) {
  const absl::optional<absl::Cord> payload = status.GetPayload(ErrnoPayloadUrl);
  int sys_errno = 0;
  if (!payload.has_value() || !absl::SimpleAtoi(std::string(*payload), &sys_errno)) {
    return 0;
  }
  return sys_errno;
}

bool isValidationError(const absl::Status& status) {
  switch (getStatusCode(status)) {
  case KtlsStatusCode::InvalidKeyLength:
  case KtlsStatusCode::InvalidIvLength:
  case KtlsStatusCode::InvalidSequenceLength:
  case KtlsStatusCode::WireSizeMismatch:
  case KtlsStatusCode::CipherSuiteMismatch:
    return true;
  default:
    return false;
  }
}

bool isKernelRejectedError(const absl::Status& status) {
  return getStatusCode(status) == KtlsStatusCode::KernelRejected;
}

bool isUlpBindFailedError(const absl::Status& status) {
  return getStatusCode(status) == KtlsStatusCode::UlpBindFailed;
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
