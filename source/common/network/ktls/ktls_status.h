#pragma once

#include <cstddef>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

/**
 * Status codes for kernel TLS offload. They ride on absl::Status as a payload so the canonical
 * absl code still describes the error category (InvalidArgument for bad key material, the errno
 * mapping for kernel rejections) while callers can branch on the exact offload failure.
 */

namespace KernelTls {
namespace Network {
namespace Ktls {

enum class KtlsStatusCode : int {
  Ok = 0,
  // Key material length does not match the cipher profile.
  InvalidKeyLength = 1,
  // IV length does not match the cipher profile and protocol version.
  InvalidIvLength = 2,
  // Record sequence length is not 8 bytes.
  InvalidSequenceLength = 3,
  // The encoded crypto info blob does not have the size the kernel expects.
  WireSizeMismatch = 4,
  // Attaching the "tls" upper layer protocol to the socket failed.
  UlpBindFailed = 5,
  // setsockopt(SOL_TLS, TLS_TX/TLS_RX) failed.
  KernelRejected = 6,
  // The negotiated cipher suite belongs to another protocol version.
  CipherSuiteMismatch = 7,
};

std::string toString(KtlsStatusCode code);

/**
 * Constructing functions for the offload errors.
 */
absl::Status invalidKeyLengthError(size_t expected, size_t actual);
absl::Status invalidIvLengthError(size_t expected, size_t actual);
absl::Status invalidSequenceLengthError(size_t expected, size_t actual);
absl::Status wireSizeMismatchError(size_t expected, size_t actual);
absl::Status ulpBindFailedError(int sys_errno);
absl::Status kernelRejectedError(absl::string_view direction, int sys_errno);
absl::Status cipherSuiteMismatchError(absl::string_view message);

/**
 * Returns the offload status code of `status`, or KtlsStatusCode::Ok for an OK status.
 * This function MUST NOT be called with a status that was not produced by the
 * functions above.
 */
KtlsStatusCode getStatusCode(const absl::Status& status);

/**
 * @return the errno carried by a UlpBindFailed or KernelRejected status, 0 otherwise.
 */
int ktlsErrno(const absl::Status& status);

/**
 * Helper functions that check the offload status code of a status.
 */
bool isValidationError(const absl::Status& status);
bool isKernelRejectedError(const absl::Status& status);
bool isUlpBindFailedError(const absl::Status& status);

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
