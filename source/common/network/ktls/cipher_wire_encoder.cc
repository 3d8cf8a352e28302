#include "source/common/network/ktls/cipher_wire_encoder.h"

#include <linux/tls.h>
#include <netinet/tcp.h>

#include <cstring>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/assert.h"
#include "source/common/common/macros.h"
#include "source/common/common/utility.h"
#include "source/common/network/ktls/ktls_status.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

namespace {

constexpr char TlsUlpName[] = "tls";

} // namespace

const CipherWireEncoder& CipherWireEncoder::aes128Gcm() {
  CONSTRUCT_ON_FIRST_USE(CipherWireEncoder, Aes128GcmProfile);
}

const CipherWireEncoder& CipherWireEncoder::aes256Gcm() {
  CONSTRUCT_ON_FIRST_USE(CipherWireEncoder, Aes256GcmProfile);
}

const CipherWireEncoder& CipherWireEncoder::chacha20Poly1305() {
  CONSTRUCT_ON_FIRST_USE(CipherWireEncoder, Chacha20Poly1305Profile);
}

const CipherWireEncoder& CipherWireEncoder::forFamily(CipherFamily family) {
  switch (family) {
  case CipherFamily::Aes128Gcm:
    return aes128Gcm();
  case CipherFamily::Aes256Gcm:
    return aes256Gcm();
  case CipherFamily::Chacha20Poly1305:
    return chacha20Poly1305();
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

absl::Status CipherWireEncoder::validate(TlsVersion version, absl::Span<const uint8_t> key,
                                         absl::Span<const uint8_t> iv,
                                         absl::Span<const uint8_t> sequence) const {
  if (key.size() != profile_.key_size_) {
    return invalidKeyLengthError(profile_.key_size_, key.size());
  }
  const size_t iv_size = profile_.ivInputSize(version);
  if (iv.size() != iv_size) {
    return invalidIvLengthError(iv_size, iv.size());
  }
  if (sequence.size() != profile_.rec_seq_size_) {
    return invalidSequenceLengthError(profile_.rec_seq_size_, sequence.size());
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<uint8_t>>
CipherWireEncoder::encode(TlsVersion version, absl::Span<const uint8_t> key,
                          absl::Span<const uint8_t> iv, absl::Span<const uint8_t> sequence) const {
  absl::Status status = validate(version, key, iv, sequence);
  if (!status.ok()) {
    return status;
  }

  std::vector<uint8_t> blob(profile_.wireSize(), 0);
  absl::Span<uint8_t> out(blob);

  // struct tls_crypto_info: both fields are host order __u16.
  const uint16_t header[2] = {static_cast<uint16_t>(version), profile_.cipher_type_};
  std::memcpy(blob.data(), header, sizeof(header));
  size_t offset = CipherProfile::HeaderSize;

  const absl::Span<const uint8_t> salt = iv.subspan(0, profile_.salt_size_);
  const absl::Span<const uint8_t> wire_iv = iv.subspan(profile_.salt_size_);
  ByteUtil::writeBytes(out, offset, wire_iv);
  offset += profile_.iv_size_;
  offset = ByteUtil::writeBytes(out, offset, key);
  offset = ByteUtil::writeBytes(out, offset, salt);
  offset = ByteUtil::writeBytes(out, offset, sequence);

  if (offset != profile_.wireSize()) {
    return wireSizeMismatchError(profile_.wireSize(), offset);
  }
  return blob;
}

absl::Status CipherWireEncoder::enable(os_fd_t fd, TlsVersion version, Direction direction,
                                       bool ulp_already_bound, absl::Span<const uint8_t> key,
                                       absl::Span<const uint8_t> iv,
                                       absl::Span<const uint8_t> sequence,
                                       const EnableOptions& options) const {
  absl::StatusOr<std::vector<uint8_t>> blob = encode(version, key, iv, sequence);
  if (!blob.ok()) {
    KTLS_LOG(debug, "kTLS: {} {} rejected: {}", cipherFamilyName(profile_.family_),
             directionName(direction), blob.status().message());
    return blob.status();
  }

  if (!ulp_already_bound) {
    absl::Status status = bindUlp(fd);
    if (!status.ok()) {
      return status;
    }
  }

  const int optname = direction == Direction::Tx ? TLS_TX : TLS_RX;
  const Api::SysCallIntResult result = Api::OsSysCallsSingleton::get().setsockopt(
      fd, SOL_TLS, optname, blob->data(), static_cast<socklen_t>(blob->size()));
  if (result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: setsockopt(SOL_TLS, {}) for {} {} failed: {}",
             directionName(direction), cipherFamilyName(profile_.family_),
             tlsVersionName(version), errorDetails(result.errno_));
    return kernelRejectedError(directionName(direction), result.errno_);
  }
  KTLS_LOG(debug, "kTLS: {} enabled with {} {}", directionName(direction),
           cipherFamilyName(profile_.family_), tlsVersionName(version));

  if (direction == Direction::Tx && options.tx_zerocopy_) {
    enableTxZerocopy(fd);
  }
  if (direction == Direction::Rx && version == TlsVersion::Tls13 && options.rx_expect_no_pad_) {
    enableRxExpectNoPad(fd);
  }
  return absl::OkStatus();
}

absl::Status CipherWireEncoder::bindUlp(os_fd_t fd) {
  const Api::SysCallIntResult result = Api::OsSysCallsSingleton::get().setsockopt(
      fd, SOL_TCP, TCP_ULP, TlsUlpName, sizeof(TlsUlpName) - 1);
  if (result.return_value_ != 0) {
    if (result.errno_ == EEXIST) {
      KTLS_LOG(debug, "kTLS: tls ULP already attached to fd {}", fd);
      return absl::OkStatus();
    }
    KTLS_LOG(debug, "kTLS: failed to attach tls ULP to fd {}: {}", fd,
             errorDetails(result.errno_));
    return ulpBindFailedError(result.errno_);
  }
  return absl::OkStatus();
}

void CipherWireEncoder::enableTxZerocopy(os_fd_t fd) const {
  const int value = 1;
  const Api::SysCallIntResult result = Api::OsSysCallsSingleton::get().setsockopt(
      fd, SOL_TLS, TLS_TX_ZEROCOPY_RO, &value, sizeof(value));
  if (result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: TLS_TX_ZEROCOPY_RO not enabled: {}", errorDetails(result.errno_));
    return;
  }
  KTLS_LOG(debug, "kTLS: TLS_TX_ZEROCOPY_RO enabled");
}

void CipherWireEncoder::enableRxExpectNoPad(os_fd_t fd) const {
  const int value = 1;
  const Api::SysCallIntResult result = Api::OsSysCallsSingleton::get().setsockopt(
      fd, SOL_TLS, TLS_RX_EXPECT_NO_PAD, &value, sizeof(value));
  if (result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: TLS_RX_EXPECT_NO_PAD not enabled: {}", errorDetails(result.errno_));
    return;
  }
  KTLS_LOG(debug, "kTLS: TLS_RX_EXPECT_NO_PAD enabled");
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
