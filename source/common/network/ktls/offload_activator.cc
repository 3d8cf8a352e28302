#include "source/common/network/ktls/offload_activator.h"

#include "source/common/network/ktls/cipher_suite_table.h"
#include "source/common/network/ktls/cipher_wire_encoder.h"
#include "source/common/network/ktls/ktls_status.h"

#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

bool OffloadActivator::familySupported(CipherFamily family) const {
  switch (family) {
  case CipherFamily::Aes128Gcm:
    return capabilities_.aes128GcmSupported();
  case CipherFamily::Aes256Gcm:
    return capabilities_.aes256GcmSupported();
  case CipherFamily::Chacha20Poly1305:
    return capabilities_.chacha20Poly1305Supported();
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

absl::Status OffloadActivator::activate(os_fd_t fd, OffloadState& state,
                                        const SessionKeys& keys) const {
  if (!capabilities_.offloadEnabled()) {
    return absl::OkStatus();
  }

  const CipherSuiteEntry* suite = CipherSuiteTable::find(keys.cipher_suite_id_);
  if (suite == nullptr) {
    KTLS_LOG(debug, "kTLS: cipher suite {:#06x} cannot be offloaded", keys.cipher_suite_id_);
    return absl::OkStatus();
  }
  if (suite->version_ != keys.version_) {
    return cipherSuiteMismatchError(absl::StrCat("kTLS: cipher suite ", suite->name_,
                                                 " negotiated with ",
                                                 tlsVersionName(keys.version_)));
  }

  const bool tls13 = keys.version_ == TlsVersion::Tls13;
  if (!familySupported(suite->family_) || (tls13 && !capabilities_.tls13TxSupported())) {
    KTLS_LOG(debug, "kTLS: {} not supported by this kernel", suite->name_);
    return absl::OkStatus();
  }
  if (!capabilities_.txSupported()) {
    return absl::OkStatus();
  }

  const CipherWireEncoder& encoder = CipherWireEncoder::forFamily(suite->family_);
  EnableOptions options;
  options.tx_zerocopy_ = policy_.tx_zerocopy_ && capabilities_.zeroCopySupported();
  options.rx_expect_no_pad_ = policy_.rx_expect_no_pad_ && capabilities_.noPadSupported();

  if (!state.isTxOffloaded()) {
    absl::Status status = encoder.enable(fd, keys.version_, Direction::Tx, state.ulpBound(),
                                         keys.out_key_, keys.out_iv_, keys.out_sequence_, options);
    if (!status.ok()) {
      KTLS_LOG(debug, "kTLS: TLS_TX error enabling: {}", status.ToString());
      return status;
    }
    state.markTxOffloaded();
  }

  // TLS 1.3 RX needs a newer kernel than TLS 1.3 TX.
  if (!capabilities_.rxSupported() || (tls13 && !capabilities_.tls13RxSupported())) {
    return absl::OkStatus();
  }

  if (!state.isRxOffloaded()) {
    absl::Status status = encoder.enable(fd, keys.version_, Direction::Rx, state.ulpBound(),
                                         keys.in_key_, keys.in_iv_, keys.in_sequence_, options);
    if (!status.ok()) {
      KTLS_LOG(debug, "kTLS: TLS_RX error enabling: {}", status.ToString());
      return status;
    }
    state.markRxOffloaded();
  }
  return absl::OkStatus();
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
