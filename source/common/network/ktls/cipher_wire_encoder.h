#pragma once

#include <cstdint>
#include <vector>

#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/cipher_profile.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Optional kernel features requested once a direction is configured. Both are best effort: a
 * kernel refusing them never fails the activation.
 */
struct EnableOptions {
  // setsockopt(SOL_TLS, TLS_TX_ZEROCOPY_RO) after TX is configured.
  bool tx_zerocopy_{false};
  // setsockopt(SOL_TLS, TLS_RX_EXPECT_NO_PAD) after a TLS 1.3 RX is configured. Only safe
  // with trusted peers: a padding peer doubles the decryption work.
  bool rx_expect_no_pad_{false};
};

/**
 * Turns session key material into the kernel crypto_info blob of one cipher family and installs
 * it on a socket.
 */
class CipherWireEncoder : public Logger::Loggable<Logger::Id::ktls> {
public:
  explicit CipherWireEncoder(const CipherProfile& profile) : profile_(profile) {}

  static const CipherWireEncoder& aes128Gcm();
  static const CipherWireEncoder& aes256Gcm();
  static const CipherWireEncoder& chacha20Poly1305();
  static const CipherWireEncoder& forFamily(CipherFamily family);

  const CipherProfile& profile() const { return profile_; }

  /**
   * Checks key, iv and sequence lengths against the profile.
   * @return InvalidKeyLength, InvalidIvLength or InvalidSequenceLength on mismatch.
   */
  absl::Status validate(TlsVersion version, absl::Span<const uint8_t> key,
                        absl::Span<const uint8_t> iv, absl::Span<const uint8_t> sequence) const;

  /**
   * Builds the crypto_info blob. The salt is the iv prefix, the wire iv is whatever follows it
   * (nothing for TLS 1.2 AES-GCM, in which case the field stays zero).
   * @return the blob, or a validation or WireSizeMismatch error.
   */
  absl::StatusOr<std::vector<uint8_t>> encode(TlsVersion version, absl::Span<const uint8_t> key,
                                              absl::Span<const uint8_t> iv,
                                              absl::Span<const uint8_t> sequence) const;

  /**
   * Validates and encodes the key material, attaches the "tls" ULP unless ulp_already_bound, and
   * configures the direction. No system call is made when validation fails.
   * @return OK, a validation error, UlpBindFailed or KernelRejected.
   */
  absl::Status enable(os_fd_t fd, TlsVersion version, Direction direction, bool ulp_already_bound,
                      absl::Span<const uint8_t> key, absl::Span<const uint8_t> iv,
                      absl::Span<const uint8_t> sequence, const EnableOptions& options) const;

  /**
   * Attaches the "tls" upper layer protocol to a TCP socket. A socket that already carries it
   * (EEXIST) counts as success.
   */
  static absl::Status bindUlp(os_fd_t fd);

private:
  void enableTxZerocopy(os_fd_t fd) const;
  void enableRxExpectNoPad(os_fd_t fd) const;

  const CipherProfile& profile_;
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
