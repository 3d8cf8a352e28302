#pragma once

#include <cstdint>
#include <vector>

#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/capability_matrix.h"
#include "source/common/network/ktls/cipher_profile.h"
#include "source/common/network/ktls/offload_state.h"

#include "absl/status/status.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Handshake outputs needed to hand a session to the kernel. "in" is what the peer sends us
 * (RX), "out" is what we send (TX). Sequences are the 8 byte big endian record sequence numbers
 * of the next record in each direction.
 */
struct SessionKeys {
  uint16_t cipher_suite_id_{0};
  TlsVersion version_{TlsVersion::Tls12};
  std::vector<uint8_t> in_key_;
  std::vector<uint8_t> out_key_;
  std::vector<uint8_t> in_iv_;
  std::vector<uint8_t> out_iv_;
  std::vector<uint8_t> in_sequence_;
  std::vector<uint8_t> out_sequence_;
};

/**
 * Operator choices layered on top of what the kernel supports.
 */
struct ActivationPolicy {
  bool tx_zerocopy_{true};
  bool rx_expect_no_pad_{false};
};

/**
 * Hands an established session to the kernel, one direction at a time.
 */
class OffloadActivator : public Logger::Loggable<Logger::Id::ktls> {
public:
  OffloadActivator(const CapabilityMatrix& capabilities, const ActivationPolicy& policy)
      : capabilities_(capabilities), policy_(policy) {}

  /**
   * Offloads TX and then RX of a connection when the kernel supports the negotiated suite.
   * Anything the kernel cannot take (disabled policy, unknown suite, missing capability) is left
   * to the software record layer and reported as OK. A direction that is attempted and fails is
   * reported as an error, and the direction stays in software.
   * @param fd supplies the connected TCP socket.
   * @param state supplies the connection's offload markers; updated per offloaded direction.
   * @param keys supplies the handshake outputs.
   */
  absl::Status activate(os_fd_t fd, OffloadState& state, const SessionKeys& keys) const;

  /**
   * @return true if the kernel can run the given cipher family at all.
   */
  bool familySupported(CipherFamily family) const;

  const CapabilityMatrix& capabilities() const { return capabilities_; }

private:
  const CapabilityMatrix& capabilities_;
  const ActivationPolicy policy_;
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
