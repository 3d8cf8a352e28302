#pragma once

#include "source/common/common/assert.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Who protects the records of one direction of a connection.
 */
enum class DirectionMode {
  // The user space record layer encrypts or decrypts.
  SoftwareCipher,
  // The kernel does; user space reads and writes plaintext on the socket.
  Offloaded,
};

/**
 * Per connection offload markers. Each direction moves from SoftwareCipher to Offloaded at most
 * once and never goes back.
 */
class OffloadState {
public:
  DirectionMode txMode() const { return tx_mode_; }
  DirectionMode rxMode() const { return rx_mode_; }
  bool isTxOffloaded() const { return tx_mode_ == DirectionMode::Offloaded; }
  bool isRxOffloaded() const { return rx_mode_ == DirectionMode::Offloaded; }

  /**
   * @return true once the "tls" ULP has been attached to the socket.
   */
  bool ulpBound() const { return ulp_bound_; }

  void markTxOffloaded() {
    ASSERT(tx_mode_ == DirectionMode::SoftwareCipher);
    tx_mode_ = DirectionMode::Offloaded;
    ulp_bound_ = true;
  }

  void markRxOffloaded() {
    ASSERT(rx_mode_ == DirectionMode::SoftwareCipher);
    rx_mode_ = DirectionMode::Offloaded;
    ulp_bound_ = true;
  }

private:
  DirectionMode tx_mode_{DirectionMode::SoftwareCipher};
  DirectionMode rx_mode_{DirectionMode::SoftwareCipher};
  bool ulp_bound_{false};
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
