#pragma once

#include <memory>

#include "kernel_tls/common/pure.h"

#include "source/common/network/ktls/offload_activator.h"

#include "absl/types/optional.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {
namespace Ktls {

/**
 * What the TLS handshake layer exposes so a session can be handed to the kernel.
 */
class KtlsInfo {
public:
  virtual ~KtlsInfo() = default;

  /**
   * @return the negotiated keys, IVs and next record sequence numbers, or nullopt if the
   *         session cannot be exported (e.g. a protocol version the kernel does not handle).
   */
  virtual absl::optional<Network::Ktls::SessionKeys> sessionKeys() const PURE;

  /**
   * @return true if the software record layer holds no buffered plaintext or unsent records.
   *         Handing over a session with buffered records would lose them.
   */
  virtual bool recordLayerIdle() const PURE;
};

using KtlsInfoConstSharedPtr = std::shared_ptr<const KtlsInfo>;

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
