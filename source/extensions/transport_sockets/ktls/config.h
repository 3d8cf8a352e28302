#pragma once

#include <string>

#include "kernel_tls/network/transport_socket.h"

#include "source/common/network/ktls/capability_matrix.h"
#include "source/common/network/ktls/file_transfer.h"
#include "source/common/network/ktls/offload_activator.h"
#include "source/common/protobuf/protobuf.h"

#include "absl/status/statusor.h"
#include "absl/types/optional.h"
#include "spdlog/spdlog.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {
namespace Ktls {

/**
 * The kTLS transport socket configuration with defaults applied.
 */
struct KtlsSocketConfig {
  Network::Ktls::ProbeOptions probe_options_;
  Network::Ktls::ActivationPolicy policy_;
  Network::Ktls::TransferMode transfer_mode_{Network::Ktls::TransferMode::Splice};
  absl::optional<spdlog::level::level_enum> log_level_;
};

/**
 * Wraps the factory of the software TLS socket. Kernel capabilities are probed once, when the
 * factory is built, and shared by every socket it creates.
 */
class KtlsTransportSocketFactory : public Network::TransportSocketFactory {
public:
  KtlsTransportSocketFactory(Network::TransportSocketFactoryPtr&& inner_factory,
                             const KtlsSocketConfig& config,
                             const Network::Ktls::CapabilityMatrix& capabilities);

  // Network::TransportSocketFactory
  Network::TransportSocketPtr createTransportSocket() const override;

  const Network::Ktls::CapabilityMatrix& capabilities() const { return capabilities_; }
  const KtlsSocketConfig& config() const { return config_; }

private:
  Network::TransportSocketFactoryPtr inner_factory_;
  const KtlsSocketConfig config_;
  const Network::Ktls::CapabilityMatrix capabilities_;
  const Network::Ktls::OffloadActivator activator_;
};

/**
 * Config registration for the kTLS transport socket.
 */
class KtlsTransportSocketConfigFactory {
public:
  std::string name() const { return "kernel_tls.transport_sockets.ktls"; }

  /**
   * @return ProtobufTypes::MessagePtr create empty config proto.
   */
  ProtobufTypes::MessagePtr createEmptyConfigProto() const;

  /**
   * Checks the configuration and applies defaults.
   * @return the resolved configuration or InvalidArgument.
   */
  static absl::StatusOr<KtlsSocketConfig> resolveConfig(const Protobuf::Message& message);

  /**
   * Builds a factory that wraps inner_factory, probing the running kernel.
   */
  absl::StatusOr<Network::TransportSocketFactoryPtr>
  createTransportSocketFactory(const Protobuf::Message& message,
                               Network::TransportSocketFactoryPtr inner_factory) const;
};

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
