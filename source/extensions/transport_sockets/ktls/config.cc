#include "source/extensions/transport_sockets/ktls/config.h"

#include "kernel_tls/extensions/transport_sockets/ktls/v3/ktls.pb.h"

#include "source/common/common/logger.h"
#include "source/extensions/transport_sockets/ktls/ktls_transport_socket.h"

#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {
namespace Ktls {

using KtlsConfigProto = kernel_tls::extensions::transport_sockets::ktls::v3::KtlsTransportSocket;

KtlsTransportSocketFactory::KtlsTransportSocketFactory(
    Network::TransportSocketFactoryPtr&& inner_factory, const KtlsSocketConfig& config,
    const Network::Ktls::CapabilityMatrix& capabilities)
    : inner_factory_(std::move(inner_factory)), config_(config), capabilities_(capabilities),
      activator_(capabilities_, config_.policy_) {}

Network::TransportSocketPtr KtlsTransportSocketFactory::createTransportSocket() const {
  return std::make_unique<KtlsTransportSocket>(inner_factory_->createTransportSocket(), activator_,
                                               config_.transfer_mode_);
}

ProtobufTypes::MessagePtr KtlsTransportSocketConfigFactory::createEmptyConfigProto() const {
  return std::make_unique<KtlsConfigProto>();
}

absl::StatusOr<KtlsSocketConfig>
KtlsTransportSocketConfigFactory::resolveConfig(const Protobuf::Message& message) {
  const auto* config = dynamic_cast<const KtlsConfigProto*>(&message);
  if (config == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("kTLS: unexpected config type ", message.GetTypeName()));
  }

  KtlsSocketConfig resolved;
  resolved.probe_options_.enabled_ = PROTOBUF_GET_WRAPPED_OR_DEFAULT(*config, enabled, true);
  if (!config->module_path().empty()) {
    resolved.probe_options_.module_path_ = config->module_path();
  }
  resolved.policy_.tx_zerocopy_ =
      PROTOBUF_GET_WRAPPED_OR_DEFAULT(*config, enable_tx_zerocopy, true);
  resolved.policy_.rx_expect_no_pad_ = config->enable_rx_no_pad();

  switch (config->file_transfer_mode()) {
  case KtlsConfigProto::SPLICE:
    resolved.transfer_mode_ = Network::Ktls::TransferMode::Splice;
    break;
  case KtlsConfigProto::MAPPED:
    resolved.transfer_mode_ = Network::Ktls::TransferMode::Mapped;
    break;
  default:
    return absl::InvalidArgumentError(absl::StrCat("kTLS: unknown file_transfer_mode ",
                                                   static_cast<int>(config->file_transfer_mode())));
  }

  if (!config->log_level().empty()) {
    spdlog::level::level_enum level;
    if (!Logger::Registry::parseLogLevel(config->log_level(), level)) {
      return absl::InvalidArgumentError(
          absl::StrCat("kTLS: invalid log_level '", config->log_level(), "'"));
    }
    resolved.log_level_ = level;
  }
  return resolved;
}

absl::StatusOr<Network::TransportSocketFactoryPtr>
KtlsTransportSocketConfigFactory::createTransportSocketFactory(
    const Protobuf::Message& message, Network::TransportSocketFactoryPtr inner_factory) const {
  if (inner_factory == nullptr) {
    return absl::InvalidArgumentError("kTLS: a wrapped transport socket factory is required");
  }
  absl::StatusOr<KtlsSocketConfig> config = resolveConfig(message);
  if (!config.ok()) {
    return config.status();
  }
  if (config->log_level_.has_value()) {
    Logger::Registry::setLogLevel(*config->log_level_);
  }

  const Network::Ktls::CapabilityMatrix capabilities =
      Network::Ktls::CapabilityMatrix::probe(config->probe_options_);
  return std::make_unique<KtlsTransportSocketFactory>(std::move(inner_factory), *config,
                                                      capabilities);
}

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
