#pragma once

#include "kernel_tls/network/transport_socket.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {

/**
 * A transport socket that forwards every call to a wrapped transport socket. Wrappers override
 * the calls they need to intercept.
 */
class PassthroughSocket : public Network::TransportSocket {
public:
  explicit PassthroughSocket(Network::TransportSocketPtr&& transport_socket);

  // Network::TransportSocket
  void setTransportSocketCallbacks(Network::TransportSocketCallbacks& callbacks) override;
  bool canFlushClose() override;
  void closeSocket(Network::ConnectionEvent event) override;
  Network::IoResult doRead(absl::Cord& buffer) override;
  Network::IoResult doWrite(absl::Cord& buffer, bool end_stream) override;
  void onConnected() override;

protected:
  Network::TransportSocketPtr transport_socket_;
};

} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
