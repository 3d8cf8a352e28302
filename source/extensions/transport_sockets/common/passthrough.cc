#include "source/extensions/transport_sockets/common/passthrough.h"

#include "source/common/common/assert.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {

PassthroughSocket::PassthroughSocket(Network::TransportSocketPtr&& transport_socket)
    : transport_socket_(std::move(transport_socket)) {
  RELEASE_ASSERT(transport_socket_ != nullptr, "wrapped transport socket must be set");
}

void PassthroughSocket::setTransportSocketCallbacks(Network::TransportSocketCallbacks& callbacks) {
  transport_socket_->setTransportSocketCallbacks(callbacks);
}

bool PassthroughSocket::canFlushClose() { return transport_socket_->canFlushClose(); }

void PassthroughSocket::closeSocket(Network::ConnectionEvent event) {
  transport_socket_->closeSocket(event);
}

Network::IoResult PassthroughSocket::doRead(absl::Cord& buffer) {
  return transport_socket_->doRead(buffer);
}

Network::IoResult PassthroughSocket::doWrite(absl::Cord& buffer, bool end_stream) {
  return transport_socket_->doWrite(buffer, end_stream);
}

void PassthroughSocket::onConnected() { transport_socket_->onConnected(); }

} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
