#pragma once

#include "kernel_tls/network/transport_socket.h"

#include "source/extensions/transport_sockets/ktls/ktls_info.h"

#include "gmock/gmock.h"

namespace KernelTls {
namespace Network {

class MockTransportSocketCallbacks : public TransportSocketCallbacks {
public:
  MockTransportSocketCallbacks();
  ~MockTransportSocketCallbacks() override;

  MOCK_METHOD(os_fd_t, fd, (), (const));
  MOCK_METHOD(void, raiseEvent, (ConnectionEvent event));
};

class MockTransportSocket : public TransportSocket {
public:
  MockTransportSocket();
  ~MockTransportSocket() override;

  MOCK_METHOD(void, setTransportSocketCallbacks, (TransportSocketCallbacks & callbacks));
  MOCK_METHOD(bool, canFlushClose, ());
  MOCK_METHOD(void, closeSocket, (ConnectionEvent event));
  MOCK_METHOD(IoResult, doRead, (absl::Cord & buffer));
  MOCK_METHOD(IoResult, doWrite, (absl::Cord & buffer, bool end_stream));
  MOCK_METHOD(void, onConnected, ());
};

class MockTransportSocketFactory : public TransportSocketFactory {
public:
  MockTransportSocketFactory();
  ~MockTransportSocketFactory() override;

  MOCK_METHOD(TransportSocketPtr, createTransportSocket, (), (const));
};

} // namespace Network

namespace Extensions {
namespace TransportSockets {
namespace Ktls {

class MockKtlsInfo : public KtlsInfo {
public:
  MockKtlsInfo();
  ~MockKtlsInfo() override;

  MOCK_METHOD(absl::optional<Network::Ktls::SessionKeys>, sessionKeys, (), (const));
  MOCK_METHOD(bool, recordLayerIdle, (), (const));
};

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
