#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/network/transport_socket.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/file_transfer.h"
#include "source/common/network/ktls/offload_activator.h"
#include "source/common/network/ktls/offload_state.h"
#include "source/common/network/ktls/transfer_request.h"
#include "source/extensions/transport_sockets/common/passthrough.h"
#include "source/extensions/transport_sockets/ktls/ktls_info.h"

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {
namespace Ktls {

/**
 * Wraps the software TLS transport socket and moves record protection into the kernel once the
 * handshake is done. Until a direction is offloaded, its I/O is delegated to the wrapped socket.
 */
class KtlsTransportSocket : public TransportSockets::PassthroughSocket,
                            public Logger::Loggable<Logger::Id::connection> {
public:
  KtlsTransportSocket(Network::TransportSocketPtr&& transport_socket,
                      const Network::Ktls::OffloadActivator& activator,
                      Network::Ktls::TransferMode transfer_mode);

  // Network::TransportSocket
  void setTransportSocketCallbacks(Network::TransportSocketCallbacks& callbacks) override;
  void closeSocket(Network::ConnectionEvent event) override;
  Network::IoResult doRead(absl::Cord& buffer) override;
  Network::IoResult doWrite(absl::Cord& buffer, bool end_stream) override;

  /**
   * Called by the handshake layer once the session is established. Offloads whatever the kernel
   * supports; directions it does not stay with the wrapped socket.
   * @return an error if the kernel refused a direction it was asked to take.
   */
  absl::Status onHandshakeComplete(const KtlsInfo& info);

  bool isTxOffloaded() const { return state_.isTxOffloaded(); }
  bool isRxOffloaded() const { return state_.isRxOffloaded(); }
  const Network::Ktls::OffloadState& offloadState() const { return state_; }

  /**
   * Copies received plaintext into a file. Suspends with Again when the socket has no data; the
   * caller passes the same request back to resume.
   * @param request supplies the destination and the byte limit; source_ is set to this socket.
   */
  Api::IoCallUint64Result writeToFile(Network::Ktls::TransferRequest& request);

  /**
   * Sends length bytes of file_fd starting at offset as application data. The kernel encrypts,
   * so this requires TX offload.
   * @param offset supplies the file position; advanced by the bytes sent.
   */
  Api::IoCallUint64Result sendFile(os_fd_t file_fd, off_t& offset, uint64_t length);

private:
  os_fd_t fd() const;
  Api::IoCallUint64Result readPlaintext(absl::Span<uint8_t> out);
  Api::IoCallUint64Result readDecrypted(absl::Span<uint8_t> out);
  Api::IoCallUint64Result sendCloseNotify();

  static constexpr size_t ReadBufferSize = 16384;
  static constexpr int MaxIovecs = 16;

  const Network::Ktls::OffloadActivator& activator_;
  const Network::Ktls::TransferMode transfer_mode_;
  Network::TransportSocketCallbacks* callbacks_{};
  Network::Ktls::OffloadState state_;
  bool close_notify_sent_{false};
  std::vector<uint8_t> read_buffer_;
  // Plaintext read through the wrapped socket that a file transfer has not consumed yet.
  absl::Cord pending_plaintext_;
  std::unique_ptr<Network::Ktls::FileTransfer> file_transfer_;
};

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
