#pragma once

#include <cstdint>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/transfer_request.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Moves bytes from a socket to a file without copying them through user space, using a pipe as
 * the in-kernel hop: socket -> pipe -> file. One bridge serves one transfer; the pipe is closed
 * when the bridge is destroyed.
 */
class SpliceBridge : public Logger::Loggable<Logger::Id::ktls> {
public:
  SpliceBridge();
  ~SpliceBridge();

  SpliceBridge(const SpliceBridge&) = delete;
  SpliceBridge& operator=(const SpliceBridge&) = delete;

  /**
   * @return true if the pipe was created.
   */
  bool initialized() const { return pipe_fds_[0] != INVALID_SOCKET; }

  /**
   * Runs the transfer until the request is done, the socket would block, or an error occurs.
   * Every chunk taken from the socket is written to the file completely before the next chunk is
   * read; short file writes are re-issued for the rest of the chunk.
   * @param request supplies the transfer; its counters carry the progress across calls.
   * @return the bytes written to the file by this call. Again means re-invoke on readiness; any
   *         other error aborts the transfer.
   */
  Api::IoCallUint64Result pump(TransferRequest& request);

  /**
   * @return bytes taken from the socket that have not reached the file yet.
   */
  uint64_t bytesInPipe() const { return bytes_in_pipe_; }

private:
  static constexpr int PipeSize = 1024 * 1024;

  // Moves everything parked in the pipe to the destination.
  Api::IoCallUint64Result drainPipe(TransferRequest& request);

  os_fd_t pipe_fds_[2]{INVALID_SOCKET, INVALID_SOCKET};
  int pipe_errno_{0};
  uint64_t bytes_in_pipe_{0};
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
