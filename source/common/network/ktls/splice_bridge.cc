#include "source/common/network/ktls/splice_bridge.h"

#include <fcntl.h>

#include <algorithm>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/utility.h"
#include "source/common/network/io_socket_error_impl.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

SpliceBridge::SpliceBridge() {
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  os_fd_t fds[2];
  const Api::SysCallIntResult result = os_sys_calls.pipe2(fds, O_CLOEXEC | O_NONBLOCK);
  if (result.return_value_ != 0) {
    pipe_errno_ = result.errno_;
    KTLS_LOG(error, "Failed to create pipe for kTLS splicing: {}", errorDetails(pipe_errno_));
    return;
  }
  pipe_fds_[0] = fds[0];
  pipe_fds_[1] = fds[1];

  // A larger pipe means fewer round trips per chunk. Not fatal if refused.
  const Api::SysCallIntResult size_result =
      os_sys_calls.fcntl(pipe_fds_[1], F_SETPIPE_SZ, PipeSize);
  if (size_result.return_value_ < 0) {
    KTLS_LOG(debug, "Failed to set pipe size for kTLS splicing: {}",
             errorDetails(size_result.errno_));
  }
}

SpliceBridge::~SpliceBridge() {
  if (!initialized()) {
    return;
  }
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  for (os_fd_t& fd : pipe_fds_) {
    const Api::SysCallIntResult result = os_sys_calls.close(fd);
    if (result.return_value_ != 0) {
      KTLS_LOG(debug, "Failed to close splice pipe: {}", errorDetails(result.errno_));
    }
    fd = INVALID_SOCKET;
  }
  if (bytes_in_pipe_ > 0) {
    KTLS_LOG(debug, "kTLS splice bridge closed with {} bytes undelivered", bytes_in_pipe_);
  }
}

Api::IoCallUint64Result SpliceBridge::pump(TransferRequest& request) {
  if (!initialized()) {
    return {0, IoSocketError::create(pipe_errno_)};
  }

  uint64_t written = 0;
  if (bytes_in_pipe_ > 0) {
    Api::IoCallUint64Result drained = drainPipe(request);
    written += drained.return_value_;
    if (!drained.ok()) {
      return {written, std::move(drained.err_)};
    }
  }

  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  while (request.remaining_ > 0) {
    const size_t chunk = static_cast<size_t>(std::min(MaxTransferChunkSize, request.remaining_));
    // SPLICE_F_NONBLOCK must not be used on the socket side: kTLS does not advance the socket
    // buffer with it. The socket's own O_NONBLOCK still yields EAGAIN.
    const Api::SysCallSizeResult in = os_sys_calls.splice(request.source_, nullptr, pipe_fds_[1],
                                                          nullptr, chunk, SPLICE_F_MORE);
    if (in.return_value_ < 0) {
      if (in.errno_ == EAGAIN) {
        return {written, IoSocketError::getIoSocketEagainError()};
      }
      KTLS_LOG(debug, "kTLS: splice from socket failed: {}", errorDetails(in.errno_));
      return {written, IoSocketError::create(in.errno_)};
    }
    if (in.return_value_ == 0) {
      request.source_closed_ = true;
      break;
    }

    bytes_in_pipe_ = static_cast<uint64_t>(in.return_value_);
    if (request.limited()) {
      request.remaining_ -= bytes_in_pipe_;
    }

    Api::IoCallUint64Result drained = drainPipe(request);
    written += drained.return_value_;
    if (!drained.ok()) {
      return {written, std::move(drained.err_)};
    }
  }
  return {written, Api::IoError::none()};
}

Api::IoCallUint64Result SpliceBridge::drainPipe(TransferRequest& request) {
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  uint64_t written = 0;
  while (bytes_in_pipe_ > 0) {
    const Api::SysCallSizeResult out =
        os_sys_calls.splice(pipe_fds_[0], nullptr, request.destination_, nullptr,
                            static_cast<size_t>(bytes_in_pipe_),
                            SPLICE_F_MOVE | SPLICE_F_MORE | SPLICE_F_NONBLOCK);
    if (out.return_value_ < 0) {
      if (out.errno_ == EAGAIN) {
        return {written, IoSocketError::getIoSocketEagainError()};
      }
      KTLS_LOG(error, "Failed to splice from pipe to destination: {}", errorDetails(out.errno_));
      return {written, IoSocketError::create(out.errno_)};
    }
    if (out.return_value_ == 0) {
      KTLS_LOG(error, "Destination accepted no bytes with {} pending in pipe", bytes_in_pipe_);
      return {written, IoSocketError::create(EIO)};
    }
    const uint64_t moved = static_cast<uint64_t>(out.return_value_);
    bytes_in_pipe_ -= moved;
    request.transferred_ += moved;
    written += moved;
  }
  return {written, Api::IoError::none()};
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
