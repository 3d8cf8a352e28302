#include "source/extensions/transport_sockets/ktls/ktls_transport_socket.h"

#include <sys/socket.h>
#include <sys/uio.h>

#include <algorithm>
#include <cstring>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/assert.h"
#include "source/common/common/utility.h"
#include "source/common/network/io_socket_error_impl.h"
#include "source/common/network/ktls/record_io.h"

namespace KernelTls {
namespace Extensions {
namespace TransportSockets {
namespace Ktls {

using Network::Ktls::RecordIo;

KtlsTransportSocket::KtlsTransportSocket(Network::TransportSocketPtr&& transport_socket,
                                         const Network::Ktls::OffloadActivator& activator,
                                         Network::Ktls::TransferMode transfer_mode)
    : PassthroughSocket(std::move(transport_socket)), activator_(activator),
      transfer_mode_(transfer_mode) {}

void KtlsTransportSocket::setTransportSocketCallbacks(
    Network::TransportSocketCallbacks& callbacks) {
  callbacks_ = &callbacks;
  PassthroughSocket::setTransportSocketCallbacks(callbacks);
}

os_fd_t KtlsTransportSocket::fd() const {
  ASSERT(callbacks_ != nullptr);
  return callbacks_->fd();
}

absl::Status KtlsTransportSocket::onHandshakeComplete(const KtlsInfo& info) {
  if (!info.recordLayerIdle()) {
    KTLS_CONN_LOG(debug, "kTLS: record layer has buffered data, staying in software", fd());
    return absl::OkStatus();
  }
  const absl::optional<Network::Ktls::SessionKeys> keys = info.sessionKeys();
  if (!keys.has_value()) {
    KTLS_CONN_LOG(debug, "kTLS: session keys not exportable, staying in software", fd());
    return absl::OkStatus();
  }

  const absl::Status status = activator_.activate(fd(), state_, *keys);
  KTLS_CONN_LOG(debug, "kTLS: tx offloaded={} rx offloaded={}", fd(), state_.isTxOffloaded(),
                state_.isRxOffloaded());
  if (!status.ok()) {
    KTLS_CONN_LOG(warn, "kTLS: offload failed: {}", fd(), status.ToString());
  }
  return status;
}

Network::IoResult KtlsTransportSocket::doRead(absl::Cord& buffer) {
  if (!state_.isRxOffloaded()) {
    return transport_socket_->doRead(buffer);
  }

  read_buffer_.resize(ReadBufferSize);
  Network::PostIoAction action = Network::PostIoAction::KeepOpen;
  absl::optional<Api::IoError::IoErrorCode> err_code;
  uint64_t bytes_read = 0;
  bool end_stream = false;

  if (!pending_plaintext_.empty()) {
    bytes_read += pending_plaintext_.size();
    buffer.Append(std::move(pending_plaintext_));
    pending_plaintext_.Clear();
  }

  while (true) {
    Api::IoCallUint64Result result = RecordIo::readDataRecord(
        fd(), absl::Span<uint8_t>(read_buffer_.data(), read_buffer_.size()));
    if (!result.ok()) {
      if (result.wouldBlock()) {
        break;
      }
      KTLS_CONN_LOG(debug, "kTLS: read error: {}", fd(), result.err_->getErrorDetails());
      action = Network::PostIoAction::Close;
      err_code = result.err_->getErrorCode();
      break;
    }
    if (result.return_value_ == 0) {
      end_stream = true;
      break;
    }
    buffer.Append(absl::string_view(reinterpret_cast<const char*>(read_buffer_.data()),
                                    result.return_value_));
    bytes_read += result.return_value_;
  }

  KTLS_CONN_LOG(trace, "kTLS: read returns: {}", fd(), bytes_read);
  return {action, bytes_read, end_stream, err_code};
}

Network::IoResult KtlsTransportSocket::doWrite(absl::Cord& buffer, bool end_stream) {
  if (!state_.isTxOffloaded()) {
    return transport_socket_->doWrite(buffer, end_stream);
  }

  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  uint64_t bytes_written = 0;
  while (!buffer.empty()) {
    struct iovec iov[MaxIovecs];
    int num_iov = 0;
    for (absl::string_view chunk : buffer.Chunks()) {
      if (num_iov == MaxIovecs) {
        break;
      }
      iov[num_iov].iov_base = const_cast<char*>(chunk.data());
      iov[num_iov].iov_len = chunk.size();
      ++num_iov;
    }

    struct msghdr msg;
    memset(&msg, 0, sizeof(msg));
    msg.msg_iov = iov;
    msg.msg_iovlen = num_iov;
    const Api::SysCallSizeResult result = os_sys_calls.sendmsg(fd(), &msg, MSG_NOSIGNAL);
    if (result.return_value_ < 0) {
      if (result.errno_ == EINTR) {
        continue;
      }
      if (result.errno_ == SOCKET_ERROR_AGAIN) {
        break;
      }
      KTLS_CONN_LOG(debug, "kTLS: write error: {}", fd(), errorDetails(result.errno_));
      Api::IoCallUint64Result io_result =
          Network::IoSocketError::ioResultSocketError(result, bytes_written);
      return {Network::PostIoAction::Close, bytes_written, false,
              io_result.err_->getErrorCode()};
    }
    buffer.RemovePrefix(static_cast<size_t>(result.return_value_));
    bytes_written += static_cast<uint64_t>(result.return_value_);
  }

  if (buffer.empty() && end_stream && !close_notify_sent_) {
    Api::IoCallUint64Result result = sendCloseNotify();
    if (!result.ok() && !result.wouldBlock()) {
      return {Network::PostIoAction::Close, bytes_written, false, result.err_->getErrorCode()};
    }
  }

  KTLS_CONN_LOG(trace, "kTLS: write returns: {}", fd(), bytes_written);
  return {Network::PostIoAction::KeepOpen, bytes_written, false};
}

void KtlsTransportSocket::closeSocket(Network::ConnectionEvent event) {
  if (!state_.isTxOffloaded()) {
    transport_socket_->closeSocket(event);
    return;
  }
  // The wrapped socket no longer owns the write side, so the alert is sent here.
  if (event == Network::ConnectionEvent::LocalClose && !close_notify_sent_) {
    Api::IoCallUint64Result result = sendCloseNotify();
    if (!result.ok()) {
      KTLS_CONN_LOG(debug, "kTLS: close_notify not sent: {}", fd(),
                    result.err_->getErrorDetails());
    }
  }
}

Api::IoCallUint64Result KtlsTransportSocket::sendCloseNotify() {
  Api::IoCallUint64Result result = RecordIo::sendCloseNotify(fd());
  if (result.ok()) {
    close_notify_sent_ = true;
  }
  return result;
}

Api::IoCallUint64Result KtlsTransportSocket::writeToFile(Network::Ktls::TransferRequest& request) {
  request.source_ = fd();
  // A new request picks its mode again: RX may have been offloaded since the last one.
  if (file_transfer_ == nullptr || !file_transfer_->resumes(request)) {
    // Splicing and mapping read the socket directly, which only yields plaintext once the kernel
    // decrypts.
    const Network::Ktls::TransferMode mode =
        state_.isRxOffloaded() && pending_plaintext_.empty() ? transfer_mode_
                                                             : Network::Ktls::TransferMode::Copy;
    file_transfer_ = std::make_unique<Network::Ktls::FileTransfer>(
        mode, [this](absl::Span<uint8_t> out) { return readPlaintext(out); });
  }
  return file_transfer_->transfer(request);
}

Api::IoCallUint64Result KtlsTransportSocket::readPlaintext(absl::Span<uint8_t> out) {
  if (pending_plaintext_.empty()) {
    if (state_.isRxOffloaded()) {
      return readDecrypted(out);
    }
    Network::IoResult result = transport_socket_->doRead(pending_plaintext_);
    if (pending_plaintext_.empty()) {
      if (result.end_stream_read_) {
        return Api::ioCallUint64ResultNoError();
      }
      if (result.action_ == Network::PostIoAction::Close) {
        // The wrapped socket only reports a code, so the errno is generic.
        return {0, Network::IoSocketError::create(EIO)};
      }
      return {0, Network::IoSocketError::getIoSocketEagainError()};
    }
  }

  size_t copied = 0;
  for (absl::string_view chunk : pending_plaintext_.Chunks()) {
    const size_t n = std::min(chunk.size(), out.size() - copied);
    memcpy(out.data() + copied, chunk.data(), n);
    copied += n;
    if (copied == out.size()) {
      break;
    }
  }
  pending_plaintext_.RemovePrefix(copied);
  return {copied, Api::IoError::none()};
}

Api::IoCallUint64Result KtlsTransportSocket::readDecrypted(absl::Span<uint8_t> out) {
  return RecordIo::readDataRecord(fd(), out);
}

Api::IoCallUint64Result KtlsTransportSocket::sendFile(os_fd_t file_fd, off_t& offset,
                                                      uint64_t length) {
  if (!state_.isTxOffloaded()) {
    return {0, Network::IoSocketError::create(EOPNOTSUPP)};
  }

  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  uint64_t sent = 0;
  while (sent < length) {
    const size_t count =
        static_cast<size_t>(std::min(length - sent, Network::Ktls::MaxTransferChunkSize));
    const Api::SysCallSizeResult result = os_sys_calls.sendfile(fd(), file_fd, &offset, count);
    if (result.return_value_ < 0) {
      if (result.errno_ == EINTR) {
        continue;
      }
      return Network::IoSocketError::ioResultSocketError(result, sent);
    }
    if (result.return_value_ == 0) {
      // End of file.
      break;
    }
    sent += static_cast<uint64_t>(result.return_value_);
  }
  return {sent, Api::IoError::none()};
}

} // namespace Ktls
} // namespace TransportSockets
} // namespace Extensions
} // namespace KernelTls
