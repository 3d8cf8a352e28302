#include "source/common/network/ktls/file_transfer.h"

#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/stat.h>

#include <algorithm>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/assert.h"
#include "source/common/common/utility.h"
#include "source/common/network/io_socket_error_impl.h"
#include "source/common/network/ktls/mapped_file_writer.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

bool FileTransfer::spliceApplicable(os_fd_t source, os_fd_t destination) {
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();

  struct stat file_stat;
  if (os_sys_calls.fstat(destination, &file_stat).return_value_ != 0 ||
      !S_ISREG(file_stat.st_mode)) {
    return false;
  }
  // splice() into a file opened with O_APPEND fails with EINVAL once the chunk has already left
  // the socket.
  const Api::SysCallIntResult flags = os_sys_calls.fcntl(destination, F_GETFL, 0);
  if (flags.return_value_ < 0 || (flags.return_value_ & O_APPEND) != 0) {
    return false;
  }

  int value = 0;
  socklen_t length = sizeof(value);
  if (os_sys_calls.getsockopt(source, SOL_SOCKET, SO_TYPE, &value, &length).return_value_ != 0 ||
      value != SOCK_STREAM) {
    return false;
  }
  length = sizeof(value);
  if (os_sys_calls.getsockopt(source, SOL_SOCKET, SO_PROTOCOL, &value, &length).return_value_ !=
          0 ||
      value != IPPROTO_TCP) {
    return false;
  }
  return true;
}

FileTransfer::Strategy FileTransfer::selectStrategy(const TransferRequest& request) const {
  switch (mode_) {
  case TransferMode::Splice:
    return spliceApplicable(request.source_, request.destination_) ? Strategy::Splice
                                                                   : Strategy::Copy;
  case TransferMode::Mapped:
    return request.limited() ? Strategy::Mapped : Strategy::Copy;
  case TransferMode::Copy:
    return Strategy::Copy;
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

Api::IoCallUint64Result FileTransfer::transfer(TransferRequest& request) {
  if (request.done()) {
    return Api::ioCallUint64ResultNoError();
  }
  if (strategy_.has_value() && !resumes(request)) {
    KTLS_LOG(debug, "kTLS: previous transfer to fd {} abandoned", destination_);
    reset();
  }
  if (!strategy_.has_value()) {
    strategy_ = selectStrategy(request);
    active_request_ = &request;
    destination_ = request.destination_;
  }

  Api::IoCallUint64Result result = advance(request);
  if (request.done() || (!result.ok() && !result.wouldBlock())) {
    reset();
  }
  return result;
}

bool FileTransfer::resumes(const TransferRequest& request) const {
  return strategy_.has_value() && active_request_ == &request &&
         destination_ == request.destination_;
}

void FileTransfer::reset() {
  strategy_.reset();
  bridge_.reset();
  active_request_ = nullptr;
  destination_ = INVALID_SOCKET;
}

Api::IoCallUint64Result FileTransfer::advance(TransferRequest& request) {
  switch (*strategy_) {
  case Strategy::Splice:
    if (bridge_ == nullptr) {
      bridge_ = std::make_unique<SpliceBridge>();
    }
    if (bridge_->initialized()) {
      return bridge_->pump(request);
    }
    KTLS_LOG(debug, "kTLS: splice bridge unavailable, copying through user space");
    strategy_ = Strategy::Copy;
    bridge_.reset();
    return copy(request);
  case Strategy::Mapped: {
    absl::optional<Api::IoCallUint64Result> result =
        MappedFileWriter::write(request.destination_, request.remaining_, read_);
    if (!result.has_value()) {
      KTLS_LOG(debug, "kTLS: file cannot be mapped, copying through user space");
      strategy_ = Strategy::Copy;
      return copy(request);
    }
    request.transferred_ += result->return_value_;
    request.remaining_ -= result->return_value_;
    if (result->ok() && request.remaining_ > 0) {
      // The source ended before the limit.
      request.source_closed_ = true;
    }
    return std::move(*result);
  }
  case Strategy::Copy:
    return copy(request);
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

Api::IoCallUint64Result FileTransfer::copy(TransferRequest& request) {
  copy_buffer_.resize(CopyBufferSize);
  uint64_t written = 0;
  while (request.remaining_ > 0) {
    const uint64_t want =
        std::min(static_cast<uint64_t>(copy_buffer_.size()), request.remaining_);
    Api::IoCallUint64Result result = read_(absl::Span<uint8_t>(copy_buffer_.data(), want));
    if (!result.ok()) {
      return {written, std::move(result.err_)};
    }
    if (result.return_value_ == 0) {
      request.source_closed_ = true;
      break;
    }
    Api::IoCallUint64Result out =
        writeAll(request.destination_, copy_buffer_.data(), result.return_value_);
    request.transferred_ += out.return_value_;
    written += out.return_value_;
    if (request.limited()) {
      request.remaining_ -= result.return_value_;
    }
    if (!out.ok()) {
      return {written, std::move(out.err_)};
    }
  }
  return {written, Api::IoError::none()};
}

Api::IoCallUint64Result FileTransfer::writeAll(os_fd_t fd, const uint8_t* data, uint64_t length) {
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();
  uint64_t written = 0;
  while (written < length) {
    const Api::SysCallSizeResult result =
        os_sys_calls.write(fd, data + written, static_cast<size_t>(length - written));
    if (result.return_value_ < 0) {
      if (result.errno_ == EINTR) {
        continue;
      }
      KTLS_LOG(debug, "kTLS: write to destination failed: {}", errorDetails(result.errno_));
      return IoSocketError::ioResultSocketError(result, written);
    }
    written += static_cast<uint64_t>(result.return_value_);
  }
  return {written, Api::IoError::none()};
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
