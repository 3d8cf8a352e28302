#include "source/common/network/ktls/record_io.h"

#include <linux/tls.h>

#include <cstring>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/utility.h"
#include "source/common/network/io_socket_error_impl.h"

#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

std::string RecordIoError::getErrorDetails() const {
  switch (reason_) {
  case RecordErrorReason::MissingRecordType:
    return "kTLS: recvmsg returned no record type";
  case RecordErrorReason::UnsupportedRecordType:
    return absl::StrCat("unsupported ktls record type: ", static_cast<int>(value_));
  case RecordErrorReason::UnsupportedAlert:
    return absl::StrCat("unsupported ktls alert type: ", static_cast<int>(value_));
  case RecordErrorReason::AlertTooShort:
    return "ktls alert payload too short";
  }
  return "";
}

Api::IoErrorPtr RecordIoError::create(RecordErrorReason reason, uint8_t value) {
  return Api::IoError::wrap(new RecordIoError(reason, value));
}

RecordFrame RecordIo::readRecord(os_fd_t fd, absl::Span<uint8_t> buffer) {
  alignas(struct cmsghdr) char control[CMSG_SPACE(sizeof(uint8_t))];
  std::memset(control, 0, sizeof(control));

  struct iovec iov;
  iov.iov_base = buffer.data();
  iov.iov_len = buffer.size();

  struct msghdr msg;
  std::memset(&msg, 0, sizeof(msg));
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  msg.msg_control = control;
  msg.msg_controllen = sizeof(control);

  const Api::SysCallSizeResult result = Api::OsSysCallsSingleton::get().recvmsg(fd, &msg, 0);
  if (result.return_value_ < 0) {
    if (result.errno_ != EAGAIN) {
      KTLS_LOG(debug, "kTLS: recvmsg failed: {}", errorDetails(result.errno_));
    }
    return {IoSocketError::ioResultSocketError(result), 0};
  }
  if (result.return_value_ == 0) {
    return {Api::ioCallUint64ResultNoError(), 0};
  }

  const struct cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
  if (cmsg == nullptr || (msg.msg_flags & MSG_CTRUNC) != 0 ||
      cmsg->cmsg_len < CMSG_LEN(sizeof(uint8_t))) {
    KTLS_LOG(debug, "kTLS: recvmsg without record type control message");
    return {Api::IoCallUint64Result(0, RecordIoError::create(RecordErrorReason::MissingRecordType,
                                                             0)),
            0};
  }
  if (cmsg->cmsg_level != SOL_TLS || cmsg->cmsg_type != TLS_GET_RECORD_TYPE) {
    KTLS_LOG(debug, "kTLS: unsupported cmsg level {} type {}", cmsg->cmsg_level,
             cmsg->cmsg_type);
    return {Api::IoCallUint64Result(0, RecordIoError::create(RecordErrorReason::MissingRecordType,
                                                             0)),
            0};
  }

  const uint8_t record_type = *CMSG_DATA(cmsg);
  KTLS_LOG(trace, "kTLS: recvmsg, type: {}, payload len: {}", record_type, result.return_value_);
  return {Api::IoCallUint64Result(static_cast<uint64_t>(result.return_value_),
                                  Api::IoError::none()),
          record_type};
}

Api::IoCallUint64Result RecordIo::readDataRecord(os_fd_t fd, absl::Span<uint8_t> buffer) {
  RecordFrame frame = readRecord(fd, buffer);
  if (!frame.result_.ok() || frame.result_.return_value_ == 0) {
    return std::move(frame.result_);
  }

  const uint64_t length = frame.result_.return_value_;
  switch (static_cast<RecordType>(frame.record_type_)) {
  case RecordType::ApplicationData:
    return std::move(frame.result_);
  case RecordType::Alert:
    if (length < 2) {
      return {0, RecordIoError::create(RecordErrorReason::AlertTooShort, 0)};
    }
    if (buffer[1] == AlertCloseNotify) {
      KTLS_LOG(debug, "kTLS: close_notify received");
      return Api::ioCallUint64ResultNoError();
    }
    return {0, RecordIoError::create(RecordErrorReason::UnsupportedAlert, buffer[1])};
  default:
    return {0, RecordIoError::create(RecordErrorReason::UnsupportedRecordType,
                                     frame.record_type_)};
  }
}

Api::IoCallUint64Result RecordIo::writeTaggedRecord(os_fd_t fd, RecordType type,
                                                    absl::Span<const uint8_t> payload) {
  alignas(struct cmsghdr) char control[CMSG_SPACE(sizeof(uint8_t))];
  std::memset(control, 0, sizeof(control));

  struct iovec iov;
  iov.iov_base = const_cast<uint8_t*>(payload.data());
  iov.iov_len = payload.size();

  struct msghdr msg;
  std::memset(&msg, 0, sizeof(msg));
  msg.msg_iov = &iov;
  msg.msg_iovlen = 1;
  msg.msg_control = control;
  msg.msg_controllen = sizeof(control);

  struct cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
  cmsg->cmsg_level = SOL_TLS;
  cmsg->cmsg_type = TLS_SET_RECORD_TYPE;
  cmsg->cmsg_len = CMSG_LEN(sizeof(uint8_t));
  *CMSG_DATA(cmsg) = static_cast<uint8_t>(type);
  msg.msg_controllen = cmsg->cmsg_len;

  const Api::SysCallSizeResult result =
      Api::OsSysCallsSingleton::get().sendmsg(fd, &msg, MSG_NOSIGNAL);
  if (result.return_value_ < 0) {
    if (result.errno_ != EAGAIN) {
      KTLS_LOG(debug, "kTLS: sendmsg of record type {} failed: {}", static_cast<int>(type),
               errorDetails(result.errno_));
    }
    return IoSocketError::ioResultSocketError(result);
  }
  return {static_cast<uint64_t>(result.return_value_), Api::IoError::none()};
}

Api::IoCallUint64Result RecordIo::sendCloseNotify(os_fd_t fd) {
  const uint8_t alert[2] = {static_cast<uint8_t>(AlertLevel::Warning), AlertCloseNotify};
  return writeTaggedRecord(fd, RecordType::Alert, alert);
}

absl::optional<RecordErrorReason> RecordIo::recordErrorReason(const Api::IoError& err) {
  const auto* record_error = dynamic_cast<const RecordIoError*>(&err);
  if (record_error == nullptr) {
    return absl::nullopt;
  }
  return record_error->reason();
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
