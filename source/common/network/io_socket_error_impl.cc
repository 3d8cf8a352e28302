#include "source/common/network/io_socket_error_impl.h"

#include <cerrno>

#include "source/common/common/assert.h"
#include "source/common/common/utility.h"

namespace KernelTls {
namespace Network {

namespace {

IoSocketError* eagainError() {
  static IoSocketError* instance = new IoSocketError(EAGAIN);
  return instance;
}

} // namespace

Api::IoError::IoErrorCode IoSocketError::getErrorCode() const { return error_code_; }

std::string IoSocketError::getErrorDetails() const { return errorDetails(errno_); }

Api::IoErrorPtr IoSocketError::getIoSocketEagainError() {
  return Api::IoErrorPtr(eagainError(), [](Api::IoError*) {});
}

Api::IoErrorPtr IoSocketError::getIoSocketEbadfError() { return create(EBADF); }

Api::IoErrorPtr IoSocketError::create(int sys_errno) {
  if (sys_errno == EAGAIN || sys_errno == EWOULDBLOCK) {
    return getIoSocketEagainError();
  }
  return Api::IoErrorPtr(new IoSocketError(sys_errno), deleteIoError);
}

Api::IoCallUint64Result IoSocketError::ioResultSocketError(Api::SysCallSizeResult result,
                                                           uint64_t bytes_done) {
  ASSERT(result.return_value_ == -1);
  return {bytes_done, create(result.errno_)};
}

void IoSocketError::deleteIoError(Api::IoError* err) {
  ASSERT(err != nullptr);
  if (err != eagainError()) {
    delete err;
  }
}

Api::IoError::IoErrorCode IoSocketError::errorCodeFromErrno(int sys_errno) {
  switch (sys_errno) {
  case EAGAIN:
    return IoErrorCode::Again;
  case EOPNOTSUPP:
  case ENOPROTOOPT:
    return IoErrorCode::NoSupport;
  case EBADF:
    return IoErrorCode::BadFd;
  case EACCES:
  case EPERM:
    return IoErrorCode::Permission;
  case EMSGSIZE:
    return IoErrorCode::MessageTooBig;
  case EINTR:
    return IoErrorCode::Interrupt;
  case ECONNRESET:
    return IoErrorCode::ConnectionReset;
  case EPIPE:
    return IoErrorCode::BrokenPipe;
  case ETIMEDOUT:
    return IoErrorCode::TimedOut;
  case EINVAL:
    return IoErrorCode::InvalidArgument;
  case EBADMSG:
  case EPROTO:
    return IoErrorCode::ProtocolError;
  default:
    return IoErrorCode::UnknownError;
  }
}

} // namespace Network
} // namespace KernelTls
