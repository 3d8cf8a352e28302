#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "kernel_tls/common/pure.h"

namespace KernelTls {
namespace Api {

class IoError;

using IoErrorDeleterType = void (*)(IoError*);
using IoErrorPtr = std::unique_ptr<IoError, IoErrorDeleterType>;

/**
 * Base class for any I/O error.
 */
class IoError {
public:
  enum class IoErrorCode {
    // No data available right now, try again later.
    Again,
    // Not supported.
    NoSupport,
    // Bad file descriptor.
    BadFd,
    // Permission denied.
    Permission,
    // Message too big to send.
    MessageTooBig,
    // Kernel interrupt.
    Interrupt,
    // Connection reset by peer.
    ConnectionReset,
    // Broken pipe.
    BrokenPipe,
    // Timed out waiting on the socket deadline.
    TimedOut,
    // Invalid argument.
    InvalidArgument,
    // The peer or the kernel sent something the record layer cannot accept.
    ProtocolError,
    // Other error codes cannot be mapped to any one above in getErrorCode().
    UnknownError
  };
  virtual ~IoError() = default;

  virtual IoErrorCode getErrorCode() const PURE;
  virtual std::string getErrorDetails() const PURE;
  virtual int getSystemErrorCode() const PURE;

  static IoErrorPtr none() { return IoErrorPtr(nullptr, [](IoError*) {}); }
  static IoErrorPtr wrap(IoError* err) {
    return {err, [](IoError* err) { delete err; }};
  }
};

/**
 * Basic type for return result which has a return code and error code defined
 * according to different implementations.
 * If the call succeeds, ok() should return true and |return_value_| is valid. Otherwise
 * |err_| can be passed into IoError::getErrorCode() to extract the error. In this case,
 * |return_value_| holds the partial progress made before the error, if any.
 */
template <typename ReturnValue> struct IoCallResult {
  IoCallResult(ReturnValue return_value, IoErrorPtr err)
      : return_value_(return_value), err_(std::move(err)) {}

  IoCallResult(IoCallResult<ReturnValue>&& result) noexcept
      : return_value_(std::move(result.return_value_)), err_(std::move(result.err_)) {}

  virtual ~IoCallResult() = default;

  IoCallResult& operator=(IoCallResult&& result) noexcept {
    return_value_ = result.return_value_;
    err_ = std::move(result.err_);
    return *this;
  }

  /**
   * @return true if the call succeeds.
   */
  bool ok() const { return err_ == nullptr; }

  /**
   * @return true if the call failed because it would block.
   */
  bool wouldBlock() const { return !ok() && err_->getErrorCode() == IoError::IoErrorCode::Again; }

  ReturnValue return_value_;
  IoErrorPtr err_;
};

using IoCallUint64Result = IoCallResult<uint64_t>;

inline IoCallUint64Result ioCallUint64ResultNoError() { return {0, IoError::none()}; }

} // namespace Api
} // namespace KernelTls
