#pragma once

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/api/os_sys_calls_common.h"

namespace KernelTls {
namespace Network {

class IoSocketError : public Api::IoError {
public:
  explicit IoSocketError(int sys_errno)
      : errno_(sys_errno), error_code_(errorCodeFromErrno(errno_)) {}

  ~IoSocketError() override = default;

  Api::IoError::IoErrorCode getErrorCode() const override;
  std::string getErrorDetails() const override;
  int getSystemErrorCode() const override { return errno_; }

  // IoErrorCode::Again is used frequently. This custom error returns a
  // reusable singleton to avoid repeated allocation.
  static Api::IoErrorPtr getIoSocketEagainError();

  static Api::IoErrorPtr getIoSocketEbadfError();

  // Wraps an errno in an owned IoErrorPtr, reusing the EAGAIN singleton.
  static Api::IoErrorPtr create(int sys_errno);

  // Converts a failed system call result into an IoCallUint64Result carrying partial progress.
  static Api::IoCallUint64Result ioResultSocketError(Api::SysCallSizeResult result,
                                                     uint64_t bytes_done = 0);

  // Deallocates memory for all types of IoError except IoSocketEagainError.
  static void deleteIoError(Api::IoError* err);

private:
  static Api::IoError::IoErrorCode errorCodeFromErrno(int sys_errno);

  const int errno_;
  const Api::IoError::IoErrorCode error_code_;
};

} // namespace Network
} // namespace KernelTls
