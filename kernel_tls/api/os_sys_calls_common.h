#pragma once

#include <sys/types.h>

namespace KernelTls {
namespace Api {

template <typename T> struct SysCallResult {
  /**
   * The return code from the system call.
   */
  T return_value_;

  /**
   * The errno value as captured after the system call.
   */
  int errno_;
};

using SysCallIntResult = SysCallResult<int>;
using SysCallSizeResult = SysCallResult<ssize_t>;
using SysCallPtrResult = SysCallResult<void*>;
using SysCallOffsetResult = SysCallResult<off_t>;

} // namespace Api
} // namespace KernelTls
