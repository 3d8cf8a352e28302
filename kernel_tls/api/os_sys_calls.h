#pragma once

#include <memory>

#include "kernel_tls/api/os_sys_calls_common.h"
#include "kernel_tls/common/platform.h"
#include "kernel_tls/common/pure.h"

namespace KernelTls {
namespace Api {

/**
 * Thin wrapper around the system calls used by the offload path, so tests can replace the
 * kernel with a mock.
 */
class OsSysCalls {
public:
  virtual ~OsSysCalls() = default;

  /**
   * @see man 2 setsockopt
   */
  virtual SysCallIntResult setsockopt(os_fd_t sockfd, int level, int optname, const void* optval,
                                      socklen_t optlen) PURE;

  /**
   * @see man 2 getsockopt
   */
  virtual SysCallIntResult getsockopt(os_fd_t sockfd, int level, int optname, void* optval,
                                      socklen_t* optlen) PURE;

  /**
   * @see man 2 recvmsg
   */
  virtual SysCallSizeResult recvmsg(os_fd_t sockfd, struct msghdr* msg, int flags) PURE;

  /**
   * @see man 2 sendmsg
   */
  virtual SysCallSizeResult sendmsg(os_fd_t sockfd, const struct msghdr* msg, int flags) PURE;

  /**
   * @see man 2 recv
   */
  virtual SysCallSizeResult recv(os_fd_t sockfd, void* buffer, size_t length, int flags) PURE;

  /**
   * @see man 2 read
   */
  virtual SysCallSizeResult read(os_fd_t fd, void* buffer, size_t num_bytes) PURE;

  /**
   * @see man 2 write
   */
  virtual SysCallSizeResult write(os_fd_t fd, const void* buffer, size_t num_bytes) PURE;

  /**
   * @see man 2 writev
   */
  virtual SysCallSizeResult writev(os_fd_t fd, const struct iovec* iov, int num_iov) PURE;

  /**
   * @see man 2 splice
   */
  virtual SysCallSizeResult splice(os_fd_t fd_in, loff_t* off_in, os_fd_t fd_out, loff_t* off_out,
                                   size_t len, unsigned int flags) PURE;

  /**
   * @see man 2 sendfile
   */
  virtual SysCallSizeResult sendfile(os_fd_t out_fd, os_fd_t in_fd, off_t* offset,
                                     size_t count) PURE;

  /**
   * @see man 2 pipe2
   */
  virtual SysCallIntResult pipe2(os_fd_t fds[2], int flags) PURE;

  /**
   * @see man 2 fcntl, limited to commands taking an int argument.
   */
  virtual SysCallIntResult fcntl(os_fd_t fd, int cmd, int arg) PURE;

  /**
   * Release all resources allocated for fd.
   * @return zero on success, -1 returned otherwise.
   */
  virtual SysCallIntResult close(os_fd_t fd) PURE;

  /**
   * @see man 2 uname
   */
  virtual SysCallIntResult uname(struct utsname* name) PURE;

  /**
   * @see man 2 stat
   */
  virtual SysCallIntResult stat(const char* pathname, struct stat* buf) PURE;

  /**
   * @see man 2 fstat
   */
  virtual SysCallIntResult fstat(os_fd_t fd, struct stat* buf) PURE;

  /**
   * @see man 2 lseek
   */
  virtual SysCallOffsetResult lseek(os_fd_t fd, off_t offset, int whence) PURE;

  /**
   * @see man 2 ftruncate
   */
  virtual SysCallIntResult ftruncate(os_fd_t fd, off_t length) PURE;

  /**
   * @see man 2 mmap
   */
  virtual SysCallPtrResult mmap(void* addr, size_t length, int prot, int flags, os_fd_t fd,
                                off_t offset) PURE;

  /**
   * @see man 2 munmap
   */
  virtual SysCallIntResult munmap(void* addr, size_t length) PURE;
};

using OsSysCallsPtr = std::unique_ptr<OsSysCalls>;

} // namespace Api
} // namespace KernelTls
