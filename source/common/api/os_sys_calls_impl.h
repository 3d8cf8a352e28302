#pragma once

#include "kernel_tls/api/os_sys_calls.h"

#include "source/common/singleton/threadsafe_singleton.h"

namespace KernelTls {
namespace Api {

class OsSysCallsImpl : public OsSysCalls {
public:
  // Api::OsSysCalls
  SysCallIntResult setsockopt(os_fd_t sockfd, int level, int optname, const void* optval,
                              socklen_t optlen) override;
  SysCallIntResult getsockopt(os_fd_t sockfd, int level, int optname, void* optval,
                              socklen_t* optlen) override;
  SysCallSizeResult recvmsg(os_fd_t sockfd, struct msghdr* msg, int flags) override;
  SysCallSizeResult sendmsg(os_fd_t sockfd, const struct msghdr* msg, int flags) override;
  SysCallSizeResult recv(os_fd_t sockfd, void* buffer, size_t length, int flags) override;
  SysCallSizeResult read(os_fd_t fd, void* buffer, size_t num_bytes) override;
  SysCallSizeResult write(os_fd_t fd, const void* buffer, size_t num_bytes) override;
  SysCallSizeResult writev(os_fd_t fd, const struct iovec* iov, int num_iov) override;
  SysCallSizeResult splice(os_fd_t fd_in, loff_t* off_in, os_fd_t fd_out, loff_t* off_out,
                           size_t len, unsigned int flags) override;
  SysCallSizeResult sendfile(os_fd_t out_fd, os_fd_t in_fd, off_t* offset, size_t count) override;
  SysCallIntResult pipe2(os_fd_t fds[2], int flags) override;
  SysCallIntResult fcntl(os_fd_t fd, int cmd, int arg) override;
  SysCallIntResult close(os_fd_t fd) override;
  SysCallIntResult uname(struct utsname* name) override;
  SysCallIntResult stat(const char* pathname, struct stat* buf) override;
  SysCallIntResult fstat(os_fd_t fd, struct stat* buf) override;
  SysCallOffsetResult lseek(os_fd_t fd, off_t offset, int whence) override;
  SysCallIntResult ftruncate(os_fd_t fd, off_t length) override;
  SysCallPtrResult mmap(void* addr, size_t length, int prot, int flags, os_fd_t fd,
                        off_t offset) override;
  SysCallIntResult munmap(void* addr, size_t length) override;
};

using OsSysCallsSingleton = ThreadSafeSingleton<OsSysCallsImpl>;

} // namespace Api
} // namespace KernelTls
