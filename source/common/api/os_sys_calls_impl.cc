#include "source/common/api/os_sys_calls_impl.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>

namespace KernelTls {
namespace Api {

SysCallIntResult OsSysCallsImpl::setsockopt(os_fd_t sockfd, int level, int optname,
                                            const void* optval, socklen_t optlen) {
  const int rc = ::setsockopt(sockfd, level, optname, optval, optlen);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::getsockopt(os_fd_t sockfd, int level, int optname, void* optval,
                                            socklen_t* optlen) {
  const int rc = ::getsockopt(sockfd, level, optname, optval, optlen);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::recvmsg(os_fd_t sockfd, struct msghdr* msg, int flags) {
  const ssize_t rc = ::recvmsg(sockfd, msg, flags);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::sendmsg(os_fd_t sockfd, const struct msghdr* msg, int flags) {
  const ssize_t rc = ::sendmsg(sockfd, msg, flags);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::recv(os_fd_t sockfd, void* buffer, size_t length, int flags) {
  const ssize_t rc = ::recv(sockfd, buffer, length, flags);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::read(os_fd_t fd, void* buffer, size_t num_bytes) {
  const ssize_t rc = ::read(fd, buffer, num_bytes);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::write(os_fd_t fd, const void* buffer, size_t num_bytes) {
  const ssize_t rc = ::write(fd, buffer, num_bytes);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::writev(os_fd_t fd, const struct iovec* iov, int num_iov) {
  const ssize_t rc = ::writev(fd, iov, num_iov);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::splice(os_fd_t fd_in, loff_t* off_in, os_fd_t fd_out,
                                         loff_t* off_out, size_t len, unsigned int flags) {
  const ssize_t rc = ::splice(fd_in, off_in, fd_out, off_out, len, flags);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallSizeResult OsSysCallsImpl::sendfile(os_fd_t out_fd, os_fd_t in_fd, off_t* offset,
                                           size_t count) {
  const ssize_t rc = ::sendfile(out_fd, in_fd, offset, count);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::pipe2(os_fd_t fds[2], int flags) {
  const int rc = ::pipe2(fds, flags);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::fcntl(os_fd_t fd, int cmd, int arg) {
  const int rc = ::fcntl(fd, cmd, arg);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::close(os_fd_t fd) {
  const int rc = ::close(fd);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::uname(struct utsname* name) {
  const int rc = ::uname(name);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::stat(const char* pathname, struct stat* buf) {
  const int rc = ::stat(pathname, buf);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::fstat(os_fd_t fd, struct stat* buf) {
  const int rc = ::fstat(fd, buf);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallOffsetResult OsSysCallsImpl::lseek(os_fd_t fd, off_t offset, int whence) {
  const off_t rc = ::lseek(fd, offset, whence);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::ftruncate(os_fd_t fd, off_t length) {
  const int rc = ::ftruncate(fd, length);
  return {rc, rc != -1 ? 0 : errno};
}

SysCallPtrResult OsSysCallsImpl::mmap(void* addr, size_t length, int prot, int flags, os_fd_t fd,
                                      off_t offset) {
  void* rc = ::mmap(addr, length, prot, flags, fd, offset);
  return {rc, rc != MAP_FAILED ? 0 : errno};
}

SysCallIntResult OsSysCallsImpl::munmap(void* addr, size_t length) {
  const int rc = ::munmap(addr, length);
  return {rc, rc != -1 ? 0 : errno};
}

} // namespace Api
} // namespace KernelTls
