#pragma once

// kTLS is a Linux kernel facility; nothing in this tree builds elsewhere.
#if !defined(__linux__)
#error "kernel TLS offload requires Linux"
#endif

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/mman.h>
#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <sys/utsname.h>
#include <unistd.h>

using os_fd_t = int;

#define INVALID_SOCKET -1
#define SOCKET_VALID(sock) ((sock) >= 0)
#define SOCKET_INVALID(sock) ((sock) == -1)
#define SOCKET_FAILURE(rc) ((rc) == -1)
#define SOCKET_ERROR_AGAIN EAGAIN
#define SOCKET_ERROR_BADF EBADF
