#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"

#include "absl/types/span.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Upper bound of bytes moved by one splice or read into a mapped window.
 */
inline constexpr uint64_t MaxTransferChunkSize = 4 * 1024 * 1024;

/**
 * Reads plaintext from the transfer source into the span. Would-block is reported as Again.
 */
using ReadFunction = std::function<Api::IoCallUint64Result(absl::Span<uint8_t>)>;

/**
 * A socket to file copy in progress. The caller keeps it across would-block suspensions and
 * passes it back on the next attempt.
 */
struct TransferRequest {
  static constexpr uint64_t Unlimited = std::numeric_limits<uint64_t>::max();

  TransferRequest(os_fd_t source, os_fd_t destination, uint64_t limit = Unlimited)
      : source_(source), destination_(destination), remaining_(limit) {}

  /**
   * @return true once the limit is reached or the source has no more data.
   */
  bool done() const { return remaining_ == 0 || source_closed_; }

  bool limited() const { return remaining_ != Unlimited; }

  os_fd_t source_;
  os_fd_t destination_;
  // Bytes still to be taken from the source.
  uint64_t remaining_;
  // Bytes already in the destination.
  uint64_t transferred_{0};
  // The source reported end of stream.
  bool source_closed_{false};
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
