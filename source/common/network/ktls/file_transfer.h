#pragma once

#include <memory>
#include <vector>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/splice_bridge.h"
#include "source/common/network/ktls/transfer_request.h"

#include "absl/types/optional.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

enum class TransferMode {
  // Splice bridge when the endpoints allow it, ordinary copy otherwise.
  Splice,
  // Read into a mapping of the destination file, ordinary copy when it cannot be mapped.
  Mapped,
  // Always copy through the read function.
  Copy,
};

/**
 * Bulk copy from a kernel protected socket to a file. The strategy is picked on the first call
 * for a request and kept until that request ends, so a suspended transfer resumes where it
 * stopped. Passing a different request starts over; bytes an abandoned transfer left in flight
 * are discarded with it.
 */
class FileTransfer : public Logger::Loggable<Logger::Id::ktls> {
public:
  /**
   * @param mode supplies the preferred strategy.
   * @param read supplies plaintext reads from the source, used by every path except splice.
   */
  FileTransfer(TransferMode mode, ReadFunction read) : mode_(mode), read_(std::move(read)) {}

  /**
   * Advances the transfer.
   * @return bytes written to the destination by this call. Again means re-invoke once the
   *         source is readable; other errors end the transfer with partial progress.
   */
  Api::IoCallUint64Result transfer(TransferRequest& request);

  /**
   * @return true if request is the suspended transfer this object is carrying.
   */
  bool resumes(const TransferRequest& request) const;

  /**
   * @return true if destination is a regular file not opened for appending and source a TCP
   *         stream socket.
   */
  static bool spliceApplicable(os_fd_t source, os_fd_t destination);

private:
  enum class Strategy { Splice, Mapped, Copy };

  Strategy selectStrategy(const TransferRequest& request) const;
  Api::IoCallUint64Result advance(TransferRequest& request);
  void reset();
  Api::IoCallUint64Result copy(TransferRequest& request);
  Api::IoCallUint64Result writeAll(os_fd_t fd, const uint8_t* data, uint64_t length);

  static constexpr size_t CopyBufferSize = 16384;

  const TransferMode mode_;
  ReadFunction read_;
  absl::optional<Strategy> strategy_;
  const TransferRequest* active_request_{nullptr};
  os_fd_t destination_{INVALID_SOCKET};
  std::unique_ptr<SpliceBridge> bridge_;
  std::vector<uint8_t> copy_buffer_;
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
