#pragma once

#include <cstdint>

#include "kernel_tls/api/io_error.h"
#include "kernel_tls/common/platform.h"

#include "source/common/common/logger.h"
#include "source/common/network/ktls/transfer_request.h"

#include "absl/types/optional.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Fallback for destinations splice cannot reach: map the target range of the file and read from
 * the source straight into it.
 */
class MappedFileWriter : public Logger::Loggable<Logger::Id::ktls> {
public:
  /**
   * Writes up to remaining bytes at the file's current offset. The file is grown to
   * offset + remaining first if it is shorter, then [0, offset + remaining) is mapped and reads
   * land in windows of at most MaxTransferChunkSize inside [offset, offset + remaining). The
   * mapping is released before returning and the file offset moves past the written bytes.
   * @param file_fd supplies the destination file, opened read-write.
   * @param remaining supplies the byte count. Must be bounded.
   * @param read supplies the source.
   * @return nullopt if the file cannot be prepared or mapped (nothing was read); otherwise the
   *         bytes written, with the read error that stopped the transfer, if any.
   */
  static absl::optional<Api::IoCallUint64Result> write(os_fd_t file_fd, uint64_t remaining,
                                                       const ReadFunction& read);
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
