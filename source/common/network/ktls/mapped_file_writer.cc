#include "source/common/network/ktls/mapped_file_writer.h"

#include <sys/mman.h>
#include <sys/stat.h>

#include <algorithm>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/utility.h"

#include "absl/cleanup/cleanup.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

absl::optional<Api::IoCallUint64Result>
MappedFileWriter::write(os_fd_t file_fd, uint64_t remaining, const ReadFunction& read) {
  if (remaining == 0 || remaining == TransferRequest::Unlimited) {
    return absl::nullopt;
  }
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();

  const Api::SysCallOffsetResult position = os_sys_calls.lseek(file_fd, 0, SEEK_CUR);
  if (position.return_value_ < 0) {
    KTLS_LOG(debug, "kTLS: file seek failed: {}", errorDetails(position.errno_));
    return absl::nullopt;
  }
  const uint64_t offset = static_cast<uint64_t>(position.return_value_);

  struct stat file_stat;
  const Api::SysCallIntResult stat_result = os_sys_calls.fstat(file_fd, &file_stat);
  if (stat_result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: file stat failed: {}", errorDetails(stat_result.errno_));
    return absl::nullopt;
  }

  const uint64_t end = offset + remaining;
  if (end > static_cast<uint64_t>(file_stat.st_size)) {
    const Api::SysCallIntResult truncate_result =
        os_sys_calls.ftruncate(file_fd, static_cast<off_t>(end));
    if (truncate_result.return_value_ != 0) {
      KTLS_LOG(debug, "kTLS: file truncate error: {}", errorDetails(truncate_result.errno_));
      return absl::nullopt;
    }
  }

  // mmap offsets must be page aligned, so map from 0 and use the data from offset on.
  const Api::SysCallPtrResult mapping =
      os_sys_calls.mmap(nullptr, end, PROT_WRITE, MAP_SHARED, file_fd, 0);
  if (mapping.return_value_ == MAP_FAILED) {
    KTLS_LOG(debug, "kTLS: file mmap failed: {}", errorDetails(mapping.errno_));
    return absl::nullopt;
  }
  auto unmap = absl::MakeCleanup([&os_sys_calls, &mapping, end] {
    const Api::SysCallIntResult result = os_sys_calls.munmap(mapping.return_value_, end);
    if (result.return_value_ != 0) {
      KTLS_LOG(warn, "kTLS: munmap failed: {}", errorDetails(result.errno_));
    }
  });

  uint8_t* target = static_cast<uint8_t*>(mapping.return_value_) + offset;
  uint64_t written = 0;
  Api::IoErrorPtr error = Api::IoError::none();
  while (written < remaining) {
    const uint64_t window = std::min(MaxTransferChunkSize, remaining - written);
    Api::IoCallUint64Result result = read(absl::Span<uint8_t>(target + written, window));
    written += result.return_value_;
    if (!result.ok()) {
      error = std::move(result.err_);
      break;
    }
    if (result.return_value_ == 0) {
      KTLS_LOG(debug, "kTLS: source closed after {} of {} bytes", written, remaining);
      break;
    }
  }

  const Api::SysCallOffsetResult advance =
      os_sys_calls.lseek(file_fd, static_cast<off_t>(offset + written), SEEK_SET);
  if (advance.return_value_ < 0) {
    KTLS_LOG(warn, "kTLS: failed to advance file offset: {}", errorDetails(advance.errno_));
  }
  return Api::IoCallUint64Result(written, std::move(error));
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
