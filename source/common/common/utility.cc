#include "source/common/common/utility.h"

#include <cstring>
#include <limits>

#include "source/common/common/assert.h"

#include "absl/strings/ascii.h"

namespace KernelTls {

std::string errorDetails(int error_code) {
  // strerror_r() is the GNU variant here and may ignore the buffer.
  char buffer[128];
  return ::strerror_r(error_code, buffer, sizeof(buffer));
}

bool StringUtil::consumeLeadingUint32(absl::string_view& str, uint32_t& out) {
  uint64_t value = 0;
  size_t pos = 0;
  while (pos < str.size() && absl::ascii_isdigit(static_cast<unsigned char>(str[pos]))) {
    value = value * 10 + static_cast<uint64_t>(str[pos] - '0');
    if (value > std::numeric_limits<uint32_t>::max()) {
      return false;
    }
    ++pos;
  }
  if (pos == 0) {
    return false;
  }
  out = static_cast<uint32_t>(value);
  str.remove_prefix(pos);
  return true;
}

size_t ByteUtil::writeBytes(absl::Span<uint8_t> dst, size_t offset,
                            absl::Span<const uint8_t> src) {
  RELEASE_ASSERT(offset + src.size() <= dst.size(), "byte write past end of buffer");
  if (!src.empty()) {
    std::memcpy(dst.data() + offset, src.data(), src.size());
  }
  return offset + src.size();
}

} // namespace KernelTls
