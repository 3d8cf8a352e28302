#pragma once

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace KernelTls {

/**
 * @return the text of strerror() for the given errno value.
 */
std::string errorDetails(int error_code);

/**
 * Utilities for dealing with kernel release strings.
 */
class StringUtil {
public:
  /**
   * Parses the leading run of decimal digits of a string.
   * @param str supplies the string to parse. On success it is advanced past the digits.
   * @param out receives the value.
   * @return false if the string does not start with a digit or the value overflows.
   */
  static bool consumeLeadingUint32(absl::string_view& str, uint32_t& out);
};

/**
 * Helpers for byte buffers.
 */
class ByteUtil {
public:
  /**
   * Copies src into dst starting at offset and returns the offset just past the copy.
   */
  static size_t writeBytes(absl::Span<uint8_t> dst, size_t offset,
                           absl::Span<const uint8_t> src);
};

} // namespace KernelTls
