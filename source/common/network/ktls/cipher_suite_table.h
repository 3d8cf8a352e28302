#pragma once

#include <cstdint>

#include "source/common/network/ktls/cipher_profile.h"

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * IANA cipher suite identifiers the kernel can take over.
 */
namespace CipherSuites {
// TLS 1.2
constexpr uint16_t TLS_RSA_WITH_AES_128_GCM_SHA256 = 0x009c;
constexpr uint16_t TLS_RSA_WITH_AES_256_GCM_SHA384 = 0x009d;
constexpr uint16_t TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256 = 0xc02b;
constexpr uint16_t TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384 = 0xc02c;
constexpr uint16_t TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256 = 0xc02f;
constexpr uint16_t TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384 = 0xc030;
constexpr uint16_t TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256 = 0xcca8;
constexpr uint16_t TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256 = 0xcca9;
// TLS 1.3
constexpr uint16_t TLS_AES_128_GCM_SHA256 = 0x1301;
constexpr uint16_t TLS_AES_256_GCM_SHA384 = 0x1302;
constexpr uint16_t TLS_CHACHA20_POLY1305_SHA256 = 0x1303;
} // namespace CipherSuites

struct CipherSuiteEntry {
  uint16_t id_;
  absl::string_view name_;
  CipherFamily family_;
  TlsVersion version_;
};

/**
 * Fixed mapping from negotiated cipher suite to the kernel cipher family that protects it.
 */
class CipherSuiteTable {
public:
  /**
   * @return the entry for a suite, or nullptr if the kernel cannot offload it.
   */
  static const CipherSuiteEntry* find(uint16_t cipher_suite_id);

  /**
   * @return every recognized suite.
   */
  static absl::Span<const CipherSuiteEntry> entries();
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
