#include "source/common/network/ktls/cipher_suite_table.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

namespace {

using namespace CipherSuites;

constexpr CipherSuiteEntry Entries[] = {
    {TLS_RSA_WITH_AES_128_GCM_SHA256, "TLS_RSA_WITH_AES_128_GCM_SHA256", CipherFamily::Aes128Gcm,
     TlsVersion::Tls12},
    {TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256, "TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256",
     CipherFamily::Aes128Gcm, TlsVersion::Tls12},
    {TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256, "TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256",
     CipherFamily::Aes128Gcm, TlsVersion::Tls12},
    {TLS_RSA_WITH_AES_256_GCM_SHA384, "TLS_RSA_WITH_AES_256_GCM_SHA384", CipherFamily::Aes256Gcm,
     TlsVersion::Tls12},
    {TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384, "TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384",
     CipherFamily::Aes256Gcm, TlsVersion::Tls12},
    {TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384, "TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384",
     CipherFamily::Aes256Gcm, TlsVersion::Tls12},
    {TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256, "TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256",
     CipherFamily::Chacha20Poly1305, TlsVersion::Tls12},
    {TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256,
     "TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256", CipherFamily::Chacha20Poly1305,
     TlsVersion::Tls12},
    {TLS_AES_128_GCM_SHA256, "TLS_AES_128_GCM_SHA256", CipherFamily::Aes128Gcm,
     TlsVersion::Tls13},
    {TLS_AES_256_GCM_SHA384, "TLS_AES_256_GCM_SHA384", CipherFamily::Aes256Gcm,
     TlsVersion::Tls13},
    {TLS_CHACHA20_POLY1305_SHA256, "TLS_CHACHA20_POLY1305_SHA256", CipherFamily::Chacha20Poly1305,
     TlsVersion::Tls13},
};

} // namespace

const CipherSuiteEntry* CipherSuiteTable::find(uint16_t cipher_suite_id) {
  for (const CipherSuiteEntry& entry : Entries) {
    if (entry.id_ == cipher_suite_id) {
      return &entry;
    }
  }
  return nullptr;
}

absl::Span<const CipherSuiteEntry> CipherSuiteTable::entries() { return Entries; }

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
