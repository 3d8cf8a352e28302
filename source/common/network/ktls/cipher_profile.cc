#include "source/common/network/ktls/cipher_profile.h"

#include "source/common/common/assert.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

absl::string_view tlsVersionName(TlsVersion version) {
  switch (version) {
  case TlsVersion::Tls12:
    return "TLSv1.2";
  case TlsVersion::Tls13:
    return "TLSv1.3";
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

absl::string_view directionName(Direction direction) {
  switch (direction) {
  case Direction::Tx:
    return "TLS_TX";
  case Direction::Rx:
    return "TLS_RX";
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

absl::string_view cipherFamilyName(CipherFamily family) {
  switch (family) {
  case CipherFamily::Aes128Gcm:
    return "AES-GCM-128";
  case CipherFamily::Aes256Gcm:
    return "AES-GCM-256";
  case CipherFamily::Chacha20Poly1305:
    return "CHACHA20-POLY1305";
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

const CipherProfile& CipherProfile::get(CipherFamily family) {
  switch (family) {
  case CipherFamily::Aes128Gcm:
    return Aes128GcmProfile;
  case CipherFamily::Aes256Gcm:
    return Aes256GcmProfile;
  case CipherFamily::Chacha20Poly1305:
    return Chacha20Poly1305Profile;
  }
  PANIC_DUE_TO_CORRUPT_ENUM;
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
