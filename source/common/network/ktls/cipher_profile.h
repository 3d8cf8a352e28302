#pragma once

#include <linux/tls.h>

#include <cstddef>
#include <cstdint>

#include "absl/strings/string_view.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Record protection versions accepted by the kernel, as they appear on the wire.
 */
enum class TlsVersion : uint16_t {
  Tls12 = TLS_1_2_VERSION,
  Tls13 = TLS_1_3_VERSION,
};

absl::string_view tlsVersionName(TlsVersion version);

/**
 * Traffic direction configured on a socket.
 */
enum class Direction { Tx, Rx };

absl::string_view directionName(Direction direction);

enum class CipherFamily { Aes128Gcm, Aes256Gcm, Chacha20Poly1305 };

absl::string_view cipherFamilyName(CipherFamily family);

/**
 * Sizes and kernel identifier of one AEAD cipher, as the kernel crypto_info layout for that
 * cipher expects them. The blob layout is
 *   u16 version | u16 cipher_type | iv | key | salt | rec_seq
 * in host byte order with no padding.
 */
struct CipherProfile {
  CipherFamily family_;
  uint16_t cipher_type_;
  size_t iv_size_;
  size_t key_size_;
  size_t salt_size_;
  size_t tag_size_;
  size_t rec_seq_size_;

  /**
   * Size of the crypto_info header holding version and cipher type.
   */
  static constexpr size_t HeaderSize = 2 * sizeof(uint16_t);

  constexpr size_t wireSize() const {
    return HeaderSize + iv_size_ + key_size_ + salt_size_ + rec_seq_size_;
  }

  /**
   * @return the IV length the handshake must hand over for the given version. Ciphers with a salt
   * take only the salt for TLS 1.2 (the explicit nonce travels in each record) and salt plus iv
   * for TLS 1.3. Ciphers without a salt always take the full iv.
   */
  constexpr size_t ivInputSize(TlsVersion version) const {
    if (salt_size_ == 0) {
      return iv_size_;
    }
    return version == TlsVersion::Tls13 ? salt_size_ + iv_size_ : salt_size_;
  }

  /**
   * @return the profile of a cipher family.
   */
  static const CipherProfile& get(CipherFamily family);
};

inline constexpr CipherProfile Aes128GcmProfile{CipherFamily::Aes128Gcm,
                                         TLS_CIPHER_AES_GCM_128,
                                         TLS_CIPHER_AES_GCM_128_IV_SIZE,
                                         TLS_CIPHER_AES_GCM_128_KEY_SIZE,
                                         TLS_CIPHER_AES_GCM_128_SALT_SIZE,
                                         TLS_CIPHER_AES_GCM_128_TAG_SIZE,
                                         TLS_CIPHER_AES_GCM_128_REC_SEQ_SIZE};

inline constexpr CipherProfile Aes256GcmProfile{CipherFamily::Aes256Gcm,
                                         TLS_CIPHER_AES_GCM_256,
                                         TLS_CIPHER_AES_GCM_256_IV_SIZE,
                                         TLS_CIPHER_AES_GCM_256_KEY_SIZE,
                                         TLS_CIPHER_AES_GCM_256_SALT_SIZE,
                                         TLS_CIPHER_AES_GCM_256_TAG_SIZE,
                                         TLS_CIPHER_AES_GCM_256_REC_SEQ_SIZE};

inline constexpr CipherProfile Chacha20Poly1305Profile{CipherFamily::Chacha20Poly1305,
                                                TLS_CIPHER_CHACHA20_POLY1305,
                                                TLS_CIPHER_CHACHA20_POLY1305_IV_SIZE,
                                                TLS_CIPHER_CHACHA20_POLY1305_KEY_SIZE,
                                                TLS_CIPHER_CHACHA20_POLY1305_SALT_SIZE,
                                                TLS_CIPHER_CHACHA20_POLY1305_TAG_SIZE,
                                                TLS_CIPHER_CHACHA20_POLY1305_REC_SEQ_SIZE};

// The kernel UAPI structs carry no padding; the explicit layout must match them.
static_assert(Aes128GcmProfile.wireSize() == sizeof(struct tls12_crypto_info_aes_gcm_128),
              "AES-GCM-128 crypto_info size mismatch");
static_assert(Aes256GcmProfile.wireSize() == sizeof(struct tls12_crypto_info_aes_gcm_256),
              "AES-GCM-256 crypto_info size mismatch");
static_assert(Chacha20Poly1305Profile.wireSize() ==
                  sizeof(struct tls12_crypto_info_chacha20_poly1305),
              "CHACHA20-POLY1305 crypto_info size mismatch");

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
