#pragma once

#include <cstdint>
#include <string>

#include "source/common/common/logger.h"

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

/**
 * Major and minor number of a kernel release. The patch level never changes what kTLS offers.
 */
struct KernelVersion {
  uint32_t major_{0};
  uint32_t minor_{0};

  /**
   * Parses a uname() release string such as "5.15.0-91-generic" or "6.1".
   * @return nullopt if the string does not start with "<major>.<minor>".
   */
  static absl::optional<KernelVersion> parse(absl::string_view release);

  bool atLeast(uint32_t major, uint32_t minor) const {
    return major_ > major || (major_ == major && minor_ >= minor);
  }

  bool operator<(const KernelVersion& other) const {
    return major_ < other.major_ || (major_ == other.major_ && minor_ < other.minor_);
  }
  bool operator==(const KernelVersion& other) const {
    return major_ == other.major_ && minor_ == other.minor_;
  }

  std::string toString() const;
};

struct ProbeOptions {
  // Offload policy switch. When false every activation is a no-op.
  bool enabled_{true};
  // Directory that exists when the tls kernel module is loaded (or built in).
  std::string module_path_{"/sys/module/tls"};
};

/**
 * What the running kernel can offload. Built once at startup and never changed afterwards, so it
 * can be shared by reference between connections and threads.
 */
class CapabilityMatrix : public Logger::Loggable<Logger::Id::ktls> {
public:
  /**
   * Probes the running kernel: checks the module marker and parses the uname() release. Never
   * fails; any detection problem yields the unsupported matrix.
   */
  static CapabilityMatrix probe(const ProbeOptions& options);

  /**
   * Derives capabilities from a kernel version. All thresholds are inclusive.
   */
  static CapabilityMatrix fromKernelVersion(const KernelVersion& version, bool module_present,
                                            bool offload_enabled);

  /**
   * @return a matrix with every capability off.
   */
  static CapabilityMatrix unsupported();

  bool modulePresent() const { return module_present_; }
  bool offloadEnabled() const { return offload_enabled_; }
  bool txSupported() const { return tx_; }
  bool rxSupported() const { return rx_; }
  bool aes128GcmSupported() const { return aes128_gcm_; }
  bool aes256GcmSupported() const { return aes256_gcm_; }
  bool chacha20Poly1305Supported() const { return chacha20_poly1305_; }
  bool tls13TxSupported() const { return tls13_tx_; }
  bool tls13RxSupported() const { return tls13_rx_; }
  bool zeroCopySupported() const { return zero_copy_; }
  bool noPadSupported() const { return no_pad_; }
  const absl::optional<KernelVersion>& kernelVersion() const { return kernel_version_; }

  /**
   * Logs every capability at debug level.
   */
  void logFeatures() const;

  /**
   * @return true if every capability of this matrix is also present in other.
   */
  bool isSubsetOf(const CapabilityMatrix& other) const;

private:
  CapabilityMatrix() = default;

  absl::optional<KernelVersion> kernel_version_;
  bool module_present_{false};
  bool offload_enabled_{false};
  bool tx_{false};
  bool rx_{false};
  bool aes128_gcm_{false};
  bool aes256_gcm_{false};
  bool chacha20_poly1305_{false};
  bool tls13_tx_{false};
  bool tls13_rx_{false};
  bool zero_copy_{false};
  bool no_pad_{false};
};

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
