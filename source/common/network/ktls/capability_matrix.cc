#include "source/common/network/ktls/capability_matrix.h"

#include <sys/stat.h>
#include <sys/utsname.h>

#include "source/common/api/os_sys_calls_impl.h"
#include "source/common/common/utility.h"

#include "absl/strings/str_cat.h"

namespace KernelTls {
namespace Network {
namespace Ktls {

absl::optional<KernelVersion> KernelVersion::parse(absl::string_view release) {
  KernelVersion version;
  if (!StringUtil::consumeLeadingUint32(release, version.major_)) {
    return absl::nullopt;
  }
  if (release.empty() || release.front() != '.') {
    return absl::nullopt;
  }
  release.remove_prefix(1);
  if (!StringUtil::consumeLeadingUint32(release, version.minor_)) {
    return absl::nullopt;
  }
  return version;
}

std::string KernelVersion::toString() const { return absl::StrCat(major_, ".", minor_); }

CapabilityMatrix CapabilityMatrix::probe(const ProbeOptions& options) {
  auto& os_sys_calls = Api::OsSysCallsSingleton::get();

  if (!options.enabled_) {
    KTLS_LOG(debug, "kTLS: disabled by configuration");
    return unsupported();
  }

  struct stat module_stat;
  const Api::SysCallIntResult stat_result =
      os_sys_calls.stat(options.module_path_.c_str(), &module_stat);
  if (stat_result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: kernel module marker {} not found: {}", options.module_path_,
             errorDetails(stat_result.errno_));
    return unsupported();
  }

  struct utsname name;
  const Api::SysCallIntResult uname_result = os_sys_calls.uname(&name);
  if (uname_result.return_value_ != 0) {
    KTLS_LOG(debug, "kTLS: uname failed: {}", errorDetails(uname_result.errno_));
    return unsupported();
  }

  const absl::optional<KernelVersion> version = KernelVersion::parse(name.release);
  if (!version.has_value()) {
    KTLS_LOG(debug, "kTLS: unable to parse kernel release '{}'", name.release);
    return unsupported();
  }

  CapabilityMatrix matrix = fromKernelVersion(*version, true, true);
  matrix.logFeatures();
  return matrix;
}

CapabilityMatrix CapabilityMatrix::fromKernelVersion(const KernelVersion& version,
                                                     bool module_present, bool offload_enabled) {
  CapabilityMatrix matrix;
  matrix.kernel_version_ = version;
  matrix.module_present_ = module_present;
  matrix.offload_enabled_ = offload_enabled;
  if (!module_present || !offload_enabled) {
    return matrix;
  }

  // Thresholds follow the kernel releases that introduced each feature in net/tls.
  matrix.tx_ = version.atLeast(4, 13);
  matrix.aes128_gcm_ = version.atLeast(4, 13);
  matrix.rx_ = version.atLeast(4, 17);
  matrix.aes256_gcm_ = version.atLeast(5, 1);
  matrix.tls13_tx_ = version.atLeast(5, 1);
  matrix.chacha20_poly1305_ = version.atLeast(5, 11);
  matrix.zero_copy_ = version.atLeast(5, 19);
  matrix.tls13_rx_ = version.major_ > 5;
  matrix.no_pad_ = version.major_ > 5;
  return matrix;
}

CapabilityMatrix CapabilityMatrix::unsupported() { return CapabilityMatrix(); }

void CapabilityMatrix::logFeatures() const {
  KTLS_LOG(debug, "kTLS: kernel {}", kernel_version_.has_value() ? kernel_version_->toString()
                                                                  : std::string("unknown"));
  KTLS_LOG(debug, "kTLS module: {}", module_present_);
  KTLS_LOG(debug, "kTLS enabled: {}", offload_enabled_);
  KTLS_LOG(debug, "kTLS TX: {}", tx_);
  KTLS_LOG(debug, "kTLS RX: {}", rx_);
  KTLS_LOG(debug, "kTLS TLS 1.3 TX: {}", tls13_tx_);
  KTLS_LOG(debug, "kTLS TLS 1.3 RX: {}", tls13_rx_);
  KTLS_LOG(debug, "kTLS TX zerocopy sendfile: {}", zero_copy_);
  KTLS_LOG(debug, "kTLS RX expect no pad: {}", no_pad_);
  KTLS_LOG(debug, "kTLS AES-GCM-128: {}", aes128_gcm_);
  KTLS_LOG(debug, "kTLS AES-GCM-256: {}", aes256_gcm_);
  KTLS_LOG(debug, "kTLS CHACHA20POLY1305: {}", chacha20_poly1305_);
}

bool CapabilityMatrix::isSubsetOf(const CapabilityMatrix& other) const {
  const auto implies = [](bool a, bool b) { return !a || b; };
  return implies(tx_, other.tx_) && implies(rx_, other.rx_) &&
         implies(aes128_gcm_, other.aes128_gcm_) && implies(aes256_gcm_, other.aes256_gcm_) &&
         implies(chacha20_poly1305_, other.chacha20_poly1305_) &&
         implies(tls13_tx_, other.tls13_tx_) && implies(tls13_rx_, other.tls13_rx_) &&
         implies(zero_copy_, other.zero_copy_) && implies(no_pad_, other.no_pad_);
}

} // namespace Ktls
} // namespace Network
} // namespace KernelTls
