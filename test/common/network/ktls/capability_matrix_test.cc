#include <sys/utsname.h>

#include <cstring>

#include "source/common/network/ktls/capability_matrix.h"

#include "test/mocks/api/mocks.h"
#include "test/test_common/threadsafe_singleton_injector.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::StrEq;

namespace KernelTls {
namespace Network {
namespace Ktls {
namespace {

TEST(KernelVersionTest, ParsesMajorMinor) {
  absl::optional<KernelVersion> version = KernelVersion::parse("6.1.0-18-amd64");
  ASSERT_TRUE(version.has_value());
  EXPECT_EQ(6u, version->major_);
  EXPECT_EQ(1u, version->minor_);
  EXPECT_EQ("6.1", version->toString());

  version = KernelVersion::parse("5.19");
  ASSERT_TRUE(version.has_value());
  EXPECT_EQ((KernelVersion{5, 19}), *version);
}

TEST(KernelVersionTest, RejectsMalformedReleases) {
  EXPECT_FALSE(KernelVersion::parse("").has_value());
  EXPECT_FALSE(KernelVersion::parse("linux").has_value());
  EXPECT_FALSE(KernelVersion::parse("6").has_value());
  EXPECT_FALSE(KernelVersion::parse("6.").has_value());
  EXPECT_FALSE(KernelVersion::parse("6-rc1").has_value());
  EXPECT_FALSE(KernelVersion::parse("99999999999.1").has_value());
}

TEST(KernelVersionTest, Ordering) {
  EXPECT_TRUE((KernelVersion{4, 13}).atLeast(4, 13));
  EXPECT_FALSE((KernelVersion{4, 12}).atLeast(4, 13));
  EXPECT_TRUE((KernelVersion{5, 0}).atLeast(4, 17));
  EXPECT_LT((KernelVersion{4, 20}), (KernelVersion{5, 1}));
}

TEST(CapabilityMatrixTest, ThresholdsByRelease) {
  const CapabilityMatrix old_kernel = CapabilityMatrix::fromKernelVersion({4, 12}, true, true);
  EXPECT_FALSE(old_kernel.txSupported());
  EXPECT_FALSE(old_kernel.aes128GcmSupported());

  const CapabilityMatrix k4_13 = CapabilityMatrix::fromKernelVersion({4, 13}, true, true);
  EXPECT_TRUE(k4_13.txSupported());
  EXPECT_TRUE(k4_13.aes128GcmSupported());
  EXPECT_FALSE(k4_13.rxSupported());

  const CapabilityMatrix k4_17 = CapabilityMatrix::fromKernelVersion({4, 17}, true, true);
  EXPECT_TRUE(k4_17.rxSupported());
  EXPECT_FALSE(k4_17.aes256GcmSupported());
  EXPECT_FALSE(k4_17.tls13TxSupported());

  const CapabilityMatrix k5_1 = CapabilityMatrix::fromKernelVersion({5, 1}, true, true);
  EXPECT_TRUE(k5_1.aes256GcmSupported());
  EXPECT_TRUE(k5_1.tls13TxSupported());
  EXPECT_FALSE(k5_1.chacha20Poly1305Supported());
  EXPECT_FALSE(k5_1.tls13RxSupported());

  const CapabilityMatrix k5_11 = CapabilityMatrix::fromKernelVersion({5, 11}, true, true);
  EXPECT_TRUE(k5_11.chacha20Poly1305Supported());
  EXPECT_FALSE(k5_11.zeroCopySupported());

  const CapabilityMatrix k5_19 = CapabilityMatrix::fromKernelVersion({5, 19}, true, true);
  EXPECT_TRUE(k5_19.zeroCopySupported());
  EXPECT_FALSE(k5_19.tls13RxSupported());
  EXPECT_FALSE(k5_19.noPadSupported());

  const CapabilityMatrix k6_0 = CapabilityMatrix::fromKernelVersion({6, 0}, true, true);
  EXPECT_TRUE(k6_0.tls13RxSupported());
  EXPECT_TRUE(k6_0.noPadSupported());
}

TEST(CapabilityMatrixTest, NewerKernelsNeverLoseFeatures) {
  const KernelVersion releases[] = {{4, 0},  {4, 13}, {4, 17}, {4, 20}, {5, 0}, {5, 1},
                                    {5, 10}, {5, 11}, {5, 18}, {5, 19}, {6, 0}, {6, 8}};
  for (size_t i = 1; i < sizeof(releases) / sizeof(releases[0]); ++i) {
    const CapabilityMatrix older = CapabilityMatrix::fromKernelVersion(releases[i - 1], true, true);
    const CapabilityMatrix newer = CapabilityMatrix::fromKernelVersion(releases[i], true, true);
    EXPECT_TRUE(older.isSubsetOf(newer)) << releases[i - 1].toString() << " vs "
                                         << releases[i].toString();
  }
}

TEST(CapabilityMatrixTest, NoFeaturesWithoutModuleOrPolicy) {
  const CapabilityMatrix no_module = CapabilityMatrix::fromKernelVersion({6, 8}, false, true);
  EXPECT_FALSE(no_module.txSupported());
  EXPECT_FALSE(no_module.rxSupported());
  EXPECT_FALSE(no_module.modulePresent());

  const CapabilityMatrix disabled = CapabilityMatrix::fromKernelVersion({6, 8}, true, false);
  EXPECT_FALSE(disabled.txSupported());
  EXPECT_FALSE(disabled.offloadEnabled());

  const CapabilityMatrix unsupported = CapabilityMatrix::unsupported();
  EXPECT_FALSE(unsupported.txSupported());
  EXPECT_FALSE(unsupported.kernelVersion().has_value());
  EXPECT_TRUE(unsupported.isSubsetOf(disabled));
}

class CapabilityMatrixProbeTest : public testing::Test {
protected:
  void expectRelease(const char* release) {
    EXPECT_CALL(os_sys_calls_, uname(_)).WillOnce(Invoke([release](struct utsname* name) {
      memset(name, 0, sizeof(*name));
      strncpy(name->release, release, sizeof(name->release) - 1);
      return Api::SysCallIntResult{0, 0};
    }));
  }

  Api::MockOsSysCalls os_sys_calls_;
  TestThreadsafeSingletonInjector<Api::OsSysCallsImpl> os_calls_{&os_sys_calls_};
};

TEST_F(CapabilityMatrixProbeTest, ProbesRunningKernel) {
  EXPECT_CALL(os_sys_calls_, stat(StrEq("/sys/module/tls"), _))
      .WillOnce(Return(Api::SysCallIntResult{0, 0}));
  expectRelease("5.15.0-91-generic");

  const CapabilityMatrix matrix = CapabilityMatrix::probe(ProbeOptions());
  EXPECT_TRUE(matrix.modulePresent());
  EXPECT_TRUE(matrix.offloadEnabled());
  EXPECT_TRUE(matrix.txSupported());
  EXPECT_TRUE(matrix.rxSupported());
  EXPECT_TRUE(matrix.chacha20Poly1305Supported());
  EXPECT_FALSE(matrix.zeroCopySupported());
  EXPECT_FALSE(matrix.tls13RxSupported());
  ASSERT_TRUE(matrix.kernelVersion().has_value());
  EXPECT_EQ((KernelVersion{5, 15}), *matrix.kernelVersion());
}

TEST_F(CapabilityMatrixProbeTest, UsesConfiguredModulePath) {
  ProbeOptions options;
  options.module_path_ = "/custom/tls";
  EXPECT_CALL(os_sys_calls_, stat(StrEq("/custom/tls"), _))
      .WillOnce(Return(Api::SysCallIntResult{0, 0}));
  expectRelease("6.6.7");

  EXPECT_TRUE(CapabilityMatrix::probe(options).noPadSupported());
}

TEST_F(CapabilityMatrixProbeTest, DisabledSkipsDetection) {
  ProbeOptions options;
  options.enabled_ = false;
  EXPECT_CALL(os_sys_calls_, stat(_, _)).Times(0);
  EXPECT_CALL(os_sys_calls_, uname(_)).Times(0);

  const CapabilityMatrix matrix = CapabilityMatrix::probe(options);
  EXPECT_FALSE(matrix.offloadEnabled());
  EXPECT_FALSE(matrix.txSupported());
}

TEST_F(CapabilityMatrixProbeTest, MissingModule) {
  EXPECT_CALL(os_sys_calls_, stat(_, _)).WillOnce(Return(Api::SysCallIntResult{-1, ENOENT}));
  EXPECT_CALL(os_sys_calls_, uname(_)).Times(0);

  const CapabilityMatrix matrix = CapabilityMatrix::probe(ProbeOptions());
  EXPECT_FALSE(matrix.modulePresent());
  EXPECT_FALSE(matrix.txSupported());
}

TEST_F(CapabilityMatrixProbeTest, UnameFailure) {
  EXPECT_CALL(os_sys_calls_, stat(_, _)).WillOnce(Return(Api::SysCallIntResult{0, 0}));
  EXPECT_CALL(os_sys_calls_, uname(_)).WillOnce(Return(Api::SysCallIntResult{-1, EFAULT}));

  EXPECT_FALSE(CapabilityMatrix::probe(ProbeOptions()).txSupported());
}

TEST_F(CapabilityMatrixProbeTest, UnparsableRelease) {
  EXPECT_CALL(os_sys_calls_, stat(_, _)).WillOnce(Return(Api::SysCallIntResult{0, 0}));
  expectRelease("unknown");

  const CapabilityMatrix matrix = CapabilityMatrix::probe(ProbeOptions());
  EXPECT_FALSE(matrix.txSupported());
  EXPECT_FALSE(matrix.kernelVersion().has_value());
}

} // namespace
} // namespace Ktls
} // namespace Network
} // namespace KernelTls
