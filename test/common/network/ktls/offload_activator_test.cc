#include <linux/tls.h>
#include <netinet/tcp.h>

#include "source/common/network/ktls/cipher_suite_table.h"
#include "source/common/network/ktls/ktls_status.h"
#include "source/common/network/ktls/offload_activator.h"

#include "test/mocks/api/mocks.h"
#include "test/test_common/threadsafe_singleton_injector.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::_;
using testing::InSequence;
using testing::Return;

namespace KernelTls {
namespace Network {
namespace Ktls {
namespace {

constexpr os_fd_t Fd = 7;

SessionKeys makeKeys(uint16_t suite, TlsVersion version, size_t key_size, size_t iv_size) {
  SessionKeys keys;
  keys.cipher_suite_id_ = suite;
  keys.version_ = version;
  keys.in_key_.assign(key_size, 0x11);
  keys.out_key_.assign(key_size, 0x22);
  keys.in_iv_.assign(iv_size, 0x33);
  keys.out_iv_.assign(iv_size, 0x44);
  keys.in_sequence_.assign(8, 0);
  keys.out_sequence_.assign(8, 0);
  keys.out_sequence_[7] = 1;
  return keys;
}

SessionKeys tls12Aes128() {
  return makeKeys(CipherSuites::TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256, TlsVersion::Tls12, 16, 4);
}

SessionKeys tls13Aes128() {
  return makeKeys(CipherSuites::TLS_AES_128_GCM_SHA256, TlsVersion::Tls13, 16, 12);
}

class OffloadActivatorTest : public testing::Test {
protected:
  void expectUlp() {
    EXPECT_CALL(os_sys_calls_, setsockopt(Fd, SOL_TCP, TCP_ULP, _, _))
        .WillOnce(Return(Api::SysCallIntResult{0, 0}));
  }
  void expectDirection(int optname, int rc = 0, int sys_errno = 0) {
    EXPECT_CALL(os_sys_calls_, setsockopt(Fd, SOL_TLS, optname, _, _))
        .WillOnce(Return(Api::SysCallIntResult{rc, sys_errno}));
  }

  Api::MockOsSysCalls os_sys_calls_;
  TestThreadsafeSingletonInjector<Api::OsSysCallsImpl> os_calls_{&os_sys_calls_};
  OffloadState state_;
  ActivationPolicy policy_;
};

TEST_F(OffloadActivatorTest, OffloadsBothDirections) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({5, 10}, true, true);
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);
  expectDirection(TLS_RX);

  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
  EXPECT_TRUE(state_.isTxOffloaded());
  EXPECT_TRUE(state_.isRxOffloaded());
  EXPECT_TRUE(state_.ulpBound());
}

TEST_F(OffloadActivatorTest, DisabledPolicyIsNoop) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, false);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
  EXPECT_EQ(DirectionMode::SoftwareCipher, state_.txMode());
  EXPECT_EQ(DirectionMode::SoftwareCipher, state_.rxMode());
}

TEST_F(OffloadActivatorTest, UnknownSuiteStaysInSoftware) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  // TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA256
  EXPECT_TRUE(activator.activate(Fd, state_, makeKeys(0xc027, TlsVersion::Tls12, 16, 4)).ok());
  EXPECT_FALSE(state_.isTxOffloaded());
  EXPECT_FALSE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, SuiteOfOtherVersionIsRejected) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  const absl::Status status = activator.activate(
      Fd, state_, makeKeys(CipherSuites::TLS_AES_128_GCM_SHA256, TlsVersion::Tls12, 16, 4));
  EXPECT_EQ(KtlsStatusCode::CipherSuiteMismatch, getStatusCode(status));
  EXPECT_FALSE(state_.isTxOffloaded());
}

TEST_F(OffloadActivatorTest, FamilyNotInKernel) {
  // ChaCha20-Poly1305 arrived in 5.11.
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({5, 10}, true, true);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_FALSE(activator.familySupported(CipherFamily::Chacha20Poly1305));
  EXPECT_TRUE(activator.familySupported(CipherFamily::Aes256Gcm));
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  EXPECT_TRUE(activator
                  .activate(Fd, state_,
                            makeKeys(CipherSuites::TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256,
                                     TlsVersion::Tls12, 32, 12))
                  .ok());
  EXPECT_FALSE(state_.isTxOffloaded());
}

TEST_F(OffloadActivatorTest, Tls13TxOnlyOnOlderKernels) {
  // TLS 1.3 TX is available, TLS 1.3 RX is not.
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({5, 15}, true, true);
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);

  EXPECT_TRUE(activator.activate(Fd, state_, tls13Aes128()).ok());
  EXPECT_TRUE(state_.isTxOffloaded());
  EXPECT_FALSE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, Tls13BeforeKernelSupport) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({4, 19}, true, true);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  EXPECT_TRUE(activator.activate(Fd, state_, tls13Aes128()).ok());
  EXPECT_FALSE(state_.isTxOffloaded());
}

TEST_F(OffloadActivatorTest, TxOnlyKernel) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({4, 14}, true, true);
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);

  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
  EXPECT_TRUE(state_.isTxOffloaded());
  EXPECT_FALSE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, TxFailureLeavesBothInSoftware) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX, -1, EINVAL);

  const absl::Status status = activator.activate(Fd, state_, tls12Aes128());
  EXPECT_TRUE(isKernelRejectedError(status));
  EXPECT_FALSE(state_.isTxOffloaded());
  EXPECT_FALSE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, RxFailureKeepsTxOffloaded) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);
  expectDirection(TLS_RX, -1, ENOMEM);

  const absl::Status status = activator.activate(Fd, state_, tls12Aes128());
  EXPECT_TRUE(isKernelRejectedError(status));
  EXPECT_EQ(ENOMEM, ktlsErrno(status));
  EXPECT_TRUE(state_.isTxOffloaded());
  EXPECT_FALSE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, BadKeyLengthIsReported) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);
  EXPECT_CALL(os_sys_calls_, setsockopt(_, _, _, _, _)).Times(0);

  SessionKeys keys = tls12Aes128();
  keys.out_key_.resize(15);
  const absl::Status status = activator.activate(Fd, state_, keys);
  EXPECT_EQ(KtlsStatusCode::InvalidKeyLength, getStatusCode(status));
  EXPECT_FALSE(state_.isTxOffloaded());
}

TEST_F(OffloadActivatorTest, AlreadyOffloadedDirectionIsSkipped) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  OffloadActivator activator(capabilities, policy_);
  state_.markTxOffloaded();

  // The ULP is attached already, only RX is configured.
  expectDirection(TLS_RX);
  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
  EXPECT_TRUE(state_.isRxOffloaded());

  // Nothing left to do.
  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
}

TEST_F(OffloadActivatorTest, PolicyAndKernelGateOptionalFeatures) {
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({6, 8}, true, true);
  policy_.tx_zerocopy_ = true;
  policy_.rx_expect_no_pad_ = true;
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);
  expectDirection(TLS_TX_ZEROCOPY_RO);
  expectDirection(TLS_RX);
  expectDirection(TLS_RX_EXPECT_NO_PAD);

  EXPECT_TRUE(activator.activate(Fd, state_, tls13Aes128()).ok());
  EXPECT_TRUE(state_.isRxOffloaded());
}

TEST_F(OffloadActivatorTest, OptionalFeaturesNeedKernelSupport) {
  // Zerocopy is 5.19+, no-pad needs 6.0+.
  const CapabilityMatrix capabilities = CapabilityMatrix::fromKernelVersion({5, 15}, true, true);
  policy_.tx_zerocopy_ = true;
  policy_.rx_expect_no_pad_ = true;
  OffloadActivator activator(capabilities, policy_);

  InSequence s;
  expectUlp();
  expectDirection(TLS_TX);
  expectDirection(TLS_RX);

  EXPECT_TRUE(activator.activate(Fd, state_, tls12Aes128()).ok());
}

} // namespace
} // namespace Ktls
} // namespace Network
} // namespace KernelTls
