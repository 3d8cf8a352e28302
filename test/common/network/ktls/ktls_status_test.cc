#include "source/common/network/ktls/ktls_status.h"

#include "gtest/gtest.h"

namespace KernelTls {
namespace Network {
namespace Ktls {
namespace {

TEST(KtlsStatusTest, OkStatus) {
  EXPECT_EQ(KtlsStatusCode::Ok, getStatusCode(absl::OkStatus()));
  EXPECT_EQ(0, ktlsErrno(absl::OkStatus()));
  EXPECT_FALSE(isValidationError(absl::OkStatus()));
}

TEST(KtlsStatusTest, ValidationErrors) {
  const absl::Status key = invalidKeyLengthError(32, 16);
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, key.code());
  EXPECT_EQ("kTLS: wrong key length, desired: 32, actual: 16", key.message());
  EXPECT_EQ(KtlsStatusCode::InvalidKeyLength, getStatusCode(key));
  EXPECT_TRUE(isValidationError(key));
  EXPECT_EQ(0, ktlsErrno(key));

  EXPECT_EQ(KtlsStatusCode::InvalidIvLength, getStatusCode(invalidIvLengthError(4, 12)));
  EXPECT_EQ(KtlsStatusCode::InvalidSequenceLength,
            getStatusCode(invalidSequenceLengthError(8, 0)));
  EXPECT_EQ("kTLS: wrong cryptoInfo length, desired: 40, actual: 41",
            std::string(wireSizeMismatchError(40, 41).message()));
  EXPECT_TRUE(isValidationError(cipherSuiteMismatchError("mismatch")));
}

TEST(KtlsStatusTest, SystemErrorsCarryErrno) {
  const absl::Status ulp = ulpBindFailedError(ENOENT);
  EXPECT_TRUE(isUlpBindFailedError(ulp));
  EXPECT_FALSE(isKernelRejectedError(ulp));
  EXPECT_FALSE(isValidationError(ulp));
  EXPECT_EQ(ENOENT, ktlsErrno(ulp));
  EXPECT_EQ(absl::StatusCode::kNotFound, ulp.code());

  const absl::Status rejected = kernelRejectedError("TLS_RX", EINVAL);
  EXPECT_TRUE(isKernelRejectedError(rejected));
  EXPECT_EQ(EINVAL, ktlsErrno(rejected));
  EXPECT_NE(std::string::npos, std::string(rejected.message()).find("TLS_RX"));
}

TEST(KtlsStatusTest, CodeNames) {
  EXPECT_EQ("InvalidKeyLength", toString(KtlsStatusCode::InvalidKeyLength));
  EXPECT_EQ("KernelRejected", toString(KtlsStatusCode::KernelRejected));
  EXPECT_EQ("CipherSuiteMismatch", toString(KtlsStatusCode::CipherSuiteMismatch));
}

} // namespace
} // namespace Ktls
} // namespace Network
} // namespace KernelTls
