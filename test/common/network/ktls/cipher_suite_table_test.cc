#include "source/common/network/ktls/cipher_suite_table.h"

#include "absl/container/flat_hash_set.h"
#include "gtest/gtest.h"

namespace KernelTls {
namespace Network {
namespace Ktls {
namespace {

TEST(CipherSuiteTableTest, MapsSuitesToFamilies) {
  const CipherSuiteEntry* entry = CipherSuiteTable::find(0xc02f);
  ASSERT_NE(nullptr, entry);
  EXPECT_EQ(CipherFamily::Aes128Gcm, entry->family_);
  EXPECT_EQ(TlsVersion::Tls12, entry->version_);
  EXPECT_EQ("TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256", entry->name_);

  entry = CipherSuiteTable::find(CipherSuites::TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384);
  ASSERT_NE(nullptr, entry);
  EXPECT_EQ(CipherFamily::Aes256Gcm, entry->family_);

  entry = CipherSuiteTable::find(CipherSuites::TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256);
  ASSERT_NE(nullptr, entry);
  EXPECT_EQ(CipherFamily::Chacha20Poly1305, entry->family_);
  EXPECT_EQ(TlsVersion::Tls12, entry->version_);

  entry = CipherSuiteTable::find(CipherSuites::TLS_AES_256_GCM_SHA384);
  ASSERT_NE(nullptr, entry);
  EXPECT_EQ(CipherFamily::Aes256Gcm, entry->family_);
  EXPECT_EQ(TlsVersion::Tls13, entry->version_);
}

TEST(CipherSuiteTableTest, UnknownSuites) {
  // TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA256 and TLS_AES_128_CCM_SHA256.
  EXPECT_EQ(nullptr, CipherSuiteTable::find(0xc027));
  EXPECT_EQ(nullptr, CipherSuiteTable::find(0x1304));
  EXPECT_EQ(nullptr, CipherSuiteTable::find(0));
}

TEST(CipherSuiteTableTest, EntriesAreUnique) {
  absl::flat_hash_set<uint16_t> ids;
  size_t tls13 = 0;
  for (const CipherSuiteEntry& entry : CipherSuiteTable::entries()) {
    EXPECT_TRUE(ids.insert(entry.id_).second) << entry.name_;
    EXPECT_EQ(&entry, CipherSuiteTable::find(entry.id_));
    if (entry.version_ == TlsVersion::Tls13) {
      ++tls13;
    }
  }
  EXPECT_EQ(11u, ids.size());
  EXPECT_EQ(3u, tls13);
}

} // namespace
} // namespace Ktls
} // namespace Network
} // namespace KernelTls
