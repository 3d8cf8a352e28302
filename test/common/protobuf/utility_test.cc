#include "kernel_tls/extensions/transport_sockets/ktls/v3/ktls.pb.h"

#include "source/common/protobuf/utility.h"

#include "test/test_common/environment.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using testing::HasSubstr;

namespace KernelTls {
namespace {

using KtlsConfig = kernel_tls::extensions::transport_sockets::ktls::v3::KtlsTransportSocket;

TEST(ValueUtilTest, ScalarTypes) {
  absl::StatusOr<ProtobufWkt::Value> value =
      ValueUtil::loadFromYaml("{a: true, b: 12, c: 1.5, d: text, e: '12', f: 9999999999}");
  ASSERT_TRUE(value.ok()) << value.status();
  const auto& fields = value->struct_value().fields();
  EXPECT_TRUE(fields.at("a").bool_value());
  EXPECT_EQ(12, fields.at("b").number_value());
  EXPECT_EQ(1.5, fields.at("c").number_value());
  EXPECT_EQ("text", fields.at("d").string_value());
  EXPECT_EQ("12", fields.at("e").string_value());
  EXPECT_EQ("9999999999", fields.at("f").string_value());
}

TEST(ValueUtilTest, MalformedYaml) {
  absl::StatusOr<ProtobufWkt::Value> value = ValueUtil::loadFromYaml("{a: [1, 2");
  ASSERT_FALSE(value.ok());
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, value.status().code());
}

TEST(MessageUtilTest, LoadsKtlsConfigFromYaml) {
  KtlsConfig config;
  const absl::Status status = MessageUtil::loadFromYaml(R"EOF(
enabled: false
enable_tx_zerocopy: false
enable_rx_no_pad: true
module_path: /proc/sys/net/tls
file_transfer_mode: MAPPED
log_level: debug
)EOF",
                                                        config);
  ASSERT_TRUE(status.ok()) << status;
  ASSERT_TRUE(config.has_enabled());
  EXPECT_FALSE(config.enabled().value());
  ASSERT_TRUE(config.has_enable_tx_zerocopy());
  EXPECT_FALSE(config.enable_tx_zerocopy().value());
  EXPECT_TRUE(config.enable_rx_no_pad());
  EXPECT_EQ("/proc/sys/net/tls", config.module_path());
  EXPECT_EQ(KtlsConfig::MAPPED, config.file_transfer_mode());
  EXPECT_EQ("debug", config.log_level());
}

TEST(MessageUtilTest, EmptyYamlClearsMessage) {
  KtlsConfig config;
  config.set_module_path("/x");
  ASSERT_TRUE(MessageUtil::loadFromYaml("", config).ok());
  EXPECT_TRUE(config.module_path().empty());
  EXPECT_FALSE(config.has_enabled());
}

TEST(MessageUtilTest, RejectsUnknownFields) {
  KtlsConfig config;
  const absl::Status status = MessageUtil::loadFromYaml("enable_tx_zero_copy: true", config);
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, status.code());
  EXPECT_THAT(std::string(status.message()), HasSubstr("Unable to parse JSON as proto"));
}

TEST(MessageUtilTest, RejectsBadEnumAndTopLevelList) {
  KtlsConfig config;
  EXPECT_FALSE(MessageUtil::loadFromYaml("file_transfer_mode: SENDFILE", config).ok());
  EXPECT_FALSE(MessageUtil::loadFromYaml("- enabled: true", config).ok());
}

TEST(MessageUtilTest, LoadsFromFiles) {
  KtlsConfig config;
  const std::string json = TestEnvironment::writeStringToFileForTest(
      "ktls.json", R"EOF({"module_path": "/json", "file_transfer_mode": "MAPPED"})EOF");
  ASSERT_TRUE(MessageUtil::loadFromFile(json, config).ok());
  EXPECT_EQ("/json", config.module_path());

  const std::string yaml =
      TestEnvironment::writeStringToFileForTest("ktls.yaml", "module_path: /yaml\n");
  ASSERT_TRUE(MessageUtil::loadFromFile(yaml, config).ok());
  EXPECT_EQ("/yaml", config.module_path());

  const std::string txt = TestEnvironment::writeStringToFileForTest("ktls.txt", "");
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, MessageUtil::loadFromFile(txt, config).code());
  EXPECT_EQ(absl::StatusCode::kNotFound,
            MessageUtil::loadFromFile(TestEnvironment::temporaryPath("missing.yaml"), config)
                .code());
}

TEST(MessageUtilTest, JsonKeepsFieldNames) {
  KtlsConfig config;
  config.set_enable_rx_no_pad(true);
  EXPECT_EQ(R"EOF({"enable_rx_no_pad":true})EOF", MessageUtil::getJsonStringFromMessage(config));
}

} // namespace
} // namespace KernelTls
