#pragma once

#include <string>

#include "source/common/protobuf/protobuf.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "yaml-cpp/yaml.h"

namespace KernelTls {

class ValueUtil {
public:
  /**
   * Converts a YAML document to a google.protobuf.Value. Scalars become bools or numbers when
   * they parse as such and strings otherwise.
   */
  static absl::StatusOr<ProtobufWkt::Value> loadFromYaml(const std::string& yaml);

private:
  static ProtobufWkt::Value parseYamlNode(const YAML::Node& node);
};

class MessageUtil {
public:
  /**
   * Parses JSON into a message. Unknown fields are rejected.
   */
  static absl::Status loadFromJson(const std::string& json, Protobuf::Message& message);

  /**
   * Parses YAML into a message through its JSON mapping.
   */
  static absl::Status loadFromYaml(const std::string& yaml, Protobuf::Message& message);

  /**
   * Reads a .yaml, .yml or .json file into a message.
   */
  static absl::Status loadFromFile(const std::string& path, Protobuf::Message& message);

  /**
   * @return the JSON form of a message, for logging.
   */
  static std::string getJsonStringFromMessage(const Protobuf::Message& message);
};

} // namespace KernelTls
