#include "source/common/protobuf/utility.h"

#include <fstream>
#include <limits>
#include <sstream>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace KernelTls {

absl::StatusOr<ProtobufWkt::Value> ValueUtil::loadFromYaml(const std::string& yaml) {
  try {
    return parseYamlNode(YAML::Load(yaml));
  } catch (const YAML::ParserException& e) {
    return absl::InvalidArgumentError(absl::StrCat("Unable to parse YAML: ", e.what()));
  } catch (const YAML::BadConversion& e) {
    return absl::InvalidArgumentError(absl::StrCat("Unable to convert YAML: ", e.what()));
  }
}

ProtobufWkt::Value ValueUtil::parseYamlNode(const YAML::Node& node) {
  ProtobufWkt::Value value;
  switch (node.Type()) {
  case YAML::NodeType::Null:
  case YAML::NodeType::Undefined:
    value.set_null_value(ProtobufWkt::NULL_VALUE);
    break;
  case YAML::NodeType::Scalar: {
    // Quoted scalars are tagged "!" and always stay strings.
    if (node.Tag() == "!") {
      value.set_string_value(node.as<std::string>());
      break;
    }
    bool bool_value;
    if (YAML::convert<bool>::decode(node, bool_value)) {
      value.set_bool_value(bool_value);
      break;
    }
    int64_t int_value;
    if (YAML::convert<int64_t>::decode(node, int_value)) {
      if (int_value >= std::numeric_limits<int32_t>::min() &&
          int_value <= std::numeric_limits<int32_t>::max()) {
        value.set_number_value(static_cast<double>(int_value));
      } else {
        // Large integers lose precision as doubles; JSON parsing accepts them as strings.
        value.set_string_value(node.as<std::string>());
      }
      break;
    }
    double double_value;
    if (YAML::convert<double>::decode(node, double_value)) {
      value.set_number_value(double_value);
      break;
    }
    value.set_string_value(node.as<std::string>());
    break;
  }
  case YAML::NodeType::Sequence: {
    auto& list_values = *value.mutable_list_value()->mutable_values();
    for (const auto& it : node) {
      *list_values.Add() = parseYamlNode(it);
    }
    break;
  }
  case YAML::NodeType::Map: {
    auto& struct_fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& it : node) {
      struct_fields[it.first.as<std::string>()] = parseYamlNode(it.second);
    }
    break;
  }
  }
  return value;
}

absl::Status MessageUtil::loadFromJson(const std::string& json, Protobuf::Message& message) {
  Protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status = Protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    return absl::InvalidArgumentError(absl::StrCat("Unable to parse JSON as proto (",
                                                   status.ToString(), "): ", json));
  }
  return absl::OkStatus();
}

absl::Status MessageUtil::loadFromYaml(const std::string& yaml, Protobuf::Message& message) {
  absl::StatusOr<ProtobufWkt::Value> value = ValueUtil::loadFromYaml(yaml);
  if (!value.ok()) {
    return value.status();
  }
  // An empty document configures nothing.
  if (value->kind_case() == ProtobufWkt::Value::kNullValue) {
    message.Clear();
    return absl::OkStatus();
  }
  if (value->kind_case() != ProtobufWkt::Value::kStructValue) {
    return absl::InvalidArgumentError("Unable to convert YAML: top level must be a map");
  }
  std::string json;
  const auto status = Protobuf::util::MessageToJsonString(value->struct_value(), &json);
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unable to convert YAML to JSON: ", status.ToString()));
  }
  return loadFromJson(json, message);
}

absl::Status MessageUtil::loadFromFile(const std::string& path, Protobuf::Message& message) {
  std::ifstream file(path);
  if (!file) {
    return absl::NotFoundError(absl::StrCat("Unable to read file: ", path));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  if (absl::EndsWith(path, ".json")) {
    return loadFromJson(contents.str(), message);
  }
  if (absl::EndsWith(path, ".yaml") || absl::EndsWith(path, ".yml")) {
    return loadFromYaml(contents.str(), message);
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported config file extension (expected .json, .yaml or .yml): ", path));
}

std::string MessageUtil::getJsonStringFromMessage(const Protobuf::Message& message) {
  std::string json;
  Protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  const auto status = Protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return absl::StrCat("<unprintable: ", status.ToString(), ">");
  }
  return json;
}

} // namespace KernelTls
