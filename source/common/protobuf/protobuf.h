#pragma once

#include <memory>

#include "google/protobuf/message.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/wrappers.pb.h"

namespace KernelTls {

// All references to google::protobuf in the tree go through these aliases.
namespace Protobuf = google::protobuf;
namespace ProtobufWkt = google::protobuf;

namespace ProtobufTypes {
using MessagePtr = std::unique_ptr<Protobuf::Message>;
} // namespace ProtobufTypes

} // namespace KernelTls

/**
 * Returns the value of a BoolValue field, or the default when unset.
 */
#define PROTOBUF_GET_WRAPPED_OR_DEFAULT(message, field_name, default_value)                        \
  ((message).has_##field_name() ? (message).field_name().value() : (default_value))
